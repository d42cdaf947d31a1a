/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <mutex>

#include "log/logger.hpp"
#include "storage/state_store.hpp"

namespace vigil::storage {

  /**
   * One file per key under a base directory, named `<key>.bin`
   */
  class FileStateStore : public StateStore {
   public:
    /// Creates `directory` if needed
    static outcome::result<std::shared_ptr<FileStateStore>> create(
        std::filesystem::path directory);

    outcome::result<qtils::Bytes> load(const std::string &key) const override;

    outcome::result<void> save(const std::string &key,
                               qtils::BytesIn value) override;

    const std::filesystem::path &directory() const {
      return directory_;
    }

   private:
    explicit FileStateStore(std::filesystem::path directory);

    std::filesystem::path pathOf(const std::string &key) const;

    const std::filesystem::path directory_;
    mutable std::mutex mutex_;
    log::Logger log_;
  };

}  // namespace vigil::storage
