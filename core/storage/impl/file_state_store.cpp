/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/impl/file_state_store.hpp"

#include "utils/file.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(vigil::storage, StateStoreError, e) {
  using E = vigil::storage::StateStoreError;
  switch (e) {
    case E::NOT_FOUND:
      return "State not found";
  }
  return "Unknown StateStoreError";
}

namespace vigil::storage {

  outcome::result<std::shared_ptr<FileStateStore>> FileStateStore::create(
      std::filesystem::path directory) {
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
      return ec;
    }
    return std::shared_ptr<FileStateStore>(
        new FileStateStore(std::move(directory)));
  }

  FileStateStore::FileStateStore(std::filesystem::path directory)
      : directory_{std::move(directory)},
        log_{log::createLogger("FileStateStore", "storage")} {}

  std::filesystem::path FileStateStore::pathOf(const std::string &key) const {
    return directory_ / (key + ".bin");
  }

  outcome::result<qtils::Bytes> FileStateStore::load(
      const std::string &key) const {
    std::unique_lock lock{mutex_};
    auto path = pathOf(key);
    std::error_code ec;
    if (not std::filesystem::exists(path, ec)) {
      if (ec) {
        return ec;
      }
      return StateStoreError::NOT_FOUND;
    }
    auto bytes = readFile(path);
    if (bytes.has_error()) {
      SL_ERROR(log_,
               "Can't read {}: {}",
               path.string(),
               bytes.error().message());
      return bytes.as_failure();
    }
    SL_TRACE(log_, "Read {} bytes of {}", bytes.value().size(), key);
    return bytes;
  }

  outcome::result<void> FileStateStore::save(const std::string &key,
                                             qtils::BytesIn value) {
    std::unique_lock lock{mutex_};
    auto path = pathOf(key);
    auto res = writeFileTmp(path, value);
    if (res.has_error()) {
      SL_ERROR(log_,
               "Can't write {}: {}",
               path.string(),
               res.error().message());
      return res;
    }
    SL_TRACE(log_, "Stored {} bytes of {}", value.size(), key);
    return outcome::success();
  }

}  // namespace vigil::storage
