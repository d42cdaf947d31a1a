/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "index/miner_index_store.hpp"

#include <mutex>
#include <unordered_map>

#include "log/logger.hpp"

namespace vigil::index {

  class InMemoryMinerIndexStore : public MinerIndexStore {
   public:
    InMemoryMinerIndexStore();

    void upsertMinerIndex(primitives::MinerIndex index,
                          primitives::TimePoint now) override;

    std::optional<primitives::ScorableMinerIndex> readMinerIndex(
        const Hotkey &hotkey, const CredibleHotkeys &credible) const override;

    void deleteMinerIndex(const Hotkey &hotkey) override;

    std::optional<primitives::TimePoint> lastUpdated(
        const Hotkey &hotkey) const override;

    outcome::result<qtils::Bytes> snapshot() const override;

    outcome::result<void> restore(qtils::BytesIn snapshot) override;

   private:
    struct Entry {
      primitives::MinerIndex index;
      primitives::TimePoint last_updated;
    };

    // Requires: mutex_ is held
    void eraseClaims(const Entry &entry);
    void insertClaims(const Entry &entry);

    mutable std::mutex mutex_;
    std::unordered_map<Hotkey, Entry> indexes_;
    ClaimsByBucket claims_;

    log::Logger log_;
  };

}  // namespace vigil::index
