/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <vector>

#include "primitives/data_entity_bucket.hpp"

namespace vigil::primitives {

  /// On-chain identity of a participant
  using Hotkey = std::string;

  /// Every bucket a miner claims, one entry per distinct bucket id
  struct MinerIndex {
    Hotkey hotkey;
    std::vector<DataEntityBucket> buckets;

    bool operator==(const MinerIndex &) const = default;
  };

  /// The subset of a miner's claims which earns reward
  struct ScorableMinerIndex {
    Hotkey hotkey;
    std::vector<ScorableDataEntityBucket> scorable_buckets;
    TimePoint last_updated;

    uint64_t totalSizeBytes() const {
      uint64_t total = 0;
      for (const auto &bucket : scorable_buckets) {
        total += bucket.size_bytes;
      }
      return total;
    }
  };

}  // namespace vigil::primitives
