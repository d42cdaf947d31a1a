/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "index/scorable_index.hpp"

#include <algorithm>

namespace vigil::index {

  std::vector<primitives::ScorableDataEntityBucket> computeScorableBuckets(
      const primitives::MinerIndex &index,
      const ClaimsByBucket &claims,
      const CredibleHotkeys &credible) {
    const bool is_credible = credible.contains(index.hotkey);

    std::vector<primitives::ScorableDataEntityBucket> scorable;
    scorable.reserve(index.buckets.size());

    for (const auto &bucket : index.buckets) {
      uint64_t covered = 0;
      if (auto it = claims.find(bucket.id); it != claims.end()) {
        for (const auto &[hotkey, size] : it->second) {
          if (hotkey == index.hotkey or not credible.contains(hotkey)) {
            continue;
          }
          // map is ordered, every later credible hotkey ranks below us
          if (is_credible and hotkey > index.hotkey) {
            break;
          }
          covered = std::max(covered, size);
        }
      }
      if (bucket.size_bytes <= covered) {
        continue;
      }
      scorable.push_back(primitives::ScorableDataEntityBucket{
          .id = bucket.id,
          .size_bytes = bucket.size_bytes,
          .scorable_bytes = bucket.size_bytes - covered,
      });
    }
    return scorable;
  }

}  // namespace vigil::index
