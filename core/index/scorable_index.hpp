/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <unordered_map>
#include <unordered_set>

#include "primitives/miner_index.hpp"

namespace vigil::index {

  using primitives::Hotkey;

  /// Claimed bytes of every miner, per bucket id. Ordered by hotkey.
  using ClaimsByBucket =
      std::unordered_map<primitives::DataEntityBucketId,
                         std::map<Hotkey, uint64_t>>;

  using CredibleHotkeys = std::unordered_set<Hotkey>;

  /**
   * Computes the scorable part of `index` against the claims of other miners.
   *
   * Credible miners are ranked by hotkey, ascending; non-credible miners rank
   * after all credible ones. For each bucket the miner gets only the bytes
   * beyond the largest claim of a higher-ranked credible miner, so the sum of
   * scorable bytes over credible miners never exceeds their largest claim.
   * Claims of non-credible miners never shrink anyone's share. Buckets left
   * with zero scorable bytes are dropped.
   *
   * @param index claims of the miner being scored
   * @param claims claims of all miners, may include the miner itself
   * @param credible hotkeys whose credibility is above the threshold
   */
  std::vector<primitives::ScorableDataEntityBucket> computeScorableBuckets(
      const primitives::MinerIndex &index,
      const ClaimsByBucket &claims,
      const CredibleHotkeys &credible);

}  // namespace vigil::index
