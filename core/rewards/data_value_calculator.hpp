/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "clock/clock.hpp"
#include "primitives/data_entity_bucket.hpp"
#include "rewards/reward_distribution_model.hpp"

namespace vigil::rewards {

  /**
   * Values claimed data. A bucket is worth
   * `weight(source) * labelFactor(source, label) * ageFactor(bucket) * bytes`.
   * Stateless apart from the clock reading.
   */
  class DataValueCalculator {
   public:
    DataValueCalculator(RewardDistributionModel model,
                        std::shared_ptr<clock::SystemClock> clock);

    /// Value of the scorable part of a bucket
    double scoreBucket(
        const primitives::ScorableDataEntityBucket &bucket) const;

    /// Value of `bytes` bytes stored under `id`
    double score(const primitives::DataEntityBucketId &id,
                 uint64_t bytes) const;

    /// weight(source) * labelFactor(source, label); zero for unknown sources
    double sourceAndLabelFactor(primitives::DataSource source,
                                const primitives::OptionalLabel &label) const;

    /**
     * Linear depreciation: 1 for the current hour, 0.5 at `max_age_in_hours`,
     * 0 beyond it. Buckets from the future count as current.
     */
    double ageFactor(const primitives::TimeBucket &time_bucket) const;

   private:
    RewardDistributionModel model_;
    std::shared_ptr<clock::SystemClock> clock_;
  };

}  // namespace vigil::rewards
