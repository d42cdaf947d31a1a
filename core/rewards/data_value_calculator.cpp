/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "rewards/data_value_calculator.hpp"

#include <boost/assert.hpp>

namespace vigil::rewards {

  DataValueCalculator::DataValueCalculator(
      RewardDistributionModel model, std::shared_ptr<clock::SystemClock> clock)
      : model_{std::move(model)}, clock_{std::move(clock)} {
    BOOST_ASSERT(clock_);
    BOOST_ASSERT(model_.max_age_in_hours > 0);
  }

  double DataValueCalculator::scoreBucket(
      const primitives::ScorableDataEntityBucket &bucket) const {
    return score(bucket.id, bucket.scorable_bytes);
  }

  double DataValueCalculator::score(const primitives::DataEntityBucketId &id,
                                    uint64_t bytes) const {
    return sourceAndLabelFactor(id.source, id.label)
         * ageFactor(id.time_bucket) * static_cast<double>(bytes);
  }

  double DataValueCalculator::sourceAndLabelFactor(
      primitives::DataSource source,
      const primitives::OptionalLabel &label) const {
    auto it = model_.distribution.find(source);
    if (it == model_.distribution.end()) {
      return 0.0;
    }
    const auto &reward = it->second;
    auto factor = reward.default_scale_factor;
    if (label) {
      if (auto label_it = reward.label_scale_factors.find(*label);
          label_it != reward.label_scale_factors.end()) {
        factor = label_it->second;
      }
    }
    return reward.weight * factor;
  }

  double DataValueCalculator::ageFactor(
      const primitives::TimeBucket &time_bucket) const {
    auto current = primitives::TimeBucket::fromTimePoint(clock_->now());
    if (time_bucket.id >= current.id) {
      return 1.0;
    }
    // exact for any pair of ids since current.id > time_bucket.id
    auto age_in_hours = static_cast<uint64_t>(current.id)
                      - static_cast<uint64_t>(time_bucket.id);
    if (age_in_hours > static_cast<uint64_t>(model_.max_age_in_hours)) {
      return 0.0;
    }
    return 1.0
         - static_cast<double>(age_in_hours)
               / (2.0 * static_cast<double>(model_.max_age_in_hours));
  }

}  // namespace vigil::rewards
