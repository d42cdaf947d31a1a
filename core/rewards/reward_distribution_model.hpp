/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <map>
#include <unordered_map>

#include "outcome/outcome.hpp"
#include "primitives/data_label.hpp"
#include "primitives/data_source.hpp"

namespace vigil::rewards {

  /// Reward parameters of a single data source
  struct DataSourceReward {
    /// Relative share of the reward which goes to this source
    double weight = 0.0;

    /// Factor of labels missing from `label_scale_factors`
    double default_scale_factor = 0.0;

    /// Per-label factor, negative for undesirable labels
    std::unordered_map<primitives::DataLabel, double> label_scale_factors;
  };

  struct RewardDistributionModel {
    std::map<primitives::DataSource, DataSourceReward> distribution;

    /// Data older than this is worth nothing
    int64_t max_age_in_hours = 0;
  };

  enum class RewardModelError {
    UNKNOWN_SOURCE = 1,
    NEGATIVE_WEIGHT,
    INVALID_MAX_AGE,
    MALFORMED_FILE,
  };

  /**
   * Model used when no reward file is configured.
   * Sources without an entry are valued at zero.
   */
  RewardDistributionModel defaultRewardModel();

  /**
   * Reads a model from JSON:
   * @code
   * {
   *   "max_age_in_hours": 720,
   *   "sources": {
   *     "REDDIT": {"weight": 0.6, "default_scale_factor": 0.5,
   *                "label_scale_factors": {"r/bitcoin": 1.0}}
   *   }
   * }
   * @endcode
   */
  outcome::result<RewardDistributionModel> loadRewardModel(
      const std::filesystem::path &path);

}  // namespace vigil::rewards

OUTCOME_HPP_DECLARE_ERROR(vigil::rewards, RewardModelError);
