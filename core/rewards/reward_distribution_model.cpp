/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "rewards/reward_distribution_model.hpp"

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(vigil::rewards, RewardModelError, e) {
  using E = vigil::rewards::RewardModelError;
  switch (e) {
    case E::UNKNOWN_SOURCE:
      return "Reward model refers to an unknown data source";
    case E::NEGATIVE_WEIGHT:
      return "Data source weight must not be negative";
    case E::INVALID_MAX_AGE:
      return "Maximum data age must be positive";
    case E::MALFORMED_FILE:
      return "Reward model file is malformed";
  }
  return "Unknown RewardModelError";
}

namespace vigil::rewards {

  using primitives::DataLabel;
  using primitives::DataSource;

  namespace {
    DataSourceReward makeReward(
        double weight,
        double default_scale_factor,
        std::initializer_list<std::pair<const char *, double>> labels) {
      DataSourceReward reward{.weight = weight,
                              .default_scale_factor = default_scale_factor};
      for (auto &[label, factor] : labels) {
        reward.label_scale_factors.emplace(DataLabel{label}, factor);
      }
      return reward;
    }
  }  // namespace

  RewardDistributionModel defaultRewardModel() {
    RewardDistributionModel model;
    model.max_age_in_hours = 30 * 24;
    model.distribution.emplace(DataSource::REDDIT,
                               makeReward(0.6,
                                          0.5,
                                          {
                                              {"r/bittensor_", 1.0},
                                              {"r/bitcoin", 1.0},
                                              {"r/cryptocurrency", 1.0},
                                              {"r/cryptomarkets", 1.0},
                                              {"r/ethtrader", 0.75},
                                              {"r/solana", 0.75},
                                              {"r/decentralizedai", 0.75},
                                              {"r/machinelearning", 0.75},
                                          }));
    model.distribution.emplace(DataSource::X,
                               makeReward(0.4,
                                          0.5,
                                          {
                                              {"#bittensor", 1.0},
                                              {"#tao", 1.0},
                                              {"#bitcoin", 1.0},
                                              {"#btc", 1.0},
                                              {"#crypto", 1.0},
                                              {"#cryptocurrency", 1.0},
                                              {"#decentralized", 0.75},
                                              {"#ai", 0.75},
                                          }));
    return model;
  }

  outcome::result<RewardDistributionModel> loadRewardModel(
      const std::filesystem::path &path) {
    namespace pt = boost::property_tree;
    pt::ptree tree;
    try {
      pt::read_json(path.native(), tree);
    } catch (const pt::json_parser_error &) {
      return RewardModelError::MALFORMED_FILE;
    }

    RewardDistributionModel model;
    auto max_age = tree.get_optional<int64_t>("max_age_in_hours");
    if (not max_age or *max_age <= 0) {
      return RewardModelError::INVALID_MAX_AGE;
    }
    model.max_age_in_hours = *max_age;

    auto sources = tree.get_child_optional("sources");
    if (not sources) {
      return RewardModelError::MALFORMED_FILE;
    }
    for (const auto &[name, node] : *sources) {
      auto source = primitives::dataSourceFromString(name);
      if (not source or *source == DataSource::UNKNOWN) {
        return RewardModelError::UNKNOWN_SOURCE;
      }
      DataSourceReward reward;
      try {
        reward.weight = node.get<double>("weight");
        reward.default_scale_factor = node.get<double>("default_scale_factor");
        if (auto labels = node.get_child_optional("label_scale_factors")) {
          for (const auto &[label, factor] : *labels) {
            reward.label_scale_factors.insert_or_assign(
                DataLabel{label}, factor.get_value<double>());
          }
        }
      } catch (const pt::ptree_error &) {
        return RewardModelError::MALFORMED_FILE;
      }
      if (reward.weight < 0.0) {
        return RewardModelError::NEGATIVE_WEIGHT;
      }
      model.distribution.insert_or_assign(*source, std::move(reward));
    }
    return model;
  }

}  // namespace vigil::rewards
