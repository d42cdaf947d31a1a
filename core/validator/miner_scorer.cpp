/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "validator/miner_scorer.hpp"

#include <algorithm>
#include <stdexcept>

#include <boost/assert.hpp>
#include <fmt/format.h>

namespace vigil::validator {

  MinerScorer::MinerScorer(
      size_t num_miners,
      std::shared_ptr<rewards::DataValueCalculator> value_calculator,
      Config config)
      : config_{config},
        value_calculator_{std::move(value_calculator)},
        scores_(num_miners, 0.0),
        credibility_(num_miners, kStartingCredibility),
        log_{log::createLogger("MinerScorer", "scorer")} {
    BOOST_ASSERT(value_calculator_);
    BOOST_ASSERT(config_.alpha > 0.0 and config_.alpha <= 1.0);
  }

  MinerScorer::MinerScorer(
      size_t num_miners,
      std::shared_ptr<rewards::DataValueCalculator> value_calculator)
      : MinerScorer(num_miners, std::move(value_calculator), Config{}) {}

  std::vector<double> MinerScorer::getScores() const {
    std::unique_lock lock{mutex_};
    return scores_;
  }

  double MinerScorer::getCredibility(Uid uid) const {
    std::unique_lock lock{mutex_};
    return credibility_.at(uid);
  }

  std::unordered_set<Uid> MinerScorer::getCredibleMiners() const {
    std::unique_lock lock{mutex_};
    std::unordered_set<Uid> credible;
    for (size_t uid = 0; uid < credibility_.size(); ++uid) {
      if (credibility_[uid] >= config_.credible_threshold) {
        credible.insert(static_cast<Uid>(uid));
      }
    }
    return credible;
  }

  void MinerScorer::reset(Uid uid) {
    std::unique_lock lock{mutex_};
    scores_.at(uid) = 0.0;
    credibility_.at(uid) = kStartingCredibility;
    SL_TRACE(log_, "Reset miner {}", uid);
  }

  void MinerScorer::resize(size_t num_miners) {
    std::unique_lock lock{mutex_};
    if (num_miners < scores_.size()) {
      throw std::logic_error{
          fmt::format("Tried to downsize the number of miners from {} to {}",
                      scores_.size(),
                      num_miners)};
    }
    scores_.resize(num_miners, 0.0);
    credibility_.resize(num_miners, kStartingCredibility);
  }

  size_t MinerScorer::size() const {
    std::unique_lock lock{mutex_};
    return scores_.size();
  }

  void MinerScorer::onMinerEvaluated(
      Uid uid,
      const primitives::ScorableMinerIndex &index,
      const std::vector<primitives::ValidationResult> &validation_results) {
    if (validation_results.empty()) {
      throw std::logic_error{"Must be provided at least 1 validation result"};
    }

    std::unique_lock lock{mutex_};
    updateCredibility(uid, validation_results);

    double reward = 0.0;
    for (const auto &bucket : index.scorable_buckets) {
      reward += value_calculator_->scoreBucket(bucket);
    }
    // negative label factors may only reduce the reward, never make it debt
    reward = std::max(0.0, reward);

    auto credibility = credibility_[uid];
    reward *= credibility * credibility;

    updateScore(uid, reward);

    SL_TRACE(log_,
             "Evaluated miner {}. Score={}. Credibility={}",
             uid,
             scores_[uid],
             credibility_[uid]);
  }

  MinerTrustState MinerScorer::saveState() const {
    std::unique_lock lock{mutex_};
    return MinerTrustState{.scores = scores_, .credibility = credibility_};
  }

  outcome::result<void> MinerScorer::loadState(MinerTrustState state) {
    if (state.scores.size() != state.credibility.size()) {
      return TrustStateError::LENGTH_MISMATCH;
    }
    std::unique_lock lock{mutex_};
    scores_ = std::move(state.scores);
    credibility_ = std::move(state.credibility);
    SL_INFO(log_, "Loaded trust state of {} miners", scores_.size());
    return outcome::success();
  }

  void MinerScorer::updateCredibility(
      Uid uid,
      const std::vector<primitives::ValidationResult> &validation_results) {
    auto valid = std::count_if(
        validation_results.begin(),
        validation_results.end(),
        [](const auto &result) { return result.is_valid; });
    auto fraction_valid = static_cast<double>(valid)
                        / static_cast<double>(validation_results.size());

    auto &credibility = credibility_.at(uid);
    credibility =
        config_.alpha * fraction_valid + (1.0 - config_.alpha) * credibility;
  }

  void MinerScorer::updateScore(Uid uid, double reward) {
    auto &score = scores_.at(uid);
    SL_TRACE(log_,
             "Updating miner {}'s score with reward {}. Current score = {}",
             uid,
             reward,
             score);
    score = config_.alpha * reward + (1.0 - config_.alpha) * score;
  }

}  // namespace vigil::validator
