/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <mutex>
#include <unordered_set>
#include <vector>

#include "log/logger.hpp"
#include "network/participant_table.hpp"
#include "primitives/miner_index.hpp"
#include "primitives/validation_result.hpp"
#include "rewards/data_value_calculator.hpp"
#include "validator/trust_state.hpp"

namespace vigil::validator {

  using network::Uid;

  /**
   * Score and credibility of every miner. All access goes through one mutex
   * and readers get copies, so a partially applied update is never visible.
   */
  class MinerScorer {
   public:
    /// New and reset miners start half trusted
    static constexpr double kStartingCredibility = 0.5;

    static constexpr double kDefaultAlpha = 0.05;

    static constexpr double kDefaultCredibleThreshold = 0.8;

    struct Config {
      double alpha = kDefaultAlpha;
      double credible_threshold = kDefaultCredibleThreshold;
    };

    MinerScorer(size_t num_miners,
                std::shared_ptr<rewards::DataValueCalculator> value_calculator,
                Config config);

    MinerScorer(size_t num_miners,
                std::shared_ptr<rewards::DataValueCalculator> value_calculator);

    /// Copy of all scores, indexed by uid
    std::vector<double> getScores() const;

    double getCredibility(Uid uid) const;

    /// Uids whose credibility reaches the credible threshold
    std::unordered_set<Uid> getCredibleMiners() const;

    /// Back to zero score and starting credibility
    void reset(Uid uid);

    /**
     * Grows the tables to `num_miners`, new entries start at defaults.
     * @throws std::logic_error when asked to shrink
     */
    void resize(size_t num_miners);

    size_t size() const;

    /**
     * Folds one audit into the miner's state: credibility moves towards the
     * fraction of valid results, then the value of the scorable index scaled
     * by credibility squared is folded into the score.
     * @throws std::logic_error when `validation_results` is empty
     */
    void onMinerEvaluated(
        Uid uid,
        const primitives::ScorableMinerIndex &index,
        const std::vector<primitives::ValidationResult> &validation_results);

    MinerTrustState saveState() const;

    /**
     * Replaces the state. The restored tables keep their persisted length,
     * callers resize afterwards if the participant table grew.
     */
    outcome::result<void> loadState(MinerTrustState state);

   private:
    // Requires: mutex_ is held
    void updateCredibility(
        Uid uid,
        const std::vector<primitives::ValidationResult> &validation_results);
    void updateScore(Uid uid, double reward);

    const Config config_;
    std::shared_ptr<rewards::DataValueCalculator> value_calculator_;

    mutable std::mutex mutex_;
    std::vector<double> scores_;
    std::vector<double> credibility_;

    log::Logger log_;
  };

}  // namespace vigil::validator
