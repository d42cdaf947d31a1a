/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include "application/app_configuration.hpp"
#include "clock/clock.hpp"
#include "index/miner_index_store.hpp"
#include "log/logger.hpp"
#include "network/miner_client.hpp"
#include "network/participant_table.hpp"
#include "storage/state_store.hpp"
#include "utils/thread_pool.hpp"
#include "validator/miner_evaluator.hpp"
#include "validator/miner_scorer.hpp"
#include "validator/participant_sync.hpp"
#include "validator/uniform_draw.hpp"
#include "verification/verifier_provider.hpp"

namespace vigil::application {

  enum class ValidatorServiceError {
    STATE_NOT_LOADED = 1,
    NO_MINERS,
  };

  /**
   * Control loop of the validator: audits a batch, syncs participants,
   * persists state every few steps and sleeps until the next batch is due.
   */
  class ValidatorService {
   public:
    ValidatorService(const AppConfiguration &config,
                     std::shared_ptr<network::MinerClient> client,
                     std::shared_ptr<network::ParticipantTable> table,
                     std::shared_ptr<verification::VerifierProvider> verifiers,
                     std::shared_ptr<storage::StateStore> state_store,
                     std::shared_ptr<validator::UniformDraw> draw,
                     std::shared_ptr<clock::SystemClock> clock);

    ~ValidatorService();

    ValidatorService(const ValidatorService &) = delete;
    ValidatorService &operator=(const ValidatorService &) = delete;

    /**
     * Restores persisted state, syncs participants and starts the loop.
     * Nothing is started when the state can't be restored.
     */
    outcome::result<void> start();

    /**
     * Lets the running batch finish, stops the loop and saves the state.
     * Does nothing when not started.
     */
    outcome::result<void> stop();

    /// Copy of the scores of all miners, indexed by uid
    outcome::result<std::vector<double>> scores() const;

    /// Number of completed loop steps, including previous runs
    uint64_t step() const;

    /// Persists trust state, loop progress and stored indexes
    outcome::result<void> saveState();

   private:
    outcome::result<void> loadState(size_t num_participants);
    void loop();

    const AppConfiguration &config_;
    std::shared_ptr<network::MinerClient> client_;
    std::shared_ptr<network::ParticipantTable> table_;
    std::shared_ptr<verification::VerifierProvider> verifiers_;
    std::shared_ptr<storage::StateStore> state_store_;
    std::shared_ptr<validator::UniformDraw> draw_;
    std::shared_ptr<clock::SystemClock> clock_;

    std::shared_ptr<index::MinerIndexStore> index_store_;
    std::shared_ptr<validator::MinerScorer> scorer_;
    std::shared_ptr<validator::MinerIterator> iterator_;
    std::shared_ptr<validator::MinerEvaluator> evaluator_;
    std::shared_ptr<validator::ParticipantSync> participant_sync_;
    std::unique_ptr<ThreadPool> thread_pool_;

    mutable std::mutex mutex_;
    std::condition_variable wakeup_;
    bool stopping_ = false;
    std::thread loop_thread_;
    uint64_t step_ = 0;
    std::vector<primitives::Hotkey> restored_hotkeys_;
    std::optional<validator::MinerTrustState> restored_trust_;

    log::Logger log_;
  };

}  // namespace vigil::application

OUTCOME_HPP_DECLARE_ERROR(vigil::application, ValidatorServiceError);
