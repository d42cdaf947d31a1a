/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/validator_service.hpp"

#include <cmath>

#include <boost/assert.hpp>
#include <soralog/util.hpp>

#include "application/validator_state.hpp"
#include "index/impl/in_memory_miner_index_store.hpp"
#include "rewards/data_value_calculator.hpp"
#include "rewards/reward_distribution_model.hpp"
#include "validator/audit_sampler.hpp"
#include "validator/trust_state.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(vigil::application, ValidatorServiceError, e) {
  using E = vigil::application::ValidatorServiceError;
  switch (e) {
    case E::STATE_NOT_LOADED:
      return "Validator state is not loaded yet";
    case E::NO_MINERS:
      return "There are no miners to evaluate";
  }
  return "Unknown ValidatorServiceError";
}

namespace vigil::application {

  ValidatorService::ValidatorService(
      const AppConfiguration &config,
      std::shared_ptr<network::MinerClient> client,
      std::shared_ptr<network::ParticipantTable> table,
      std::shared_ptr<verification::VerifierProvider> verifiers,
      std::shared_ptr<storage::StateStore> state_store,
      std::shared_ptr<validator::UniformDraw> draw,
      std::shared_ptr<clock::SystemClock> clock)
      : config_{config},
        client_{std::move(client)},
        table_{std::move(table)},
        verifiers_{std::move(verifiers)},
        state_store_{std::move(state_store)},
        draw_{std::move(draw)},
        clock_{std::move(clock)},
        log_{log::createLogger("ValidatorService", "application")} {
    BOOST_ASSERT(client_ != nullptr);
    BOOST_ASSERT(table_ != nullptr);
    BOOST_ASSERT(verifiers_ != nullptr);
    BOOST_ASSERT(state_store_ != nullptr);
    BOOST_ASSERT(draw_ != nullptr);
    BOOST_ASSERT(clock_ != nullptr);
    log::tuneLoggingSystem(config_.log());
  }

  ValidatorService::~ValidatorService() {
    if (auto res = stop(); res.has_error()) {
      SL_ERROR(log_, "Final state save failed: {}", res.error().message());
    }
  }

  outcome::result<void> ValidatorService::loadState(size_t num_participants) {
    auto trust = state_store_->load(storage::kTrustStateKey);
    if (trust.has_value()) {
      OUTCOME_TRY(state, validator::decodeTrustState(trust.value()));
      SL_INFO(log_,
              "Restored trust state of {} miners",
              state.scores.size());
      restored_trust_ = std::move(state);
    } else if (trust.error() == storage::StateStoreError::NOT_FOUND) {
      SL_INFO(log_,
              "No trust state found, starting {} miners afresh",
              num_participants);
    } else {
      return trust.as_failure();
    }

    auto progress = state_store_->load(storage::kValidatorStateKey);
    if (progress.has_value()) {
      OUTCOME_TRY(state, decodeValidatorState(progress.value()));
      step_ = state.step;
      restored_hotkeys_ = std::move(state.hotkeys);
    } else if (progress.error() != storage::StateStoreError::NOT_FOUND) {
      return progress.as_failure();
    }

    auto indexes = state_store_->load(storage::kMinerIndexKey);
    if (indexes.has_value()) {
      OUTCOME_TRY(index_store_->restore(indexes.value()));
    } else if (indexes.error() != storage::StateStoreError::NOT_FOUND) {
      return indexes.as_failure();
    }
    return outcome::success();
  }

  outcome::result<void> ValidatorService::start() {
    if (loop_thread_.joinable()) {
      throw std::logic_error{"Validator service started twice"};
    }

    rewards::RewardDistributionModel model;
    if (const auto &path = config_.rewardModelPath()) {
      OUTCOME_TRY(loaded, rewards::loadRewardModel(*path));
      model = std::move(loaded);
    } else {
      model = rewards::defaultRewardModel();
    }
    auto calculator = std::make_shared<rewards::DataValueCalculator>(
        std::move(model), clock_);

    table_->refresh();
    auto participants = table_->participants();

    index_store_ = std::make_shared<index::InMemoryMinerIndexStore>();
    OUTCOME_TRY(loadState(participants.size()));

    auto scorer = std::make_shared<validator::MinerScorer>(
        participants.size(),
        calculator,
        validator::MinerScorer::Config{
            .alpha = config_.scoringAlpha(),
            .credible_threshold = config_.credibleThreshold(),
        });
    if (restored_trust_) {
      OUTCOME_TRY(scorer->loadState(std::move(*restored_trust_)));
      restored_trust_.reset();
    }

    std::vector<network::Uid> miner_uids;
    for (const auto &participant : participants) {
      if (participant.isMiner()) {
        miner_uids.push_back(participant.uid);
      }
    }
    if (miner_uids.empty()) {
      return ValidatorServiceError::NO_MINERS;
    }
    const auto offset = static_cast<size_t>(
        std::floor(draw_->draw(static_cast<double>(miner_uids.size()))));
    iterator_ = std::make_shared<validator::MinerIterator>(
        std::move(miner_uids), offset);

    thread_pool_ =
        std::make_unique<ThreadPool>("evaluation", config_.workerThreads());
    evaluator_ = std::make_shared<validator::MinerEvaluator>(
        validator::MinerEvaluator::Config{
            .batch_size = config_.evalBatchSize(),
            .min_evaluation_period = config_.minEvalPeriod(),
            .request_timeout = config_.requestTimeout(),
        },
        thread_pool_->io_context(),
        client_,
        index_store_,
        scorer,
        std::make_shared<validator::AuditSampler>(draw_),
        verifiers_,
        iterator_,
        clock_);

    participant_sync_ = std::make_shared<validator::ParticipantSync>(
        table_, scorer, index_store_, evaluator_, iterator_);
    participant_sync_->setKnownHotkeys(std::move(restored_hotkeys_));
    participant_sync_->sync();

    {
      std::unique_lock lock{mutex_};
      scorer_ = std::move(scorer);
      stopping_ = false;
    }

    SL_INFO(log_,
            "Validator started at step {} with {} participants",
            step(),
            participants.size());
    loop_thread_ = std::thread([this] {
      soralog::util::setThreadName("validator");
      loop();
    });
    return outcome::success();
  }

  outcome::result<void> ValidatorService::stop() {
    {
      std::unique_lock lock{mutex_};
      if (not loop_thread_.joinable()) {
        return outcome::success();
      }
      stopping_ = true;
    }
    wakeup_.notify_all();
    loop_thread_.join();
    thread_pool_.reset();
    SL_INFO(log_, "Validator stopped at step {}", step());
    return saveState();
  }

  void ValidatorService::loop() {
    while (true) {
      {
        std::unique_lock lock{mutex_};
        if (stopping_) {
          break;
        }
      }

      auto wait = evaluator_->runNextEvalBatch();
      participant_sync_->sync();

      uint64_t step = 0;
      {
        std::unique_lock lock{mutex_};
        step = ++step_;
      }
      if (step % config_.saveInterval() == 0) {
        if (auto res = saveState(); res.has_error()) {
          SL_ERROR(log_,
                   "State save at step {} failed: {}",
                   step,
                   res.error().message());
        }
      }

      std::unique_lock lock{mutex_};
      wakeup_.wait_for(lock, wait, [this] { return stopping_; });
    }
  }

  outcome::result<std::vector<double>> ValidatorService::scores() const {
    std::shared_ptr<validator::MinerScorer> scorer;
    {
      std::unique_lock lock{mutex_};
      scorer = scorer_;
    }
    if (scorer == nullptr) {
      return ValidatorServiceError::STATE_NOT_LOADED;
    }
    return scorer->getScores();
  }

  uint64_t ValidatorService::step() const {
    std::unique_lock lock{mutex_};
    return step_;
  }

  outcome::result<void> ValidatorService::saveState() {
    std::shared_ptr<validator::MinerScorer> scorer;
    uint64_t step = 0;
    {
      std::unique_lock lock{mutex_};
      scorer = scorer_;
      step = step_;
    }
    if (scorer == nullptr) {
      return ValidatorServiceError::STATE_NOT_LOADED;
    }

    OUTCOME_TRY(trust, validator::encodeTrustState(scorer->saveState()));
    OUTCOME_TRY(state_store_->save(storage::kTrustStateKey, trust));

    OUTCOME_TRY(progress,
                encodeValidatorState(ValidatorState{
                    .step = step,
                    .hotkeys = participant_sync_->knownHotkeys(),
                }));
    OUTCOME_TRY(state_store_->save(storage::kValidatorStateKey, progress));

    OUTCOME_TRY(indexes, index_store_->snapshot());
    OUTCOME_TRY(state_store_->save(storage::kMinerIndexKey, indexes));

    SL_DEBUG(log_, "State saved at step {}", step);
    return outcome::success();
  }

}  // namespace vigil::application
