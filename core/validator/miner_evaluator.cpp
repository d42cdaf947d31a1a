/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "validator/miner_evaluator.hpp"

#include <atomic>
#include <future>
#include <stdexcept>
#include <unordered_set>

#include <boost/assert.hpp>

namespace vigil::validator {

  MinerEvaluator::MinerEvaluator(
      Config config,
      std::shared_ptr<boost::asio::io_context> io_context,
      std::shared_ptr<network::MinerClient> client,
      std::shared_ptr<index::MinerIndexStore> index_store,
      std::shared_ptr<MinerScorer> scorer,
      std::shared_ptr<AuditSampler> sampler,
      std::shared_ptr<verification::VerifierProvider> verifiers,
      std::shared_ptr<MinerIterator> iterator,
      std::shared_ptr<clock::SystemClock> clock)
      : config_{config},
        io_context_{std::move(io_context)},
        scorer_{scorer},
        iterator_{std::move(iterator)},
        clock_{clock},
        log_{log::createLogger("MinerEvaluator", "evaluator")} {
    BOOST_ASSERT(io_context_ != nullptr);
    BOOST_ASSERT(scorer_ != nullptr);
    BOOST_ASSERT(iterator_ != nullptr);
    BOOST_ASSERT(clock_ != nullptr);
    if (config_.batch_size == 0) {
      throw std::logic_error{"Evaluation batch size must be positive"};
    }

    context_ = std::make_shared<EvaluationContext>(EvaluationContext{
        .client = std::move(client),
        .index_store = std::move(index_store),
        .scorer = std::move(scorer),
        .sampler = std::move(sampler),
        .verifiers = std::move(verifiers),
        .clock = std::move(clock),
        .request_timeout = config_.request_timeout,
        .credible_hotkeys = [this] { return credibleHotkeys(); },
    });
  }

  std::chrono::milliseconds MinerEvaluator::runNextEvalBatch() {
    BOOST_ASSERT(not io_context_->get_executor().running_in_this_thread());
    using std::chrono::duration_cast;
    using std::chrono::milliseconds;

    const auto next = participant(iterator_->peek());
    if (next) {
      if (auto last = lastEvaluated(next->hotkey)) {
        const auto elapsed = clock_->now() - *last;
        if (elapsed < config_.min_evaluation_period) {
          auto wait = duration_cast<milliseconds>(
              config_.min_evaluation_period - elapsed);
          SL_DEBUG(log_,
                   "Miner {} was evaluated recently, next batch in {}ms",
                   next->hotkey,
                   wait.count());
          return wait;
        }
      }
    }

    std::vector<network::Participant> batch;
    for (auto uid : takeBatch()) {
      if (auto miner = participant(uid)) {
        batch.emplace_back(std::move(*miner));
      } else {
        SL_WARN(log_, "Miner uid {} is not a known participant", uid);
      }
    }
    if (batch.empty()) {
      return milliseconds::zero();
    }

    SL_INFO(log_, "Running evaluation of {} miners", batch.size());

    auto remaining = std::make_shared<std::atomic_size_t>(batch.size());
    auto all_done = std::make_shared<std::promise<void>>();
    auto all_done_future = all_done->get_future();

    for (auto &miner : batch) {
      auto hotkey = miner.hotkey;
      auto evaluation = std::make_shared<MinerEvaluation>(
          context_, *io_context_, std::move(miner));
      evaluation->start(
          [this, hotkey{std::move(hotkey)}, remaining, all_done](
              MinerEvaluation::State) {
            {
              std::unique_lock lock{mutex_};
              last_evaluated_.insert_or_assign(hotkey, clock_->now());
            }
            if (remaining->fetch_sub(1) == 1) {
              all_done->set_value();
            }
          });
    }

    all_done_future.wait();
    SL_INFO(log_, "Evaluation of {} miners completed", batch.size());
    return milliseconds::zero();
  }

  void MinerEvaluator::setParticipants(
      std::vector<network::Participant> participants) {
    std::unique_lock lock{mutex_};
    participants_ = std::move(participants);
  }

  void MinerEvaluator::forgetHotkey(const primitives::Hotkey &hotkey) {
    std::unique_lock lock{mutex_};
    last_evaluated_.erase(hotkey);
  }

  std::optional<primitives::TimePoint> MinerEvaluator::lastEvaluated(
      const primitives::Hotkey &hotkey) const {
    std::unique_lock lock{mutex_};
    auto it = last_evaluated_.find(hotkey);
    if (it == last_evaluated_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  index::CredibleHotkeys MinerEvaluator::credibleHotkeys() const {
    const auto credible_uids = scorer_->getCredibleMiners();
    index::CredibleHotkeys hotkeys;
    std::unique_lock lock{mutex_};
    for (auto uid : credible_uids) {
      if (uid < participants_.size()) {
        hotkeys.insert(participants_[uid].hotkey);
      }
    }
    return hotkeys;
  }

  std::optional<network::Participant> MinerEvaluator::participant(
      Uid uid) const {
    std::unique_lock lock{mutex_};
    if (uid >= participants_.size()) {
      return std::nullopt;
    }
    return participants_[uid];
  }

  std::vector<Uid> MinerEvaluator::takeBatch() {
    std::vector<Uid> uids;
    std::unordered_set<Uid> taken;
    while (uids.size() < config_.batch_size) {
      if (taken.contains(iterator_->peek())) {
        break;
      }
      auto uid = iterator_->next();
      taken.insert(uid);
      uids.push_back(uid);
    }
    return uids;
  }

}  // namespace vigil::validator
