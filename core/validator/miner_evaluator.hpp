/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "clock/clock.hpp"
#include "log/logger.hpp"
#include "validator/miner_evaluation.hpp"
#include "validator/miner_iterator.hpp"

namespace vigil::validator {

  /**
   * Audits miners in batches, walking them round-robin.
   */
  class MinerEvaluator {
   public:
    static constexpr size_t kDefaultBatchSize = 10;

    struct Config {
      size_t batch_size = kDefaultBatchSize;
      /// A miner is not audited again sooner than that
      std::chrono::seconds min_evaluation_period = std::chrono::minutes{20};
      std::chrono::milliseconds request_timeout = std::chrono::seconds{60};
    };

    /**
     * @param io_context runs the audits; `runNextEvalBatch` must be called
     * from outside of its threads
     */
    MinerEvaluator(Config config,
                   std::shared_ptr<boost::asio::io_context> io_context,
                   std::shared_ptr<network::MinerClient> client,
                   std::shared_ptr<index::MinerIndexStore> index_store,
                   std::shared_ptr<MinerScorer> scorer,
                   std::shared_ptr<AuditSampler> sampler,
                   std::shared_ptr<verification::VerifierProvider> verifiers,
                   std::shared_ptr<MinerIterator> iterator,
                   std::shared_ptr<clock::SystemClock> clock);

    /**
     * Audits the next batch of miners concurrently and blocks until every
     * audit reached a terminal state. Does nothing when the next miner was
     * audited within the minimum evaluation period.
     * @return how long to wait before the next call, zero when a batch ran
     */
    std::chrono::milliseconds runNextEvalBatch();

    /// Replaces the participants known to the evaluator, indexed by uid
    void setParticipants(std::vector<network::Participant> participants);

    /// Forgets when `hotkey` was last audited
    void forgetHotkey(const primitives::Hotkey &hotkey);

    std::optional<primitives::TimePoint> lastEvaluated(
        const primitives::Hotkey &hotkey) const;

    /// Hotkeys of the miners the scorer currently finds credible
    index::CredibleHotkeys credibleHotkeys() const;

   private:
    std::optional<network::Participant> participant(Uid uid) const;

    /// Next distinct uids, at most `batch_size`
    std::vector<Uid> takeBatch();

    const Config config_;
    std::shared_ptr<boost::asio::io_context> io_context_;
    std::shared_ptr<MinerScorer> scorer_;
    std::shared_ptr<MinerIterator> iterator_;
    std::shared_ptr<clock::SystemClock> clock_;
    std::shared_ptr<EvaluationContext> context_;

    mutable std::mutex mutex_;
    std::vector<network::Participant> participants_;
    std::unordered_map<primitives::Hotkey, primitives::TimePoint>
        last_evaluated_;

    log::Logger log_;
  };

}  // namespace vigil::validator
