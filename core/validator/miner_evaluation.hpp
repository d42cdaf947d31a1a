/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <fmt/format.h>

#include "clock/clock.hpp"
#include "index/miner_index_store.hpp"
#include "log/logger.hpp"
#include "network/miner_client.hpp"
#include "validator/audit_sampler.hpp"
#include "validator/miner_scorer.hpp"
#include "verification/verifier_provider.hpp"

namespace vigil::validator {

  /// Collaborators shared by every evaluation, immutable once built
  struct EvaluationContext {
    std::shared_ptr<network::MinerClient> client;
    std::shared_ptr<index::MinerIndexStore> index_store;
    std::shared_ptr<MinerScorer> scorer;
    std::shared_ptr<AuditSampler> sampler;
    std::shared_ptr<verification::VerifierProvider> verifiers;
    std::shared_ptr<clock::SystemClock> clock;
    std::chrono::milliseconds request_timeout;
    /// Hotkeys of currently credible miners
    std::function<index::CredibleHotkeys()> credible_hotkeys;
  };

  /**
   * One audit of one miner:
   *
   *   FetchIndex -> Select -> FetchContent -> BasicCheck -> SampleVerify
   *                   |            |              |              |
   *                 NoData         +--------------+-----------> Score
   *
   * A failed index fetch falls back to the stored index; NoData is reached
   * only when there is no index or nothing scorable in it. Failures after
   * Select become failed validation results and are scored. An audit whose
   * verification can not complete is Discarded without touching the score.
   *
   * Every step runs on a private strand, so a timeout and a late response are
   * never handled concurrently.
   */
  class MinerEvaluation : public std::enable_shared_from_this<MinerEvaluation> {
   public:
    enum class State {
      FetchIndex,
      Select,
      FetchContent,
      BasicCheck,
      SampleVerify,
      Score,
      NoData,
      Discarded,
    };

    using Callback = std::function<void(State)>;

    MinerEvaluation(std::shared_ptr<const EvaluationContext> context,
                    boost::asio::io_context &io_context,
                    network::Participant miner);

    /// Starts the audit, `done` is called once with the terminal state
    void start(Callback done);

    State state() const {
      return state_;
    }

   private:
    void fetchIndex();
    void onIndex(outcome::result<network::MinerIndexResponse> response);
    void select();
    void fetchContent();
    void onContent(outcome::result<network::BucketContentResponse> response);
    void basicCheck(std::vector<primitives::DataEntity> entities);
    void sampleVerify(const std::vector<primitives::DataEntity> &entities);
    void onVerified(std::vector<primitives::ValidationResult> results);
    void score(std::vector<primitives::ValidationResult> results);
    void finish(State terminal);

    /**
     * Arms the timeout of the request about to be sent and returns its id.
     * `on_timeout` runs on the strand unless the response arrives first.
     */
    uint64_t armTimeout(std::function<void()> on_timeout);

    /// True when `request_id` is still awaited; it is not awaited afterwards
    bool takeResponse(uint64_t request_id);

    std::shared_ptr<const EvaluationContext> context_;
    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    boost::asio::steady_timer timer_;
    network::Participant miner_;

    State state_ = State::FetchIndex;
    Callback done_;

    uint64_t last_request_id_ = 0;
    std::optional<uint64_t> awaited_request_;

    std::optional<primitives::ScorableMinerIndex> scorable_index_;
    primitives::DataEntityBucket chosen_bucket_;
    size_t sampled_count_ = 0;

    log::Logger log_;
  };

  std::string_view toString(MinerEvaluation::State state);

}  // namespace vigil::validator

template <>
struct fmt::formatter<vigil::validator::MinerEvaluation::State>
    : fmt::formatter<std::string_view> {
  auto format(vigil::validator::MinerEvaluation::State state,
              format_context &ctx) const {
    return fmt::formatter<std::string_view>::format(
        vigil::validator::toString(state), ctx);
  }
};
