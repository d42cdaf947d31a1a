/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "validator/miner_evaluation.hpp"

#include <stdexcept>

#include <boost/asio/post.hpp>
#include <boost/assert.hpp>

#include "network/index_response_validator.hpp"

namespace vigil::validator {

  namespace {
    constexpr std::string_view kFailedResponse =
        "Response failed or is invalid";
  }  // namespace

  std::string_view toString(MinerEvaluation::State state) {
    using State = MinerEvaluation::State;
    switch (state) {
      case State::FetchIndex:
        return "FetchIndex";
      case State::Select:
        return "Select";
      case State::FetchContent:
        return "FetchContent";
      case State::BasicCheck:
        return "BasicCheck";
      case State::SampleVerify:
        return "SampleVerify";
      case State::Score:
        return "Score";
      case State::NoData:
        return "NoData";
      case State::Discarded:
        return "Discarded";
    }
    return "Unknown";
  }

  MinerEvaluation::MinerEvaluation(
      std::shared_ptr<const EvaluationContext> context,
      boost::asio::io_context &io_context,
      network::Participant miner)
      : context_{std::move(context)},
        strand_{boost::asio::make_strand(io_context)},
        timer_{strand_},
        miner_{std::move(miner)},
        log_{log::createLogger("MinerEvaluation", "evaluator")} {
    BOOST_ASSERT(context_ != nullptr);
    BOOST_ASSERT(context_->client != nullptr);
    BOOST_ASSERT(context_->index_store != nullptr);
    BOOST_ASSERT(context_->scorer != nullptr);
    BOOST_ASSERT(context_->sampler != nullptr);
    BOOST_ASSERT(context_->verifiers != nullptr);
    BOOST_ASSERT(context_->clock != nullptr);
  }

  void MinerEvaluation::start(Callback done) {
    BOOST_ASSERT(done);
    if (done_) {
      throw std::logic_error{"Miner evaluation started twice"};
    }
    done_ = std::move(done);
    boost::asio::post(strand_,
                      [self{shared_from_this()}] { self->fetchIndex(); });
  }

  uint64_t MinerEvaluation::armTimeout(std::function<void()> on_timeout) {
    const auto request_id = ++last_request_id_;
    awaited_request_ = request_id;
    timer_.expires_after(context_->request_timeout);
    timer_.async_wait([self{shared_from_this()},
                       request_id,
                       on_timeout{std::move(on_timeout)}](
                          const boost::system::error_code &ec) {
      if (ec == boost::asio::error::operation_aborted) {
        return;
      }
      // The handler owns `self`, so `on_timeout` may refer to this
      if (self->takeResponse(request_id)) {
        on_timeout();
      }
    });
    return request_id;
  }

  bool MinerEvaluation::takeResponse(uint64_t request_id) {
    if (awaited_request_ != request_id) {
      return false;
    }
    awaited_request_.reset();
    timer_.cancel();
    return true;
  }

  void MinerEvaluation::fetchIndex() {
    state_ = State::FetchIndex;
    SL_DEBUG(log_,
             "Evaluating miner {} (uid {})",
             miner_.hotkey,
             miner_.uid);

    const auto request_id = armTimeout(
        [this] { onIndex(network::MinerClientError::TIMEOUT); });
    context_->client->requestIndex(
        miner_,
        context_->request_timeout,
        [self{shared_from_this()},
         request_id](outcome::result<network::MinerIndexResponse> response) {
          boost::asio::post(self->strand_,
                            [self,
                             request_id,
                             response{std::move(response)}]() mutable {
                              if (self->takeResponse(request_id)) {
                                self->onIndex(std::move(response));
                              } else {
                                SL_TRACE(self->log_,
                                         "Late index of {} ignored",
                                         self->miner_.hotkey);
                              }
                            });
        });
  }

  void MinerEvaluation::onIndex(
      outcome::result<network::MinerIndexResponse> response) {
    if (response.has_value()) {
      auto checked = network::checkIndexResponse(response.value());
      if (checked.has_value()) {
        context_->index_store->upsertMinerIndex(
            primitives::MinerIndex{
                .hotkey = miner_.hotkey,
                .buckets = std::move(response.value().buckets),
            },
            context_->clock->now());
      } else {
        SL_DEBUG(log_,
                 "Index of {} rejected: {}",
                 miner_.hotkey,
                 checked.error().message());
      }
    } else {
      SL_DEBUG(log_,
               "Index of {} not received: {}",
               miner_.hotkey,
               response.error().message());
    }
    // A miner which failed to answer is still judged by its stored index
    select();
  }

  void MinerEvaluation::select() {
    state_ = State::Select;
    auto scorable = context_->index_store->readMinerIndex(
        miner_.hotkey, context_->credible_hotkeys());
    if (not scorable or scorable->totalSizeBytes() == 0) {
      SL_DEBUG(log_, "Miner {} has nothing scorable", miner_.hotkey);
      context_->scorer->reset(miner_.uid);
      finish(State::NoData);
      return;
    }
    scorable_index_ = std::move(*scorable);
    chosen_bucket_ =
        context_->sampler->chooseBucket(*scorable_index_).toBucket();
    fetchContent();
  }

  void MinerEvaluation::fetchContent() {
    state_ = State::FetchContent;
    SL_TRACE(log_,
             "Requesting bucket {} from {}",
             chosen_bucket_.id,
             miner_.hotkey);

    const auto request_id = armTimeout(
        [this] { onContent(network::MinerClientError::TIMEOUT); });
    context_->client->requestBucket(
        miner_,
        chosen_bucket_.id,
        context_->request_timeout,
        [self{shared_from_this()},
         request_id](outcome::result<network::BucketContentResponse> response) {
          boost::asio::post(self->strand_,
                            [self,
                             request_id,
                             response{std::move(response)}]() mutable {
                              if (self->takeResponse(request_id)) {
                                self->onContent(std::move(response));
                              } else {
                                SL_TRACE(self->log_,
                                         "Late content of {} ignored",
                                         self->miner_.hotkey);
                              }
                            });
        });
  }

  void MinerEvaluation::onContent(
      outcome::result<network::BucketContentResponse> response) {
    if (response.has_error()) {
      SL_DEBUG(log_,
               "Content of {} not received: {}",
               miner_.hotkey,
               response.error().message());
      score({primitives::ValidationResult::invalid(
          std::string{kFailedResponse})});
      return;
    }
    basicCheck(std::move(response.value().entities));
  }

  void MinerEvaluation::basicCheck(
      std::vector<primitives::DataEntity> entities) {
    state_ = State::BasicCheck;
    // an empty batch fails here since a chosen bucket is never empty
    auto result = validateBatch(entities, chosen_bucket_);
    if (not result.is_valid) {
      SL_DEBUG(log_,
               "Content of {} failed basic checks: {}",
               miner_.hotkey,
               result.reason);
      score({std::move(result)});
      return;
    }
    sampleVerify(entities);
  }

  void MinerEvaluation::sampleVerify(
      const std::vector<primitives::DataEntity> &entities) {
    state_ = State::SampleVerify;
    auto verifier = context_->verifiers->get(chosen_bucket_.id.source);
    if (verifier == nullptr) {
      SL_ERROR(log_,
               "No verifier for source {}, audit of {} discarded",
               chosen_bucket_.id.source,
               miner_.hotkey);
      finish(State::Discarded);
      return;
    }

    auto sampled = context_->sampler->chooseEntities(entities);
    sampled_count_ = sampled.size();

    // Verification is never cut short, a result after the timeout is dropped
    const auto request_id = armTimeout([this] {
      SL_WARN(log_,
              "Verification for {} timed out, audit discarded",
              miner_.hotkey);
      finish(State::Discarded);
    });
    verifier->validate(
        std::move(sampled),
        [self{shared_from_this()},
         request_id](std::vector<primitives::ValidationResult> results) {
          boost::asio::post(
              self->strand_,
              [self, request_id, results{std::move(results)}]() mutable {
                if (self->takeResponse(request_id)) {
                  self->onVerified(std::move(results));
                }
              });
        });
  }

  void MinerEvaluation::onVerified(
      std::vector<primitives::ValidationResult> results) {
    if (results.size() != sampled_count_) {
      SL_ERROR(log_,
               "Verifier returned {} results for {} entities, audit of {} "
               "discarded",
               results.size(),
               sampled_count_,
               miner_.hotkey);
      finish(State::Discarded);
      return;
    }
    score(std::move(results));
  }

  void MinerEvaluation::score(
      std::vector<primitives::ValidationResult> results) {
    state_ = State::Score;
    BOOST_ASSERT(scorable_index_.has_value());
    context_->scorer->onMinerEvaluated(miner_.uid, *scorable_index_, results);
    finish(State::Score);
  }

  void MinerEvaluation::finish(State terminal) {
    state_ = terminal;
    SL_DEBUG(log_,
             "Evaluation of {} (uid {}) finished in state {}",
             miner_.hotkey,
             miner_.uid,
             terminal);
    auto done = std::move(done_);
    done_ = nullptr;
    done(terminal);
  }

}  // namespace vigil::validator
