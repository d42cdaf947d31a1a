/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "validator/participant_sync.hpp"

#include <boost/assert.hpp>

namespace vigil::validator {

  ParticipantSync::ParticipantSync(
      std::shared_ptr<network::ParticipantTable> table,
      std::shared_ptr<MinerScorer> scorer,
      std::shared_ptr<index::MinerIndexStore> index_store,
      std::shared_ptr<MinerEvaluator> evaluator,
      std::shared_ptr<MinerIterator> iterator)
      : table_{std::move(table)},
        scorer_{std::move(scorer)},
        index_store_{std::move(index_store)},
        evaluator_{std::move(evaluator)},
        iterator_{std::move(iterator)},
        log_{log::createLogger("ParticipantSync", "participants")} {
    BOOST_ASSERT(table_ != nullptr);
    BOOST_ASSERT(scorer_ != nullptr);
    BOOST_ASSERT(index_store_ != nullptr);
    BOOST_ASSERT(evaluator_ != nullptr);
    BOOST_ASSERT(iterator_ != nullptr);
  }

  void ParticipantSync::setKnownHotkeys(
      std::vector<primitives::Hotkey> hotkeys) {
    std::unique_lock lock{mutex_};
    hotkeys_ = std::move(hotkeys);
  }

  std::vector<primitives::Hotkey> ParticipantSync::knownHotkeys() const {
    std::unique_lock lock{mutex_};
    return hotkeys_;
  }

  void ParticipantSync::sync() {
    table_->refresh();
    auto participants = table_->participants();

    std::unique_lock lock{mutex_};
    const auto common = std::min(hotkeys_.size(), participants.size());
    for (size_t uid = 0; uid < common; ++uid) {
      const auto &old_hotkey = hotkeys_[uid];
      const auto &participant = participants[uid];
      if (old_hotkey == participant.hotkey) {
        continue;
      }
      SL_INFO(log_,
              "Uid {} moved from {} to {}, resetting its state",
              uid,
              old_hotkey,
              participant.hotkey);
      if (uid < scorer_->size()) {
        scorer_->reset(static_cast<Uid>(uid));
      }
      index_store_->deleteMinerIndex(old_hotkey);
      evaluator_->forgetHotkey(old_hotkey);
    }

    if (participants.size() > scorer_->size()) {
      SL_INFO(log_,
              "Participant table grew from {} to {}",
              scorer_->size(),
              participants.size());
      scorer_->resize(participants.size());
    }

    std::vector<Uid> miner_uids;
    hotkeys_.clear();
    hotkeys_.reserve(participants.size());
    for (const auto &participant : participants) {
      BOOST_ASSERT(participant.uid == hotkeys_.size());
      hotkeys_.push_back(participant.hotkey);
      if (participant.isMiner()) {
        miner_uids.push_back(participant.uid);
      }
    }

    if (miner_uids.empty()) {
      SL_WARN(log_, "No miners among {} participants", participants.size());
    } else {
      iterator_->setMinerUids(std::move(miner_uids));
    }
    evaluator_->setParticipants(std::move(participants));
  }

}  // namespace vigil::validator
