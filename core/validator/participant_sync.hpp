/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <mutex>
#include <vector>

#include "index/miner_index_store.hpp"
#include "log/logger.hpp"
#include "network/participant_table.hpp"
#include "validator/miner_evaluator.hpp"
#include "validator/miner_iterator.hpp"
#include "validator/miner_scorer.hpp"

namespace vigil::validator {

  /**
   * Keeps everything indexed by uid in line with the participant table.
   * A uid taken over by a new hotkey loses its score, its index and its
   * evaluation history.
   */
  class ParticipantSync {
   public:
    ParticipantSync(std::shared_ptr<network::ParticipantTable> table,
                    std::shared_ptr<MinerScorer> scorer,
                    std::shared_ptr<index::MinerIndexStore> index_store,
                    std::shared_ptr<MinerEvaluator> evaluator,
                    std::shared_ptr<MinerIterator> iterator);

    /**
     * Takes the known hotkeys, e.g. restored from a previous run, to detect
     * replacements made while the validator was down.
     */
    void setKnownHotkeys(std::vector<primitives::Hotkey> hotkeys);

    /// Refreshes the table and applies what changed since the last sync
    void sync();

    std::vector<primitives::Hotkey> knownHotkeys() const;

   private:
    std::shared_ptr<network::ParticipantTable> table_;
    std::shared_ptr<MinerScorer> scorer_;
    std::shared_ptr<index::MinerIndexStore> index_store_;
    std::shared_ptr<MinerEvaluator> evaluator_;
    std::shared_ptr<MinerIterator> iterator_;

    mutable std::mutex mutex_;
    std::vector<primitives::Hotkey> hotkeys_;

    log::Logger log_;
  };

}  // namespace vigil::validator
