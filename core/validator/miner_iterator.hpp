/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <mutex>
#include <vector>

#include "network/participant_table.hpp"

namespace vigil::validator {

  using network::Uid;

  /**
   * Endless round-robin over miner uids. Thread safe.
   */
  class MinerIterator {
   public:
    /**
     * @param miner_uids uids to cycle through, must not be empty
     * @param start_offset position of the first uid returned, taken modulo
     * the number of uids; a random offset spreads validators over miners
     */
    MinerIterator(std::vector<Uid> miner_uids, size_t start_offset);

    /// The uid `next()` will return
    Uid peek() const;

    Uid next();

    /**
     * Replaces the uids. The cursor stays on the current uid when it is
     * still present, otherwise on the first uid following it.
     */
    void setMinerUids(std::vector<Uid> miner_uids);

    std::vector<Uid> minerUids() const;

   private:
    mutable std::mutex mutex_;
    std::vector<Uid> miner_uids_;
    size_t index_;
  };

}  // namespace vigil::validator
