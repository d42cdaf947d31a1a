/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <vector>

#include "primitives/miner_index.hpp"

namespace vigil::network {

  /// Stable arena-style index of a registered participant
  using Uid = uint32_t;

  struct Participant {
    Uid uid = 0;
    primitives::Hotkey hotkey;
    double stake = 0.0;
    double validator_trust = 0.0;
    bool validator_permit = false;

    /// Everyone who has not earned validator trust is treated as a miner
    bool isMiner() const {
      return validator_trust == 0.0;
    }

    bool mayValidate() const {
      return validator_permit and stake >= kMinValidatorStake;
    }

    static constexpr double kMinValidatorStake = 512.0;
  };

  /**
   * Registered participants, indexed by uid. Uids are dense and the table
   * only grows; a uid may be re-assigned to a new hotkey.
   */
  class ParticipantTable {
   public:
    virtual ~ParticipantTable() = default;

    /// Refreshes the table from the chain
    virtual void refresh() = 0;

    /// Snapshot of all participants, `result[i].uid == i`
    virtual std::vector<Participant> participants() const = 0;
  };

}  // namespace vigil::network
