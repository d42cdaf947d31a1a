/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <vector>

#include <qtils/bytes.hpp>

#include "outcome/outcome.hpp"
#include "primitives/miner_index.hpp"

namespace vigil::application {

  /// Progress of the control loop, kept across restarts
  struct ValidatorState {
    uint64_t step = 0;
    /// Hotkey of every participant at the last sync, indexed by uid
    std::vector<primitives::Hotkey> hotkeys;

    bool operator==(const ValidatorState &) const = default;
  };

  outcome::result<qtils::Bytes> encodeValidatorState(
      const ValidatorState &state);

  outcome::result<ValidatorState> decodeValidatorState(qtils::BytesIn bytes);

}  // namespace vigil::application
