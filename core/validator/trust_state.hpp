/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include <qtils/bytes.hpp>

#include "outcome/outcome.hpp"

namespace vigil::validator {

  /// Audit memory of all miners, indexed by uid
  struct MinerTrustState {
    std::vector<double> scores;
    std::vector<double> credibility;

    bool operator==(const MinerTrustState &) const = default;
  };

  enum class TrustStateError {
    LENGTH_MISMATCH = 1,
  };

  /// Doubles are stored by bit pattern, decoding restores them exactly
  outcome::result<qtils::Bytes> encodeTrustState(const MinerTrustState &state);

  outcome::result<MinerTrustState> decodeTrustState(qtils::BytesIn bytes);

}  // namespace vigil::validator

OUTCOME_HPP_DECLARE_ERROR(vigil::validator, TrustStateError);
