/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/validator_state.hpp"

#include <scale/scale.hpp>

namespace vigil::application {

  namespace {
    using Record = std::tuple<uint64_t, std::vector<std::string>>;
  }

  outcome::result<qtils::Bytes> encodeValidatorState(
      const ValidatorState &state) {
    OUTCOME_TRY(encoded, scale::encode(Record{state.step, state.hotkeys}));
    return qtils::Bytes{encoded.begin(), encoded.end()};
  }

  outcome::result<ValidatorState> decodeValidatorState(qtils::BytesIn bytes) {
    OUTCOME_TRY(record, scale::decode<Record>(bytes));
    auto &[step, hotkeys] = record;
    return ValidatorState{.step = step, .hotkeys = std::move(hotkeys)};
  }

}  // namespace vigil::application
