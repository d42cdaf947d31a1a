/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "validator/trust_state.hpp"

#include <bit>

#include <scale/scale.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(vigil::validator, TrustStateError, e) {
  using E = vigil::validator::TrustStateError;
  switch (e) {
    case E::LENGTH_MISMATCH:
      return "Scores and credibility have different lengths";
  }
  return "Unknown TrustStateError";
}

namespace vigil::validator {

  namespace {
    using Record = std::tuple<std::vector<uint64_t>, std::vector<uint64_t>>;

    std::vector<uint64_t> toBits(const std::vector<double> &values) {
      std::vector<uint64_t> bits;
      bits.reserve(values.size());
      for (auto value : values) {
        bits.push_back(std::bit_cast<uint64_t>(value));
      }
      return bits;
    }

    std::vector<double> fromBits(const std::vector<uint64_t> &bits) {
      std::vector<double> values;
      values.reserve(bits.size());
      for (auto b : bits) {
        values.push_back(std::bit_cast<double>(b));
      }
      return values;
    }
  }  // namespace

  outcome::result<qtils::Bytes> encodeTrustState(const MinerTrustState &state) {
    if (state.scores.size() != state.credibility.size()) {
      return TrustStateError::LENGTH_MISMATCH;
    }
    OUTCOME_TRY(encoded,
                scale::encode(Record{toBits(state.scores),
                                     toBits(state.credibility)}));
    return qtils::Bytes{encoded.begin(), encoded.end()};
  }

  outcome::result<MinerTrustState> decodeTrustState(qtils::BytesIn bytes) {
    OUTCOME_TRY(record, scale::decode<Record>(bytes));
    auto &[scores, credibility] = record;
    if (scores.size() != credibility.size()) {
      return TrustStateError::LENGTH_MISMATCH;
    }
    return MinerTrustState{.scores = fromBits(scores),
                           .credibility = fromBits(credibility)};
  }

}  // namespace vigil::validator
