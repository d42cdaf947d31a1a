/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string>
#include <tuple>
#include <vector>

#include "outcome/outcome.hpp"
#include "primitives/miner_index.hpp"

/**
 * Persisted layouts. Everything is reduced to integers, strings, optionals,
 * vectors and tuples before SCALE encoding, so the on-disk format does not
 * depend on the in-memory types.
 */
namespace vigil::storage {

  /// time bucket id, source, label, claimed bytes
  using BucketRecord =
      std::tuple<int64_t, uint8_t, std::optional<std::string>, uint64_t>;

  /// hotkey, seconds since epoch of the last update, buckets
  using MinerIndexRecord =
      std::tuple<std::string, int64_t, std::vector<BucketRecord>>;

  enum class RecordError {
    INVALID_DATA_SOURCE = 1,
  };

  BucketRecord toRecord(const primitives::DataEntityBucket &bucket);

  outcome::result<primitives::DataEntityBucket> fromRecord(
      const BucketRecord &record);

  int64_t toSeconds(primitives::TimePoint tp);

  primitives::TimePoint fromSeconds(int64_t seconds);

}  // namespace vigil::storage

OUTCOME_HPP_DECLARE_ERROR(vigil::storage, RecordError);
