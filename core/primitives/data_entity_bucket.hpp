/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <boost/container_hash/hash.hpp>
#include <fmt/format.h>

#include "primitives/data_label.hpp"
#include "primitives/data_source.hpp"
#include "primitives/time_bucket.hpp"

namespace vigil::primitives {

  /// Key of a claim: one hour of one source under one label
  struct DataEntityBucketId {
    TimeBucket time_bucket;
    DataSource source = DataSource::UNKNOWN;
    OptionalLabel label;

    bool operator==(const DataEntityBucketId &) const = default;
    auto operator<=>(const DataEntityBucketId &) const = default;
  };

  /// Miner's claim of holding `size_bytes` of content under `id`
  struct DataEntityBucket {
    DataEntityBucketId id;
    uint64_t size_bytes = 0;

    bool operator==(const DataEntityBucket &) const = default;
  };

  /**
   * Claimed bucket after cross-miner deduplication.
   * `scorable_bytes` never exceeds `size_bytes`.
   */
  struct ScorableDataEntityBucket {
    DataEntityBucketId id;
    uint64_t size_bytes = 0;
    uint64_t scorable_bytes = 0;

    DataEntityBucket toBucket() const {
      return DataEntityBucket{id, size_bytes};
    }

    bool operator==(const ScorableDataEntityBucket &) const = default;
  };

}  // namespace vigil::primitives

template <>
struct std::hash<vigil::primitives::DataEntityBucketId> {
  size_t operator()(const vigil::primitives::DataEntityBucketId &id) const {
    size_t seed = 0;
    boost::hash_combine(seed, id.time_bucket.id);
    boost::hash_combine(seed, static_cast<uint8_t>(id.source));
    if (id.label) {
      boost::hash_combine(seed, id.label->value());
    }
    return seed;
  }
};

template <>
struct fmt::formatter<vigil::primitives::DataEntityBucketId>
    : fmt::formatter<std::string_view> {
  auto format(const vigil::primitives::DataEntityBucketId &id,
              format_context &ctx) const {
    return fmt::format_to(ctx.out(),
                          "{{time_bucket={}, source={}, label={}}}",
                          id.time_bucket.id,
                          id.source,
                          vigil::primitives::labelOrNone(id.label));
  }
};
