/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/records.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(vigil::storage, RecordError, e) {
  using E = vigil::storage::RecordError;
  switch (e) {
    case E::INVALID_DATA_SOURCE:
      return "Persisted record has an unknown data source";
  }
  return "Unknown RecordError";
}

namespace vigil::storage {

  BucketRecord toRecord(const primitives::DataEntityBucket &bucket) {
    std::optional<std::string> label;
    if (bucket.id.label) {
      label = bucket.id.label->value();
    }
    return BucketRecord{bucket.id.time_bucket.id,
                        static_cast<uint8_t>(bucket.id.source),
                        std::move(label),
                        bucket.size_bytes};
  }

  outcome::result<primitives::DataEntityBucket> fromRecord(
      const BucketRecord &record) {
    const auto &[time_bucket, raw_source, label, size_bytes] = record;
    auto source = primitives::dataSourceFromUint(raw_source);
    if (not source) {
      return RecordError::INVALID_DATA_SOURCE;
    }
    primitives::DataEntityBucket bucket{
        .id = {.time_bucket = {time_bucket}, .source = *source},
        .size_bytes = size_bytes,
    };
    if (label) {
      bucket.id.label = primitives::DataLabel{*label};
    }
    return bucket;
  }

  int64_t toSeconds(primitives::TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(
               tp.time_since_epoch())
        .count();
  }

  primitives::TimePoint fromSeconds(int64_t seconds) {
    return primitives::TimePoint{std::chrono::seconds{seconds}};
  }

}  // namespace vigil::storage
