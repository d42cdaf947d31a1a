/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "network/index_response_validator.hpp"

#include <unordered_set>

OUTCOME_CPP_DEFINE_CATEGORY(vigil::network, IndexResponseError, e) {
  using E = vigil::network::IndexResponseError;
  switch (e) {
    case E::TOO_MANY_BUCKETS:
      return "Index has more buckets than allowed";
    case E::BUCKET_TOO_LARGE:
      return "Index claims a bucket above the size limit";
    case E::DUPLICATE_BUCKET:
      return "Index claims the same bucket twice";
    case E::TIME_BUCKET_OUT_OF_RANGE:
      return "Index claims a bucket outside the representable time range";
  }
  return "Unknown IndexResponseError";
}

namespace vigil::network {

  outcome::result<void> checkIndexResponse(const MinerIndexResponse &response) {
    if (response.buckets.size() > kMaxBucketsPerIndex) {
      return IndexResponseError::TOO_MANY_BUCKETS;
    }
    std::unordered_set<primitives::DataEntityBucketId> seen;
    seen.reserve(response.buckets.size());
    for (const auto &bucket : response.buckets) {
      if (bucket.size_bytes > kMaxBucketSizeBytes) {
        return IndexResponseError::BUCKET_TOO_LARGE;
      }
      if (not bucket.id.time_bucket.isRepresentable()) {
        return IndexResponseError::TIME_BUCKET_OUT_OF_RANGE;
      }
      if (not seen.emplace(bucket.id).second) {
        return IndexResponseError::DUPLICATE_BUCKET;
      }
    }
    return outcome::success();
  }

}  // namespace vigil::network
