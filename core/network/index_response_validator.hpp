/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "network/miner_client.hpp"

namespace vigil::network {

  constexpr size_t kMaxBucketsPerIndex = 350'000;
  constexpr uint64_t kMaxBucketSizeBytes = 128ull * 1024 * 1024;

  enum class IndexResponseError {
    TOO_MANY_BUCKETS = 1,
    BUCKET_TOO_LARGE,
    DUPLICATE_BUCKET,
    TIME_BUCKET_OUT_OF_RANGE,
  };

  /**
   * Protocol checks on a received index. A response failing them is handled
   * exactly like a failed request.
   */
  outcome::result<void> checkIndexResponse(const MinerIndexResponse &response);

}  // namespace vigil::network

OUTCOME_HPP_DECLARE_ERROR(vigil::network, IndexResponseError);
