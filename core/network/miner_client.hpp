/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <functional>
#include <vector>

#include "network/participant_table.hpp"
#include "outcome/outcome.hpp"
#include "primitives/data_entity.hpp"
#include "primitives/data_entity_bucket.hpp"

namespace vigil::network {

  struct MinerIndexResponse {
    std::vector<primitives::DataEntityBucket> buckets;
  };

  struct BucketContentResponse {
    std::vector<primitives::DataEntity> entities;
  };

  enum class MinerClientError {
    TIMEOUT = 1,
    UNREACHABLE,
    INVALID_RESPONSE,
  };

  /**
   * Query side of the peer transport. Handlers may be called on any thread,
   * exactly once per request. The transport should give up after `timeout`;
   * callers do not rely on it and arm their own timer as well.
   */
  class MinerClient {
   public:
    using IndexHandler =
        std::function<void(outcome::result<MinerIndexResponse>)>;
    using BucketHandler =
        std::function<void(outcome::result<BucketContentResponse>)>;

    virtual ~MinerClient() = default;

    /// Asks the miner for its whole claimed index
    virtual void requestIndex(const Participant &miner,
                              std::chrono::milliseconds timeout,
                              IndexHandler handler) = 0;

    /// Asks the miner for all content it holds under `bucket_id`
    virtual void requestBucket(const Participant &miner,
                               const primitives::DataEntityBucketId &bucket_id,
                               std::chrono::milliseconds timeout,
                               BucketHandler handler) = 0;
  };

}  // namespace vigil::network

OUTCOME_HPP_DECLARE_ERROR(vigil::network, MinerClientError);
