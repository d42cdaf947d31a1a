/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "network/miner_client.hpp"

#include <gmock/gmock.h>

namespace vigil::network {

  class MinerClientMock : public MinerClient {
   public:
    MOCK_METHOD(void,
                requestIndex,
                (const Participant &, std::chrono::milliseconds, IndexHandler),
                (override));

    MOCK_METHOD(void,
                requestBucket,
                (const Participant &,
                 const primitives::DataEntityBucketId &,
                 std::chrono::milliseconds,
                 BucketHandler),
                (override));
  };

}  // namespace vigil::network
