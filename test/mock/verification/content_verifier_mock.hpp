/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "verification/content_verifier.hpp"

#include <gmock/gmock.h>

namespace vigil::verification {

  class ContentVerifierMock : public ContentVerifier {
   public:
    MOCK_METHOD(void,
                validate,
                (std::vector<primitives::DataEntity>, Handler),
                (override));
  };

}  // namespace vigil::verification
