/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <vector>

#include "primitives/data_entity.hpp"
#include "primitives/validation_result.hpp"

namespace vigil::verification {

  /**
   * Re-fetches content from its origin platform and compares it with what a
   * miner served. One implementation per data source.
   */
  class ContentVerifier {
   public:
    using Handler =
        std::function<void(std::vector<primitives::ValidationResult>)>;

    virtual ~ContentVerifier() = default;

    /**
     * Verifies every entity. `handler` gets exactly one result per entity,
     * in the same order, and is called exactly once.
     */
    virtual void validate(std::vector<primitives::DataEntity> entities,
                          Handler handler) = 0;
  };

}  // namespace vigil::verification
