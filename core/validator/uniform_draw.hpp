/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

namespace vigil::validator {

  /// Source of the random points used to pick what to audit
  class UniformDraw {
   public:
    virtual ~UniformDraw() = default;

    /// @return a value uniformly distributed in [0, upper)
    virtual double draw(double upper) = 0;
  };

}  // namespace vigil::validator
