/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "clock/clock.hpp"

namespace vigil::clock {

  class SystemClockImpl : public SystemClock {
   public:
    TimePoint now() const override;
  };

}  // namespace vigil::clock
