/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>

namespace vigil::clock {

  /**
   * Wall clock. Ages of time buckets and re-evaluation periods are measured
   * against it, so tests substitute their own time.
   */
  class SystemClock {
   public:
    using TimePoint = std::chrono::system_clock::time_point;

    virtual ~SystemClock() = default;

    virtual TimePoint now() const = 0;
  };

}  // namespace vigil::clock
