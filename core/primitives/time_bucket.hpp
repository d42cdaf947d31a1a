/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <cstdint>

#include <fmt/chrono.h>
#include <fmt/format.h>

namespace vigil::primitives {

  using TimePoint = std::chrono::system_clock::time_point;

  /// Half-open interval [start, end)
  struct DateRange {
    TimePoint start;
    TimePoint end;

    bool contains(TimePoint tp) const {
      return start <= tp and tp < end;
    }

    bool operator==(const DateRange &) const = default;
  };

  /**
   * One hour of UTC time. The id is the number of whole hours since the
   * Unix epoch.
   */
  struct TimeBucket {
    static constexpr std::chrono::hours kDuration{1};

    /// Ids whose whole hour fits into TimePoint
    static constexpr int64_t kMinId =
        std::chrono::ceil<std::chrono::hours>(TimePoint::duration::min())
            .count();
    static constexpr int64_t kMaxId =
        std::chrono::floor<std::chrono::hours>(TimePoint::duration::max())
            .count()
        - 1;

    int64_t id = 0;

    static TimeBucket fromTimePoint(TimePoint tp) {
      return TimeBucket{
          std::chrono::floor<std::chrono::hours>(tp.time_since_epoch())
              .count()};
    }

    bool isRepresentable() const {
      return kMinId <= id and id <= kMaxId;
    }

    TimePoint start() const {
      return TimePoint{std::chrono::hours{id}};
    }

    TimePoint end() const {
      return start() + kDuration;
    }

    DateRange range() const {
      return DateRange{start(), end()};
    }

    bool operator==(const TimeBucket &) const = default;
    auto operator<=>(const TimeBucket &) const = default;
  };

}  // namespace vigil::primitives

template <>
struct fmt::formatter<vigil::primitives::DateRange>
    : fmt::formatter<std::string_view> {
  auto format(const vigil::primitives::DateRange &range,
              format_context &ctx) const {
    using std::chrono::system_clock;
    return fmt::format_to(
        ctx.out(),
        "[{:%Y-%m-%dT%H:%M:%S}, {:%Y-%m-%dT%H:%M:%S})",
        fmt::gmtime(system_clock::to_time_t(range.start)),
        fmt::gmtime(system_clock::to_time_t(range.end)));
  }
};
