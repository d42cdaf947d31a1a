/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include <fmt/format.h>

namespace vigil::primitives {

  /**
   * Platform the content was scraped from. Numeric values are part of the
   * wire and persistence formats and must never be reassigned.
   */
  enum class DataSource : uint8_t {
    UNKNOWN = 0,
    REDDIT = 1,
    X = 2,
    YOUTUBE = 3,
  };

  constexpr std::string_view toString(DataSource source) {
    switch (source) {
      case DataSource::UNKNOWN:
        return "UNKNOWN";
      case DataSource::REDDIT:
        return "REDDIT";
      case DataSource::X:
        return "X";
      case DataSource::YOUTUBE:
        return "YOUTUBE";
    }
    return "UNKNOWN";
  }

  /// Reverse of `toString`, case sensitive
  inline std::optional<DataSource> dataSourceFromString(std::string_view str) {
    for (auto source : {DataSource::UNKNOWN,
                        DataSource::REDDIT,
                        DataSource::X,
                        DataSource::YOUTUBE}) {
      if (toString(source) == str) {
        return source;
      }
    }
    return std::nullopt;
  }

  /// Validating conversion from the raw encoding
  inline std::optional<DataSource> dataSourceFromUint(uint8_t raw) {
    if (raw > static_cast<uint8_t>(DataSource::YOUTUBE)) {
      return std::nullopt;
    }
    return static_cast<DataSource>(raw);
  }

}  // namespace vigil::primitives

template <>
struct fmt::formatter<vigil::primitives::DataSource>
    : fmt::formatter<std::string_view> {
  auto format(vigil::primitives::DataSource source,
              format_context &ctx) const {
    return fmt::formatter<std::string_view>::format(
        vigil::primitives::toString(source), ctx);
  }
};
