/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>

#include <fmt/format.h>

namespace vigil::primitives {

  /**
   * Topical tag of a piece of content: a hashtag, a subreddit, a keyword.
   * Stored lower-cased, so equality is case-insensitive.
   */
  class DataLabel {
   public:
    static constexpr size_t kMaxLength = 140;

    DataLabel() = default;

    explicit DataLabel(std::string value)
        : value_{normalize(std::move(value))} {}

    const std::string &value() const {
      return value_;
    }

    bool operator==(const DataLabel &) const = default;
    auto operator<=>(const DataLabel &) const = default;

   private:
    static std::string normalize(std::string value) {
      if (value.size() > kMaxLength) {
        value.resize(kMaxLength);
      }
      std::transform(value.begin(), value.end(), value.begin(), [](char c) {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
      });
      return value;
    }

    std::string value_;
  };

  /// A bucket or entity may carry no label at all
  using OptionalLabel = std::optional<DataLabel>;

  inline std::string_view labelOrNone(const OptionalLabel &label) {
    return label ? std::string_view{label->value()} : std::string_view{"None"};
  }

}  // namespace vigil::primitives

template <>
struct std::hash<vigil::primitives::DataLabel> {
  size_t operator()(const vigil::primitives::DataLabel &label) const {
    return std::hash<std::string>{}(label.value());
  }
};

template <>
struct fmt::formatter<vigil::primitives::DataLabel>
    : fmt::formatter<std::string_view> {
  auto format(const vigil::primitives::DataLabel &label,
              format_context &ctx) const {
    return fmt::formatter<std::string_view>::format(label.value(), ctx);
  }
};
