/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

namespace vigil::primitives {

  /// Outcome of auditing one sampled item, or a whole failed response
  struct ValidationResult {
    bool is_valid = false;
    std::string reason;

    static ValidationResult valid() {
      return ValidationResult{true, ""};
    }

    static ValidationResult invalid(std::string reason) {
      return ValidationResult{false, std::move(reason)};
    }

    bool operator==(const ValidationResult &) const = default;
  };

}  // namespace vigil::primitives
