/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <memory>

#include "primitives/data_source.hpp"
#include "verification/content_verifier.hpp"

namespace vigil::verification {

  /// Registry of verifiers by data source
  class VerifierProvider {
   public:
    void add(primitives::DataSource source,
             std::shared_ptr<ContentVerifier> verifier) {
      verifiers_.insert_or_assign(source, std::move(verifier));
    }

    /// @return nullptr when nothing can verify `source`
    std::shared_ptr<ContentVerifier> get(primitives::DataSource source) const {
      auto it = verifiers_.find(source);
      return it != verifiers_.end() ? it->second : nullptr;
    }

   private:
    std::map<primitives::DataSource, std::shared_ptr<ContentVerifier>>
        verifiers_;
  };

}  // namespace vigil::verification
