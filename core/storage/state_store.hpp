/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

#include <qtils/bytes.hpp>

#include "outcome/outcome.hpp"

namespace vigil::storage {

  enum class StateStoreError {
    NOT_FOUND = 1,
  };

  /**
   * Durable blobs by name. `save` replaces a blob as a whole: after a crash
   * `load` returns either the previous or the new value.
   */
  class StateStore {
   public:
    virtual ~StateStore() = default;

    /// @return StateStoreError::NOT_FOUND when `key` was never stored
    virtual outcome::result<qtils::Bytes> load(
        const std::string &key) const = 0;

    virtual outcome::result<void> save(const std::string &key,
                                       qtils::BytesIn value) = 0;
  };

  /// Well-known keys
  inline const std::string kTrustStateKey = "trust_state";
  inline const std::string kValidatorStateKey = "validator_state";
  inline const std::string kMinerIndexKey = "miner_index";

}  // namespace vigil::storage

OUTCOME_HPP_DECLARE_ERROR(vigil::storage, StateStoreError);
