/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include <qtils/bytes.hpp>

#include "index/scorable_index.hpp"
#include "outcome/outcome.hpp"
#include "primitives/miner_index.hpp"

namespace vigil::index {

  /**
   * Latest claimed index of every miner. Implementations are thread safe.
   */
  class MinerIndexStore {
   public:
    virtual ~MinerIndexStore() = default;

    /**
     * Replaces the whole index of `index.hotkey`
     * @param now moment the index was received
     */
    virtual void upsertMinerIndex(primitives::MinerIndex index,
                                  primitives::TimePoint now) = 0;

    /**
     * @return scorable view of the stored index of `hotkey`, or nullopt when
     * the miner never provided one
     */
    virtual std::optional<primitives::ScorableMinerIndex> readMinerIndex(
        const Hotkey &hotkey, const CredibleHotkeys &credible) const = 0;

    /// Forgets the index of a deregistered hotkey
    virtual void deleteMinerIndex(const Hotkey &hotkey) = 0;

    /// When the stored index of `hotkey` was received
    virtual std::optional<primitives::TimePoint> lastUpdated(
        const Hotkey &hotkey) const = 0;

    /// Serialized copy of every stored index
    virtual outcome::result<qtils::Bytes> snapshot() const = 0;

    /// Replaces the content of the store with a snapshot
    virtual outcome::result<void> restore(qtils::BytesIn snapshot) = 0;
  };

}  // namespace vigil::index
