/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <span>
#include <vector>

#include "log/logger.hpp"
#include "primitives/data_entity.hpp"
#include "primitives/miner_index.hpp"
#include "primitives/validation_result.hpp"
#include "validator/uniform_draw.hpp"

namespace vigil::validator {

  /**
   * Walks `sizes` in order accumulating them and returns the position of the
   * first non-empty element at which the running total reaches `x`.
   * Returns the last non-empty position when `x` exceeds the total.
   * @pre at least one element is positive
   */
  size_t pickByCumulativeSize(std::span<const uint64_t> sizes, double x);

  /**
   * Basic checks of everything a miner returned for `bucket`: each entity must
   * match the bucket's source, label and hour, and the content must be at
   * least as large as both the per-entity claims and the bucket claim.
   * A single non-conforming entity fails the whole batch.
   */
  primitives::ValidationResult validateBatch(
      const std::vector<primitives::DataEntity> &entities,
      const primitives::DataEntityBucket &bucket);

  /**
   * Chooses what to audit. Both choices are weighted by size, so a miner
   * inflating a claim draws proportionally more attention to it.
   */
  class AuditSampler {
   public:
    explicit AuditSampler(std::shared_ptr<UniformDraw> draw);

    /**
     * @throws std::logic_error when the index has nothing to audit; callers
     * treat a zero-size index as "no data" before sampling
     */
    const primitives::ScorableDataEntityBucket &chooseBucket(
        const primitives::ScorableMinerIndex &index) const;

    /**
     * Picks one entity, weighted by its claimed size.
     * @throws std::logic_error on an empty batch
     */
    std::vector<primitives::DataEntity> chooseEntities(
        const std::vector<primitives::DataEntity> &entities) const;

   private:
    std::shared_ptr<UniformDraw> draw_;
    log::Logger log_;
  };

}  // namespace vigil::validator
