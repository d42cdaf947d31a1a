/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "validator/audit_sampler.hpp"

#include <limits>
#include <optional>
#include <stdexcept>

#include <boost/assert.hpp>
#include <fmt/chrono.h>

namespace {

  /// Sums sizes without wrapping, sticking at the maximum instead
  uint64_t saturatingAdd(uint64_t lhs, uint64_t rhs) {
    constexpr auto kMax = std::numeric_limits<uint64_t>::max();
    return rhs > kMax - lhs ? kMax : lhs + rhs;
  }

}  // namespace

namespace vigil::validator {

  size_t pickByCumulativeSize(std::span<const uint64_t> sizes, double x) {
    std::optional<size_t> last_non_empty;
    uint64_t cumulative = 0;
    for (size_t i = 0; i < sizes.size(); ++i) {
      if (sizes[i] == 0) {
        continue;
      }
      cumulative = saturatingAdd(cumulative, sizes[i]);
      last_non_empty = i;
      if (static_cast<double>(cumulative) >= x) {
        return i;
      }
    }
    if (not last_non_empty) {
      throw std::logic_error{"Sampling over an empty set of sizes"};
    }
    return *last_non_empty;
  }

  primitives::ValidationResult validateBatch(
      const std::vector<primitives::DataEntity> &entities,
      const primitives::DataEntityBucket &bucket) {
    using primitives::ValidationResult;
    using std::chrono::system_clock;

    const auto expected_range = bucket.id.time_bucket.range();
    uint64_t actual_size = 0;
    uint64_t claimed_size = 0;
    for (const auto &entity : entities) {
      actual_size = saturatingAdd(actual_size, entity.content.size());
      claimed_size = saturatingAdd(claimed_size, entity.content_size_bytes);
      if (entity.source != bucket.id.source) {
        return ValidationResult::invalid(
            fmt::format("Entity source {} does not match chunk source {}",
                        entity.source,
                        bucket.id.source));
      }
      if (entity.label != bucket.id.label) {
        return ValidationResult::invalid(
            fmt::format("Entity label {} does not match chunk label {}",
                        primitives::labelOrNone(entity.label),
                        primitives::labelOrNone(bucket.id.label)));
      }
      if (not expected_range.contains(entity.datetime)) {
        return ValidationResult::invalid(fmt::format(
            "Entity datetime {:%Y-%m-%dT%H:%M:%S} is not in the expected "
            "range {}",
            fmt::gmtime(system_clock::to_time_t(entity.datetime)),
            expected_range));
      }
    }

    if (actual_size < claimed_size or actual_size < bucket.size_bytes) {
      return ValidationResult::invalid(
          fmt::format("Size not as expected. Actual={}. Claimed={}. Expected={}",
                      actual_size,
                      claimed_size,
                      bucket.size_bytes));
    }

    return ValidationResult::valid();
  }

  AuditSampler::AuditSampler(std::shared_ptr<UniformDraw> draw)
      : draw_{std::move(draw)},
        log_{log::createLogger("AuditSampler", "sampler")} {
    BOOST_ASSERT(draw_);
  }

  const primitives::ScorableDataEntityBucket &AuditSampler::chooseBucket(
      const primitives::ScorableMinerIndex &index) const {
    std::vector<uint64_t> sizes;
    sizes.reserve(index.scorable_buckets.size());
    uint64_t total = 0;
    for (const auto &bucket : index.scorable_buckets) {
      sizes.push_back(bucket.size_bytes);
      total = saturatingAdd(total, bucket.size_bytes);
    }
    if (total == 0) {
      throw std::logic_error{"chooseBucket called on an index without data"};
    }

    auto x = draw_->draw(static_cast<double>(total));
    auto chosen = pickByCumulativeSize(sizes, x);
    SL_TRACE(log_,
             "Chose bucket {} of {} for {} (x={}, total={})",
             chosen,
             sizes.size(),
             index.hotkey,
             x,
             total);
    return index.scorable_buckets[chosen];
  }

  std::vector<primitives::DataEntity> AuditSampler::chooseEntities(
      const std::vector<primitives::DataEntity> &entities) const {
    if (entities.empty()) {
      throw std::logic_error{"chooseEntities called on an empty batch"};
    }

    // TODO: sample one entity per N bytes instead of exactly one
    std::vector<uint64_t> sizes;
    sizes.reserve(entities.size());
    uint64_t total = 0;
    for (const auto &entity : entities) {
      sizes.push_back(entity.content_size_bytes);
      total = saturatingAdd(total, entity.content_size_bytes);
    }
    if (total == 0) {
      // no claimed sizes to weight by
      return {entities.front()};
    }

    auto x = draw_->draw(static_cast<double>(total));
    return {entities[pickByCumulativeSize(sizes, x)]};
  }

}  // namespace vigil::validator
