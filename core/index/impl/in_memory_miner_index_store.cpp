/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "index/impl/in_memory_miner_index_store.hpp"

#include <scale/scale.hpp>

#include "storage/records.hpp"

namespace vigil::index {

  InMemoryMinerIndexStore::InMemoryMinerIndexStore()
      : log_{log::createLogger("MinerIndexStore", "index")} {}

  void InMemoryMinerIndexStore::upsertMinerIndex(primitives::MinerIndex index,
                                                 primitives::TimePoint now) {
    std::unique_lock lock{mutex_};
    auto hotkey = index.hotkey;
    if (auto it = indexes_.find(hotkey); it != indexes_.end()) {
      eraseClaims(it->second);
      indexes_.erase(it);
    }
    auto [it, _] = indexes_.emplace(
        hotkey, Entry{.index = std::move(index), .last_updated = now});
    insertClaims(it->second);
    SL_TRACE(log_,
             "Stored index of {} with {} buckets",
             hotkey,
             it->second.index.buckets.size());
  }

  std::optional<primitives::ScorableMinerIndex>
  InMemoryMinerIndexStore::readMinerIndex(
      const Hotkey &hotkey, const CredibleHotkeys &credible) const {
    std::unique_lock lock{mutex_};
    auto it = indexes_.find(hotkey);
    if (it == indexes_.end()) {
      return std::nullopt;
    }
    return primitives::ScorableMinerIndex{
        .hotkey = hotkey,
        .scorable_buckets =
            computeScorableBuckets(it->second.index, claims_, credible),
        .last_updated = it->second.last_updated,
    };
  }

  void InMemoryMinerIndexStore::deleteMinerIndex(const Hotkey &hotkey) {
    std::unique_lock lock{mutex_};
    if (auto it = indexes_.find(hotkey); it != indexes_.end()) {
      eraseClaims(it->second);
      indexes_.erase(it);
      SL_DEBUG(log_, "Deleted index of {}", hotkey);
    }
  }

  std::optional<primitives::TimePoint> InMemoryMinerIndexStore::lastUpdated(
      const Hotkey &hotkey) const {
    std::unique_lock lock{mutex_};
    if (auto it = indexes_.find(hotkey); it != indexes_.end()) {
      return it->second.last_updated;
    }
    return std::nullopt;
  }

  outcome::result<qtils::Bytes> InMemoryMinerIndexStore::snapshot() const {
    std::vector<storage::MinerIndexRecord> records;
    {
      std::unique_lock lock{mutex_};
      records.reserve(indexes_.size());
      for (const auto &[hotkey, entry] : indexes_) {
        std::vector<storage::BucketRecord> buckets;
        buckets.reserve(entry.index.buckets.size());
        for (const auto &bucket : entry.index.buckets) {
          buckets.emplace_back(storage::toRecord(bucket));
        }
        records.emplace_back(
            hotkey, storage::toSeconds(entry.last_updated), std::move(buckets));
      }
    }
    OUTCOME_TRY(encoded, scale::encode(records));
    return qtils::Bytes{encoded.begin(), encoded.end()};
  }

  outcome::result<void> InMemoryMinerIndexStore::restore(
      qtils::BytesIn snapshot) {
    using Records = std::vector<storage::MinerIndexRecord>;
    OUTCOME_TRY(records, scale::decode<Records>(snapshot));

    std::unordered_map<Hotkey, Entry> indexes;
    for (auto &[hotkey, last_updated, bucket_records] : records) {
      Entry entry{.index = {.hotkey = hotkey},
                  .last_updated = storage::fromSeconds(last_updated)};
      entry.index.buckets.reserve(bucket_records.size());
      for (const auto &record : bucket_records) {
        OUTCOME_TRY(bucket, storage::fromRecord(record));
        entry.index.buckets.emplace_back(std::move(bucket));
      }
      indexes.insert_or_assign(hotkey, std::move(entry));
    }

    std::unique_lock lock{mutex_};
    indexes_ = std::move(indexes);
    claims_.clear();
    for (const auto &[_, entry] : indexes_) {
      insertClaims(entry);
    }
    SL_INFO(log_, "Restored indexes of {} miners", indexes_.size());
    return outcome::success();
  }

  void InMemoryMinerIndexStore::eraseClaims(const Entry &entry) {
    for (const auto &bucket : entry.index.buckets) {
      auto it = claims_.find(bucket.id);
      if (it == claims_.end()) {
        continue;
      }
      it->second.erase(entry.index.hotkey);
      if (it->second.empty()) {
        claims_.erase(it);
      }
    }
  }

  void InMemoryMinerIndexStore::insertClaims(const Entry &entry) {
    for (const auto &bucket : entry.index.buckets) {
      claims_[bucket.id][entry.index.hotkey] = bucket.size_bytes;
    }
  }

}  // namespace vigil::index
