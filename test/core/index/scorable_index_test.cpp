/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include "index/scorable_index.hpp"

using namespace vigil::index;
using namespace vigil::primitives;

namespace {
  const DataEntityBucketId kBucket{
      TimeBucket{100}, DataSource::X, DataLabel{"#tao"}};
  const DataEntityBucketId kOtherBucket{
      TimeBucket{101}, DataSource::REDDIT, std::nullopt};

  MinerIndex indexOf(const Hotkey &hotkey, uint64_t size) {
    return MinerIndex{hotkey, {DataEntityBucket{kBucket, size}}};
  }

  uint64_t scorableBytes(const std::vector<ScorableDataEntityBucket> &buckets) {
    uint64_t total = 0;
    for (const auto &bucket : buckets) {
      total += bucket.scorable_bytes;
    }
    return total;
  }
}  // namespace

/**
 * @given a bucket claimed by a single miner
 * @when its scorable view is computed
 * @then every claimed byte is scorable
 */
TEST(ScorableIndexTest, UncontestedClaimIsFullyScorable) {
  ClaimsByBucket claims{{kBucket, {{"a", 100}}}};
  auto scorable = computeScorableBuckets(indexOf("a", 100), claims, {"a"});
  ASSERT_EQ(scorable.size(), 1);
  EXPECT_EQ(scorable[0].size_bytes, 100);
  EXPECT_EQ(scorable[0].scorable_bytes, 100);
}

/**
 * @given two credible miners claiming the same bucket
 * @when their scorable views are computed
 * @then the lower hotkey keeps its whole claim and the other one gets only
 * the bytes beyond it
 */
TEST(ScorableIndexTest, CredibleMinersShareByHotkeyRank) {
  ClaimsByBucket claims{{kBucket, {{"a", 60}, {"b", 100}}}};
  CredibleHotkeys credible{"a", "b"};

  auto a = computeScorableBuckets(indexOf("a", 60), claims, credible);
  auto b = computeScorableBuckets(indexOf("b", 100), claims, credible);
  EXPECT_EQ(scorableBytes(a), 60);
  EXPECT_EQ(scorableBytes(b), 40);
  EXPECT_EQ(scorableBytes(a) + scorableBytes(b), 100);
}

TEST(ScorableIndexTest, FullyCoveredBucketIsDropped) {
  ClaimsByBucket claims{{kBucket, {{"a", 100}, {"b", 80}}},
                        {kOtherBucket, {{"b", 10}}}};
  CredibleHotkeys credible{"a", "b"};
  MinerIndex b{"b",
               {DataEntityBucket{kBucket, 80},
                DataEntityBucket{kOtherBucket, 10}}};

  auto scorable = computeScorableBuckets(b, claims, credible);
  ASSERT_EQ(scorable.size(), 1);
  EXPECT_EQ(scorable[0].id, kOtherBucket);
}

/**
 * @given a credible and a non-credible miner claiming the same bucket
 * @when their scorable views are computed
 * @then the non-credible claim takes nothing from the credible one, and the
 * non-credible miner is only paid beyond the credible claim
 */
TEST(ScorableIndexTest, NonCredibleMinerRanksLast) {
  ClaimsByBucket claims{{kBucket, {{"a", 50}, {"z", 200}}}};
  CredibleHotkeys credible{"z"};

  // "a" sorts first but is not credible
  auto a = computeScorableBuckets(indexOf("a", 50), claims, credible);
  auto z = computeScorableBuckets(indexOf("z", 200), claims, credible);
  EXPECT_EQ(scorableBytes(z), 200);
  EXPECT_TRUE(a.empty());
}

TEST(ScorableIndexTest, NonCredibleMinersDoNotShrinkEachOther) {
  ClaimsByBucket claims{{kBucket, {{"a", 50}, {"b", 70}}}};
  auto a = computeScorableBuckets(indexOf("a", 50), claims, {});
  auto b = computeScorableBuckets(indexOf("b", 70), claims, {});
  EXPECT_EQ(scorableBytes(a), 50);
  EXPECT_EQ(scorableBytes(b), 70);
}
