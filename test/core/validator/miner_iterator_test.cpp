/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include "validator/miner_iterator.hpp"

using vigil::validator::MinerIterator;
using vigil::validator::Uid;

TEST(MinerIteratorTest, CyclesInUidOrderFromOffset) {
  MinerIterator iterator{{7, 2, 5}, 1};
  EXPECT_EQ(iterator.peek(), 5);
  EXPECT_EQ(iterator.peek(), 5);
  std::vector<Uid> seen;
  for (int i = 0; i < 6; ++i) {
    seen.push_back(iterator.next());
  }
  EXPECT_EQ(seen, (std::vector<Uid>{5, 7, 2, 5, 7, 2}));
}

TEST(MinerIteratorTest, OffsetWrapsAround) {
  MinerIterator iterator{{1, 2}, 5};
  EXPECT_EQ(iterator.peek(), 2);
}

TEST(MinerIteratorTest, EmptyListIsRejected) {
  EXPECT_THROW(MinerIterator({}, 0), std::logic_error);
  MinerIterator iterator{{1}, 0};
  EXPECT_THROW(iterator.setMinerUids({}), std::logic_error);
}

/**
 * @given an iterator positioned on uid 5
 * @when the uid list is replaced by lists with and without uid 5
 * @then the cursor stays on 5 when present, otherwise moves to the next
 * larger uid, wrapping to the start past the end
 */
TEST(MinerIteratorTest, ReplacingUidsKeepsPosition) {
  MinerIterator iterator{{2, 5, 7}, 1};

  iterator.setMinerUids({9, 5, 1});
  EXPECT_EQ(iterator.peek(), 5);

  iterator.setMinerUids({1, 6, 9});
  EXPECT_EQ(iterator.peek(), 6);

  iterator.setMinerUids({1, 3});
  EXPECT_EQ(iterator.peek(), 1);
  EXPECT_EQ(iterator.minerUids(), (std::vector<Uid>{1, 3}));
}
