/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <libp2p/crypto/random_generator/boost_generator.hpp>

#include "validator/impl/csprng_uniform_draw.hpp"

using libp2p::crypto::random::BoostRandomGenerator;
using vigil::validator::CsprngUniformDraw;

/**
 * @given a draw backed by the system generator
 * @when many values are drawn
 * @then all lie in [0, upper) and they are not all equal
 */
TEST(CsprngUniformDrawTest, StaysInRange) {
  CsprngUniformDraw draw{std::make_shared<BoostRandomGenerator>()};
  double min = 10.0;
  double max = 0.0;
  for (int i = 0; i < 1000; ++i) {
    auto value = draw.draw(10.0);
    ASSERT_GE(value, 0.0);
    ASSERT_LT(value, 10.0);
    min = std::min(min, value);
    max = std::max(max, value);
  }
  EXPECT_LT(min, max);
}

TEST(CsprngUniformDrawTest, ZeroUpperBound) {
  CsprngUniformDraw draw{std::make_shared<BoostRandomGenerator>()};
  EXPECT_EQ(draw.draw(0.0), 0.0);
}
