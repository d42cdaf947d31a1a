/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "validator/impl/csprng_uniform_draw.hpp"

#include <boost/assert.hpp>

namespace vigil::validator {

  CsprngUniformDraw::CsprngUniformDraw(
      std::shared_ptr<libp2p::crypto::random::CSPRNG> generator)
      : generator_{std::move(generator)} {
    BOOST_ASSERT(generator_);
  }

  double CsprngUniformDraw::draw(double upper) {
    std::vector<uint8_t> bytes;
    {
      std::unique_lock lock{mutex_};
      bytes = generator_->randomBytes(sizeof(uint64_t));
    }
    uint64_t bits = 0;
    for (auto byte : bytes) {
      bits = (bits << 8) | byte;
    }
    // top 53 bits give every representable double in [0, 1)
    constexpr double kScale = 1.0 / static_cast<double>(1ull << 53);
    return static_cast<double>(bits >> 11) * kScale * upper;
  }

}  // namespace vigil::validator
