/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "validator/uniform_draw.hpp"

#include <memory>
#include <mutex>

#include <libp2p/crypto/random_generator.hpp>

namespace vigil::validator {

  /**
   * Draws from a cryptographically secure generator, so a miner cannot
   * predict which bucket or item will be audited next.
   */
  class CsprngUniformDraw : public UniformDraw {
   public:
    explicit CsprngUniformDraw(
        std::shared_ptr<libp2p::crypto::random::CSPRNG> generator);

    double draw(double upper) override;

   private:
    std::mutex mutex_;
    std::shared_ptr<libp2p::crypto::random::CSPRNG> generator_;
  };

}  // namespace vigil::validator
