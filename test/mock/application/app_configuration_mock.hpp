/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "application/app_configuration.hpp"

#include <gmock/gmock.h>

namespace vigil::application {

  class AppConfigurationMock : public AppConfiguration {
   public:
    MOCK_METHOD(const std::filesystem::path &, basePath, (), (const, override));

    MOCK_METHOD(const std::vector<std::string> &, log, (), (const, override));

    MOCK_METHOD(size_t, evalBatchSize, (), (const, override));

    MOCK_METHOD(std::chrono::seconds, minEvalPeriod, (), (const, override));

    MOCK_METHOD(std::chrono::milliseconds,
                requestTimeout,
                (),
                (const, override));

    MOCK_METHOD(double, scoringAlpha, (), (const, override));

    MOCK_METHOD(double, credibleThreshold, (), (const, override));

    MOCK_METHOD(const std::optional<std::filesystem::path> &,
                rewardModelPath,
                (),
                (const, override));

    MOCK_METHOD(size_t, workerThreads, (), (const, override));

    MOCK_METHOD(uint32_t, saveInterval, (), (const, override));
  };

}  // namespace vigil::application
