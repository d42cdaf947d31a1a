/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace vigil::application {

  /**
   * Parse and store application config.
   */
  class AppConfiguration {
   public:
    virtual ~AppConfiguration() = default;

    /**
     * @return directory where validator state is persisted
     */
    virtual const std::filesystem::path &basePath() const = 0;

    /**
     * @return log level tuning, as given on the command line
     */
    virtual const std::vector<std::string> &log() const = 0;

    /**
     * @return number of miners audited concurrently in one batch
     */
    virtual size_t evalBatchSize() const = 0;

    /**
     * @return minimum interval between two audits of the same miner
     */
    virtual std::chrono::seconds minEvalPeriod() const = 0;

    virtual std::chrono::milliseconds requestTimeout() const = 0;

    /// Weight of a new observation in score and credibility averages
    virtual double scoringAlpha() const = 0;

    virtual double credibleThreshold() const = 0;

    /**
     * @return JSON reward model file, the built-in model is used when unset
     */
    virtual const std::optional<std::filesystem::path> &rewardModelPath()
        const = 0;

    virtual size_t workerThreads() const = 0;

    /**
     * @return number of loop steps between two state saves
     */
    virtual uint32_t saveInterval() const = 0;
  };

}  // namespace vigil::application
