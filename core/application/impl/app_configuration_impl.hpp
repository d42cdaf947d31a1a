/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "application/app_configuration.hpp"

#include <cstdio>
#include <functional>
#include <memory>

#include <rapidjson/document.h>

#include "log/logger.hpp"

namespace vigil::application {

  class AppConfigurationImpl final : public AppConfiguration {
    using FilePtr = std::unique_ptr<std::FILE, decltype(&std::fclose)>;

   public:
    static constexpr size_t kDefaultEvalBatchSize = 10;
    static constexpr uint32_t kDefaultMinEvalPeriodSec = 20 * 60;
    static constexpr uint32_t kDefaultRequestTimeoutSec = 60;
    static constexpr size_t kDefaultWorkerThreads = 4;
    static constexpr uint32_t kDefaultSaveInterval = 10;

    explicit AppConfigurationImpl(log::Logger logger);
    ~AppConfigurationImpl() override = default;

    AppConfigurationImpl(const AppConfigurationImpl &) = delete;
    AppConfigurationImpl &operator=(const AppConfigurationImpl &) = delete;

    /**
     * Fills the configuration. Values from `--config` are read first,
     * explicit command line flags override them.
     * @return false when the arguments are invalid or help was requested
     */
    [[nodiscard]] bool initializeFromArgs(int argc, const char **argv);

    const std::filesystem::path &basePath() const override {
      return base_path_;
    }
    const std::vector<std::string> &log() const override {
      return logger_tuning_config_;
    }
    size_t evalBatchSize() const override {
      return eval_batch_size_;
    }
    std::chrono::seconds minEvalPeriod() const override {
      return std::chrono::seconds{min_eval_period_sec_};
    }
    std::chrono::milliseconds requestTimeout() const override {
      return std::chrono::seconds{request_timeout_sec_};
    }
    double scoringAlpha() const override {
      return scoring_alpha_;
    }
    double credibleThreshold() const override {
      return credible_threshold_;
    }
    const std::optional<std::filesystem::path> &rewardModelPath()
        const override {
      return reward_model_path_;
    }
    size_t workerThreads() const override {
      return worker_threads_;
    }
    uint32_t saveInterval() const override {
      return save_interval_;
    }

   private:
    void parse_general_segment(const rapidjson::Value &val);
    void parse_evaluation_segment(const rapidjson::Value &val);
    void parse_scoring_segment(const rapidjson::Value &val);

    /// @return false when the file can't be opened or parsed
    bool read_config_from_file(const std::string &filepath);

    bool load_ms(const rapidjson::Value &val,
                 const char *name,
                 std::vector<std::string> &target);
    bool load_str(const rapidjson::Value &val,
                  const char *name,
                  std::string &target);
    bool load_u32(const rapidjson::Value &val,
                  const char *name,
                  uint32_t &target);
    bool load_double(const rapidjson::Value &val,
                     const char *name,
                     double &target);

    /// Checks value ranges, logging the first violation
    bool validate_config();

    FilePtr open_file(const std::string &filepath);

    struct SegmentHandler {
      using Handler = std::function<void(const rapidjson::Value &)>;
      const char *segment_name;
      Handler handler;
    };

    log::Logger logger_;
    std::vector<SegmentHandler> handlers_;

    std::filesystem::path base_path_;
    std::vector<std::string> logger_tuning_config_;
    size_t eval_batch_size_;
    uint32_t min_eval_period_sec_;
    uint32_t request_timeout_sec_;
    double scoring_alpha_;
    double credible_threshold_;
    std::optional<std::filesystem::path> reward_model_path_;
    size_t worker_threads_;
    uint32_t save_interval_;
  };

}  // namespace vigil::application
