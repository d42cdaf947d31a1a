/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>

#include "application/impl/app_configuration_impl.hpp"
#include "testutil/prepare_loggers.hpp"
#include "validator/miner_scorer.hpp"

using vigil::application::AppConfigurationImpl;
using vigil::validator::MinerScorer;

class AppConfigurationImplTest : public ::testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    config_path_ = std::filesystem::temp_directory_path()
                 / "vigil_app_config_test.json";
    app_config_ = std::make_shared<AppConfigurationImpl>(
        vigil::log::createLogger("AppConfiguration", "testing"));
  }

  void TearDown() override {
    std::filesystem::remove(config_path_);
  }

  void writeConfig(const std::string &content) {
    std::ofstream file{config_path_};
    file << content;
  }

  std::filesystem::path config_path_;
  std::shared_ptr<AppConfigurationImpl> app_config_;
};

/**
 * @given no arguments at all
 * @when the configuration is initialized
 * @then every value has its default
 */
TEST_F(AppConfigurationImplTest, Defaults) {
  const char *args[] = {"vigil"};
  ASSERT_TRUE(app_config_->initializeFromArgs(std::size(args), args));

  EXPECT_EQ(app_config_->basePath().string(), "./vigil-data");
  EXPECT_TRUE(app_config_->log().empty());
  EXPECT_EQ(app_config_->evalBatchSize(),
            AppConfigurationImpl::kDefaultEvalBatchSize);
  EXPECT_EQ(app_config_->minEvalPeriod(), std::chrono::minutes{20});
  EXPECT_EQ(app_config_->requestTimeout(), std::chrono::seconds{60});
  EXPECT_DOUBLE_EQ(app_config_->scoringAlpha(), MinerScorer::kDefaultAlpha);
  EXPECT_DOUBLE_EQ(app_config_->credibleThreshold(),
                   MinerScorer::kDefaultCredibleThreshold);
  EXPECT_FALSE(app_config_->rewardModelPath().has_value());
  EXPECT_EQ(app_config_->workerThreads(),
            AppConfigurationImpl::kDefaultWorkerThreads);
  EXPECT_EQ(app_config_->saveInterval(),
            AppConfigurationImpl::kDefaultSaveInterval);
}

TEST_F(AppConfigurationImplTest, CommandLine) {
  const char *args[] = {"vigil",
                        "--base-path",
                        "/tmp/vigil",
                        "-levaluator=debug",
                        "--eval-batch-size",
                        "3",
                        "--min-eval-period",
                        "30",
                        "--request-timeout",
                        "5",
                        "--scoring-alpha",
                        "0.2",
                        "--credible-threshold",
                        "0.5",
                        "--reward-model",
                        "/etc/vigil/rewards.json",
                        "--worker-threads",
                        "2",
                        "--save-interval",
                        "7"};
  ASSERT_TRUE(app_config_->initializeFromArgs(std::size(args), args));

  EXPECT_EQ(app_config_->basePath().string(), "/tmp/vigil");
  EXPECT_EQ(app_config_->log(), std::vector<std::string>{"evaluator=debug"});
  EXPECT_EQ(app_config_->evalBatchSize(), 3);
  EXPECT_EQ(app_config_->minEvalPeriod(), std::chrono::seconds{30});
  EXPECT_EQ(app_config_->requestTimeout(), std::chrono::seconds{5});
  EXPECT_DOUBLE_EQ(app_config_->scoringAlpha(), 0.2);
  EXPECT_DOUBLE_EQ(app_config_->credibleThreshold(), 0.5);
  ASSERT_TRUE(app_config_->rewardModelPath().has_value());
  EXPECT_EQ(app_config_->rewardModelPath()->string(),
            "/etc/vigil/rewards.json");
  EXPECT_EQ(app_config_->workerThreads(), 2);
  EXPECT_EQ(app_config_->saveInterval(), 7);
}

/**
 * @given a configuration file and a command line flag for one of its values
 * @when the configuration is initialized
 * @then file values are used except the one given on the command line
 */
TEST_F(AppConfigurationImplTest, FileValuesAreOverriddenByFlags) {
  writeConfig(R"({
    "general": {"base-path": "/var/vigil", "log": ["scoring=trace"],
                "worker-threads": 8},
    "evaluation": {"eval-batch-size": 4, "request-timeout": 15},
    "scoring": {"alpha": 0.1, "reward-model": "rewards.json"}
  })");
  const auto path = config_path_.string();
  const char *args[] = {
      "vigil", "--config", path.c_str(), "--eval-batch-size", "6"};
  ASSERT_TRUE(app_config_->initializeFromArgs(std::size(args), args));

  EXPECT_EQ(app_config_->basePath().string(), "/var/vigil");
  EXPECT_EQ(app_config_->log(), std::vector<std::string>{"scoring=trace"});
  EXPECT_EQ(app_config_->workerThreads(), 8);
  EXPECT_EQ(app_config_->evalBatchSize(), 6);
  EXPECT_EQ(app_config_->requestTimeout(), std::chrono::seconds{15});
  EXPECT_EQ(app_config_->minEvalPeriod(), std::chrono::minutes{20});
  EXPECT_DOUBLE_EQ(app_config_->scoringAlpha(), 0.1);
  ASSERT_TRUE(app_config_->rewardModelPath().has_value());
  EXPECT_EQ(app_config_->rewardModelPath()->string(), "rewards.json");
}

TEST_F(AppConfigurationImplTest, BrokenConfigFile) {
  writeConfig(R"({"general": )");
  const auto path = config_path_.string();
  const char *args[] = {"vigil", "--config", path.c_str()};
  EXPECT_FALSE(app_config_->initializeFromArgs(std::size(args), args));
}

TEST_F(AppConfigurationImplTest, MissingConfigFile) {
  const char *args[] = {"vigil", "--config", "/nonexistent/vigil.json"};
  EXPECT_FALSE(app_config_->initializeFromArgs(std::size(args), args));
}

TEST_F(AppConfigurationImplTest, OutOfRangeValues) {
  {
    const char *args[] = {"vigil", "--scoring-alpha", "0"};
    EXPECT_FALSE(app_config_->initializeFromArgs(std::size(args), args));
  }
  {
    const char *args[] = {"vigil", "--scoring-alpha", "1.5"};
    EXPECT_FALSE(app_config_->initializeFromArgs(std::size(args), args));
  }
  {
    const char *args[] = {"vigil", "--credible-threshold", "-0.1"};
    EXPECT_FALSE(app_config_->initializeFromArgs(std::size(args), args));
  }
  {
    const char *args[] = {"vigil", "--eval-batch-size", "0"};
    EXPECT_FALSE(app_config_->initializeFromArgs(std::size(args), args));
  }
  {
    const char *args[] = {"vigil", "--request-timeout", "0"};
    EXPECT_FALSE(app_config_->initializeFromArgs(std::size(args), args));
  }
}

TEST_F(AppConfigurationImplTest, UnknownOption) {
  const char *args[] = {"vigil", "--no-such-option"};
  EXPECT_FALSE(app_config_->initializeFromArgs(std::size(args), args));
}
