/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include "log/logger.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using vigil::log::Level;

class LoggerTest : public ::testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }
};

TEST_F(LoggerTest, LevelNames) {
  EXPECT_EQ(vigil::log::str2lvl("trace").value(), Level::TRACE);
  EXPECT_EQ(vigil::log::str2lvl("warn").value(), Level::WARN);
  EXPECT_EQ(vigil::log::str2lvl("err").value(), Level::ERROR);
  EXPECT_EQ(vigil::log::str2lvl("off").value(), Level::OFF);
  EXPECT_EC(vigil::log::str2lvl("loud"), vigil::log::Error::WRONG_LEVEL);
}

/**
 * @given a logger in the testing group
 * @when levels are tuned with group=level chunks
 * @then the logger follows its group and malformed chunks are skipped
 */
TEST_F(LoggerTest, TuneGroupLevel) {
  auto logger = vigil::log::createLogger("LoggerTest", "testing");

  vigil::log::tuneLoggingSystem({"testing=debug"});
  EXPECT_EQ(logger->level(), Level::DEBUG);

  vigil::log::tuneLoggingSystem({"nosuchgroup=trace", "testing=loud"});
  EXPECT_EQ(logger->level(), Level::DEBUG);

  vigil::log::tuneLoggingSystem({"testing=trace"});
  EXPECT_EQ(logger->level(), Level::TRACE);
}

TEST_F(LoggerTest, BareLevelTunesRootGroup) {
  auto logger = vigil::log::createLogger("LoggerTest");

  vigil::log::tuneLoggingSystem({"warn"});
  EXPECT_EQ(logger->level(), Level::WARN);

  vigil::log::tuneLoggingSystem({"info"});
  EXPECT_EQ(logger->level(), Level::INFO);
}
