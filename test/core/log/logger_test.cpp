/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "log/logger.hpp"

#include <gtest/gtest.h>

#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using sss::log::Level;

class LoggerTest : public ::testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }
};

/**
 * @given level names and their short forms
 * @when they are converted
 * @then matching levels are returned @and unknown names are rejected
 */
TEST_F(LoggerTest, Str2Lvl) {
  EXPECT_OUTCOME_TRUE(trace, sss::log::str2lvl("trace"));
  EXPECT_EQ(trace, Level::TRACE);
  EXPECT_OUTCOME_TRUE(warn, sss::log::str2lvl("warn"));
  EXPECT_EQ(warn, Level::WARN);
  EXPECT_EC(sss::log::str2lvl("loud"), sss::log::Error::WRONG_LEVEL);
}

/**
 * @given logger of the codec group
 * @when group level is tuned
 * @then logger follows the group until it is reset
 */
TEST_F(LoggerTest, TuneGroupLevel) {
  auto logger = sss::log::createLogger("LoggerTest", "codec");

  EXPECT_OUTCOME_TRUE_1(sss::log::tuneLoggingSystem({"codec=trace"}));
  EXPECT_EQ(logger->level(), Level::TRACE);

  ASSERT_TRUE(sss::log::setLevelOfGroup("codec", Level::ERROR));
  EXPECT_EQ(logger->level(), Level::ERROR);

  ASSERT_TRUE(sss::log::resetLevelOfGroup("codec"));
  EXPECT_EQ(logger->level(), Level::INFO);
}

/**
 * @given logger of the parser group
 * @when its own level is set
 * @then it overrides the group level until it is reset
 */
TEST_F(LoggerTest, LoggerLevelOverridesGroup) {
  auto logger = sss::log::createLogger("ParserLoggerTest", "parser");
  EXPECT_EQ(logger->level(), Level::INFO);

  ASSERT_TRUE(sss::log::setLevelOfLogger("ParserLoggerTest", Level::DEBUG));
  EXPECT_EQ(logger->level(), Level::DEBUG);

  ASSERT_TRUE(sss::log::setLevelOfGroup("parser", Level::WARN));
  EXPECT_EQ(logger->level(), Level::DEBUG);

  ASSERT_TRUE(sss::log::resetLevelOfLogger("ParserLoggerTest"));
  EXPECT_EQ(logger->level(), Level::WARN);

  ASSERT_TRUE(sss::log::resetLevelOfGroup("parser"));
}

/**
 * @given malformed tuning chunks
 * @when they are applied
 * @then each one is rejected with its own error
 */
TEST_F(LoggerTest, TuneRejectsBadChunks) {
  EXPECT_EC(sss::log::tuneLoggingSystem({"loud"}),
            sss::log::Error::WRONG_LEVEL);
  EXPECT_EC(sss::log::tuneLoggingSystem({"codec=loud"}),
            sss::log::Error::WRONG_LEVEL);
  EXPECT_EC(sss::log::tuneLoggingSystem({"nosuchgroup=debug"}),
            sss::log::Error::WRONG_GROUP);
  EXPECT_EC(sss::log::tuneLoggingSystem({"=debug"}),
            sss::log::Error::WRONG_TUNING);
  EXPECT_EC(sss::log::tuneLoggingSystem({"codec=debug=trace"}),
            sss::log::Error::WRONG_TUNING);
}
