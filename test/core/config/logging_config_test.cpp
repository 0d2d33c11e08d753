/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "config/logging_config.hpp"

#include <gtest/gtest.h>

#include "common/logger.hpp"
#include "testutil/outcome.hpp"

namespace sr::config {
  namespace po = boost::program_options;

  class LoggingConfigTest : public ::testing::Test {
   public:
    void TearDown() override {
      common::setLogLevel(spdlog::level::info);
    }

    void parse(std::vector<std::string> args) {
      po::variables_map vm;
      po::store(po::command_line_parser{args}.options(configLogging()).run(),
                vm);
      po::notify(vm);
    }
  };

  TEST_F(LoggingConfigTest, ParseLevel) {
    EXPECT_OUTCOME_EQ(parseLogLevel("trace"), spdlog::level::trace);
    EXPECT_OUTCOME_EQ(parseLogLevel("warn"), spdlog::level::warn);
    EXPECT_OUTCOME_EQ(parseLogLevel("error"), spdlog::level::err);
    EXPECT_OUTCOME_EQ(parseLogLevel("off"), spdlog::level::off);
  }

  TEST_F(LoggingConfigTest, UnknownLevel) {
    EXPECT_OUTCOME_ERROR(ConfigError::UNKNOWN_LOG_LEVEL,
                         parseLogLevel("verbose"));
    EXPECT_OUTCOME_ERROR(ConfigError::UNKNOWN_LOG_LEVEL, parseLogLevel("err"));
  }

  /**
   * @given log level option
   * @when options are notified
   * @then level applied to existing and new loggers
   */
  TEST_F(LoggingConfigTest, OptionAppliesLevel) {
    const auto existing{common::createLogger("logging_config_test")};
    parse({"--log-level", "debug"});
    EXPECT_EQ(existing->level(), spdlog::level::debug);
    EXPECT_EQ(common::createLogger("logging_config_test_new")->level(),
              spdlog::level::debug);
  }

  TEST_F(LoggingConfigTest, DefaultLevel) {
    common::setLogLevel(spdlog::level::err);
    parse({});
    EXPECT_EQ(spdlog::get_level(), spdlog::level::info);
  }

  TEST_F(LoggingConfigTest, InvalidOptionValue) {
    EXPECT_THROW(parse({"--log-level", "loud"}), po::validation_error);
  }
}  // namespace sr::config
