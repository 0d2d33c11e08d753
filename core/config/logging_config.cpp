/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "config/logging_config.hpp"

#include <array>
#include <utility>

#include "cli/validate/with.hpp"
#include "common/logger.hpp"

namespace sr::config {
  using spdlog::level::level_enum;

  /**
   * Log level parsed from command line
   */
  struct LogLevel {
    level_enum level;
  };

  /**
   * Checks that level name is expected one.
   */
  CLI_VALIDATE(LogLevel) {
    validateWith(out, values, [](const std::string &value) {
      return LogLevel{parseLogLevel(value).value()};
    });
  }

  outcome::result<level_enum> parseLogLevel(const std::string &name) {
    static const std::array<std::pair<const char *, level_enum>, 6> kLevels{{
        {"trace", level_enum::trace},
        {"debug", level_enum::debug},
        {"info", level_enum::info},
        {"warn", level_enum::warn},
        {"error", level_enum::err},
        {"off", level_enum::off},
    }};
    for (const auto &[level_name, level] : kLevels) {
      if (name == level_name) {
        return level;
      }
    }
    return ConfigError::UNKNOWN_LOG_LEVEL;
  }

  options_description configLogging() {
    options_description optionsDescription("Logging options");
    optionsDescription.add_options()(
        "log-level",
        boost::program_options::value<LogLevel>()
            ->default_value(LogLevel{level_enum::info}, "info")
            ->notifier([](const LogLevel &log_level) {
              common::setLogLevel(log_level.level);
            }),
        "Level of every logger. Supported levels: \n"
        " * 'trace'\n"
        " * 'debug'\n"
        " * 'info'\n"
        " * 'warn'\n"
        " * 'error'\n"
        " * 'off'\n");
    return optionsDescription;
  }
}  // namespace sr::config

OUTCOME_CPP_DEFINE_CATEGORY(sr::config, ConfigError, e) {
  using sr::config::ConfigError;
  switch (e) {
    case ConfigError::UNKNOWN_LOG_LEVEL:
      return "Config: unknown log level";
    default:
      return "Config: unknown error";
  }
}
