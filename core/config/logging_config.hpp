/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/program_options.hpp>
#include <spdlog/common.h>

#include "common/outcome.hpp"

namespace sr::config {
  using boost::program_options::options_description;

  enum class ConfigError {
    UNKNOWN_LOG_LEVEL = 1,
  };

  /**
   * @param name - one of "trace", "debug", "info", "warn", "error", "off"
   * @return spdlog level or UNKNOWN_LOG_LEVEL error
   */
  outcome::result<spdlog::level::level_enum> parseLogLevel(
      const std::string &name);

  /**
   * Creates program option description for 'log-level' and applies chosen
   * level to every logger on notify.
   *
   * @return logging program option description
   */
  options_description configLogging();
}  // namespace sr::config

OUTCOME_HPP_DECLARE_ERROR(sr::config, ConfigError);
