/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/logger.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace sr::common {
  namespace {
    constexpr auto kPattern{"%Y-%m-%d %H:%M:%S.%e %n %^%l%$ %v"};

    std::mutex &loggerMutex() {
      static std::mutex mutex;
      return mutex;
    }
  }  // namespace

  Logger createLogger(const std::string &tag) {
    std::lock_guard lock{loggerMutex()};
    auto logger{spdlog::get(tag)};
    if (logger == nullptr) {
      logger = spdlog::stderr_color_mt(tag);
      logger->set_pattern(kPattern);
      logger->set_level(spdlog::get_level());
    }
    return logger;
  }

  void setLogLevel(spdlog::level::level_enum level) {
    std::lock_guard lock{loggerMutex()};
    spdlog::set_level(level);
  }
}  // namespace sr::common
