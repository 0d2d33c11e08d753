/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "cli/stake/stake.hpp"
#include "stake/entrypoint.hpp"

namespace sr::cli::_stake {
  struct Stake_entrypoint {
    struct Args {
      CLI_DEFAULT("backend",
                  "arithmetic backend: streaming, fixed, bigint, wide",
                  CalculatorKind,
                  {CalculatorKind::kStreaming})
      backend;

      CLI_OPTS() {
        Opts opts;
        backend(opts);
        return opts;
      }
    };
    CLI_RUN() {
      const auto arg{cliArgv<uint64_t>(argv, 0, "arg")};
      const auto calculator{stake::makeCalculator(*args.backend)};
      fmt::print("{}\n", stake::entrypoint(*calculator, arg));
    }
  };
}  // namespace sr::cli::_stake
