/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <fmt/format.h>

#include "cli/cli.hpp"
#include "cli/validate/calculator_kind.hpp"
#include "config/logging_config.hpp"
#include "stake/calculator_kind.hpp"

namespace sr::cli::_stake {
  using primitives::ChainEpoch;
  using primitives::StakeAmount;
  using stake::CalculatorKind;

  constexpr auto kVersion{"0.1.0"};

  struct Stake {
    struct Args {
      bool version{};

      CLI_OPTS() {
        Opts opts;
        auto opt{opts.add_options()};
        opt("version,v", po::bool_switch(&version), "print version");
        opts.add(config::configLogging());
        return opts;
      }
    };
    CLI_RUN() {
      if (args.version) {
        fmt::print("{}\n", kVersion);
        return;
      }
      throw ShowHelp{};
    }
  };

  /// Options shared by commands evaluating formula
  struct FormulaArgs {
    CLI_DEFAULT("epoch", "current epoch", ChainEpoch, {0}) epoch;
    CLI_OPTIONAL("activation-epoch",
                 "first epoch of reduced warmup/cooldown rate",
                 ChainEpoch)
    activation_epoch;
    CLI_DEFAULT("backend",
                "arithmetic backend: streaming, fixed, bigint, wide",
                CalculatorKind,
                {CalculatorKind::kStreaming})
    backend;

    void add(Opts &opts) {
      epoch(opts);
      activation_epoch(opts);
      backend(opts);
    }

    boost::optional<ChainEpoch> activationEpoch() const {
      return activation_epoch.v;
    }
  };
}  // namespace sr::cli::_stake
