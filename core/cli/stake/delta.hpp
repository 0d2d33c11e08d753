/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "cli/stake/stake.hpp"
#include "stake/stake_calculator.hpp"

namespace sr::cli::_stake {
  struct Stake_delta {
    struct Args {
      FormulaArgs formula;
      CLI_OPTIONAL("account", "stake of account pending change", StakeAmount)
      account;
      CLI_OPTIONAL("cluster", "stake of cluster pending change", StakeAmount)
      cluster;
      CLI_OPTIONAL("effective", "effective stake of cluster", StakeAmount)
      effective;

      CLI_OPTS() {
        Opts opts;
        formula.add(opts);
        account(opts);
        cluster(opts);
        effective(opts);
        return opts;
      }
    };
    CLI_RUN() {
      const auto calculator{stake::makeCalculator(*args.formula.backend)};
      fmt::print("{}\n",
                 calculator->rateLimitedStakeChange(
                     *args.formula.epoch,
                     *args.account,
                     *args.cluster,
                     *args.effective,
                     args.formula.activationEpoch()));
    }
  };
}  // namespace sr::cli::_stake
