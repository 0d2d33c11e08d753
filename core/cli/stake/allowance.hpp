/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "cli/stake/stake.hpp"
#include "stake/stake_calculator.hpp"

namespace sr::cli::_stake {
  using primitives::StakeHistoryEntry;

  /// Account stake and previous epoch cluster totals
  struct AllowanceArgs {
    FormulaArgs formula;
    CLI_OPTIONAL("stake", "stake of account pending change", StakeAmount)
    stake;
    CLI_DEFAULT("activating", "activating stake of cluster", StakeAmount, {0})
    activating;
    CLI_DEFAULT(
        "deactivating", "deactivating stake of cluster", StakeAmount, {0})
    deactivating;
    CLI_OPTIONAL("effective", "effective stake of cluster", StakeAmount)
    effective;

    CLI_OPTS() {
      Opts opts;
      formula.add(opts);
      stake(opts);
      activating(opts);
      deactivating(opts);
      effective(opts);
      return opts;
    }

    StakeHistoryEntry clusterState() const {
      StakeHistoryEntry entry;
      entry.effective = *effective;
      entry.activating = *activating;
      entry.deactivating = *deactivating;
      return entry;
    }
  };

  struct Stake_allowance_activation {
    using Args = AllowanceArgs;
    CLI_RUN() {
      const auto calculator{stake::makeCalculator(*args.formula.backend)};
      fmt::print("{}\n",
                 stake::calculateActivationAllowance(
                     *calculator,
                     *args.formula.epoch,
                     *args.stake,
                     args.clusterState(),
                     args.formula.activationEpoch()));
    }
  };

  struct Stake_allowance_deactivation {
    using Args = AllowanceArgs;
    CLI_RUN() {
      const auto calculator{stake::makeCalculator(*args.formula.backend)};
      fmt::print("{}\n",
                 stake::calculateDeactivationAllowance(
                     *calculator,
                     *args.formula.epoch,
                     *args.stake,
                     args.clusterState(),
                     args.formula.activationEpoch()));
    }
  };
}  // namespace sr::cli::_stake
