/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "cli/stake/stake.hpp"
#include "stake/differential_check.hpp"

namespace sr::cli::_stake {
  using stake::DifferentialCheck;

  struct Stake_check {
    struct Args {
      CLI_DEFAULT("start", "first entrypoint argument", uint64_t, {0}) start;
      CLI_DEFAULT("count", "entrypoint arguments to check", uint64_t, {65536})
      count;
      CLI_DEFAULT("random", "random formula samples to check", uint64_t, {0})
      random;
      CLI_DEFAULT("seed", "seed of random samples", uint64_t, {0}) seed;
      CLI_DEFAULT("max-mismatches", "mismatches to print", size_t, {16})
      max_mismatches;
      CLI_DEFAULT("expected",
                  "reference backend",
                  CalculatorKind,
                  {CalculatorKind::kBigInt})
      expected;
      CLI_DEFAULT("actual",
                  "backend under test",
                  CalculatorKind,
                  {CalculatorKind::kStreaming})
      actual;

      CLI_OPTS() {
        Opts opts;
        start(opts);
        count(opts);
        random(opts);
        seed(opts);
        max_mismatches(opts);
        expected(opts);
        actual(opts);
        return opts;
      }
    };
    CLI_RUN() {
      DifferentialCheck::Config config;
      config.start = *args.start;
      config.count = *args.count;
      config.random_samples = *args.random;
      config.seed = *args.seed;
      config.max_mismatches = *args.max_mismatches;

      const DifferentialCheck check{stake::makeCalculator(*args.expected),
                                    stake::makeCalculator(*args.actual)};
      const auto report{cliTry(check.run(config), "differential check")};
      for (const auto &mismatch : report.mismatches) {
        if (mismatch.probe == DifferentialCheck::Probe::kEntrypoint) {
          fmt::print("entrypoint arg={} expected={} actual={}\n",
                     mismatch.arg,
                     mismatch.expected,
                     mismatch.actual);
        } else {
          const auto &sample{mismatch.sample};
          fmt::print(
              "formula epoch={} account={} cluster={} effective={} "
              "activation_epoch={} expected={} actual={}\n",
              sample.epoch,
              sample.account_portion,
              sample.cluster_portion,
              sample.cluster_effective,
              sample.new_rate_activation_epoch
                  ? std::to_string(*sample.new_rate_activation_epoch)
                  : "none",
              mismatch.expected,
              mismatch.actual);
        }
      }
      fmt::print("{} {} vs {}: checked {}, mismatches {}\n",
                 report.mismatch_count == 0 ? "OK" : "FAIL",
                 stake::calculatorName(*args.actual),
                 stake::calculatorName(*args.expected),
                 report.checked,
                 report.mismatch_count);
      if (report.mismatch_count != 0) {
        throw CliError{"{} mismatches found", report.mismatch_count};
      }
    }
  };
}  // namespace sr::cli::_stake
