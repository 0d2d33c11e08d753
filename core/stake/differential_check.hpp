/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <random>
#include <vector>

#include "common/outcome.hpp"
#include "stake/stake_calculator.hpp"

namespace sr::stake {

  enum class CheckError {
    EMPTY_SAMPLE = 1,
    RANGE_OVERFLOW,
  };

  /// Inputs of one formula evaluation
  struct FormulaSample {
    ChainEpoch epoch{};
    StakeAmount account_portion{};
    StakeAmount cluster_portion{};
    StakeAmount cluster_effective{};
    boost::optional<ChainEpoch> new_rate_activation_epoch;
  };

  /**
   * Full width formula inputs with random magnitudes, so that small, large
   * and saturating values are all frequent
   */
  FormulaSample randomFormulaSample(std::mt19937_64 &rng);

  /**
   * Compares two stake calculators on the entrypoint probe and on raw formula
   * inputs
   */
  class DifferentialCheck {
   public:
    struct Config {
      /// first entrypoint argument of linear range
      uint64_t start{};
      /// length of linear range
      uint64_t count{};
      /// number of random full width formula samples
      uint64_t random_samples{};
      uint64_t seed{};
      /// mismatches kept in report, all are counted
      size_t max_mismatches{16};
    };

    enum class Probe {
      kEntrypoint,
      kFormula,
    };

    struct Mismatch {
      Probe probe{};
      /// entrypoint argument, zero for formula probe
      uint64_t arg{};
      /// formula inputs, for formula probe
      FormulaSample sample;
      uint64_t expected{};
      uint64_t actual{};
    };

    struct Report {
      uint64_t checked{};
      uint64_t mismatch_count{};
      std::vector<Mismatch> mismatches;
    };

    DifferentialCheck(std::shared_ptr<StakeCalculator> expected,
                      std::shared_ptr<StakeCalculator> actual);

    static outcome::result<void> validate(const Config &config);

    /**
     * @brief Runs linear entrypoint range, then random formula samples
     * @return report or config validation error
     */
    outcome::result<Report> run(const Config &config) const;

   private:
    void record(Report &report,
                size_t max_mismatches,
                Mismatch mismatch) const;

    std::shared_ptr<StakeCalculator> expected_;
    std::shared_ptr<StakeCalculator> actual_;
  };

}  // namespace sr::stake

OUTCOME_HPP_DECLARE_ERROR(sr::stake, CheckError);
