/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "stake/differential_check.hpp"

#include <limits>

#include "common/logger.hpp"
#include "stake/entrypoint.hpp"

namespace sr::stake {
  namespace {
    auto log() {
      static common::Logger logger = common::createLogger("differential");
      return logger.get();
    }

    uint64_t randomMagnitude(std::mt19937_64 &rng) {
      const auto shift{rng() % 64};
      return rng() >> shift;
    }

    uint64_t evaluate(const StakeCalculator &calculator,
                      const FormulaSample &sample) {
      return calculator.rateLimitedStakeChange(sample.epoch,
                                               sample.account_portion,
                                               sample.cluster_portion,
                                               sample.cluster_effective,
                                               sample.new_rate_activation_epoch);
    }
  }  // namespace

  FormulaSample randomFormulaSample(std::mt19937_64 &rng) {
    FormulaSample sample;
    sample.epoch = randomMagnitude(rng);
    sample.account_portion = randomMagnitude(rng);
    sample.cluster_portion = randomMagnitude(rng);
    sample.cluster_effective = randomMagnitude(rng);
    if (rng() % 3 != 0) {
      sample.new_rate_activation_epoch = randomMagnitude(rng);
    }
    return sample;
  }

  DifferentialCheck::DifferentialCheck(
      std::shared_ptr<StakeCalculator> expected,
      std::shared_ptr<StakeCalculator> actual)
      : expected_{std::move(expected)}, actual_{std::move(actual)} {}

  outcome::result<void> DifferentialCheck::validate(const Config &config) {
    if (config.count == 0 && config.random_samples == 0) {
      return CheckError::EMPTY_SAMPLE;
    }
    if (config.count != 0
        && config.start > std::numeric_limits<uint64_t>::max()
                              - (config.count - 1)) {
      return CheckError::RANGE_OVERFLOW;
    }
    return outcome::success();
  }

  outcome::result<DifferentialCheck::Report> DifferentialCheck::run(
      const Config &config) const {
    OUTCOME_TRY(validate(config));

    Report report;
    for (uint64_t i = 0; i < config.count; ++i) {
      const auto arg{config.start + i};
      Mismatch mismatch;
      mismatch.probe = Probe::kEntrypoint;
      mismatch.arg = arg;
      mismatch.expected = entrypoint(*expected_, arg);
      mismatch.actual = entrypoint(*actual_, arg);
      ++report.checked;
      if (mismatch.expected != mismatch.actual) {
        record(report, config.max_mismatches, std::move(mismatch));
      }
    }

    std::mt19937_64 rng{config.seed};
    for (uint64_t i = 0; i < config.random_samples; ++i) {
      Mismatch mismatch;
      mismatch.probe = Probe::kFormula;
      mismatch.sample = randomFormulaSample(rng);
      mismatch.expected = evaluate(*expected_, mismatch.sample);
      mismatch.actual = evaluate(*actual_, mismatch.sample);
      ++report.checked;
      if (mismatch.expected != mismatch.actual) {
        record(report, config.max_mismatches, std::move(mismatch));
      }
    }

    log()->info("checked {} samples, {} mismatches",
                report.checked,
                report.mismatch_count);
    return report;
  }

  void DifferentialCheck::record(Report &report,
                                 size_t max_mismatches,
                                 Mismatch mismatch) const {
    ++report.mismatch_count;
    if (mismatch.probe == Probe::kEntrypoint) {
      log()->warn("entrypoint mismatch, arg={}, expected={}, actual={}",
                  mismatch.arg,
                  mismatch.expected,
                  mismatch.actual);
    } else {
      const auto &sample{mismatch.sample};
      log()->warn(
          "formula mismatch, epoch={}, account={}, cluster={}, effective={}, "
          "expected={}, actual={}",
          sample.epoch,
          sample.account_portion,
          sample.cluster_portion,
          sample.cluster_effective,
          mismatch.expected,
          mismatch.actual);
    }
    if (report.mismatches.size() < max_mismatches) {
      report.mismatches.push_back(std::move(mismatch));
    }
  }
}  // namespace sr::stake

OUTCOME_CPP_DEFINE_CATEGORY(sr::stake, CheckError, e) {
  using sr::stake::CheckError;
  switch (e) {
    case CheckError::EMPTY_SAMPLE:
      return "Differential check: nothing to check";
    case CheckError::RANGE_OVERFLOW:
      return "Differential check: entrypoint range exceeds 64 bits";
    default:
      return "Differential check: unknown error";
  }
}
