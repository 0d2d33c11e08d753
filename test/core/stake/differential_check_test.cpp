/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "stake/differential_check.hpp"

#include <gtest/gtest.h>
#include <limits>

#include "stake/calculator_kind.hpp"
#include "testutil/mocks/stake/stake_calculator_mock.hpp"
#include "testutil/outcome.hpp"

namespace sr::stake {
  using testing::_;
  using testing::NiceMock;
  using testing::Return;

  class DifferentialCheckTest : public ::testing::Test {
   public:
    DifferentialCheck::Config config;
    std::shared_ptr<StakeCalculator> streaming{
        makeCalculator(CalculatorKind::kStreaming)};
    std::shared_ptr<StakeCalculator> big_int{
        makeCalculator(CalculatorKind::kBigInt)};
  };

  TEST_F(DifferentialCheckTest, EmptySample) {
    EXPECT_OUTCOME_ERROR(CheckError::EMPTY_SAMPLE,
                         DifferentialCheck::validate(config));
    const DifferentialCheck check{big_int, streaming};
    EXPECT_OUTCOME_ERROR(CheckError::EMPTY_SAMPLE, check.run(config));
  }

  TEST_F(DifferentialCheckTest, RangeOverflow) {
    config.start = std::numeric_limits<uint64_t>::max();
    config.count = 2;
    EXPECT_OUTCOME_ERROR(CheckError::RANGE_OVERFLOW,
                         DifferentialCheck::validate(config));
    config.count = 1;
    EXPECT_OUTCOME_TRUE_1(DifferentialCheck::validate(config));
  }

  /**
   * @given every backend compared with arbitrary precision one
   * @when checking entrypoint range and random formula samples
   * @then no mismatches
   */
  TEST_F(DifferentialCheckTest, BackendsAgree) {
    config.start = 0x12340000;
    config.count = 4096;
    config.random_samples = 4096;
    config.seed = 5;
    for (const auto kind : allCalculatorKinds()) {
      const DifferentialCheck check{big_int, makeCalculator(kind)};
      EXPECT_OUTCOME_TRUE(report, check.run(config));
      EXPECT_EQ(report.checked, 8192);
      EXPECT_EQ(report.mismatch_count, 0) << calculatorName(kind);
      EXPECT_TRUE(report.mismatches.empty());
    }
  }

  /**
   * @given calculator always returning zero
   * @when checking first 100 entrypoint arguments
   * @then every argument with nonzero allowance is a mismatch, only first
   * ones are kept
   */
  TEST_F(DifferentialCheckTest, MismatchesReported) {
    auto broken{std::make_shared<NiceMock<StakeCalculatorMock>>()};
    ON_CALL(*broken, rateLimitedStakeChange(_, _, _, _, _))
        .WillByDefault(Return(0));
    config.count = 100;
    config.max_mismatches = 4;

    const DifferentialCheck check{streaming, broken};
    EXPECT_OUTCOME_TRUE(report, check.run(config));
    EXPECT_EQ(report.checked, 100);
    EXPECT_EQ(report.mismatch_count, 93);
    ASSERT_EQ(report.mismatches.size(), 4);
    const auto &first{report.mismatches.front()};
    EXPECT_EQ(first.probe, DifferentialCheck::Probe::kEntrypoint);
    EXPECT_EQ(first.expected, entrypoint(*streaming, first.arg));
    EXPECT_EQ(first.actual, 0);
  }

  /**
   * @given calculator always returning zero
   * @when checking random formula samples only
   * @then mismatches carry formula inputs
   */
  TEST_F(DifferentialCheckTest, FormulaMismatch) {
    auto broken{std::make_shared<NiceMock<StakeCalculatorMock>>()};
    config.random_samples = 1000;
    config.seed = 3;

    const DifferentialCheck check{streaming, broken};
    EXPECT_OUTCOME_TRUE(report, check.run(config));
    EXPECT_EQ(report.checked, 1000);
    ASSERT_FALSE(report.mismatches.empty());
    for (const auto &mismatch : report.mismatches) {
      EXPECT_EQ(mismatch.probe, DifferentialCheck::Probe::kFormula);
      EXPECT_EQ(mismatch.arg, 0);
      const auto &sample{mismatch.sample};
      EXPECT_EQ(mismatch.expected,
                streaming->rateLimitedStakeChange(
                    sample.epoch,
                    sample.account_portion,
                    sample.cluster_portion,
                    sample.cluster_effective,
                    sample.new_rate_activation_epoch));
      EXPECT_NE(mismatch.expected, 0);
    }
  }
}  // namespace sr::stake
