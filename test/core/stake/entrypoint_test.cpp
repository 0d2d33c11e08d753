/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "stake/entrypoint.hpp"

#include <gtest/gtest.h>

#include "stake/calculator_kind.hpp"
#include "testutil/mocks/stake/stake_calculator_mock.hpp"

namespace sr::stake {
  using testing::Eq;
  using testing::Return;

  TEST(Entrypoint, PackSmallest) {
    const auto inputs{packEntrypointInputs(0)};
    EXPECT_EQ(inputs.epoch, 0);
    EXPECT_EQ(inputs.activating_stake, 1);
    EXPECT_EQ(inputs.deactivating_stake, 1);
    EXPECT_EQ(inputs.cluster_state, (StakeHistoryEntry{2, 1, 1}));
    EXPECT_EQ(inputs.activation_rate_epoch, 0);
    EXPECT_EQ(inputs.deactivation_rate_epoch, 0);
  }

  /**
   * @given argument with account bits 5 and cluster bits 3
   * @when packing inputs
   * @then both are offset by one, high bits only affect epochs
   */
  TEST(Entrypoint, PackFields) {
    const uint64_t arg{0x700030005};
    const auto inputs{packEntrypointInputs(arg)};
    EXPECT_EQ(inputs.epoch, arg);
    EXPECT_EQ(inputs.activating_stake, 6);
    EXPECT_EQ(inputs.deactivating_stake, 4);
    EXPECT_EQ(inputs.cluster_state, (StakeHistoryEntry{8, 4, 3}));
    EXPECT_EQ(inputs.activation_rate_epoch, arg / 3);
    EXPECT_EQ(inputs.deactivation_rate_epoch, arg / 5);
  }

  /**
   * @given calculator mock
   * @when calling entrypoint
   * @then activation and deactivation allowances are requested with packed
   * inputs and combined with xor
   */
  TEST(Entrypoint, XorOfAllowances) {
    const uint64_t arg{0x700030005};
    StakeCalculatorMock calculator;
    EXPECT_CALL(calculator,
                rateLimitedStakeChange(
                    arg, 6, 4, 8, Eq(boost::optional<ChainEpoch>{arg / 3})))
        .WillOnce(Return(0b1100));
    EXPECT_CALL(calculator,
                rateLimitedStakeChange(
                    arg, 4, 3, 8, Eq(boost::optional<ChainEpoch>{arg / 5})))
        .WillOnce(Return(0b1010));
    EXPECT_EQ(entrypoint(calculator, arg), 0b0110);
  }

  /**
   * @given arguments with known allowances
   * @when calling entrypoint with every backend
   * @then expected xor returned
   */
  TEST(Entrypoint, KnownValues) {
    const std::vector<std::pair<uint64_t, uint64_t>> cases{
        {0, 0},
        {5, 1},
        {40000, 4656},
        {123456789, 10},
        {0x12345678, 31},
        {0xabcd00001234, 741},
        {0xffffffff, 0},
    };
    for (const auto kind : allCalculatorKinds()) {
      const auto calculator{makeCalculator(kind)};
      for (const auto &[arg, expected] : cases) {
        EXPECT_EQ(entrypoint(*calculator, arg), expected)
            << calculatorName(kind) << " arg=" << arg;
      }
    }
  }
}  // namespace sr::stake
