/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "stake/rate_limited_change.hpp"

#include <gtest/gtest.h>
#include <limits>

namespace sr::stake {
  constexpr auto kMax{std::numeric_limits<uint64_t>::max()};

  TEST(WarmupCooldownRate, Schedule) {
    EXPECT_EQ(warmupCooldownRateBps(0, boost::none),
              kOriginalWarmupCooldownRateBps);
    EXPECT_EQ(warmupCooldownRateBps(kMax, boost::none),
              kOriginalWarmupCooldownRateBps);
    EXPECT_EQ(warmupCooldownRateBps(9, ChainEpoch{10}),
              kOriginalWarmupCooldownRateBps);
    EXPECT_EQ(warmupCooldownRateBps(10, ChainEpoch{10}),
              kTowerWarmupCooldownRateBps);
    EXPECT_EQ(warmupCooldownRateBps(11, ChainEpoch{0}),
              kTowerWarmupCooldownRateBps);
  }

  /**
   * @given account of 100000, cluster of 50000, effective 100000
   * @when epoch is before reduced rate activation
   * @then quarter of effective stake scaled by account share is allowed
   */
  TEST(RateLimitedStakeChange, OriginalRate) {
    EXPECT_EQ(rateLimitedStakeChange(0, 100000, 50000, 100000, boost::none),
              50000);
    EXPECT_EQ(rateLimitedStakeChange(9, 100000, 50000, 100000, ChainEpoch{10}),
              50000);
  }

  TEST(RateLimitedStakeChange, ReducedRate) {
    EXPECT_EQ(
        rateLimitedStakeChange(10, 100000, 50000, 100000, ChainEpoch{10}),
        18000);
  }

  TEST(RateLimitedStakeChange, ZeroPortion) {
    EXPECT_EQ(rateLimitedStakeChange(0, 0, 50000, 100000, boost::none), 0);
    EXPECT_EQ(rateLimitedStakeChange(0, 100000, 0, 100000, boost::none), 0);
    EXPECT_EQ(rateLimitedStakeChange(0, 100000, 50000, 0, boost::none), 0);
  }

  /**
   * @given product of account and effective stake below modulus
   * @when computing change
   * @then whole result comes from remainder correction
   */
  TEST(RateLimitedStakeChange, RemainderCorrection) {
    // floor(7 * 11 * 2500 / 30000) = 6
    EXPECT_EQ(rateLimitedStakeChange(0, 7, 3, 11, boost::none), 6);
  }

  /**
   * @given effective stake much larger than cluster portion
   * @when computing change
   * @then result clamped to account portion
   */
  TEST(RateLimitedStakeChange, ClampToAccount) {
    EXPECT_EQ(rateLimitedStakeChange(0, 10, 1, 1000000, boost::none), 10);
    EXPECT_EQ(rateLimitedStakeChange(0, 1, 1, kMax, boost::none), 1);
    EXPECT_EQ(rateLimitedStakeChange(0, kMax, 1, kMax, boost::none), kMax);
  }

  /**
   * @given largest portions
   * @when cluster portion equals effective stake
   * @then rate share of account is allowed without overflow
   */
  TEST(RateLimitedStakeChange, LargestValues) {
    EXPECT_EQ(rateLimitedStakeChange(0, kMax, kMax, kMax, boost::none),
              kMax / 4);
    EXPECT_EQ(rateLimitedStakeChange(0, kMax, kMax, kMax, ChainEpoch{0}),
              1660206966633859645ull);
  }
}  // namespace sr::stake
