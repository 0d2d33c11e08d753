/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "stake/rate_limited_change.hpp"

#include "math/streaming.hpp"

namespace sr::stake {
  StakeAmount rateLimitedStakeChange(
      ChainEpoch epoch,
      StakeAmount account_portion,
      StakeAmount cluster_portion,
      StakeAmount cluster_effective,
      const boost::optional<ChainEpoch> &new_rate_activation_epoch) {
    if (account_portion == 0 || cluster_portion == 0 || cluster_effective == 0) {
      return 0;
    }
    const auto rate_bps{
        warmupCooldownRateBps(epoch, new_rate_activation_epoch)};

    // q1 * rate_bps <= account_portion for every q1 <= q_cap
    const auto q_cap{account_portion / rate_bps};
    const auto q1{math::mulDivCapped(
        account_portion, cluster_effective, cluster_portion, q_cap)};
    if (!q1) {
      return account_portion;
    }

    const auto total{math::mulCap(q1->quotient, rate_bps, account_portion)};
    if (total >= account_portion) {
      return account_portion;
    }

    // floor(rem * rate_bps / (cluster_portion * 10000))
    const auto correction{
        math::remainderMulDiv(q1->remainder, rate_bps, cluster_portion)};
    if (correction >= account_portion - total) {
      return account_portion;
    }
    return total + correction;
  }
}  // namespace sr::stake
