/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "primitives/big_int.hpp"
#include "stake/warmup_cooldown.hpp"

namespace sr::stake::detail {
  using primitives::StakeAmount;

  /**
   * Rate limited stake change with full numerator formed in `Wide`.
   * `Wide` must hold 2^64 * 2^64 * 10000.
   */
  template <typename Wide>
  StakeAmount wideRateLimitedStakeChange(
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

    const Wide numerator{Wide{account_portion} * cluster_effective * rate_bps};
    const Wide denominator{Wide{cluster_portion}
                           * primitives::kBasisPointsPerUnit};
    const Wide delta{numerator / denominator};
    if (delta > account_portion) {
      return account_portion;
    }
    return delta.template convert_to<StakeAmount>();
  }
}  // namespace sr::stake::detail
