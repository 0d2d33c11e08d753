/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "stake/impl/fixed_width_calculator.hpp"

#include "stake/impl/wide_int_formula.hpp"

namespace sr::stake {
  StakeAmount FixedWidthCalculator::rateLimitedStakeChange(
      ChainEpoch epoch,
      StakeAmount account_portion,
      StakeAmount cluster_portion,
      StakeAmount cluster_effective,
      const boost::optional<ChainEpoch> &new_rate_activation_epoch) const {
    return detail::wideRateLimitedStakeChange<primitives::UInt256>(
        epoch,
        account_portion,
        cluster_portion,
        cluster_effective,
        new_rate_activation_epoch);
  }
}  // namespace sr::stake
