/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "stake/stake_calculator.hpp"

namespace sr::stake {
  /**
   * Calculator on 128 bit integers.
   * Two factor product and modulus fit 128 bits, rate is applied to quotient
   * and remainder separately.
   */
  class WideCalculator : public StakeCalculator {
   public:
    StakeAmount rateLimitedStakeChange(
        ChainEpoch epoch,
        StakeAmount account_portion,
        StakeAmount cluster_portion,
        StakeAmount cluster_effective,
        const boost::optional<ChainEpoch> &new_rate_activation_epoch)
        const override;
  };
}  // namespace sr::stake
