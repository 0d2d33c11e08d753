/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "stake/impl/streaming_calculator.hpp"

#include "stake/rate_limited_change.hpp"

namespace sr::stake {
  StakeAmount StreamingCalculator::rateLimitedStakeChange(
      ChainEpoch epoch,
      StakeAmount account_portion,
      StakeAmount cluster_portion,
      StakeAmount cluster_effective,
      const boost::optional<ChainEpoch> &new_rate_activation_epoch) const {
    return stake::rateLimitedStakeChange(epoch,
                                         account_portion,
                                         cluster_portion,
                                         cluster_effective,
                                         new_rate_activation_epoch);
  }
}  // namespace sr::stake
