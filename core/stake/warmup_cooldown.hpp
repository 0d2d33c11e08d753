/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/optional.hpp>

#include "primitives/types.hpp"

namespace sr::stake {
  using primitives::BasisPoints;
  using primitives::ChainEpoch;

  /// 25% of effective cluster stake per epoch
  constexpr BasisPoints kOriginalWarmupCooldownRateBps{2500};

  /// 9% of effective cluster stake per epoch
  constexpr BasisPoints kTowerWarmupCooldownRateBps{900};

  /**
   * Warmup and cooldown rate in effect at `epoch`
   * @param new_rate_activation_epoch - first epoch of reduced rate, none if
   * reduced rate is not scheduled
   */
  inline BasisPoints warmupCooldownRateBps(
      ChainEpoch epoch,
      const boost::optional<ChainEpoch> &new_rate_activation_epoch) {
    if (!new_rate_activation_epoch || epoch < *new_rate_activation_epoch) {
      return kOriginalWarmupCooldownRateBps;
    }
    return kTowerWarmupCooldownRateBps;
  }
}  // namespace sr::stake
