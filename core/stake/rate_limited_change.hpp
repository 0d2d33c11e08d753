/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "stake/warmup_cooldown.hpp"

namespace sr::stake {
  using primitives::StakeAmount;

  /**
   * Amount of stake allowed to change during one epoch:
   * floor(account_portion * cluster_effective * rate_bps
   *       / (cluster_portion * 10000)),
   * clamped to account_portion.
   * Evaluated with 64 bit arithmetic only.
   * @param epoch - current epoch, selects rate
   * @param account_portion - stake of account pending change
   * @param cluster_portion - stake of cluster pending change
   * @param cluster_effective - effective stake of cluster
   * @param new_rate_activation_epoch - first epoch of reduced rate
   * @return allowed change, 0 if any of portions is 0
   */
  StakeAmount rateLimitedStakeChange(
      ChainEpoch epoch,
      StakeAmount account_portion,
      StakeAmount cluster_portion,
      StakeAmount cluster_effective,
      const boost::optional<ChainEpoch> &new_rate_activation_epoch);
}  // namespace sr::stake
