/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "stake/warmup_cooldown.hpp"

namespace sr::stake {
  using primitives::StakeAmount;
  using primitives::StakeHistoryEntry;

  /**
   * @interface Evaluates rate limited stake change formula.
   * Implementations differ only in arithmetic used and must agree on every
   * input.
   */
  class StakeCalculator {
   public:
    virtual ~StakeCalculator() = default;

    /**
     * @brief floor(account_portion * cluster_effective * rate_bps
     * / (cluster_portion * 10000)) clamped to account_portion
     * @return 0 if any of portions is 0
     */
    virtual StakeAmount rateLimitedStakeChange(
        ChainEpoch epoch,
        StakeAmount account_portion,
        StakeAmount cluster_portion,
        StakeAmount cluster_effective,
        const boost::optional<ChainEpoch> &new_rate_activation_epoch)
        const = 0;
  };

  /**
   * Stake of account allowed to become effective in `current_epoch`
   * @param prev_epoch_cluster_state - cluster totals of previous epoch
   */
  StakeAmount calculateActivationAllowance(
      const StakeCalculator &calculator,
      ChainEpoch current_epoch,
      StakeAmount account_activating_stake,
      const StakeHistoryEntry &prev_epoch_cluster_state,
      const boost::optional<ChainEpoch> &new_rate_activation_epoch);

  /**
   * Stake of account allowed to cool down in `current_epoch`
   * @param prev_epoch_cluster_state - cluster totals of previous epoch
   */
  StakeAmount calculateDeactivationAllowance(
      const StakeCalculator &calculator,
      ChainEpoch current_epoch,
      StakeAmount account_deactivating_stake,
      const StakeHistoryEntry &prev_epoch_cluster_state,
      const boost::optional<ChainEpoch> &new_rate_activation_epoch);
}  // namespace sr::stake
