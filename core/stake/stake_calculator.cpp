/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "stake/stake_calculator.hpp"

namespace sr::stake {
  StakeAmount calculateActivationAllowance(
      const StakeCalculator &calculator,
      ChainEpoch current_epoch,
      StakeAmount account_activating_stake,
      const StakeHistoryEntry &prev_epoch_cluster_state,
      const boost::optional<ChainEpoch> &new_rate_activation_epoch) {
    return calculator.rateLimitedStakeChange(
        current_epoch,
        account_activating_stake,
        prev_epoch_cluster_state.activating,
        prev_epoch_cluster_state.effective,
        new_rate_activation_epoch);
  }

  StakeAmount calculateDeactivationAllowance(
      const StakeCalculator &calculator,
      ChainEpoch current_epoch,
      StakeAmount account_deactivating_stake,
      const StakeHistoryEntry &prev_epoch_cluster_state,
      const boost::optional<ChainEpoch> &new_rate_activation_epoch) {
    return calculator.rateLimitedStakeChange(
        current_epoch,
        account_deactivating_stake,
        prev_epoch_cluster_state.deactivating,
        prev_epoch_cluster_state.effective,
        new_rate_activation_epoch);
  }
}  // namespace sr::stake
