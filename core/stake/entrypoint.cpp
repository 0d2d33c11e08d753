/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "stake/entrypoint.hpp"

#include <algorithm>

namespace sr::stake {
  constexpr uint64_t kLow16Mask{0xffff};

  EntrypointInputs packEntrypointInputs(uint64_t arg) {
    const StakeAmount account_stake{(arg & kLow16Mask) + 1};
    const StakeAmount cluster_share{((arg >> 16) & kLow16Mask) + 1};

    EntrypointInputs inputs;
    inputs.epoch = arg;
    inputs.cluster_state.activating = cluster_share;
    inputs.cluster_state.deactivating = cluster_share / 2 + 1;
    inputs.cluster_state.effective =
        std::max<StakeAmount>(cluster_share << 1, 1);
    inputs.activating_stake = account_stake;
    inputs.activation_rate_epoch = arg / 3;
    inputs.deactivating_stake = account_stake / 2 + 1;
    inputs.deactivation_rate_epoch = arg / 5;
    return inputs;
  }

  uint64_t entrypoint(const StakeCalculator &calculator, uint64_t arg) {
    const auto inputs{packEntrypointInputs(arg)};
    const auto activation{
        calculateActivationAllowance(calculator,
                                     inputs.epoch,
                                     inputs.activating_stake,
                                     inputs.cluster_state,
                                     inputs.activation_rate_epoch)};
    const auto deactivation{
        calculateDeactivationAllowance(calculator,
                                       inputs.epoch,
                                       inputs.deactivating_stake,
                                       inputs.cluster_state,
                                       inputs.deactivation_rate_epoch)};
    return activation ^ deactivation;
  }
}  // namespace sr::stake
