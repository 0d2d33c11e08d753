/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "stake/stake_calculator.hpp"

namespace sr::stake {

  /**
   * Synthetic activation and deactivation requests derived from one 64 bit
   * value
   */
  struct EntrypointInputs {
    ChainEpoch epoch{};
    StakeHistoryEntry cluster_state;
    StakeAmount activating_stake{};
    ChainEpoch activation_rate_epoch{};
    StakeAmount deactivating_stake{};
    ChainEpoch deactivation_rate_epoch{};
  };

  /**
   * Account stake is taken from bits 0..15, cluster share from bits 16..31,
   * both offset by one. Reduced rate activates at arg / 3 for activation and
   * at arg / 5 for deactivation.
   */
  EntrypointInputs packEntrypointInputs(uint64_t arg);

  /**
   * @brief Differential test probe
   * @return activation allowance xor deactivation allowance for inputs
   * derived from `arg`
   */
  uint64_t entrypoint(const StakeCalculator &calculator, uint64_t arg);

}  // namespace sr::stake
