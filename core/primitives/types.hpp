/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include "primitives/chain_epoch/chain_epoch.hpp"

namespace sr::primitives {
  /// Amount of stake in the smallest indivisible unit
  using StakeAmount = uint64_t;

  /// Rate expressed in 1/10000 of a unit
  using BasisPoints = uint64_t;

  constexpr BasisPoints kBasisPointsPerUnit{10000};

  /**
   * Cluster-wide stake totals recorded for one epoch
   */
  struct StakeHistoryEntry {
    /// stake that became effective
    StakeAmount effective{};
    /// stake requested to warm up
    StakeAmount activating{};
    /// stake requested to cool down
    StakeAmount deactivating{};
  };

  inline bool operator==(const StakeHistoryEntry &lhs,
                         const StakeHistoryEntry &rhs) {
    return lhs.effective == rhs.effective && lhs.activating == rhs.activating
           && lhs.deactivating == rhs.deactivating;
  }
}  // namespace sr::primitives
