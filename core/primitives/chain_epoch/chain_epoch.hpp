/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

namespace sr::primitives {

  /**
   * @brief epoch index type represents a round of a proof-of-stake protocol,
   * stake warmup and cooldown are rate limited per epoch
   */
  using ChainEpoch = uint64_t;

}  // namespace sr::primitives
