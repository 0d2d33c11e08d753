/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/optional.hpp>

#include "math/base_10k.hpp"

/**
 * Multiplication and division with only 64 bit state.
 * Loops are bounded by 64 iterations, no heap allocation, no recursion.
 */
namespace sr::math {

  /**
   * Result of floor(a * b / (cp * 10000))
   */
  struct MulDivResult {
    uint64_t quotient{};
    /// exact remainder, less than cp * 10000
    Base10k remainder;
  };

  inline bool operator==(const MulDivResult &lhs, const MulDivResult &rhs) {
    return lhs.quotient == rhs.quotient && lhs.remainder == rhs.remainder;
  }

  /**
   * Saturating multiplication by shift and add
   * @return min(a * b, cap)
   */
  uint64_t mulCap(uint64_t a, uint64_t b, uint64_t cap);

  /**
   * Computes floor(a * b / (cp * 10000)) and the remainder by binary long
   * division over bits of `b`
   * @param cp - nonzero high part of divisor
   * @param q_cap - max quotient allowed
   * @return none if quotient exceeds q_cap
   */
  boost::optional<MulDivResult> mulDivCapped(uint64_t a,
                                             uint64_t b,
                                             uint64_t cp,
                                             uint64_t q_cap);

  /**
   * Computes floor(remainder * k / (cp * 10000)).
   * Result never exceeds k.
   * @param remainder - reduced, less than cp * 10000
   * @param cp - nonzero high part of divisor
   */
  uint64_t remainderMulDiv(const Base10k &remainder, uint64_t k, uint64_t cp);

}  // namespace sr::math
