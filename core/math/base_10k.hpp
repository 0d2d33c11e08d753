/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cassert>
#include <cstdint>

#include "primitives/types.hpp"

namespace sr::math {
  using primitives::kBasisPointsPerUnit;

  /**
   * Mixed radix number, value = hi * 10000 + lo.
   * Used as running remainder modulo cp * 10000, where the modulus itself
   * may not fit into 64 bits.
   * Invariant: lo < 10000, and hi < cp when reduced modulo cp * 10000.
   */
  struct Base10k {
    uint64_t hi{};
    uint64_t lo{};
  };

  inline bool operator==(const Base10k &lhs, const Base10k &rhs) {
    return lhs.hi == rhs.hi && lhs.lo == rhs.lo;
  }

  inline Base10k splitBase10k(uint64_t x) {
    return {x / kBasisPointsPerUnit, x % kBasisPointsPerUnit};
  }

  namespace detail {
    /**
     * hi = (hi + add) mod cp without overflowing 64 bits
     * @return 1 if cp was crossed, 0 otherwise
     */
    inline uint64_t addHiMod(uint64_t &hi, uint64_t add, uint64_t cp) {
      assert(cp != 0);
      if (add == 0) {
        return 0;
      }
      if (hi >= cp) {
        hi %= cp;
      }
      const auto space{cp - hi};
      if (add >= space) {
        hi = add - space;
        return 1;
      }
      hi += add;
      return 0;
    }
  }  // namespace detail

  /**
   * Adds `add` to `value` modulo cp * 10000 in place.
   * Low limb carry is applied as a second hi reduction step.
   * @param value - reduced remainder
   * @param add - addend, add.hi < cp
   * @param cp - nonzero high part of modulus
   * @return number of times modulus was subtracted
   */
  inline uint64_t addBase10kMod(Base10k &value,
                                const Base10k &add,
                                uint64_t cp) {
    uint64_t carry{0};
    value.lo += add.lo;
    if (value.lo >= kBasisPointsPerUnit) {
      value.lo -= kBasisPointsPerUnit;
      carry = 1;
    }
    auto wraps{detail::addHiMod(value.hi, add.hi, cp)};
    wraps += detail::addHiMod(value.hi, carry, cp);
    return wraps;
  }

  /**
   * Doubles `value` modulo cp * 10000 in place.
   * @return quotient bit shifted out by doubling
   */
  inline uint64_t doubleBase10kMod(Base10k &value, uint64_t cp) {
    const auto prev{value};
    return addBase10kMod(value, prev, cp) != 0 ? 1 : 0;
  }
}  // namespace sr::math
