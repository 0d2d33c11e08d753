/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "math/streaming.hpp"

namespace sr::math {
  namespace {
    constexpr int kBits{64};

    /// q + add, none if result exceeds cap
    boost::optional<uint64_t> addWithCap(uint64_t q,
                                         uint64_t add,
                                         uint64_t cap) {
      if (add == 0) {
        return q;
      }
      if (add > cap || q > cap - add) {
        return boost::none;
      }
      return q + add;
    }

    /// 2 * q + bit, none if result exceeds cap
    boost::optional<uint64_t> doubleWithCap(uint64_t q,
                                            uint64_t bit,
                                            uint64_t cap) {
      assert(bit <= 1);
      if (bit > cap || q > ((cap - bit) >> 1)) {
        return boost::none;
      }
      return (q << 1) | bit;
    }
  }  // namespace

  uint64_t mulCap(uint64_t a, uint64_t b, uint64_t cap) {
    if (a == 0 || b == 0) {
      return 0;
    }
    uint64_t res{0};
    while (b != 0 && res < cap) {
      if ((b & 1) != 0) {
        if (a >= cap - res) {
          return cap;
        }
        res += a;
      }
      // a is saturated, any further set bit of b reaches the cap
      if (a > (cap >> 1)) {
        a = cap;
      } else {
        a <<= 1;
      }
      b >>= 1;
    }
    return res;
  }

  boost::optional<MulDivResult> mulDivCapped(uint64_t a,
                                             uint64_t b,
                                             uint64_t cp,
                                             uint64_t q_cap) {
    if (a == 0 || b == 0) {
      return MulDivResult{};
    }
    assert(cp != 0);

    // a = adder_q * cp * 10000 + adder
    const auto a_split{splitBase10k(a)};
    const auto adder_q{a_split.hi / cp};
    const Base10k adder{a_split.hi % cp, a_split.lo};

    uint64_t q{0};
    Base10k rem;
    for (int i = kBits - 1; i >= 0; --i) {
      const auto bit{doubleBase10kMod(rem, cp)};
      auto doubled{doubleWithCap(q, bit, q_cap)};
      if (!doubled) {
        return boost::none;
      }
      q = *doubled;

      if (((b >> i) & 1) != 0) {
        auto added{addWithCap(q, adder_q, q_cap)};
        if (!added) {
          return boost::none;
        }
        const auto wraps{addBase10kMod(rem, adder, cp)};
        added = addWithCap(*added, wraps, q_cap);
        if (!added) {
          return boost::none;
        }
        q = *added;
      }
    }
    return MulDivResult{q, rem};
  }

  uint64_t remainderMulDiv(const Base10k &remainder, uint64_t k, uint64_t cp) {
    if (k == 0) {
      return 0;
    }
    assert(cp != 0);

    uint64_t q{0};
    Base10k rem;
    for (int i = kBits - 1; i >= 0; --i) {
      q = (q << 1) | doubleBase10kMod(rem, cp);
      if (((k >> i) & 1) != 0) {
        // final quotient is at most k, so wrapping addition is exact
        q += addBase10kMod(rem, remainder, cp);
      }
    }
    return q;
  }
}  // namespace sr::math
