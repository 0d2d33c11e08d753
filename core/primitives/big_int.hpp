/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/multiprecision/cpp_int.hpp>

namespace sr::primitives {
  using BigInt = boost::multiprecision::cpp_int;

  /// Fixed width unsigned integers, no heap allocation
  using UInt128 = boost::multiprecision::uint128_t;
  using UInt256 = boost::multiprecision::uint256_t;
}  // namespace sr::primitives
