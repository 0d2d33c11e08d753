/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "stake/impl/wide_calculator.hpp"

#include "primitives/big_int.hpp"

namespace sr::stake {
  using primitives::UInt128;

  StakeAmount WideCalculator::rateLimitedStakeChange(
      ChainEpoch epoch,
      StakeAmount account_portion,
      StakeAmount cluster_portion,
      StakeAmount cluster_effective,
      const boost::optional<ChainEpoch> &new_rate_activation_epoch) const {
    if (account_portion == 0 || cluster_portion == 0 || cluster_effective == 0) {
      return 0;
    }
    const auto rate_bps{
        warmupCooldownRateBps(epoch, new_rate_activation_epoch)};

    const UInt128 modulus{UInt128{cluster_portion}
                          * primitives::kBasisPointsPerUnit};
    const UInt128 product{UInt128{account_portion} * cluster_effective};
    const UInt128 quotient{product / modulus};
    if (quotient > account_portion / rate_bps) {
      return account_portion;
    }

    const auto total{quotient.convert_to<StakeAmount>() * rate_bps};
    const UInt128 correction{(product % modulus) * rate_bps / modulus};
    if (correction >= account_portion - total) {
      return account_portion;
    }
    return total + correction.convert_to<StakeAmount>();
  }
}  // namespace sr::stake
