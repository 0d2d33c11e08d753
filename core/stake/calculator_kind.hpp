/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "common/outcome.hpp"
#include "stake/stake_calculator.hpp"

namespace sr::stake {

  /**
   * @brief Arithmetic backends of stake calculator
   */
  enum class CalculatorKind {
    kStreaming,
    kFixedWidth,
    kBigInt,
    kWide,
  };

  /**
   * @brief Type of errors returned by calculator lookup
   */
  enum class CalculatorError {
    UNKNOWN_BACKEND = 1,
  };

  /// Every backend, streaming one first
  const std::vector<CalculatorKind> &allCalculatorKinds();

  /// Name used in command line and logs
  std::string calculatorName(CalculatorKind kind);

  /**
   * @brief Find backend by name
   * @param name - one of "streaming", "fixed", "bigint", "wide"
   * @return backend kind or UNKNOWN_BACKEND error
   */
  outcome::result<CalculatorKind> parseCalculatorKind(const std::string &name);

  std::shared_ptr<StakeCalculator> makeCalculator(CalculatorKind kind);
}  // namespace sr::stake

OUTCOME_HPP_DECLARE_ERROR(sr::stake, CalculatorError);
