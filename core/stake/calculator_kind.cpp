/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "stake/calculator_kind.hpp"

#include "stake/impl/big_int_calculator.hpp"
#include "stake/impl/fixed_width_calculator.hpp"
#include "stake/impl/streaming_calculator.hpp"
#include "stake/impl/wide_calculator.hpp"

namespace sr::stake {
  const std::vector<CalculatorKind> &allCalculatorKinds() {
    static const std::vector<CalculatorKind> kinds{
        CalculatorKind::kStreaming,
        CalculatorKind::kFixedWidth,
        CalculatorKind::kBigInt,
        CalculatorKind::kWide,
    };
    return kinds;
  }

  std::string calculatorName(CalculatorKind kind) {
    switch (kind) {
      case CalculatorKind::kStreaming:
        return "streaming";
      case CalculatorKind::kFixedWidth:
        return "fixed";
      case CalculatorKind::kBigInt:
        return "bigint";
      case CalculatorKind::kWide:
        return "wide";
    }
    return "unknown";
  }

  outcome::result<CalculatorKind> parseCalculatorKind(const std::string &name) {
    for (const auto kind : allCalculatorKinds()) {
      if (calculatorName(kind) == name) {
        return kind;
      }
    }
    return CalculatorError::UNKNOWN_BACKEND;
  }

  std::shared_ptr<StakeCalculator> makeCalculator(CalculatorKind kind) {
    switch (kind) {
      case CalculatorKind::kStreaming:
        return std::make_shared<StreamingCalculator>();
      case CalculatorKind::kFixedWidth:
        return std::make_shared<FixedWidthCalculator>();
      case CalculatorKind::kBigInt:
        return std::make_shared<BigIntCalculator>();
      case CalculatorKind::kWide:
        return std::make_shared<WideCalculator>();
    }
    return nullptr;
  }
}  // namespace sr::stake

OUTCOME_CPP_DEFINE_CATEGORY(sr::stake, CalculatorError, e) {
  using sr::stake::CalculatorError;
  switch (e) {
    case CalculatorError::UNKNOWN_BACKEND:
      return "Stake calculator: unknown backend name";
    default:
      return "Stake calculator: unknown error";
  }
}
