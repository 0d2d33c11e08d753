/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "cli/validate/with.hpp"
#include "stake/calculator_kind.hpp"

namespace sr::stake {
  CLI_VALIDATE(CalculatorKind) {
    validateWith(out, values, [](const std::string &value) {
      return parseCalculatorKind(value).value();
    });
  }
}  // namespace sr::stake
