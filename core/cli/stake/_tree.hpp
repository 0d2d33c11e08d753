/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "cli/stake/allowance.hpp"
#include "cli/stake/check.hpp"
#include "cli/stake/delta.hpp"
#include "cli/stake/entrypoint.hpp"
#include "cli/tree.hpp"

namespace sr::cli::_stake {
  const auto _tree{tree<Stake>(
      "rate limited stake warmup and cooldown",
      {
          {"delta",
           tree<Stake_delta>("stake change allowed in one epoch")},
          {"allowance",
           tree<Group>(
               "allowance of account against cluster stake history",
               {
                   {"activation",
                    tree<Stake_allowance_activation>("activation allowance")},
                   {"deactivation",
                    tree<Stake_allowance_deactivation>(
                        "deactivation allowance")},
               })},
          {"entrypoint",
           tree<Stake_entrypoint>("differential probe for one argument")},
          {"check",
           tree<Stake_check>("compare two backends on many inputs")},
      })};
}  // namespace sr::cli::_stake
