/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "cli/run.hpp"
#include "cli/stake/_tree.hpp"

int main(int argc, const char *argv[]) {
  return sr::cli::run("stakerate-cli", sr::cli::_stake::_tree, argc, argv);
}
