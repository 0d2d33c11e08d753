/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <string>

#include "cli/cli.hpp"

namespace sr::cli {
  struct Tree {
    using Sub = std::map<std::string, Tree>;
    struct Args {
      std::pair<std::type_index, std::shared_ptr<void>> _;
      Opts opts;
    };
    std::function<Args()> args;
    std::function<RunResult(ArgsMap &argm, Argv &&argv)> run;
    Sub sub;
    std::string description;
  };

  /**
   * Builds tree node of command `Cmd`, subcommands are optional
   */
  template <typename Cmd>
  Tree tree(std::string description, Tree::Sub sub = {}) {
    Tree t;
    t.description = std::move(description);
    t.args = [] {
      const auto ptr{std::make_shared<typename Cmd::Args>()};
      return Tree::Args{{typeid(typename Cmd::Args), ptr}, ptr->opts()};
    };
    if constexpr (!std::is_same_v<decltype(Cmd::run), const std::nullptr_t>) {
      t.run = [](ArgsMap &argm, Argv &&argv) {
        return Cmd::run(argm, argm.of<Cmd>(), std::move(argv));
      };
    }
    t.sub = std::move(sub);
    return t;
  }
}  // namespace sr::cli
