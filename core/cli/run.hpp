/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>

#include <fmt/format.h>
#include <fmt/ostream.h>
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/variables_map.hpp>

#include "cli/tree.hpp"
#include "cli/try.hpp"

namespace sr::cli {
  inline bool isDash(const std::string &s) {
    return !s.empty() && s[0] == '-';
  }

  /**
   * Parses options of one command level.
   * Stops at first positional argument, which is either subcommand name or
   * argument of command.
   * @return iterator to first unparsed argument
   */
  inline Argv::const_iterator parseLevel(po::variables_map &vm,
                                         const Opts &opts,
                                         Argv::const_iterator begin,
                                         Argv::const_iterator end) {
    po::parsed_options parsed{&opts};
    while (begin != end && isDash(*begin)) {
      if (*begin == "--") {
        ++begin;
        break;
      }
      // option with its value tokens, up to next dash token
      const auto next{std::find_if(begin + 1, end, isDash)};
      const auto options{
          po::command_line_parser{Argv{begin, next}}.options(opts).run()
              .options};
      if (options.empty() || options.front().string_key.empty()) {
        break;
      }
      const auto &option{options.front()};
      parsed.options.push_back(option);
      begin += option.original_tokens.size();
    }
    po::store(parsed, vm);
    return begin;
  }

  inline void printHelp(const std::vector<std::string> &cmds,
                        const Tree &tree,
                        const Opts &opts) {
    fmt::print("name:\n  {}\n", fmt::join(cmds, " "));
    if (!tree.description.empty()) {
      fmt::print("description:\n  {}\n", tree.description);
    }
    fmt::print("options:\n{}", fmt::streamed(opts));
    if (!tree.sub.empty()) {
      fmt::print("subcommands:\n");
      for (const auto &sub : tree.sub) {
        fmt::print("  {}\n", sub.first);
      }
    }
  }

  /**
   * Walks command tree along argv and runs the last command found.
   * @return process exit code
   */
  inline int run(std::string app, const Tree &root, const Argv &argv) {
    const Tree *tree{&root};
    std::vector<std::string> cmds{std::move(app)};
    ArgsMap argm;
    auto it{argv.cbegin()};
    while (true) {
      auto args{tree->args()};
      args.opts.add_options()("help,h", "print help");
      po::variables_map vm;
      try {
        it = parseLevel(vm, args.opts, it, argv.cend());
        if (vm.count("help") != 0) {
          printHelp(cmds, *tree, args.opts);
          return 0;
        }
        po::notify(vm);
      } catch (po::error &e) {
        fmt::print(stderr, "{}: {}\n", fmt::join(cmds, " "), e.what());
        return 1;
      }
      argm._.emplace(args._);

      if (it != argv.cend()) {
        const auto sub{tree->sub.find(*it)};
        if (sub != tree->sub.end()) {
          ++it;
          cmds.push_back(sub->first);
          tree = &sub->second;
          continue;
        }
      }
      if (!tree->run) {
        printHelp(cmds, *tree, args.opts);
        return 1;
      }
      try {
        tree->run(argm, {it, argv.cend()});
        return 0;
      } catch (ShowHelp &) {
        printHelp(cmds, *tree, args.opts);
        return 0;
      } catch (po::error &e) {
        fmt::print(stderr, "{}: {}\n", fmt::join(cmds, " "), e.what());
      } catch (CliError &e) {
        fmt::print(stderr, "{}: {}\n", fmt::join(cmds, " "), e.what());
      }
      return 1;
    }
  }

  inline int run(std::string app,
                 const Tree &tree,
                 int argc,
                 const char *argv[]) {
    return run(std::move(app), tree, Argv{argv + 1, argv + argc});
  }
}  // namespace sr::cli
