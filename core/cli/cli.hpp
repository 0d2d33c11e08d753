/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/any.hpp>
#include <boost/optional.hpp>
#include <boost/program_options/options_description.hpp>
#include <boost/program_options/value_semantic.hpp>
#include <map>
#include <memory>
#include <typeindex>

#include "cli/try.hpp"

/// Option with default value, `*opt` reads value
#define CLI_DEFAULT(NAME, DESCRIPTION, TYPE, INIT)          \
  struct {                                                  \
    TYPE v INIT;                                            \
    void operator()(Opts &opts) {                           \
      opts.add_options()(NAME, po::value(&v), DESCRIPTION); \
    }                                                       \
    const auto &operator*() const {                         \
      return v;                                             \
    }                                                       \
  }

/// Option that may be absent, `*opt` throws CliError when absent
#define CLI_OPTIONAL(NAME, DESCRIPTION, TYPE)                              \
  struct {                                                                 \
    boost::optional<TYPE> v;                                               \
    void operator()(Opts &opts) {                                          \
      opts.add_options()(NAME, po::value(&v), DESCRIPTION);                \
    }                                                                      \
    const auto &operator*() const {                                        \
      if (!v) {                                                            \
        throw ::sr::cli::CliError{"--{} argument is required but missing", \
                                  NAME};                                   \
      }                                                                    \
      return *v;                                                           \
    }                                                                      \
  }

#define CLI_OPTS() ::sr::cli::Opts opts()
#define CLI_RUN()                  \
  static ::sr::cli::RunResult run( \
      ::sr::cli::ArgsMap &argm, Args &args, ::sr::cli::Argv &&argv)
#define CLI_NO_RUN() constexpr static std::nullptr_t run{nullptr};

namespace sr::cli {
  namespace po = boost::program_options;
  using Opts = po::options_description;

  using RunResult = void;

  /// Parsed options of every command on path to current one
  struct ArgsMap {
    std::map<std::type_index, std::shared_ptr<void>> _;

    template <typename Cmd>
    typename Cmd::Args &of() {
      return *reinterpret_cast<typename Cmd::Args *>(
          _.at(typeid(typename Cmd::Args)).get());
    }
  };
  // note: Args is defined inside command
  using Argv = std::vector<std::string>;

  inline const std::string &cliArgv(const Argv &argv,
                                    size_t i,
                                    const std::string_view &name) {
    if (i < argv.size()) {
      return argv[i];
    }
    throw CliError{"positional argument {} is required but missing", name};
  }

  /// Parses positional argument same way as option value
  template <typename T>
  T cliArgv(const Argv &argv, size_t i, const std::string_view &name) {
    boost::any out;
    try {
      po::value<T>()->xparse(out, Argv{cliArgv(argv, i, name)});
    } catch (po::validation_error &e) {
      e.set_option_name(std::string{name});
      throw;
    }
    return boost::any_cast<T>(out);
  }

  struct Empty {
    struct Args {
      CLI_OPTS() {
        return {};
      }
    };
    CLI_NO_RUN();
  };
  using Group = Empty;

  struct ShowHelp {};
}  // namespace sr::cli
