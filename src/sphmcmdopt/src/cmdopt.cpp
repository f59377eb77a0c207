// -------------------------------------------------------//
//
// SPHMAP code for SPH particle rendering
// Copyright (c) 2024-2026 The Sphmap developers
// SPDX-License-Identifier: CeCILL Free Software License Agreement v2.1
// Sphmap is licensed under the CeCILL 2.1 License, see LICENSE for more information
//
// -------------------------------------------------------//

/**
 * @file cmdopt.cpp
 * @brief
 */

#include "sphmcmdopt/cmdopt.hpp"
#include "sphmbase/exception.hpp"
#include "sphmbase/print.hpp"
#include "sphmbase/string.hpp"
#include "sphmbase/term_colors.hpp"
#include "sphmcmdopt/env.hpp"
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include <vector>

namespace {

    struct OptInfo {
        std::string name;
        std::optional<std::string> args;
        std::string description;
    };

    std::vector<OptInfo> &registered_opts() {
        static std::vector<OptInfo> opts{OptInfo{"--help", {}, "show this help"}};
        return opts;
    }

    const OptInfo *find_opt(std::string_view name) {
        for (const OptInfo &o : registered_opts()) {
            if (o.name == name) {
                return &o;
            }
        }
        return nullptr;
    }

    int argc_save    = 0;
    char **argv_save = nullptr;
    bool init_done   = false;
    std::unordered_map<std::string, std::optional<std::string>> parsed_opts;

} // namespace

namespace sphmcmdopt {

    void register_opt(std::string name, std::optional<std::string> args, std::string description) {
        if (init_done) {
            sphmbase::throw_with_loc<std::runtime_error>(sphmbase::format(
                "option {} registered after the command line was parsed", name));
        }
        if (find_opt(name) != nullptr) {
            sphmbase::throw_with_loc<std::invalid_argument>(
                sphmbase::format("option {} is already registered", name));
        }
        registered_opts().push_back({std::move(name), std::move(args), std::move(description)});
    }

    void init(int argc, char *argv[]) {
        argc_save = argc;
        argv_save = argv;
        parsed_opts.clear();

        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];

            const OptInfo *opt = find_opt(arg);
            if (opt == nullptr) {
                sphmbase::throw_with_loc<std::invalid_argument>(
                    sphmbase::format("unknown option : {}, see --help", arg));
            }

            if (opt->args) {
                if (i + 1 >= argc) {
                    sphmbase::throw_with_loc<std::invalid_argument>(
                        sphmbase::format("option {} expects a value {}", arg, *opt->args));
                }
                parsed_opts[arg] = std::string(argv[++i]);
            } else {
                parsed_opts[arg] = std::nullopt;
            }
        }

        init_done = true;
    }

    bool has_option(const std::string_view &option_name) {
        return parsed_opts.find(std::string(option_name)) != parsed_opts.end();
    }

    std::string_view get_option(const std::string_view &option_name) {
        auto it = parsed_opts.find(std::string(option_name));
        if (it == parsed_opts.end() || !it->second) {
            sphmbase::throw_with_loc<std::invalid_argument>(
                sphmbase::format("option {} has no value", option_name));
        }
        return *it->second;
    }

    void print_help() {
        sphmbase::println(sphmbase::format(
            "executable : {}", (argc_save > 0) ? argv_save[0] : "<unknown>"));
        sphmbase::println("");
        sphmbase::println("Usage :");
        for (const OptInfo &o : registered_opts()) {
            sphmbase::println(sphmbase::format(
                "  {}{:<15}{} {:<12} : {}",
                sphmbase::term_colors::bold(),
                o.name,
                sphmbase::term_colors::reset(),
                o.args.value_or(""),
                o.description));
        }
        sphmbase::println("");
        print_help_env_var();
    }

    bool is_help_mode() { return has_option("--help"); }

} // namespace sphmcmdopt
