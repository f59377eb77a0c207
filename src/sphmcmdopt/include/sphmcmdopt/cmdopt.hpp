// -------------------------------------------------------//
//
// SPHMAP code for SPH particle rendering
// Copyright (c) 2024-2026 The Sphmap developers
// SPDX-License-Identifier: CeCILL Free Software License Agreement v2.1
// Sphmap is licensed under the CeCILL 2.1 License, see LICENSE for more information
//
// -------------------------------------------------------//

#pragma once

/**
 * @file cmdopt.hpp
 * @brief Registry of the command line options of the executables
 *
 * Options must be registered before calling init, an unknown option makes init throw.
 *
 * @code{.cpp}
 * opts::register_opt("--run-only", "(regex)", "run only the tests matching the regex");
 * opts::init(argc, argv);
 * if (opts::has_option("--run-only")) {
 *     std::string_view regex = opts::get_option("--run-only");
 * }
 * @endcode
 */

#include <optional>
#include <string>
#include <string_view>

namespace sphmcmdopt {

    /**
     * @brief Register an option
     *
     * @param name option name including the dashes, ex: "--help"
     * @param args description of the value following the option, none for a flag
     * @param description help text
     */
    void register_opt(std::string name, std::optional<std::string> args, std::string description);

    /**
     * @brief Parse the command line against the registered options
     *
     * @throws std::invalid_argument for an unknown option or an option missing its value
     */
    void init(int argc, char *argv[]);

    bool has_option(const std::string_view &option_name);

    /**
     * @brief Value following an option
     *
     * @throws std::invalid_argument if the option is not set or is a flag
     */
    std::string_view get_option(const std::string_view &option_name);

    void print_help();
    bool is_help_mode();

} // namespace sphmcmdopt

namespace opts {
    using namespace sphmcmdopt;
}
