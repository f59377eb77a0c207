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
 * @file exception_ctx.hpp
 * @brief Exceptions carrying the values of the arguments that caused them
 *
 */

#include "sphmbase/SourceLocation.hpp"
#include "sphmbase/exception.hpp"
#include "sphmbase/string.hpp"
#include <optional>
#include <string>
#include <vector>

namespace sphmbase {

    struct args_info {
        std::string name;
        std::string value;
        std::optional<std::string> special_print;

        args_info() = default;

        template<class T>
        args_info(std::string name, T value) : name(name), value(sphmbase::format("{}", value)) {}

        args_info(std::string special_print) : special_print(special_print) {}
    };

    /**
     * @brief Make an exception with a message and a context
     *
     * The context is a list of args_info, printed below the message one per line.
     *
     * Usage :
     * @code{.cpp}
     * throw sphmbase::make_except_with_loc_with_ctx<std::invalid_argument>(
     *     "Zero length cross section!",
     *     std::vector<sphmbase::args_info>{
     *         sphmbase::args_info("--function args--"), // special print
     *         sphmbase::args_info("x1", x1),             // name and value
     *         sphmbase::args_info("x2", x2)});           // name and value
     * @endcode
     */
    template<class ExcptTypes>
    inline ExcptTypes make_except_with_loc_with_ctx(
        std::string message, std::vector<args_info> args, SourceLocation loc = SourceLocation{}) {
        std::string msg = message;
        msg += "\n  context :\n";
        for (const auto &arg : args) {
            if (arg.special_print) {
                msg += sphmbase::format("    {}\n", arg.special_print.value());
            } else {
                msg += sphmbase::format("    {} = {}\n", arg.name, arg.value);
            }
        }
        return sphmbase::make_except_with_loc<ExcptTypes>(msg, loc);
    }
} // namespace sphmbase
