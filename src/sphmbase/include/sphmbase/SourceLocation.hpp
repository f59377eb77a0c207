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
 * @file SourceLocation.hpp
 * @brief Call site capture used by the exception helpers and the test asserts
 *
 */

#include "sphmbase/aliases_int.hpp"
#include <string>

/**
 * @brief Location in the source code of the place where the object was constructed
 *
 * The constructor default arguments are evaluated at the construction site, hence using
 * `SourceLocation{}` as a default function argument records the location of the caller.
 *
 * Usage :
 * \code{.cpp}
 * void f(SourceLocation loc = SourceLocation{}) {
 *     logger::raw_ln(loc.format_one_line());
 * }
 * \endcode
 */
struct SourceLocation {

    /// Raw location info
    struct Loc {
        const char *file_name;
        const char *function_name;
        u32 line;
    } loc;

    inline SourceLocation(
        const char *file = __builtin_FILE(),
        const char *func = __builtin_FUNCTION(),
        u32 line         = __builtin_LINE())
        : loc{file, func, line} {}

    /// format the location in a one-liner
    std::string format_one_line() const;

    /// format the location in a one-liner with the function name displayed
    std::string format_one_line_func() const;
};
