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
 * @file exception.hpp
 * @brief Exception helpers appending the throw location to the message
 *
 */

#include "sphmbase/SourceLocation.hpp"
#include <stdexcept>
#include <string>

namespace sphmbase {

    /**
     * @brief Make an exception with the location of the caller appended to the message
     *
     * @tparam ExcptTypes The exception type, must be constructible from a std::string
     * @param message The message of the exception
     * @param loc The location of the exception (default to the caller)
     * @return ExcptTypes The exception
     */
    template<class ExcptTypes>
    inline ExcptTypes
    make_except_with_loc(std::string message, SourceLocation loc = SourceLocation{}) {
        return ExcptTypes(message + "\n" + loc.format_one_line_func());
    }

    /**
     * @brief Throw an exception with the location of the caller appended to the message
     *
     * @code{.cpp}
     * sphmbase::throw_with_loc<std::invalid_argument>("pixcount must be greater than zero!");
     * @endcode
     */
    template<class ExcptTypes>
    [[noreturn]] inline void
    throw_with_loc(std::string message, SourceLocation loc = SourceLocation{}) {
        throw make_except_with_loc<ExcptTypes>(message, loc);
    }

    /// Throw a std::runtime_error stating that the called path is not implemented
    [[noreturn]] inline void
    throw_unimplemented(std::string message = "", SourceLocation loc = SourceLocation{}) {
        throw make_except_with_loc<std::runtime_error>("unimplemented : " + message, loc);
    }

} // namespace sphmbase
