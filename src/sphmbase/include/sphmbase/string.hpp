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
 * @file string.hpp
 * @brief String formatting helpers built on fmt
 *
 */

#include "sphmbase/aliases_int.hpp"
#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <string>
#include <utility>

namespace sphmbase {

    /**
     * @brief format a string using fmt syntax
     *
     * @code{.cpp}
     * std::string s = sphmbase::format("pixcount = {}", 480);
     * @endcode
     */
    template<typename... T>
    inline std::string format(fmt::format_string<T...> fmt, T &&...args) {
        return fmt::format(fmt, std::forward<T>(args)...);
    }

    /**
     * @brief Right pad a string with spaces up to the given width
     */
    inline std::string pad_right(std::string in, u64 width) {
        if (in.size() >= width) {
            return in;
        }
        return in + std::string(width - in.size(), ' ');
    }

} // namespace sphmbase
