// -------------------------------------------------------//
//
// SPHMAP code for SPH particle rendering
// Copyright (c) 2024-2026 The Sphmap developers
// SPDX-License-Identifier: CeCILL Free Software License Agreement v2.1
// Sphmap is licensed under the CeCILL 2.1 License, see LICENSE for more information
//
// -------------------------------------------------------//

#pragma once

#include "sphmbase/SourceLocation.hpp"
#include "sphmbase/exception.hpp"
#include "sphmbase/string.hpp"
#include "sphmbase/type_traits.hpp"
#include <limits>
#include <stdexcept>

/**
 * @file narrowing.hpp
 * @brief Checked integer narrowing
 *
 */

namespace sphmbase {

    /**
     * @brief Check if an integer value can be represented in the integer type U
     *
     * @code{.cpp}
     * i64 value = -10;
     * bool ok = can_narrow<u32>(value);  // false, negative value
     * @endcode
     */
    template<class U, class T>
    constexpr bool can_narrow(T val) {
        using lim_T = std::numeric_limits<T>;
        using lim_U = std::numeric_limits<U>;

        if constexpr (lim_T::is_integer && lim_U::is_integer) {
            if constexpr (lim_T::is_signed) {
                if constexpr (lim_U::is_signed) {
                    return val >= lim_U::min() && val <= lim_U::max();
                } else {
                    // cast to avoid -Wsign-compare
                    return val >= 0 && static_cast<std::make_unsigned_t<T>>(val) <= lim_U::max();
                }
            } else {
                if constexpr (lim_U::is_signed) {
                    return val <= static_cast<std::make_unsigned_t<U>>(lim_U::max());
                } else {
                    return val <= lim_U::max();
                }
            }
        } else {
            static_assert(
                sphmbase::always_false_v<T>, "can_narrow is not implemented for this type");
        }
    }

    /**
     * @brief Narrow an integer, throwing std::runtime_error if the value does not fit
     */
    template<class U, class T>
    inline U narrow_check(T val, SourceLocation loc = SourceLocation{}) {
        if (can_narrow<U, T>(val)) {
            return static_cast<U>(val);
        } else {
            throw make_except_with_loc<std::runtime_error>(
                sphmbase::format(
                    "value cannot be narrowed to type U: {} -> {}", val, static_cast<U>(val)),
                loc);
        }
    }

} // namespace sphmbase
