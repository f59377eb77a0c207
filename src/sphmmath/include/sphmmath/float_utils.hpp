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
 * @file float_utils.hpp
 * @brief Floating point comparison and rounding
 *
 */

#include <cmath>

namespace sphmmath {

    /**
     * @brief Tolerant equality `|a - b| <= atol + rtol * |b|`
     *
     * The test is not symmetric, `b` is the reference value.
     */
    template<class T>
    inline bool is_close(T a, T b, T rtol = T(1e-5), T atol = T(1e-8)) {
        return std::abs(a - b) <= atol + rtol * std::abs(b);
    }

    /// Round to the nearest integer value, ties to even (IEEE default rounding mode)
    template<class T>
    inline T round_half_even(T x) {
        return std::nearbyint(x);
    }

} // namespace sphmmath
