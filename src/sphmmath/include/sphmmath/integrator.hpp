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
 * @file integrator.hpp
 * @brief Trapezoidal quadrature on [start, end] and a finite difference derivative
 *
 */

namespace sphmmath {

    template<class T, class Lambda>
    inline constexpr T integ_trapezoidal(T start, T end, T step, Lambda &&fct) {
        T acc   = {};
        T fprev = fct(start);
        for (T x = start + step; x < end + step / 2; x += step) {
            T f = fct(x);
            acc += T(0.5) * (f + fprev) * step;
            fprev = f;
        }
        return acc;
    }

    /// Upwind finite difference estimate of the derivative of fct at x
    template<class T, class Lambda>
    inline constexpr T derivative_upwind(T x, T dx, Lambda &&fct) {
        return (fct(x + dx) - fct(x)) / dx;
    }

} // namespace sphmmath
