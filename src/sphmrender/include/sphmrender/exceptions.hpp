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
 * @file exceptions.hpp
 * @brief Errors raised by the interpolators before any computation
 *
 */

#include "sphmbase/exception.hpp"
#include "sphmbase/string.hpp"
#include "sphmmath/SmoothingKernel.hpp"
#include <stdexcept>

namespace sphmrender {

    /// A render parameter is out of its valid range (pixel sizes, counts, line endpoints)
    class InvalidParameter : public std::invalid_argument {
        public:
        using std::invalid_argument::invalid_argument;
    };

    /// The kernel was normalised for another dimensionality than the render
    class DimensionMismatch : public std::invalid_argument {
        public:
        using std::invalid_argument::invalid_argument;
    };

    /**
     * @brief Check that the kernel is normalised in ndims dimensions
     *
     * @throws DimensionMismatch otherwise
     */
    template<class Tscal>
    inline void check_kernel_dimension(
        const sphmmath::SmoothingKernel<Tscal> &kernel,
        u32 ndims,
        SourceLocation loc = SourceLocation{}) {
        if (kernel.get_ndims() != ndims) {
            throw sphmbase::make_except_with_loc<DimensionMismatch>(
                sphmbase::format(
                    "Kernel must be {}-dimensional! (kernel {} is {}-dimensional)",
                    ndims,
                    kernel.get_name(),
                    kernel.get_ndims()),
                loc);
        }
    }

} // namespace sphmrender
