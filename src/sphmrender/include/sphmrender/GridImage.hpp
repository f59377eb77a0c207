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
 * @file GridImage.hpp
 * @brief Row major 2D image produced by the grid interpolator
 *
 */

#include "sphmbase/aliases_int.hpp"
#include <cstddef>
#include <numeric>
#include <vector>

namespace sphmrender {

    /**
     * @brief Image of ny rows by nx columns, row index is the y pixel index
     */
    template<class Tscal>
    struct GridImage {
        u32 nx;
        u32 ny;
        std::vector<Tscal> data;

        GridImage(u32 nx, u32 ny) : nx(nx), ny(ny), data(std::size_t(nx) * ny, Tscal(0)) {}

        inline Tscal &get(u32 row, u32 col) { return data[std::size_t(row) * nx + col]; }
        inline const Tscal &get(u32 row, u32 col) const {
            return data[std::size_t(row) * nx + col];
        }

        /// pointer to the first pixel of a row
        inline Tscal *row_ptr(u32 row) { return data.data() + std::size_t(row) * nx; }

        inline Tscal sum() const { return std::accumulate(data.begin(), data.end(), Tscal(0)); }
    };

} // namespace sphmrender
