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
 * @file Constants.hpp
 * @brief Mathematical constants
 *
 */

namespace sphmbase {

    template<class T>
    struct Constants {
        static constexpr T pi = 3.141592653589793238462643383279502884L;
    };

} // namespace sphmbase
