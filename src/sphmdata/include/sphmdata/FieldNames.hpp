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
 * @file FieldNames.hpp
 * @brief Default column names of the SPH quantities
 *
 */

namespace sphmdata::names {

    inline constexpr const char *mass    = "m";
    inline constexpr const char *density = "rho";
    inline constexpr const char *hpart   = "h";

} // namespace sphmdata::names
