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
 * @file aliases_float.hpp
 * @brief Floating point aliases
 *
 */

using f32 = float;
using f64 = double;
