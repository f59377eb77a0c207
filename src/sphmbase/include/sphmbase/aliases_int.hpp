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
 * @file aliases_int.hpp
 * @brief Fixed width integer aliases
 *
 */

#include <cstdint>
#include <limits>

using u8  = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using i8  = std::int8_t;
using i16 = std::int16_t;
using i32 = std::int32_t;
using i64 = std::int64_t;

constexpr u32 u32_max = std::numeric_limits<u32>::max();
constexpr u64 u64_max = std::numeric_limits<u64>::max();
constexpr i32 i32_max = std::numeric_limits<i32>::max();
constexpr i64 i64_max = std::numeric_limits<i64>::max();
