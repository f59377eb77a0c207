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
 * @file type_traits.hpp
 * @brief
 *
 */

#include <type_traits>

namespace sphmbase {

    /// false for any type, to trigger static_assert only on instantiation
    template<class T>
    constexpr bool always_false_v = false;

    /// identity metafunction, used to exclude a parameter from template argument deduction
    template<class T>
    struct type_identity {
        using type = T;
    };

    template<class T>
    using type_identity_t = typename type_identity<T>::type;

} // namespace sphmbase
