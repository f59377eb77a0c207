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
 * @file assert.hpp
 * @brief Internal assertion utility, disabled unless SPHM_ASSERT_IS is defined
 *
 */

#define SPHM_ASSERT_MODE_CASSERT 1
#define SPHM_ASSERT_MODE_RUNTIME_ERROR 2

#ifdef SPHM_ASSERT_IS
    #if SPHM_ASSERT_IS == SPHM_ASSERT_MODE_RUNTIME_ERROR
        #include "sphmbase/exception.hpp"
    #elif SPHM_ASSERT_IS == SPHM_ASSERT_MODE_CASSERT
        #include <cassert>
    #endif
#endif

/*
 * do { ... } while (false) forces a compilation error on a missing ; after the macro call.
 */

/**
 * @brief Macro to assert that a condition is true
 */
#define SPHM_ASSERT(message, condition)                                                            \
    do {                                                                                           \
    } while (false)

#ifdef SPHM_ASSERT_IS
    #undef SPHM_ASSERT

    #if SPHM_ASSERT_IS == SPHM_ASSERT_MODE_CASSERT
        #define SPHM_ASSERT(message, condition)                                                    \
            do {                                                                                   \
                assert(((void) message, condition));                                               \
            } while (false)
    #elif SPHM_ASSERT_IS == SPHM_ASSERT_MODE_RUNTIME_ERROR
        #define SPHM_ASSERT(message, condition)                                                    \
            do {                                                                                   \
                if (!(condition)) {                                                                \
                    sphmbase::throw_with_loc<std::runtime_error>(message);                         \
                }                                                                                  \
            } while (false)
    #else
        #error                                                                                     \
            "Unknown value for SPHM_ASSERT_IS. Possible values are: SPHM_ASSERT_MODE_CASSERT,SPHM_ASSERT_MODE_RUNTIME_ERROR"
    #endif

#endif
