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
 * @file sphmtest.hpp
 * @brief main include file for testing
 */

#include "sphmbase/SourceLocation.hpp"
#include "sphmbase/string.hpp"
#include "sphmtest/details/Test.hpp"
#include <cmath>
#include <optional>
#include <string>
#include <utility>
#include <vector>

/**
 * @brief namespace containing stuff related to the test library
 *
 */
namespace sphmtest {

    namespace details {

        /**
         * @brief Static init vector containing the list of all the tests in the code
         */
        inline std::vector<Test> static_init_vec_tests{};

        /**
         * @brief helper class to statically register tests
         *
         */
        struct TestStaticInit {
            inline explicit TestStaticInit(Test t) {
                static_init_vec_tests.push_back(std::move(t));
            }
        };

        /**
         * @brief the test currently running
         *
         */
        extern TestResult current_test;

    } // namespace details

    /// Configuration of the test runner
    struct TestConfig {

        /// Should print test list and then exit
        bool print_test_list_exit = false;

        /// Should display all logs including all asserts
        bool full_output = false;

        /// Should output a json report
        std::optional<std::string> json_output = {};

        bool run_unittest   = true;  ///< run unittests
        bool run_validation = true;  ///< run validation tests
        bool run_benchmark  = false; ///< run benchmarks

        std::optional<std::string> run_only = {}; ///< Run only regex to select tests
    };

    /**
     * @brief run all the tests
     *
     * Command line options override the fields of cfg :
     * `--test-list`, `--full-output`, `--run-only <regex>`, `--benchmark`,
     * `--json-output <file>`.
     *
     * @param argc main argc
     * @param argv  main argv
     * @param cfg test run configuration
     * @return int exit code, 0 if every selected test passed, 1 otherwise
     */
    int run_all_tests(int argc, char *argv[], TestConfig cfg);

    /**
     * @brief current test asserts
     *
     * @return sphmtest::details::TestAssertList& reference to the test asserts
     */
    inline sphmtest::details::TestAssertList &asserts() {
        return sphmtest::details::current_test.asserts;
    };

} // namespace sphmtest

/**
 * @brief Macro to declare a test
 *
 * Exemple :
 * \code{.cpp}
 * TestStart(Unittest, "testname", testfuncname, 1) {
 *     sphmtest::asserts().assert_bool("what a reliable test", true);
 * }
 * \endcode
 */
#define TestStart(type, name, func_name, node_cnt)                                                 \
    void test_func_##func_name();                                                                  \
    void (*test_func_ptr_##func_name)() = test_func_##func_name;                                   \
    sphmtest::details::TestStaticInit test_class_obj_##func_name(                                  \
        sphmtest::details::Test{type, name, node_cnt, test_func_ptr_##func_name});                 \
    void test_func_##func_name()

///////////////////////////////////////////////////////////////////////////////////////////////////
// Assert macros
///////////////////////////////////////////////////////////////////////////////////////////////////

/**
 * @brief Assert macro for test
 * write the conditional, the name of the assert will be the condition
 *
 * Usage :
 * \code{.cpp}
 * _Assert(a == 0)
 * \endcode
 */
#define _Assert(a) sphmtest::asserts().assert_bool("_Assert(" #a ")", a);

/**
 * @brief Assert macro for test, testing equality between two variables
 *
 * Usage :
 * \code{.cpp}
 * _AssertEqual(a , b)
 * \endcode
 */
#define _AssertEqual(a, b) sphmtest::asserts().assert_equal("_AssertEqual(" #a ", " #b ")", a, b);

/**
 * @brief Assert macro for test, testing equality between two variables, with a given precision
 *
 * Usage :
 * \code{.cpp}
 * _AssertFloatEqual(a , b, 1e-9)
 * \endcode
 */
#define _AssertFloatEqual(a, b, prec)                                                              \
    sphmtest::asserts().assert_float_equal(#a " ==(" #prec ") " #b, a, b, prec);

#define STDSTRINGIFY(x) std::string(#x)

// Note : the do-while are here to enforce the presence of a semicolumn after the call to the macros

/// REQUIRE macro alias to _Assert
#define REQUIRE(a)                                                                                 \
    do {                                                                                           \
        bool eval = a;                                                                             \
        if (eval) {                                                                                \
            sphmtest::asserts().assert_bool_with_log(#a, eval, "");                                \
        } else {                                                                                   \
            sphmtest::asserts().assert_bool_with_log(                                              \
                #a,                                                                                \
                eval,                                                                              \
                STDSTRINGIFY(a) + " evaluated to false\n\n"                                        \
                    + " -> location : " + SourceLocation{}.format_one_line());                     \
        }                                                                                          \
    } while (0)

/// REQUIRE with a custom assert name
#define REQUIRE_NAMED(name, a)                                                                     \
    do {                                                                                           \
        bool eval = a;                                                                             \
        if (eval) {                                                                                \
            sphmtest::asserts().assert_bool_with_log(name, eval, "");                              \
        } else {                                                                                   \
            sphmtest::asserts().assert_bool_with_log(                                              \
                name,                                                                              \
                eval,                                                                              \
                STDSTRINGIFY(a) + " evaluated to false\n\n"                                        \
                    + " -> location : " + SourceLocation{}.format_one_line());                     \
        }                                                                                          \
    } while (0)

/// REQUIRE_EQUAL with a custom assert name and comparison
#define REQUIRE_EQUAL_CUSTOM_COMP_NAMED(name, a, b, comp)                                          \
    do {                                                                                           \
        bool eval               = comp(a, b);                                                      \
        std::string assert_name = name;                                                            \
        if (eval) {                                                                                \
            sphmtest::asserts().assert_bool_with_log(assert_name, eval, "");                       \
        } else {                                                                                   \
            sphmtest::asserts().assert_bool_with_log(                                              \
                assert_name,                                                                       \
                eval,                                                                              \
                "(" + assert_name + ") evaluated to false\n\n"                                     \
                    + sphmbase::format(" -> " #a " = {}", a) + "\n"                                \
                    + sphmbase::format(" -> " #b " = {}", b) + "\n"                                \
                    + " -> location : " + SourceLocation{}.format_one_line());                     \
        }                                                                                          \
    } while (0)

#define REQUIRE_EQUAL_CUSTOM_COMP(a, b, comp)                                                      \
    REQUIRE_EQUAL_CUSTOM_COMP_NAMED(#a " == " #b, a, b, comp)

#define REQUIRE_EQUAL(a, b)                                                                        \
    REQUIRE_EQUAL_CUSTOM_COMP(a, b, [](const auto &p1, const auto &p2) {                           \
        return p1 == p2;                                                                           \
    })

#define REQUIRE_EQUAL_NAMED(name, a, b)                                                            \
    REQUIRE_EQUAL_CUSTOM_COMP_NAMED(name, a, b, [](const auto &p1, const auto &p2) {               \
        return p1 == p2;                                                                           \
    })

/// REQUIRE_EQUAL with the tolerance |a - b| <= prec
#define REQUIRE_FLOAT_EQUAL(a, b, prec)                                                            \
    REQUIRE_EQUAL_CUSTOM_COMP_NAMED(                                                               \
        #a " ==(" #prec ") " #b, a, b, [&](const auto &p1, const auto &p2) {                       \
            return std::abs(p1 - p2) <= prec;                                                      \
        })

/// REQUIRE macro alias to _Assert_throw
#define REQUIRE_EXCEPTION_THROW(call, exception_type)                                              \
    do {                                                                                           \
        try {                                                                                      \
            /* Try to call the function that is expected to throw */                               \
            call;                                                                                  \
            /* If no exception is thrown, assert that the test failed */                           \
            sphmtest::asserts().assert_bool_with_log(                                              \
                #exception_type " was not thrown",                                                 \
                false,                                                                             \
                "Expected throw of type " #exception_type ", but nothing was thrown\n"             \
                " -> location : "                                                                  \
                    + SourceLocation{}.format_one_line());                                         \
        } catch (const exception_type &ex) {                                                       \
            /* If wanted exception is thrown, assert that the test pass */                         \
            sphmtest::asserts().assert_bool_with_log(                                              \
                "Found wanted throw of type " #exception_type, true, "");                          \
        } catch (const std::exception &e) {                                                        \
            /* If another exception type is thrown, assert that the test failed */                 \
            sphmtest::asserts().assert_bool_with_log(                                              \
                #exception_type " was not thrown",                                                 \
                false,                                                                             \
                "Expected throw of type " #exception_type ", but got " + std::string(e.what())     \
                    + "\n" + " -> location : " + SourceLocation{}.format_one_line());              \
        }                                                                                          \
    } while (0)
