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
 * @file TestResult.hpp
 * @brief Asserts and result of a test
 */

#include "sphmbase/aliases_float.hpp"
#include "sphmbase/aliases_int.hpp"
#include "sphmbase/string.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <string>
#include <utility>
#include <vector>

namespace sphmtest::details {

    /// Type of a test, selects when the runner executes it
    enum TestType { Benchmark, ValidationTest, Unittest };

    /// Result of one assert
    struct TestAssert {
        std::string name;
        bool value;
        std::string comment;
    };

    /// List of the asserts evaluated by a test
    class TestAssertList {
        public:
        std::vector<TestAssert> asserts;

        inline void assert_bool(std::string assert_name, bool v) {
            asserts.push_back(TestAssert{std::move(assert_name), v, ""});
        }

        inline void assert_bool_with_log(std::string assert_name, bool v, std::string comment) {
            asserts.push_back(TestAssert{std::move(assert_name), v, std::move(comment)});
        }

        template<class Ta, class Tb>
        inline void assert_equal(std::string assert_name, const Ta &a, const Tb &b) {
            bool eval = (a == b);
            std::string comment;
            if (!eval) {
                comment = sphmbase::format("left = {}, right = {}", a, b);
            }
            assert_bool_with_log(std::move(assert_name), eval, std::move(comment));
        }

        /// succeeds if |a - b| <= prec
        inline void assert_float_equal(std::string assert_name, f64 a, f64 b, f64 prec) {
            bool eval = std::abs(a - b) <= prec;
            std::string comment;
            if (!eval) {
                comment = sphmbase::format(
                    "left = {}, right = {}, delta = {}, prec = {}", a, b, std::abs(a - b), prec);
            }
            assert_bool_with_log(std::move(assert_name), eval, std::move(comment));
        }

        u32 get_assert_count() const { return asserts.size(); }

        u32 get_assert_success_count() const;

        inline bool all_success() const { return get_assert_success_count() == get_assert_count(); }

        nlohmann::json serialize_json() const;
    };

    /// Result of a test run
    struct TestResult {
        TestType type;
        std::string name;
        TestAssertList asserts;
        f64 duration_sec = 0;

        inline TestResult(TestType type, std::string name)
            : type(type), name(std::move(name)), asserts() {}

        nlohmann::json serialize_json() const;
    };

} // namespace sphmtest::details
