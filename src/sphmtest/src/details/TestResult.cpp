// -------------------------------------------------------//
//
// SPHMAP code for SPH particle rendering
// Copyright (c) 2024-2026 The Sphmap developers
// SPDX-License-Identifier: CeCILL Free Software License Agreement v2.1
// Sphmap is licensed under the CeCILL 2.1 License, see LICENSE for more information
//
// -------------------------------------------------------//

/**
 * @file TestResult.cpp
 * @brief
 */

#include "sphmtest/details/TestResult.hpp"
#include <algorithm>

namespace {

    const char *test_type_name(sphmtest::details::TestType t) {
        switch (t) {
        case sphmtest::details::Benchmark     : return "Benchmark";
        case sphmtest::details::ValidationTest: return "ValidationTest";
        case sphmtest::details::Unittest      : return "Unittest";
        }
        return "Unknown";
    }

} // namespace

namespace sphmtest::details {

    u32 TestAssertList::get_assert_success_count() const {
        return std::count_if(asserts.begin(), asserts.end(), [](const TestAssert &a) {
            return a.value;
        });
    }

    nlohmann::json TestAssertList::serialize_json() const {
        nlohmann::json ret = nlohmann::json::array();
        for (const TestAssert &a : asserts) {
            nlohmann::json ja = {{"name", a.name}, {"value", a.value}};
            if (!a.comment.empty()) {
                ja["comment"] = a.comment;
            }
            ret.push_back(ja);
        }
        return ret;
    }

    nlohmann::json TestResult::serialize_json() const {
        return {
            {"type", test_type_name(type)},
            {"name", name},
            {"duration_sec", duration_sec},
            {"assert_count", asserts.get_assert_count()},
            {"assert_success", asserts.get_assert_success_count()},
            {"asserts", asserts.serialize_json()},
        };
    }

} // namespace sphmtest::details
