// -------------------------------------------------------//
//
// SPHMAP code for SPH particle rendering
// Copyright (c) 2024-2026 The Sphmap developers
// SPDX-License-Identifier: CeCILL Free Software License Agreement v2.1
// Sphmap is licensed under the CeCILL 2.1 License, see LICENSE for more information
//
// -------------------------------------------------------//

/**
 * @file sphmtest.cpp
 * @brief Test runner
 */

#include "sphmtest/sphmtest.hpp"
#include "sphmbase/exception.hpp"
#include "sphmbase/string.hpp"
#include "sphmbase/term_colors.hpp"
#include "sphmcmdopt/cmdopt.hpp"
#include "sphmlog/logs.hpp"
#include <algorithm>
#include <fstream>
#include <regex>
#include <stdexcept>

namespace {

    bool is_selected(const sphmtest::details::Test &t, const sphmtest::TestConfig &cfg) {
        using namespace sphmtest::details;

        bool type_ok = (t.type == Unittest && cfg.run_unittest)
                       || (t.type == ValidationTest && cfg.run_validation)
                       || (t.type == Benchmark && cfg.run_benchmark);

        if (!type_ok) {
            return false;
        }

        if (cfg.run_only) {
            return std::regex_search(t.name, std::regex(*cfg.run_only));
        }

        return true;
    }

    void print_test_result(const sphmtest::details::TestResult &res, bool full_output) {
        namespace term_colors = sphmbase::term_colors;

        bool success = res.asserts.all_success();

        logger::raw_ln(sphmbase::format(
            "{}[{}]{} {} ({:.3f} s) : {}/{} asserts",
            success ? term_colors::col8b_green() : term_colors::col8b_red(),
            success ? "Pass" : "Fail",
            term_colors::reset(),
            sphmbase::pad_right(res.name, 40),
            res.duration_sec,
            res.asserts.get_assert_success_count(),
            res.asserts.get_assert_count()));

        for (const auto &a : res.asserts.asserts) {
            if (full_output || !a.value) {
                logger::raw_ln(sphmbase::format(
                    "    {} {}", (a.value) ? "[ok]  " : "[fail]", a.name));
                if (!a.comment.empty()) {
                    logger::raw_ln(a.comment);
                }
            }
        }
    }

} // namespace

namespace sphmtest {

    int run_all_tests(int argc, char *argv[], TestConfig cfg) {

        opts::register_opt("--test-list", {}, "print the test list and exit");
        opts::register_opt("--full-output", {}, "print every assert");
        opts::register_opt("--run-only", "(regex)", "run only the tests matching the regex");
        opts::register_opt("--benchmark", {}, "run only the benchmarks");
        opts::register_opt("--json-output", "(file)", "write a json report");

        opts::init(argc, argv);

        if (opts::is_help_mode()) {
            opts::print_help();
            return 0;
        }

        logger::init_from_env();

        if (opts::has_option("--test-list")) {
            cfg.print_test_list_exit = true;
        }
        if (opts::has_option("--full-output")) {
            cfg.full_output = true;
        }
        if (opts::has_option("--run-only")) {
            cfg.run_only = std::string(opts::get_option("--run-only"));
        }
        if (opts::has_option("--benchmark")) {
            cfg.run_unittest   = false;
            cfg.run_validation = false;
            cfg.run_benchmark  = true;
        }
        if (opts::has_option("--json-output")) {
            cfg.json_output = std::string(opts::get_option("--json-output"));
        }

        std::vector<details::Test> selected;
        for (const details::Test &t : details::static_init_vec_tests) {
            if (is_selected(t, cfg)) {
                selected.push_back(t);
            }
        }

        std::sort(selected.begin(), selected.end(), [](const auto &a, const auto &b) {
            return a.name < b.name;
        });

        if (cfg.print_test_list_exit) {
            for (const details::Test &t : selected) {
                logger::raw_ln(t.name);
            }
            return 0;
        }

        logger::print_faint_row();
        logger::raw_ln(sphmbase::format("running {} tests", selected.size()));
        logger::print_faint_row();

        std::vector<details::TestResult> results;
        u32 failed = 0;

        for (details::Test &t : selected) {
            details::TestResult res = t.run();
            print_test_result(res, cfg.full_output);
            if (!res.asserts.all_success()) {
                failed++;
            }
            results.push_back(std::move(res));
        }

        logger::print_faint_row();
        logger::raw_ln(sphmbase::format(
            "{} / {} tests passed", results.size() - failed, results.size()));

        if (cfg.json_output) {
            nlohmann::json report = nlohmann::json::array();
            for (const auto &res : results) {
                report.push_back(res.serialize_json());
            }

            std::ofstream out(*cfg.json_output);
            if (!out) {
                sphmbase::throw_with_loc<std::runtime_error>(
                    sphmbase::format("cannot open {} to write the test report", *cfg.json_output));
            }
            out << report.dump(4);
        }

        return (failed > 0) ? 1 : 0;
    }

} // namespace sphmtest
