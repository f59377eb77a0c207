// -------------------------------------------------------//
//
// SPHMAP code for SPH particle rendering
// Copyright (c) 2024-2026 The Sphmap developers
// SPDX-License-Identifier: CeCILL Free Software License Agreement v2.1
// Sphmap is licensed under the CeCILL 2.1 License, see LICENSE for more information
//
// -------------------------------------------------------//

/**
 * @file env.cpp
 * @brief
 */

#include "sphmcmdopt/env.hpp"
#include "sphmbase/print.hpp"
#include "sphmbase/string.hpp"
#include "sphmbase/term_colors.hpp"
#include <cstdlib>
#include <utility>
#include <vector>

namespace {

    struct EnvVarDoc {
        std::string name;
        std::string desc;
    };

    std::vector<EnvVarDoc> &get_env_var_docs() {
        static std::vector<EnvVarDoc> docs{};
        return docs;
    }

} // namespace

std::optional<std::string> sphmcmdopt::getenv_str(const char *env_var) {
    const char *val = std::getenv(env_var);
    if (val != nullptr) {
        return std::string(val);
    }
    return {};
}

void sphmcmdopt::register_env_var_doc(std::string env_var, std::string desc) {
    for (auto &doc : get_env_var_docs()) {
        if (doc.name == env_var) {
            doc.desc = std::move(desc);
            return;
        }
    }
    get_env_var_docs().push_back({std::move(env_var), std::move(desc)});
}

void sphmcmdopt::print_help_env_var() {
    sphmbase::println("Env variables :");
    for (const auto &doc : get_env_var_docs()) {
        sphmbase::println(sphmbase::format(
            "  {}{:<20}{} : {}",
            sphmbase::term_colors::bold(),
            doc.name,
            sphmbase::term_colors::reset(),
            doc.desc));
    }
}
