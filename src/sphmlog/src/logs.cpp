// -------------------------------------------------------//
//
// SPHMAP code for SPH particle rendering
// Copyright (c) 2024-2026 The Sphmap developers
// SPDX-License-Identifier: CeCILL Free Software License Agreement v2.1
// Sphmap is licensed under the CeCILL 2.1 License, see LICENSE for more information
//
// -------------------------------------------------------//

/**
 * @file logs.cpp
 * @brief
 *
 */

#include "sphmlog/logs.hpp"
#include "sphmcmdopt/env.hpp"
#include <stdexcept>

namespace sphmlog::logs {

    void init_from_env() {
        sphmcmdopt::register_env_var_doc("SPHM_LOGLEVEL", "Log level (integer, default 0)");
        sphmcmdopt::register_env_var_doc("SPHM_NOCOLOR", "Disable terminal colors if set");

        if (auto lvl = sphmcmdopt::getenv_str("SPHM_LOGLEVEL")) {
            try {
                int val = std::stoi(*lvl);
                if (val < -128 || val > 127) {
                    throw std::out_of_range("log level out of range");
                }
                set_loglevel(static_cast<i8>(val));
            } catch (const std::logic_error &e) {
                err_ln("Logs", "invalid SPHM_LOGLEVEL value :", *lvl, "(", e.what(), ")");
            }
        }

        if (sphmcmdopt::getenv_str("SPHM_NOCOLOR")) {
            sphmbase::term_colors::disable_colors();
        }
    }

} // namespace sphmlog::logs

inline std::string
reformat_all(std::string color, const char *name, std::string module_name, std::string content) {
    return "[" + (color) + module_name + sphmbase::term_colors::reset() + "] " + (color) + (name)
           + sphmbase::term_colors::reset() + ": " + content;
}

inline std::string
reformat_simple(std::string color, std::string module_name, std::string content) {
    if (module_name.empty()) {
        return content;
    }
    return "[" + (color) + module_name + sphmbase::term_colors::reset() + "] " + content;
}

std::string LogLevel_Debug::reformat(const std::string &in, std::string module_name) {
    return ::reformat_all(sphmbase::term_colors::col8b_green(), level_name, module_name, in);
}

std::string LogLevel_Info::reformat(const std::string &in, std::string module_name) {
    return ::reformat_all(sphmbase::term_colors::col8b_cyan(), "Info", module_name, in);
}

std::string LogLevel_Normal::reformat(const std::string &in, std::string module_name) {
    return ::reformat_simple(sphmbase::term_colors::empty(), module_name, in);
}

std::string LogLevel_Warning::reformat(const std::string &in, std::string module_name) {
    return ::reformat_all(sphmbase::term_colors::col8b_yellow(), level_name, module_name, in);
}

std::string LogLevel_Error::reformat(const std::string &in, std::string module_name) {
    return ::reformat_all(sphmbase::term_colors::col8b_red(), level_name, module_name, in);
}
