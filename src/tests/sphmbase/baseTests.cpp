// -------------------------------------------------------//
//
// SPHMAP code for SPH particle rendering
// Copyright (c) 2024-2026 The Sphmap developers
// SPDX-License-Identifier: CeCILL Free Software License Agreement v2.1
// Sphmap is licensed under the CeCILL 2.1 License, see LICENSE for more information
//
// -------------------------------------------------------//

#include "sphmbase/aliases_int.hpp"
#include "sphmbase/exception_ctx.hpp"
#include "sphmbase/narrowing.hpp"
#include "sphmbase/string.hpp"
#include "sphmtest/sphmtest.hpp"
#include <stdexcept>
#include <string>
#include <vector>

TestStart(Unittest, "sphmbase/narrowing", test_narrow_check, 1) {
    REQUIRE(sphmbase::can_narrow<u32>(i64(480)));
    REQUIRE(!sphmbase::can_narrow<u32>(i64(-1)));
    REQUIRE(!sphmbase::can_narrow<u32>(u64(u32_max) + 1));
    REQUIRE(sphmbase::can_narrow<i32>(u32(12)));

    REQUIRE_EQUAL(sphmbase::narrow_check<u32>(u64(7)), u32(7));
    REQUIRE_EXCEPTION_THROW(sphmbase::narrow_check<u32>(i64(-3)), std::runtime_error);
}

TestStart(Unittest, "sphmbase/string/pad_right", test_pad_right, 1) {
    REQUIRE_EQUAL(sphmbase::pad_right("abc", 6), std::string("abc   "));
    REQUIRE_EQUAL(sphmbase::pad_right("abcdef", 3), std::string("abcdef"));
}

TestStart(Unittest, "sphmbase/exception_ctx", test_exception_ctx, 1) {
    std::invalid_argument ex = sphmbase::make_except_with_loc_with_ctx<std::invalid_argument>(
        "bad segment",
        std::vector<sphmbase::args_info>{
            sphmbase::args_info("--segment--"), sphmbase::args_info("x1", 0.5)});

    std::string msg = ex.what();
    REQUIRE(msg.find("bad segment") != std::string::npos);
    REQUIRE(msg.find("--segment--") != std::string::npos);
    REQUIRE(msg.find("x1 = 0.5") != std::string::npos);
}
