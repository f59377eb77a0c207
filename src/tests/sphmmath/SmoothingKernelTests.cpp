// -------------------------------------------------------//
//
// SPHMAP code for SPH particle rendering
// Copyright (c) 2024-2026 The Sphmap developers
// SPDX-License-Identifier: CeCILL Free Software License Agreement v2.1
// Sphmap is licensed under the CeCILL 2.1 License, see LICENSE for more information
//
// -------------------------------------------------------//

#include "sphmbase/Constants.hpp"
#include "sphmmath/SmoothingKernel.hpp"
#include "sphmmath/integrator.hpp"
#include "sphmtest/sphmtest.hpp"
#include <stdexcept>

TestStart(Unittest, "sphmmath/SmoothingKernel/make_kernel", test_make_kernel, 1) {

    constexpr f64 pi = sphmbase::Constants<f64>::pi;

    auto m4 = sphmmath::make_kernel<f64>("M4", 2);
    REQUIRE_EQUAL(m4->get_name(), "M4");
    REQUIRE_EQUAL(m4->get_ndims(), 2);
    REQUIRE_EQUAL(m4->get_radkernel(), 2);
    REQUIRE_FLOAT_EQUAL(m4->w(0), 10. / (7. * pi), 1e-15);
    REQUIRE_EQUAL(m4->w(2), 0);
    REQUIRE_EQUAL(m4->w(3), 0);

    auto cubic = sphmmath::make_kernel<f64>("cubic", 2);
    REQUIRE_EQUAL(cubic->get_name(), "M4");
    REQUIRE_EQUAL(cubic->w(0.7), m4->w(0.7));

    REQUIRE_EQUAL(sphmmath::make_kernel<f64>("quartic", 3)->get_name(), "M5");
    REQUIRE_EQUAL(sphmmath::make_kernel<f64>("quartic", 3)->get_radkernel(), 2.5);
    REQUIRE_EQUAL(sphmmath::make_kernel<f64>("quintic", 1)->get_name(), "M6");
    REQUIRE_EQUAL(sphmmath::make_kernel<f64>("quintic", 1)->get_radkernel(), 3);
    REQUIRE_EQUAL(sphmmath::make_kernel<f32>("C2", 2)->get_name(), "C2");
    REQUIRE_EQUAL(sphmmath::make_kernel<f32>("C4", 2)->get_name(), "C4");
    REQUIRE_EQUAL(sphmmath::make_kernel<f32>("C6", 2)->get_name(), "C6");

    REQUIRE_EXCEPTION_THROW(sphmmath::make_kernel<f64>("gaussian", 2), std::invalid_argument);
    REQUIRE_EXCEPTION_THROW(sphmmath::make_kernel<f64>("M4", 0), std::invalid_argument);
    REQUIRE_EXCEPTION_THROW(sphmmath::make_kernel<f64>("M4", 4), std::invalid_argument);
}

TestStart(Unittest, "sphmmath/SmoothingKernel/norm_2d", test_kernel_norm_2d, 1) {

    constexpr f64 pi = sphmbase::Constants<f64>::pi;

    for (const char *name : {"M4", "M5", "M6", "C2", "C4", "C6"}) {
        auto kernel = sphmmath::make_kernel<f64>(name, 2);

        f64 integ = sphmmath::integ_trapezoidal<f64>(0, kernel->get_radkernel(), 1e-4, [&](f64 q) {
            return 2 * pi * q * kernel->w(q);
        });

        REQUIRE_NAMED(std::string("2d normalisation of ") + name, std::abs(integ - 1) < 1e-6);
    }
}

TestStart(Unittest, "sphmmath/SmoothingKernel/adapter", test_kernel_adapter, 1) {

    sphmmath::SPHKernelAdapter<f64, sphmmath::M6> k3(3, "quintic 3d");

    REQUIRE_EQUAL(k3.get_name(), "quintic 3d");
    REQUIRE_EQUAL(k3.get_ndims(), 3);
    REQUIRE_EQUAL(k3.w(1.5), sphmmath::M6<f64>::W_3d(1.5, 1));

    using Adapter = sphmmath::SPHKernelAdapter<f32, sphmmath::C2>;
    REQUIRE_EXCEPTION_THROW(Adapter(7), std::invalid_argument);
}
