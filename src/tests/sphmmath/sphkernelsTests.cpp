// -------------------------------------------------------//
//
// SPHMAP code for SPH particle rendering
// Copyright (c) 2024-2026 The Sphmap developers
// SPDX-License-Identifier: CeCILL Free Software License Agreement v2.1
// Sphmap is licensed under the CeCILL 2.1 License, see LICENSE for more information
//
// -------------------------------------------------------//

#include "sphmbase/Constants.hpp"
#include "sphmmath/integrator.hpp"
#include "sphmmath/sphkernels.hpp"
#include "sphmtest/sphmtest.hpp"

template<class Ker>
inline void validate_kernel(
    typename Ker::Tscal tol, typename Ker::Tscal dx, typename Ker::Tscal dx_int) {

    using Tscal = typename Ker::Tscal;

    constexpr Tscal pi = sphmbase::Constants<Tscal>::pi;

    // test finite support
    _AssertEqual(Ker::f(Ker::Rkern), 0);
    _AssertEqual(Ker::W_1d(Ker::Rkern, 1), 0);
    _AssertEqual(Ker::W_2d(Ker::Rkern, 1), 0);
    _AssertEqual(Ker::W_3d(Ker::Rkern, 1), 0);
    _AssertEqual(Ker::f(2 * Ker::Rkern), 0);

    Tscal gen_norm2d = Ker::Generator::norm_2d;
    Tscal gen_norm3d = Ker::Generator::norm_3d;

    // test f <-> W scale relations
    _AssertEqual(gen_norm2d * Ker::f(Ker::Rkern / 2), Ker::W_2d(Ker::Rkern / 2, 1));
    _AssertEqual(gen_norm2d * Ker::f(Ker::Rkern / 3), Ker::W_2d(Ker::Rkern / 3, 1));
    _AssertEqual(gen_norm2d * Ker::f(Ker::Rkern / 2) / 4, Ker::W_2d(2 * Ker::Rkern / 2, 2));
    _AssertEqual(gen_norm2d * Ker::f(Ker::Rkern / 3) / 4, Ker::W_2d(2 * Ker::Rkern / 3, 2));

    _AssertEqual(gen_norm3d * Ker::f(Ker::Rkern / 2), Ker::W_3d(Ker::Rkern / 2, 1));
    _AssertEqual(gen_norm3d * Ker::f(Ker::Rkern / 4), Ker::W_3d(Ker::Rkern / 4, 1));
    _AssertEqual(gen_norm3d * Ker::f(Ker::Rkern / 2) / 8, Ker::W_3d(2 * Ker::Rkern / 2, 2));
    _AssertEqual(gen_norm3d * Ker::f(Ker::Rkern / 4) / 8, Ker::W_3d(2 * Ker::Rkern / 4, 2));

    // test df <-> dW scale relations
    _AssertEqual(gen_norm3d * Ker::df(Ker::Rkern / 2), Ker::dW_3d(Ker::Rkern / 2, 1));
    _AssertEqual(gen_norm3d * Ker::df(Ker::Rkern / 2) / 16, Ker::dW_3d(2 * Ker::Rkern / 2, 2));

    // norm accessor
    _AssertEqual(Ker::norm(1), Ker::Generator::norm_1d);
    _AssertEqual(Ker::norm(2), Ker::Generator::norm_2d);
    _AssertEqual(Ker::norm(3), Ker::Generator::norm_3d);
    _AssertEqual(Ker::norm(4), 0);

    // is integral of W == 1 (1d)
    _AssertFloatEqual(
        1,
        sphmmath::integ_trapezoidal<Tscal>(
            0,
            Ker::Rkern,
            dx_int,
            [](Tscal x) {
                return 2 * Ker::W_1d(x, 1);
            }),
        tol)

    // is integral of W == 1 (2d)
    _AssertFloatEqual(
        1,
        sphmmath::integ_trapezoidal<Tscal>(
            0,
            Ker::Rkern,
            dx_int,
            [](Tscal x) {
                return 2 * pi * x * Ker::W_2d(x, 1);
            }),
        tol)

    // is integral of W == 1 (3d)
    _AssertFloatEqual(
        1,
        sphmmath::integ_trapezoidal<Tscal>(
            0,
            Ker::Rkern,
            dx_int,
            [](Tscal x) {
                return 4 * pi * x * x * Ker::W_3d(x, 1);
            }),
        tol)

    // is df = f' ?
    Tscal L2_sum = 0;
    Tscal step   = 0.01;
    for (Tscal x = 0; x < Ker::Rkern; x += step) {
        Tscal diff = Ker::df(x) - sphmmath::derivative_upwind<Tscal>(x, dx, [](Tscal x) {
                         return Ker::f(x);
                     });
        diff *= gen_norm3d;
        L2_sum += diff * diff * step;
    }
    _AssertFloatEqual(L2_sum, 0, tol)
}

TestStart(Unittest, "sphmmath/sphkernels/M4", validateM4kernel, 1) {
    validate_kernel<sphmmath::M4<f32>>(1e-3, 1e-3, 1e-2);
    validate_kernel<sphmmath::M4<f64>>(1e-5, 1e-5, 1e-4);
}

TestStart(Unittest, "sphmmath/sphkernels/M5", validateM5kernel, 1) {
    validate_kernel<sphmmath::M5<f32>>(1e-3, 1e-3, 1e-2);
    validate_kernel<sphmmath::M5<f64>>(1e-5, 1e-5, 1e-4);
}

TestStart(Unittest, "sphmmath/sphkernels/M6", validateM6kernel, 1) {
    validate_kernel<sphmmath::M6<f32>>(1e-3, 1e-3, 1e-2);
    validate_kernel<sphmmath::M6<f64>>(1e-5, 1e-5, 1e-4);
}

TestStart(Unittest, "sphmmath/sphkernels/C2", validateC2kernel, 1) {
    validate_kernel<sphmmath::C2<f32>>(1e-3, 1e-3, 1e-2);
    validate_kernel<sphmmath::C2<f64>>(1e-5, 1e-5, 1e-4);
}

TestStart(Unittest, "sphmmath/sphkernels/C4", validateC4kernel, 1) {
    validate_kernel<sphmmath::C4<f32>>(1e-3, 1e-3, 1e-2);
    validate_kernel<sphmmath::C4<f64>>(1e-5, 1e-5, 1e-4);
}

TestStart(Unittest, "sphmmath/sphkernels/C6", validateC6kernel, 1) {
    validate_kernel<sphmmath::C6<f32>>(1e-3, 1e-3, 1e-2);
    validate_kernel<sphmmath::C6<f64>>(1e-5, 1e-5, 1e-4);
}
