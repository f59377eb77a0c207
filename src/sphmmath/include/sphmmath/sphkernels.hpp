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
 * @file sphkernels.hpp
 * @brief Compile time SPH kernel generators
 *
 * A generator defines the shape function `f(q)` of the kernel, its derivative `df(q)`, the
 * support radius `Rkern` (in units of h) and the normalisation constants in 1, 2 and 3
 * dimensions. SPHKernelGen builds the dimensional kernels from it :
 * \f[ W_{nd}(r,h) = \frac{C_{nd}}{h^{nd}} f(r/h) \f]
 *
 * References:
 * - Monaghan, J.J. & Lattanzio, J.C. (1985), B-spline kernels M4, M5, M6
 * - Dehnen, W. & Aly, H. (2012), Wendland kernels C2, C4, C6
 */

#include "sphmbase/Constants.hpp"
#include <cmath>

namespace sphmmath::details {

    template<class Tscal>
    inline constexpr Tscal pow4(Tscal x) {
        Tscal x2 = x * x;
        return x2 * x2;
    }

    template<class Tscal>
    inline constexpr Tscal pow5(Tscal x) {
        return pow4(x) * x;
    }

    /// Cubic B-spline
    template<class Tscal>
    class KernelDefM4 {
        public:
        inline static constexpr Tscal pi      = sphmbase::Constants<Tscal>::pi;
        inline static constexpr Tscal Rkern   = 2;
        inline static constexpr Tscal norm_1d = 2. / 3.;
        inline static constexpr Tscal norm_2d = 10. / (7. * pi);
        inline static constexpr Tscal norm_3d = 1. / pi;

        inline static Tscal f(Tscal q) {
            Tscal t1 = 2 - q;
            Tscal t2 = 1 - q;
            if (q < 1) {
                return Tscal(0.25) * t1 * t1 * t1 - t2 * t2 * t2;
            } else if (q < 2) {
                return Tscal(0.25) * t1 * t1 * t1;
            }
            return 0;
        }

        inline static Tscal df(Tscal q) {
            Tscal t1 = 2 - q;
            Tscal t2 = 1 - q;
            if (q < 1) {
                return Tscal(-0.75) * t1 * t1 + 3 * t2 * t2;
            } else if (q < 2) {
                return Tscal(-0.75) * t1 * t1;
            }
            return 0;
        }
    };

    /// Quartic B-spline
    template<class Tscal>
    class KernelDefM5 {
        public:
        inline static constexpr Tscal pi      = sphmbase::Constants<Tscal>::pi;
        inline static constexpr Tscal Rkern   = 2.5;
        inline static constexpr Tscal norm_1d = 1. / 24.;
        inline static constexpr Tscal norm_2d = 96. / (1199. * pi);
        inline static constexpr Tscal norm_3d = 1. / (20. * pi);

        inline static Tscal f(Tscal q) {
            Tscal t1 = Tscal(2.5) - q;
            Tscal t2 = Tscal(1.5) - q;
            Tscal t3 = Tscal(0.5) - q;
            if (q < Tscal(0.5)) {
                return pow4(t1) - 5 * pow4(t2) + 10 * pow4(t3);
            } else if (q < Tscal(1.5)) {
                return pow4(t1) - 5 * pow4(t2);
            } else if (q < Tscal(2.5)) {
                return pow4(t1);
            }
            return 0;
        }

        inline static Tscal df(Tscal q) {
            Tscal t1 = Tscal(2.5) - q;
            Tscal t2 = Tscal(1.5) - q;
            Tscal t3 = Tscal(0.5) - q;
            if (q < Tscal(0.5)) {
                return -4 * t1 * t1 * t1 + 20 * t2 * t2 * t2 - 40 * t3 * t3 * t3;
            } else if (q < Tscal(1.5)) {
                return -4 * t1 * t1 * t1 + 20 * t2 * t2 * t2;
            } else if (q < Tscal(2.5)) {
                return -4 * t1 * t1 * t1;
            }
            return 0;
        }
    };

    /// Quintic B-spline
    template<class Tscal>
    class KernelDefM6 {
        public:
        inline static constexpr Tscal pi      = sphmbase::Constants<Tscal>::pi;
        inline static constexpr Tscal Rkern   = 3;
        inline static constexpr Tscal norm_1d = 1. / 120.;
        inline static constexpr Tscal norm_2d = 7. / (478. * pi);
        inline static constexpr Tscal norm_3d = 1. / (120. * pi);

        inline static Tscal f(Tscal q) {
            Tscal t1 = 3 - q;
            Tscal t2 = 2 - q;
            Tscal t3 = 1 - q;
            if (q < 1) {
                return pow5(t1) - 6 * pow5(t2) + 15 * pow5(t3);
            } else if (q < 2) {
                return pow5(t1) - 6 * pow5(t2);
            } else if (q < 3) {
                return pow5(t1);
            }
            return 0;
        }

        inline static Tscal df(Tscal q) {
            Tscal t1 = 3 - q;
            Tscal t2 = 2 - q;
            Tscal t3 = 1 - q;
            if (q < 1) {
                return -5 * pow4(t1) + 30 * pow4(t2) - 75 * pow4(t3);
            } else if (q < 2) {
                return -5 * pow4(t1) + 30 * pow4(t2);
            } else if (q < 3) {
                return -5 * pow4(t1);
            }
            return 0;
        }
    };

    /// Wendland C2, support scaled to 2h
    template<class Tscal>
    class KernelDefC2 {
        public:
        inline static constexpr Tscal pi      = sphmbase::Constants<Tscal>::pi;
        inline static constexpr Tscal Rkern   = 2;
        inline static constexpr Tscal norm_1d = 3. / 4.;
        inline static constexpr Tscal norm_2d = 7. / (4. * pi);
        inline static constexpr Tscal norm_3d = 21. / (16. * pi);

        inline static Tscal f(Tscal q) {
            if (q < 2) {
                Tscal t = 1 - q / 2;
                return pow4(t) * (1 + 2 * q);
            }
            return 0;
        }

        inline static Tscal df(Tscal q) {
            if (q < 2) {
                Tscal t = 1 - q / 2;
                return -5 * q * t * t * t;
            }
            return 0;
        }
    };

    /// Wendland C4, support scaled to 2h
    template<class Tscal>
    class KernelDefC4 {
        public:
        inline static constexpr Tscal pi      = sphmbase::Constants<Tscal>::pi;
        inline static constexpr Tscal Rkern   = 2;
        inline static constexpr Tscal norm_1d = 27. / 32.;
        inline static constexpr Tscal norm_2d = 9. / (4. * pi);
        inline static constexpr Tscal norm_3d = 495. / (256. * pi);

        inline static Tscal f(Tscal q) {
            if (q < 2) {
                Tscal t  = 1 - q / 2;
                Tscal t2 = t * t;
                return t2 * t2 * t2 * (1 + 3 * q + Tscal(35. / 12.) * q * q);
            }
            return 0;
        }

        inline static Tscal df(Tscal q) {
            if (q < 2) {
                Tscal t = 1 - q / 2;
                return Tscal(-14. / 3.) * q * (1 + Tscal(2.5) * q) * pow5(t);
            }
            return 0;
        }
    };

    /// Wendland C6, support scaled to 2h
    template<class Tscal>
    class KernelDefC6 {
        public:
        inline static constexpr Tscal pi      = sphmbase::Constants<Tscal>::pi;
        inline static constexpr Tscal Rkern   = 2;
        inline static constexpr Tscal norm_1d = 15. / 16.;
        inline static constexpr Tscal norm_2d = 39. / (14. * pi);
        inline static constexpr Tscal norm_3d = 1365. / (512. * pi);

        inline static Tscal f(Tscal q) {
            if (q < 2) {
                Tscal t4 = pow4(1 - q / 2);
                return t4 * t4 * (1 + 4 * q + Tscal(6.25) * q * q + 4 * q * q * q);
            }
            return 0;
        }

        inline static Tscal df(Tscal q) {
            if (q < 2) {
                Tscal t  = 1 - q / 2;
                Tscal t7 = pow4(t) * t * t * t;
                return Tscal(-2.75) * q * (2 + 7 * q + 8 * q * q) * t7;
            }
            return 0;
        }
    };

} // namespace sphmmath::details

namespace sphmmath {

    /**
     * @brief Build the dimensional SPH kernels from a kernel generator
     *
     * @tparam flt scalar type
     * @tparam Gen kernel generator (see details::KernelDefM4)
     */
    template<class flt, class Gen>
    class SPHKernelGen {
        public:
        using Generator = Gen;
        using Tscal     = flt;

        inline static constexpr Tscal Rkern = Generator::Rkern;

        inline static Tscal f(Tscal q) { return Generator::f(q); }
        inline static Tscal df(Tscal q) { return Generator::df(q); }

        inline static Tscal W_1d(Tscal r, Tscal h) { return Generator::norm_1d * f(r / h) / h; }

        inline static Tscal W_2d(Tscal r, Tscal h) {
            return Generator::norm_2d * f(r / h) / (h * h);
        }

        inline static Tscal W_3d(Tscal r, Tscal h) {
            return Generator::norm_3d * f(r / h) / (h * h * h);
        }

        inline static Tscal dW_1d(Tscal r, Tscal h) {
            return Generator::norm_1d * df(r / h) / (h * h);
        }

        inline static Tscal dW_2d(Tscal r, Tscal h) {
            return Generator::norm_2d * df(r / h) / (h * h * h);
        }

        inline static Tscal dW_3d(Tscal r, Tscal h) {
            return Generator::norm_3d * df(r / h) / (h * h * h * h);
        }

        /// Normalisation constant in the requested dimension (1, 2 or 3), 0 otherwise
        inline static constexpr Tscal norm(unsigned int dim) {
            switch (dim) {
            case 1 : return Generator::norm_1d;
            case 2 : return Generator::norm_2d;
            case 3 : return Generator::norm_3d;
            default: return 0;
            }
        }
    };

    template<class flt>
    using M4 = SPHKernelGen<flt, details::KernelDefM4<flt>>;

    template<class flt>
    using M5 = SPHKernelGen<flt, details::KernelDefM5<flt>>;

    template<class flt>
    using M6 = SPHKernelGen<flt, details::KernelDefM6<flt>>;

    template<class flt>
    using C2 = SPHKernelGen<flt, details::KernelDefC2<flt>>;

    template<class flt>
    using C4 = SPHKernelGen<flt, details::KernelDefC4<flt>>;

    template<class flt>
    using C6 = SPHKernelGen<flt, details::KernelDefC6<flt>>;

} // namespace sphmmath
