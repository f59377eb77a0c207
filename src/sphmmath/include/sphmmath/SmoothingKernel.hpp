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
 * @file SmoothingKernel.hpp
 * @brief Runtime kernel interface consumed by the interpolators
 *
 */

#include "sphmbase/aliases_float.hpp"
#include "sphmbase/aliases_int.hpp"
#include "sphmbase/exception.hpp"
#include "sphmbase/string.hpp"
#include "sphmmath/sphkernels.hpp"
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace sphmmath {

    /**
     * @brief Dimensionless smoothing kernel with a fixed dimensionality
     *
     * `w(q)` is the normalised weight at the dimensionless distance `q = r/h`. It is only
     * queried for `q >= 0` and is zero for `q >= get_radkernel()`.
     *
     * @tparam Tscal scalar type
     */
    template<class Tscal>
    class SmoothingKernel {
        public:
        virtual ~SmoothingKernel() = default;

        /// weight at dimensionless distance q
        virtual Tscal w(Tscal q) const = 0;

        /// compact support radius in units of h
        virtual Tscal get_radkernel() const = 0;

        /// dimensionality the normalisation was made for
        virtual u32 get_ndims() const = 0;

        virtual std::string get_name() const = 0;
    };

    /**
     * @brief SmoothingKernel built from a compile time generator of sphkernels.hpp
     *
     * @code{.cpp}
     * sphmmath::SPHKernelAdapter<f64, sphmmath::M4> kernel(2);
     * f64 w0 = kernel.w(0); // 10/(7 pi)
     * @endcode
     */
    template<class Tscal, template<class> class SPHKernel>
    class SPHKernelAdapter final : public SmoothingKernel<Tscal> {
        public:
        using Kernel = SPHKernel<Tscal>;

        explicit SPHKernelAdapter(u32 ndims, std::string name = "")
            : ndims(ndims), norm(Kernel::norm(ndims)), name(std::move(name)) {
            if (ndims < 1 || ndims > 3) {
                sphmbase::throw_with_loc<std::invalid_argument>(sphmbase::format(
                    "kernels are only defined in 1, 2 or 3 dimensions, got ndims = {}", ndims));
            }
        }

        Tscal w(Tscal q) const override { return norm * Kernel::f(q); }

        Tscal get_radkernel() const override { return Kernel::Rkern; }

        u32 get_ndims() const override { return ndims; }

        std::string get_name() const override { return name; }

        private:
        u32 ndims;
        Tscal norm;
        std::string name;
    };

    /**
     * @brief Create a kernel from its name
     *
     * Known names : "M4" ("cubic"), "M5" ("quartic"), "M6" ("quintic"), "C2", "C4", "C6".
     *
     * @throws std::invalid_argument for an unknown name or ndims outside [1,3]
     */
    template<class Tscal>
    std::unique_ptr<SmoothingKernel<Tscal>> make_kernel(const std::string &name, u32 ndims);

} // namespace sphmmath
