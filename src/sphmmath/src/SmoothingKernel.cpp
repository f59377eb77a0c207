// -------------------------------------------------------//
//
// SPHMAP code for SPH particle rendering
// Copyright (c) 2024-2026 The Sphmap developers
// SPDX-License-Identifier: CeCILL Free Software License Agreement v2.1
// Sphmap is licensed under the CeCILL 2.1 License, see LICENSE for more information
//
// -------------------------------------------------------//

/**
 * @file SmoothingKernel.cpp
 * @brief
 *
 */

#include "sphmmath/SmoothingKernel.hpp"

namespace sphmmath {

    template<class Tscal>
    std::unique_ptr<SmoothingKernel<Tscal>> make_kernel(const std::string &name, u32 ndims) {

        if (name == "M4" || name == "cubic") {
            return std::make_unique<SPHKernelAdapter<Tscal, M4>>(ndims, "M4");
        } else if (name == "M5" || name == "quartic") {
            return std::make_unique<SPHKernelAdapter<Tscal, M5>>(ndims, "M5");
        } else if (name == "M6" || name == "quintic") {
            return std::make_unique<SPHKernelAdapter<Tscal, M6>>(ndims, "M6");
        } else if (name == "C2") {
            return std::make_unique<SPHKernelAdapter<Tscal, C2>>(ndims, "C2");
        } else if (name == "C4") {
            return std::make_unique<SPHKernelAdapter<Tscal, C4>>(ndims, "C4");
        } else if (name == "C6") {
            return std::make_unique<SPHKernelAdapter<Tscal, C6>>(ndims, "C6");
        }

        throw sphmbase::make_except_with_loc<std::invalid_argument>(
            "unknown kernel name : " + name + " (possible values : M4, M5, M6, C2, C4, C6)");
    }

    template std::unique_ptr<SmoothingKernel<f32>> make_kernel<f32>(const std::string &, u32);
    template std::unique_ptr<SmoothingKernel<f64>> make_kernel<f64>(const std::string &, u32);

} // namespace sphmmath
