// -------------------------------------------------------//
//
// SPHMAP code for SPH particle rendering
// Copyright (c) 2024-2026 The Sphmap developers
// SPDX-License-Identifier: CeCILL Free Software License Agreement v2.1
// Sphmap is licensed under the CeCILL 2.1 License, see LICENSE for more information
//
// -------------------------------------------------------//

/**
 * @file pyRender.cpp
 * @brief Python bindings of the kernels and of the interpolators
 *
 * Particles are given as a dict of 1D numpy arrays, one entry per column.
 */

#include "sphmbase/exception.hpp"
#include "sphmbase/string.hpp"
#include "sphmdata/ParticleTable.hpp"
#include "sphmlog/logs.hpp"
#include "sphmmath/SmoothingKernel.hpp"
#include "sphmpylib/pybind11_json.hpp"
#include "sphmpylib/pybindaliases.hpp"
#include "sphmrender/GridInterpolator.hpp"
#include "sphmrender/LineInterpolator.hpp"
#include "sphmrender/exceptions.hpp"
#include <pybind11/numpy.h>
#include <pybind11/stl.h>
#include <algorithm>
#include <string>
#include <vector>

namespace {

    using Kernel = sphmmath::SmoothingKernel<f64>;

    using array_f64 = py::array_t<f64, py::array::c_style | py::array::forcecast>;

    /// copy a dict of numpy arrays into a particle table
    sphmdata::ParticleTable<f64> table_from_dict(
        const py::dict &particles,
        const std::string &mass,
        const std::string &density,
        const std::string &hpart) {

        sphmdata::ParticleTable<f64> table;

        for (auto item : particles) {
            std::string name = py::str(item.first);
            array_f64 arr    = item.second.cast<array_f64>();

            if (arr.ndim() != 1) {
                sphmbase::throw_with_loc<std::invalid_argument>(sphmbase::format(
                    "column {} must be a 1D array (got {} dimensions)", name, arr.ndim()));
            }

            table.add_column(name, std::vector<f64>(arr.data(), arr.data() + arr.size()));
        }

        table.set_mass_column(mass);
        table.set_density_column(density);
        table.set_hpart_column(hpart);

        return table;
    }

    py::array_t<f64> image_to_numpy(const sphmrender::GridImage<f64> &img) {
        py::array_t<f64> ret(std::vector<py::ssize_t>{py::ssize_t(img.ny), py::ssize_t(img.nx)});
        std::copy(img.data.begin(), img.data.end(), ret.mutable_data());
        return ret;
    }

} // namespace

Register_pymod(pysphmrender) {

    sphmlog_debug_ln("[Py]", "registering sphmap render functions");

    py::register_exception<sphmrender::InvalidParameter>(m, "InvalidParameter", PyExc_ValueError);
    py::register_exception<sphmrender::DimensionMismatch>(
        m, "DimensionMismatch", PyExc_ValueError);
    py::register_exception<sphmdata::MissingColumn>(m, "MissingColumn", PyExc_KeyError);

    py::class_<Kernel>(m, "SmoothingKernel")
        .def("w", &Kernel::w, py::arg("q"))
        .def("get_radkernel", &Kernel::get_radkernel)
        .def("get_ndims", &Kernel::get_ndims)
        .def("get_name", &Kernel::get_name)
        .def("__repr__", [](const Kernel &k) {
            return sphmbase::format("<SmoothingKernel {} {}d>", k.get_name(), k.get_ndims());
        });

    m.def(
        "make_kernel",
        [](const std::string &name, u32 ndims) {
            return sphmmath::make_kernel<f64>(name, ndims);
        },
        py::arg("name"),
        py::arg("ndims") = 2,
        R"==(
    Create a smoothing kernel

    Known names : M4 (cubic), M5 (quartic), M6 (quintic), C2, C4, C6
)==");

    m.def(
        "interpolate_2d",
        [](const py::dict &particles,
           const std::string &x,
           const std::string &y,
           const std::string &target,
           const Kernel &kernel,
           f64 pixwidthx,
           f64 pixwidthy,
           f64 xmin,
           f64 ymin,
           i64 pixcountx,
           i64 pixcounty,
           const std::string &mass,
           const std::string &density,
           const std::string &hpart) {
            sphmdata::ParticleTable<f64> table = table_from_dict(particles, mass, density, hpart);

            return image_to_numpy(sphmrender::interpolate_2d(
                table,
                x,
                y,
                target,
                kernel,
                pixwidthx,
                pixwidthy,
                xmin,
                ymin,
                pixcountx,
                pixcounty));
        },
        py::arg("particles"),
        py::arg("x"),
        py::arg("y"),
        py::arg("target"),
        py::arg("kernel"),
        py::arg("pixwidthx"),
        py::arg("pixwidthy"),
        py::arg("xmin")      = 0.,
        py::arg("ymin")      = 0.,
        py::arg("pixcountx") = 480,
        py::arg("pixcounty") = 480,
        py::kw_only(),
        py::arg("mass")    = "m",
        py::arg("density") = "rho",
        py::arg("hpart")   = "h",
        R"==(
    Interpolate a particle field onto a 2D grid

    Returns an array of shape (pixcounty, pixcountx)
)==");

    m.def(
        "interpolate_cross_section",
        [](const py::dict &particles,
           const std::string &x,
           const std::string &y,
           const std::string &target,
           const Kernel &kernel,
           f64 x1,
           f64 y1,
           f64 x2,
           f64 y2,
           i64 pixcount,
           const std::string &mass,
           const std::string &density,
           const std::string &hpart) {
            sphmdata::ParticleTable<f64> table = table_from_dict(particles, mass, density, hpart);

            std::vector<f64> prof = sphmrender::interpolate_cross_section(
                table, x, y, target, kernel, x1, y1, x2, y2, pixcount);

            py::array_t<f64> ret(static_cast<py::ssize_t>(prof.size()));
            std::copy(prof.begin(), prof.end(), ret.mutable_data());
            return ret;
        },
        py::arg("particles"),
        py::arg("x"),
        py::arg("y"),
        py::arg("target"),
        py::arg("kernel"),
        py::arg("x1")       = 0.,
        py::arg("y1")       = 0.,
        py::arg("x2")       = 1.,
        py::arg("y2")       = 1.,
        py::arg("pixcount") = 500,
        py::kw_only(),
        py::arg("mass")    = "m",
        py::arg("density") = "rho",
        py::arg("hpart")   = "h",
        R"==(
    Interpolate a particle field along the segment (x1, y1) -> (x2, y2)
)==");

    m.def(
        "fit_pixel_grid",
        [](const py::dict &particles, const std::string &x, const std::string &y, i64 nx, i64 ny) {
            sphmdata::ParticleTable<f64> table = table_from_dict(particles, "m", "rho", "h");
            nlohmann::json j = sphmrender::PixelGrid<f64>::fit_particles(table, x, y, nx, ny);
            return sphmpylib::json_to_pyobject(j);
        },
        py::arg("particles"),
        py::arg("x"),
        py::arg("y"),
        py::arg("pixcountx") = 480,
        py::arg("pixcounty") = 480,
        R"==(
    Pixel grid parameters spanning the bounding box of the particles, as a dict
)==");
}
