// -------------------------------------------------------//
//
// SPHMAP code for SPH particle rendering
// Copyright (c) 2024-2026 The Sphmap developers
// SPDX-License-Identifier: CeCILL Free Software License Agreement v2.1
// Sphmap is licensed under the CeCILL 2.1 License, see LICENSE for more information
//
// -------------------------------------------------------//

#include "sphmdata/ParticleTable.hpp"
#include "sphmtest/sphmtest.hpp"
#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

TestStart(Unittest, "sphmdata/ParticleTable/columns", test_particle_table_columns, 1) {

    sphmdata::ParticleTable<f64> table;
    REQUIRE_EQUAL(table.get_obj_cnt(), 0);

    table.add_column("x", {0.0, 1.0, 2.0});
    table.add_column("y", {1.0, 1.0, 1.0});

    REQUIRE_EQUAL(table.get_obj_cnt(), 3);
    REQUIRE(table.has_column("x"));
    REQUIRE(!table.has_column("z"));
    REQUIRE_EQUAL(table.get_column("x")[2], 2.0);
    REQUIRE_EQUAL(table.get_column_names(), (std::vector<std::string>{"x", "y"}));

    std::vector<f64> same_size(3, 0.0);
    std::vector<f64> wrong_size(1, 0.0);
    REQUIRE_EXCEPTION_THROW(table.add_column("x", same_size), std::invalid_argument);
    REQUIRE_EXCEPTION_THROW(table.add_column("z", wrong_size), std::invalid_argument);
}

TestStart(Unittest, "sphmdata/ParticleTable/missing_column", test_particle_table_missing, 1) {

    sphmdata::ParticleTable<f64> table;
    table.add_column("x", {0.0});

    REQUIRE_EXCEPTION_THROW(table.get_column("rho"), sphmdata::MissingColumn);

    // MissingColumn is a lookup error
    REQUIRE_EXCEPTION_THROW(table.get_column("rho"), std::out_of_range);

    try {
        table.get_column("vx");
        REQUIRE_NAMED("get_column(\"vx\") should throw", false);
    } catch (const sphmdata::MissingColumn &e) {
        REQUIRE_EQUAL(e.get_column_name(), "vx");
    }
}

TestStart(Unittest, "sphmdata/ParticleTable/resolve_fields", test_resolve_fields, 1) {

    sphmdata::ParticleTable<f32> table;
    table.add_column("x", {0.f, 1.f});
    table.add_column("y", {2.f, 3.f});
    table.add_column("m", {1.f, 1.f});
    table.add_column("rho", {4.f, 5.f});
    table.add_column("h", {0.5f, 0.25f});

    sphmdata::ParticleFieldRefs<f32> refs = sphmdata::resolve_fields(table, "x", "y", "rho");

    REQUIRE_EQUAL(refs.obj_cnt, 2);
    REQUIRE_EQUAL(refs.y[1], 3.f);
    REQUIRE_EQUAL(refs.target[0], 4.f);
    REQUIRE_EQUAL(refs.hpart[1], 0.25f);
    REQUIRE(refs.target == refs.rho);

    // any of the implicit columns missing is reported
    sphmdata::ParticleTable<f32> no_h;
    no_h.add_column("x", {0.f});
    no_h.add_column("y", {0.f});
    no_h.add_column("m", {1.f});
    no_h.add_column("rho", {1.f});
    REQUIRE_EXCEPTION_THROW(
        sphmdata::resolve_fields(no_h, "x", "y", "rho"), sphmdata::MissingColumn);
    REQUIRE_EXCEPTION_THROW(
        sphmdata::resolve_fields(table, "x", "z", "rho"), sphmdata::MissingColumn);
}

TestStart(Unittest, "sphmdata/ParticleTable/custom_names", test_custom_column_names, 1) {

    sphmdata::ParticleTable<f64> table;
    table.add_column("x", {0.0});
    table.add_column("y", {0.0});
    table.add_column("mass", {2.0});
    table.add_column("density", {3.0});
    table.add_column("hsml", {0.1});

    REQUIRE_EXCEPTION_THROW(
        sphmdata::resolve_fields(table, "x", "y", "density"), sphmdata::MissingColumn);

    table.set_mass_column("mass");
    table.set_density_column("density");
    table.set_hpart_column("hsml");

    sphmdata::ParticleFieldRefs<f64> refs = sphmdata::resolve_fields(table, "x", "y", "density");
    REQUIRE_EQUAL(refs.mass[0], 2.0);
    REQUIRE_EQUAL(refs.rho[0], 3.0);
    REQUIRE_EQUAL(refs.hpart[0], 0.1);
}

TestStart(Unittest, "sphmdata/ParticleTable/canonical_order", test_canonical_order, 1) {

    const f64 nan = std::numeric_limits<f64>::quiet_NaN();

    std::vector<f64> x   = {2., -0., 0., 1., nan, 1.};
    std::vector<f64> y   = {0., 0., 0., 5., 0., 3.};
    std::vector<f64> one = {1., 1., 1., 1., 1., 1.};

    sphmdata::ParticleFieldRefs<f64> refs{
        x.data(), y.data(), one.data(), one.data(), one.data(), one.data(), 6};

    // x first (-0 before +0, nan last), ties on x broken by y
    REQUIRE_EQUAL(sphmdata::canonical_order(refs), (std::vector<u32>{1, 2, 5, 3, 0, 4}));

    // the same particles stored in reverse give the same sequence of particles
    std::vector<f64> x_rev(x.rbegin(), x.rend());
    std::vector<f64> y_rev(y.rbegin(), y.rend());
    sphmdata::ParticleFieldRefs<f64> refs_rev{
        x_rev.data(), y_rev.data(), one.data(), one.data(), one.data(), one.data(), 6};

    REQUIRE_EQUAL(sphmdata::canonical_order(refs_rev), (std::vector<u32>{4, 3, 0, 2, 5, 1}));

    sphmdata::ParticleFieldRefs<f64> empty{
        x.data(), y.data(), one.data(), one.data(), one.data(), one.data(), 0};
    REQUIRE(sphmdata::canonical_order(empty).empty());
}
