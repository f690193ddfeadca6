/*
 * <Tests for the periodic halo construction>
 * Copyright (C) 2025 Conrad Hübler <Conrad.Huebler@gmx.net>
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 *
 */

#include "src/core/halo_logger.h"
#include "src/core/neighbor_errors.h"
#include "src/core/periodic_halo.h"

#include "core/halo_tester.h"
#include "core/test_structures.h"

#include <cmath>
#include <iostream>
#include <limits>
#include <set>

using namespace halo;
using TestStructures::TestStructureRegistry;

namespace {
const double unbounded = std::numeric_limits<double>::infinity();
}

void test_estimate_width(HaloTester& tester)
{
    tester.section("Halo width estimate");

    Cell cell = Cell::Identity();
    const Structure sc(Geometry::Zero(1, 3), cell, { true, true, true }, { "Po" });

    // 2^3 Gamma(3/2)^2 / Gamma(5/2) * 8 atoms per unit volume, cube root, times 1.2
    tester.assert_near(4.027718698907231, PeriodicHalo::EstimateWidth(sc, 8, unbounded, 1.2, 2), 1e-9,
        "sc a=1, k=8, p=2 follows the empirical ball estimate");
    tester.assert_near(PeriodicHalo::EstimateWidth(sc, 8, unbounded, 1.2, 2),
        PeriodicHalo::EstimateWidth(sc, 4, unbounded, 1.2, 2), 1e-12,
        "fewer than 8 neighbors are raised to 8");
    tester.assert_true(PeriodicHalo::EstimateWidth(sc, 30, unbounded, 1.2, 2) > PeriodicHalo::EstimateWidth(sc, 8, unbounded, 1.2, 2),
        "more neighbors need a thicker halo");
    tester.assert_near(2.0 * PeriodicHalo::EstimateWidth(sc, 8, unbounded, 1.0, 2),
        PeriodicHalo::EstimateWidth(sc, 8, unbounded, 2.0, 2), 1e-12,
        "width scales linearly with width_buffer");
    tester.assert_near(3.5, PeriodicHalo::EstimateWidth(sc, 8, 3.5, 1.2, 2), 1e-12,
        "a finite cutoff radius is the width");

    const Structure cluster = TestStructureRegistry::createStructure("Cu5_cluster");
    tester.assert_near(0.0, PeriodicHalo::EstimateWidth(cluster, 4, unbounded, 1.2, 2), 1e-12,
        "non-periodic structures need no halo");

    tester.assert_throws<ConfigurationError>([&]() { PeriodicHalo::EstimateWidth(sc, std::nullopt, unbounded, 1.2, 2); },
        "neither num_neighbors nor cutoff_radius");
}

void test_simple_cubic_images(HaloTester& tester)
{
    tester.section("Simple cubic images");

    Cell cell = Cell::Identity();
    const Structure sc(Geometry::Zero(1, 3), cell, { true, true, true }, { "Po" });
    const PeriodicHalo halo(sc, 0.5);

    // the atom at the origin and its images at the upper faces, edges and corner
    tester.assert_equal(8, halo.Size(), "width 0.5 keeps the 2x2x2 corner images");
    bool all_atom_zero = true;
    for (int index : halo.WrappedIndices())
        all_atom_zero = all_atom_zero && index == 0;
    tester.assert_true(all_atom_zero, "every image maps back to atom 0");
    tester.assert_near(0.0, halo.Positions().row(0).norm(), 1e-12, "the atom itself comes first");
    tester.assert_near(0.5, halo.Width(), 1e-12, "width is stored");

    bool in_range = true;
    for (int i = 0; i < halo.Size(); ++i)
        for (int axis = 0; axis < 3; ++axis)
            in_range = in_range && halo.Positions()(i, axis) > -0.5 && halo.Positions()(i, axis) < 1.5;
    tester.assert_true(in_range, "all images lie within the width around the cell");

    const PeriodicHalo wide(sc, 1.6);
    tester.assert_true(wide.Size() > halo.Size(), "a thicker halo holds more images");
}

void test_non_periodic(HaloTester& tester)
{
    tester.section("Non-periodic and zero width");

    const Structure cluster = TestStructureRegistry::createStructure("Cu5_cluster");
    const PeriodicHalo halo(cluster, 3.0);
    tester.assert_equal(cluster.AtomCount(), halo.Size(), "no images without periodic axes");
    bool identity = true;
    for (int i = 0; i < halo.Size(); ++i)
        identity = identity && halo.WrappedIndices()[i] == i && (halo.Positions().row(i) - cluster.Positions().row(i)).norm() < 1e-12;
    tester.assert_true(identity, "positions and indices are the identity");

    const Structure bcc = TestStructureRegistry::createStructure("Fe_bcc");
    const PeriodicHalo flat(bcc, 0.0);
    tester.assert_equal(bcc.AtomCount(), flat.Size(), "zero width keeps only the atoms");

    tester.assert_throws<ConfigurationError>([&]() { PeriodicHalo(bcc, -1.0); }, "negative width");
}

void test_mixed_periodicity(HaloTester& tester)
{
    tester.section("Periodic along x and y only");

    const Structure slab = TestStructureRegistry::createStructure("Fe_slab");
    const PeriodicHalo halo(slab, 1.0);

    // only fractional coordinate 0 gains an image at 1 per periodic axis:
    // corners 2 * (4 + 2 + 2 + 1), body centers 8
    tester.assert_equal(26, halo.Size(), "images only along periodic axes");

    std::set<long> heights;
    for (int i = 0; i < slab.AtomCount(); ++i)
        heights.insert(std::lround(slab.Positions()(i, 2) * 1000));
    bool flat = true;
    for (int i = 0; i < halo.Size(); ++i)
        flat = flat && heights.count(std::lround(halo.Positions()(i, 2) * 1000)) == 1;
    tester.assert_true(flat, "no image is shifted along the non-periodic axis");
}

void test_wrapped_originals(HaloTester& tester)
{
    tester.section("Originals are wrapped");

    const double a = 3.35;
    Geometry positions(1, 3);
    positions << 1.5 * a, -0.25 * a, 0.0;
    const Structure sc(positions, Cell::Identity() * a, { true, true, true }, { "Po" });
    const PeriodicHalo halo(sc, 1.0);

    tester.assert_near(0.5 * a, halo.Positions()(0, 0), 1e-9, "x folded into the cell");
    tester.assert_near(0.75 * a, halo.Positions()(0, 1), 1e-9, "y folded into the cell");
    tester.assert_equal(0, halo.WrappedIndices()[0], "first row is the atom itself");
}

int main()
{
    HaloLogger::initialize(1, false);

    std::cout << "=== Periodic Halo Test Suite ===" << std::endl;

    HaloTester tester;
    test_estimate_width(tester);
    test_simple_cubic_images(tester);
    test_non_periodic(tester);
    test_mixed_periodicity(tester);
    test_wrapped_originals(tester);

    return tester.print_summary();
}
