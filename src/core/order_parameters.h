/*
 * <Spherical harmonics and Steinhardt bond order parameters>
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

#pragma once

#include <complex>
#include <optional>
#include <random>
#include <vector>

#include "src/core/global.h"
#include "src/core/neighbor_table.h"

namespace halo {
namespace OrderParameters {

/*! \brief Complex spherical harmonic Y_l^m with Condon-Shortley phase
 *
 *  Y_l^m(theta, phi) = sqrt((2l+1)/(4 pi) (l-m)!/(l+m)!) e^{i m theta} P_l^m(cos phi)
 *
 * \param theta azimuthal angle in the xy plane
 * \param phi polar angle measured from the z axis
 */
std::complex<double> SphericalHarmonic(int l, int m, double theta, double phi);

/*! \brief Y_l^m for m = -l..l of one direction, entry m + l */
std::vector<std::complex<double>> SphericalHarmonics(int l, double theta, double phi);

/*! \brief Rotation matrix of a modified Rodrigues parameter vector */
Eigen::Matrix3d RotationFromMRP(const Position& mrp);

/*! \brief Rotation drawn from a modified Rodrigues vector uniform in [0, 1)^3 */
Eigen::Matrix3d RandomRotation(std::mt19937& generator);

/*! \brief Per row average of Y_l^m over the neighbors strictly closer than cutoff_radius
 *
 * \throws DegenerateGeometryError if a row has no neighbor within cutoff_radius
 */
ComplexVector AverageSphericalHarmonic(const NeighborTable& table, int l, int m, double cutoff_radius,
    const std::optional<Eigen::Matrix3d>& rotation = std::nullopt);

/*! \brief Q_l = sqrt(4 pi / (2l+1) sum_m |<Y_l^m>|^2) per row, neighbors rotated by rotation
 *
 * \throws DegenerateGeometryError if a row has no neighbor within cutoff_radius
 */
Vector Steinhardt(const NeighborTable& table, int l, double cutoff_radius, const Eigen::Matrix3d& rotation);

} // namespace OrderParameters
} // namespace halo
