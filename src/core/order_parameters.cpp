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

#include "order_parameters.h"

#include "src/core/neighbor_errors.h"

#include <gsl/gsl_sf_legendre.h>

#include <Eigen/Geometry>

#include <fmt/core.h>

#include <cmath>

namespace halo {
namespace OrderParameters {

namespace {

void checkDegree(int l, int m)
{
    if (l < 0 || std::abs(m) > l)
        throw ConfigurationError(fmt::format("Spherical harmonic requires l >= 0 and |m| <= l, got l = {}, m = {}", l, m));
}

/* azimuthal and polar angle of a vector */
inline void angles(const Position& vector, double& theta, double& phi)
{
    theta = std::atan2(vector(1), vector(0));
    phi = std::atan2(std::hypot(vector(0), vector(1)), vector(2));
}

/* Y_l^m for m = 0..l, normalized Legendre functions from GSL, phase (-1)^m applied here */
std::vector<std::complex<double>> positiveOrders(int l, double theta, double phi)
{
    std::vector<double> result_array(gsl_sf_legendre_array_n(l));
    gsl_sf_legendre_array(GSL_SF_LEGENDRE_SPHARM, l, std::cos(phi), &result_array[0]);

    std::vector<std::complex<double>> ylm(l + 1);
    for (int m = 0; m <= l; ++m) {
        const std::complex<double> z = std::exp(std::complex<double>(0.0, m * theta)) * std::pow(-1.0, m);
        ylm[m] = result_array[gsl_sf_legendre_array_index(l, m)] * z;
    }
    return ylm;
}

/* rows of the table with the count of neighbors inside the cutoff, throws on an empty row */
std::vector<int> neighborsWithin(const NeighborTable& table, double cutoff_radius)
{
    std::vector<int> counts(table.Rows(), 0);
    for (int row = 0; row < table.Rows(); ++row) {
        for (int slot = 0; slot < table.Columns(); ++slot)
            if (table.distances()(row, slot) < cutoff_radius)
                ++counts[row];
        if (counts[row] == 0)
            throw DegenerateGeometryError(fmt::format(
                "cutoff_radius {} too small - atom {} has no neighbors (closest neighbor at {})",
                cutoff_radius, row, table.Columns() > 0 ? table.distances()(row, 0) : SentinelDistance));
    }
    return counts;
}

} // namespace

std::complex<double> SphericalHarmonic(int l, int m, double theta, double phi)
{
    checkDegree(l, m);
    const std::vector<std::complex<double>> ylm = positiveOrders(l, theta, phi);
    if (m >= 0)
        return ylm[m];
    return std::pow(-1.0, -m) * std::conj(ylm[-m]);
}

std::vector<std::complex<double>> SphericalHarmonics(int l, double theta, double phi)
{
    checkDegree(l, 0);
    const std::vector<std::complex<double>> positive = positiveOrders(l, theta, phi);
    std::vector<std::complex<double>> ylm(2 * l + 1);
    for (int m = 0; m <= l; ++m) {
        ylm[l + m] = positive[m];
        ylm[l - m] = std::pow(-1.0, m) * std::conj(positive[m]);
    }
    return ylm;
}

Eigen::Matrix3d RotationFromMRP(const Position& mrp)
{
    const double squared = mrp.squaredNorm();
    const double denominator = 1.0 + squared;
    const Position xyz = 2.0 * mrp / denominator;
    const Eigen::Quaterniond quaternion((1.0 - squared) / denominator, xyz(0), xyz(1), xyz(2));
    return quaternion.normalized().toRotationMatrix();
}

Eigen::Matrix3d RandomRotation(std::mt19937& generator)
{
    std::uniform_real_distribution<double> uniform(0.0, 1.0);
    Position mrp;
    for (int i = 0; i < 3; ++i)
        mrp(i) = uniform(generator);
    return RotationFromMRP(mrp);
}

ComplexVector AverageSphericalHarmonic(const NeighborTable& table, int l, int m, double cutoff_radius,
    const std::optional<Eigen::Matrix3d>& rotation)
{
    checkDegree(l, m);
    const std::vector<int> counts = neighborsWithin(table, cutoff_radius);

    ComplexVector average = ComplexVector::Zero(table.Rows());
    for (int row = 0; row < table.Rows(); ++row) {
        for (int slot = 0; slot < table.Columns(); ++slot) {
            if (!(table.distances()(row, slot) < cutoff_radius))
                continue;
            Position vector = table.Vector(row, slot);
            if (rotation)
                vector = (*rotation) * vector;
            double theta = 0, phi = 0;
            angles(vector, theta, phi);
            average(row) += SphericalHarmonic(l, m, theta, phi);
        }
        average(row) /= static_cast<double>(counts[row]);
    }
    return average;
}

Vector Steinhardt(const NeighborTable& table, int l, double cutoff_radius, const Eigen::Matrix3d& rotation)
{
    checkDegree(l, 0);
    const std::vector<int> counts = neighborsWithin(table, cutoff_radius);

    Vector q = Vector::Zero(table.Rows());
    for (int row = 0; row < table.Rows(); ++row) {
        std::vector<std::complex<double>> sum(l + 1, std::complex<double>(0.0, 0.0));
        for (int slot = 0; slot < table.Columns(); ++slot) {
            if (!(table.distances()(row, slot) < cutoff_radius))
                continue;
            const Position vector = rotation * table.Vector(row, slot);
            double theta = 0, phi = 0;
            angles(vector, theta, phi);
            const std::vector<std::complex<double>> ylm = positiveOrders(l, theta, phi);
            for (int m = 0; m <= l; ++m)
                sum[m] += ylm[m];
        }
        // |<Y_l^-m>| == |<Y_l^m>|
        double total = 0;
        for (int m = 0; m <= l; ++m) {
            const double magnitude = std::norm(sum[m] / static_cast<double>(counts[row]));
            total += m == 0 ? magnitude : 2.0 * magnitude;
        }
        q(row) = std::sqrt(4.0 * pi / (2.0 * l + 1.0) * total);
    }
    return q;
}

} // namespace OrderParameters
} // namespace halo
