/*
 * <Periodic halo implementation>
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

#include "periodic_halo.h"

#include "src/core/halo_logger.h"
#include "src/core/neighbor_errors.h"
#include "src/tools/pbc_utils.h"

#include <fmt/core.h>

#include <algorithm>
#include <array>
#include <cmath>

namespace halo {

double PeriodicHalo::EstimateWidth(const Structure& structure, std::optional<int> num_neighbors,
    double cutoff_radius, double width_buffer, int norm_order)
{
    if (!num_neighbors && std::isinf(cutoff_radius))
        throw ConfigurationError("Define either num_neighbors or cutoff_radius");
    if (!structure.isPeriodic())
        return 0.0;
    if (!std::isinf(cutoff_radius))
        return cutoff_radius;

    const auto& pbc = structure.PBC();
    const int n = structure.PeriodicAxes();
    const double p = norm_order;
    const double prefactor = std::pow(2.0, n) * std::pow(std::tgamma(1.0 + 1.0 / p), 2) / std::tgamma(1.0 + n / p);

    const Eigen::Vector3d lengths = structure.CellLengths(norm_order);
    double width = 1.0;
    for (int axis = 0; axis < 3; ++axis)
        width *= pbc[axis] ? lengths(axis) : 1.0;
    width *= prefactor * std::max(*num_neighbors, 8) / static_cast<double>(structure.AtomCount());
    return width_buffer * std::pow(width, 1.0 / n);
}

PeriodicHalo::PeriodicHalo(const Structure& structure, double width, int norm_order)
    : m_width(width)
{
    if (width < 0)
        throw ConfigurationError(fmt::format("Halo width must not be negative, got {}", width));

    const int atoms = structure.AtomCount();
    if (width == 0 || !structure.isPeriodic()) {
        m_positions = structure.Positions();
        m_wrapped_indices.resize(atoms);
        for (int i = 0; i < atoms; ++i)
            m_wrapped_indices[i] = i;
        return;
    }

    const auto& pbc = structure.PBC();
    const Cell& cell = structure.getCell();
    const Geometry wrapped = structure.WrappedPositions();
    const Geometry fractional = PBCUtils::toFractional(wrapped, cell);
    const Eigen::Vector3d vertical = structure.VerticalLengths(norm_order);

    Eigen::Vector3d width_frac = Eigen::Vector3d::Zero();
    std::array<int, 3> repeat = { 0, 0, 0 };
    for (int axis = 0; axis < 3; ++axis) {
        if (!pbc[axis])
            continue;
        width_frac(axis) = width / vertical(axis);
        repeat[axis] = static_cast<int>(std::ceil(width_frac(axis)));
    }

    // the atoms themselves come first, images are appended behind them
    std::vector<Eigen::RowVector3d> images;
    std::vector<int> indices;
    images.reserve(atoms);
    indices.reserve(atoms);
    for (int i = 0; i < atoms; ++i) {
        images.push_back(wrapped.row(i));
        indices.push_back(i);
    }

    for (int a = -repeat[0]; a <= repeat[0]; ++a)
        for (int b = -repeat[1]; b <= repeat[1]; ++b)
            for (int c = -repeat[2]; c <= repeat[2]; ++c) {
                if (a == 0 && b == 0 && c == 0)
                    continue;
                const Eigen::RowVector3d shift(a, b, c);
                for (int i = 0; i < atoms; ++i) {
                    const Eigen::RowVector3d frac = fractional.row(i) + shift;
                    bool inside = true;
                    for (int axis = 0; axis < 3 && inside; ++axis) {
                        if (!pbc[axis])
                            continue;
                        // distance outside the primary cell in fractional units
                        const double outside = std::abs(frac(axis) - 0.5 + 1e-8) - 0.5;
                        inside = outside < width_frac(axis);
                    }
                    if (!inside)
                        continue;
                    images.push_back(frac * cell);
                    indices.push_back(i);
                }
            }

    m_positions.resize(static_cast<Eigen::Index>(images.size()), 3);
    for (std::size_t i = 0; i < images.size(); ++i)
        m_positions.row(static_cast<Eigen::Index>(i)) = images[i];
    m_wrapped_indices = std::move(indices);

    if (HaloLogger::get_verbosity() >= 3)
        HaloLogger::info_fmt("Periodic halo of width {:.4f}: {} atoms extended to {} points", width, atoms, Size());
}

} // namespace halo
