/*
 * <Neighbor search engine reusing one spatial index>
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

#include "neighbor_tree.h"

#include "src/core/halo_logger.h"
#include "src/core/neighbor_errors.h"
#include "src/core/order_parameters.h"
#include "src/tools/pbc_utils.h"

#include <fmt/core.h>

#include <cmath>

namespace halo {

namespace {

std::mt19937 seededGenerator(int seed)
{
    if (seed < 0) {
        std::random_device device;
        return std::mt19937(device());
    }
    return std::mt19937(static_cast<std::mt19937::result_type>(seed));
}

} // namespace

NeighborTree::NeighborTree(const Structure& structure, const NeighborSettings& settings)
    : m_structure(structure)
    , m_settings(settings)
    , m_generator(seededGenerator(settings.seed))
{
    m_settings.Validate();
}

void NeighborTree::BuildIndex(std::optional<int> num_neighbors, double cutoff_radius, double width_buffer)
{
    const double width = PeriodicHalo::EstimateWidth(m_structure, num_neighbors, cutoff_radius, width_buffer, m_settings.norm_order);
    auto halo = std::make_shared<const PeriodicHalo>(m_structure, width, m_settings.norm_order);
    m_index = std::make_shared<const SpatialIndex>(halo, m_settings.norm_order);
    m_halo = std::move(halo);
}

NeighborTable NeighborTree::Query(const Geometry& positions, std::optional<int> num_neighbors,
    double cutoff_radius, double width_buffer)
{
    if (!m_index)
        throw ConfigurationError("No spatial index available, call BuildIndex first");
    if (positions.rows() > 0 && positions.cols() != 3)
        throw ConfigurationError(fmt::format("Query positions must have 3 columns, got {}", positions.cols()));

    const int k = m_estimator.Resolve(num_neighbors, cutoff_radius, width_buffer,
        m_structure.VolumePerAtom(), m_settings.norm_order);
    if (m_index->Size() < k && std::isinf(cutoff_radius))
        throw InfeasibleSearchError(fmt::format(
            "num_neighbors too large ({} requested, {} points available) - make width_buffer larger and/or make num_neighbors smaller",
            k, m_index->Size()));

    Geometry wrapped = positions;
    if (m_settings.wrap_positions)
        wrapped = PBCUtils::wrapPositions(positions, m_structure.getCell(), m_structure.PBC(), 1.0e-12);

    Matrix distances;
    IndexMatrix extended;
    m_index->Query(wrapped, k, cutoff_radius, distances, extended);

    if (!std::isinf(cutoff_radius) && distances.cols() > 0) {
        for (int row = 0; row < distances.rows(); ++row) {
            if (!IsSentinel(distances(row, distances.cols() - 1))) {
                HaloLogger::warn_fmt("Number of neighbors found within the cutoff_radius {} is equal to (estimated) num_neighbors {}. "
                                     "Increase num_neighbors (or set it to none) or width_buffer to find all neighbors within cutoff_radius.",
                    cutoff_radius, k);
                break;
            }
        }
    }

    const std::vector<int>& wrapped_indices = m_halo->WrappedIndices();
    IndexMatrix indices = IndexMatrix::Constant(distances.rows(), distances.cols(), SentinelIndex);
    for (int row = 0; row < distances.rows(); ++row)
        for (int slot = 0; slot < distances.cols(); ++slot)
            if (!IsSentinel(distances(row, slot)))
                indices(row, slot) = wrapped_indices[extended(row, slot)];

    return NeighborTable(std::move(distances), std::move(indices), std::move(extended), std::move(wrapped), m_halo);
}

void NeighborTree::Populate(const Geometry& positions, std::optional<int> num_neighbors, double cutoff_radius,
    double width_buffer, bool exclude_self)
{
    int first_column = 0;
    std::optional<int> requested = num_neighbors;
    if (exclude_self) {
        first_column = 1;
        if (requested)
            *requested += 1;
    }

    m_table = Query(positions, requested, cutoff_radius, width_buffer);
    if (exclude_self && num_neighbors)
        m_estimator.Decrement();

    m_table.TrimColumns(first_column, m_table.MaxFiniteColumns());
    TableChanged();
}

NeighborTree NeighborTree::GetNeighborhood(const Geometry& positions, std::optional<int> num_neighbors,
    double cutoff_radius, double width_buffer) const
{
    NeighborTree neighborhood = Copy();
    neighborhood.Populate(positions, num_neighbors, cutoff_radius, width_buffer, false);
    return neighborhood;
}

NeighborView<double> NeighborTree::GetDistances(const Geometry& positions, std::optional<Mode> mode,
    std::optional<int> num_neighbors, double cutoff_radius, double width_buffer)
{
    return Query(positions, num_neighbors, cutoff_radius, width_buffer).Distances(mode.value_or(m_settings.mode));
}

NeighborView<int> NeighborTree::GetIndices(const Geometry& positions, std::optional<Mode> mode,
    std::optional<int> num_neighbors, double cutoff_radius, double width_buffer)
{
    return Query(positions, num_neighbors, cutoff_radius, width_buffer).Indices(mode.value_or(m_settings.mode));
}

NeighborView<Position> NeighborTree::GetVectors(const Geometry& positions, std::optional<Mode> mode,
    std::optional<int> num_neighbors, double cutoff_radius, double width_buffer)
{
    return Query(positions, num_neighbors, cutoff_radius, width_buffer).Vectors(mode.value_or(m_settings.mode));
}

const PeriodicHalo& NeighborTree::Halo() const
{
    if (!m_halo)
        throw ConfigurationError("No periodic halo available, call BuildIndex first");
    return *m_halo;
}

void NeighborTree::setNormOrder(int norm_order)
{
    throw ConfigurationError(fmt::format(
        "norm_order cannot be changed after initialization (requested {}, current {}). "
        "Re-initialize the neighbor engine with the correct norm_order value",
        norm_order, m_settings.norm_order));
}

bool NeighborTree::CheckWidth(double width) const
{
    return m_table.CheckWidth(width, m_structure.PBC(), m_settings.norm_order);
}

ComplexVector NeighborTree::SphericalHarmonics(int l, int m, double cutoff_radius,
    const std::optional<Eigen::Matrix3d>& rotation) const
{
    return OrderParameters::AverageSphericalHarmonic(m_table, l, m, cutoff_radius, rotation);
}

Vector NeighborTree::SteinhardtParameter(int l, double cutoff_radius)
{
    const Eigen::Matrix3d rotation = OrderParameters::RandomRotation(m_generator);
    return OrderParameters::Steinhardt(m_table, l, cutoff_radius, rotation);
}

std::string NeighborTree::Summary() const
{
    std::string summary = "Main attributes:\n"
                          "- distances : Distances to the neighbors of given positions\n"
                          "- indices : Indices of the neighbors of given positions\n";
    if (m_table.hasVectors())
        summary += "- vectors : Vectors to the neighbors of given positions\n";
    summary += fmt::format("{} positions, {} slots, mode {}, norm order {}\n",
        m_table.Rows(), m_table.Columns(), ModeName(m_settings.mode), m_settings.norm_order);
    return summary;
}

} // namespace halo
