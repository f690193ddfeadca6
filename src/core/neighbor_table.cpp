/*
 * <Canonical neighbor table and its filled / ragged / flattened views>
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

#include "neighbor_table.h"

#include "src/core/neighbor_errors.h"

#include <fmt/core.h>

#include <algorithm>

namespace halo {

NeighborView<int> Reshape(Mode mode, const Matrix& distances, const IndexMatrix& values)
{
    return Reshape<int>(mode, distances, [&values](int row, int slot) { return values(row, slot); });
}

NeighborTable::NeighborTable(Matrix distances, IndexMatrix indices, IndexMatrix extended_indices, Geometry positions,
    std::shared_ptr<const PeriodicHalo> halo)
    : m_distances(std::move(distances))
    , m_indices(std::move(indices))
    , m_extended_indices(std::move(extended_indices))
    , m_positions(std::move(positions))
    , m_halo(std::move(halo))
    , m_populated(true)
{
    if (m_indices.rows() != m_distances.rows() || m_indices.cols() != m_distances.cols()
        || m_extended_indices.rows() != m_distances.rows() || m_extended_indices.cols() != m_distances.cols())
        throw ConfigurationError(fmt::format("Neighbor table shape mismatch: distances {}x{}, indices {}x{}",
            m_distances.rows(), m_distances.cols(), m_indices.rows(), m_indices.cols()));
    if (m_positions.rows() != m_distances.rows())
        throw ConfigurationError(fmt::format("Neighbor table has {} rows but {} query positions",
            m_distances.rows(), m_positions.rows()));
}

const Geometry& NeighborTable::vectors() const
{
    if (m_vectors_ready)
        return m_vectors;

    const int rows = Rows();
    const int cols = Columns();
    m_vectors = Geometry::Constant(static_cast<Eigen::Index>(rows) * cols, 3, SentinelDistance);
    for (int row = 0; row < rows; ++row)
        for (int slot = 0; slot < cols; ++slot) {
            if (IsSentinel(m_distances(row, slot)))
                continue;
            m_vectors.row(row * cols + slot) = m_halo->Positions().row(m_extended_indices(row, slot)) - m_positions.row(row);
        }
    m_vectors_ready = true;
    return m_vectors;
}

NeighborView<double> NeighborTable::Distances(Mode mode) const
{
    return Reshape<double>(mode, m_distances, [this](int row, int slot) { return m_distances(row, slot); });
}

NeighborView<int> NeighborTable::Indices(Mode mode) const
{
    return Reshape(mode, m_distances, m_indices);
}

NeighborView<Position> NeighborTable::Vectors(Mode mode) const
{
    const Geometry& vecs = vectors();
    const int cols = Columns();
    return Reshape<Position>(mode, m_distances, [&vecs, cols](int row, int slot) {
        return Position(vecs.row(row * cols + slot).transpose());
    });
}

NeighborView<int> NeighborTable::AtomNumbers(Mode mode) const
{
    return Reshape<int>(mode, m_distances, [](int row, int) { return row; });
}

std::vector<int> NeighborTable::NumbersOfNeighbors() const
{
    std::vector<int> counts(Rows(), 0);
    for (int row = 0; row < Rows(); ++row)
        for (int slot = 0; slot < Columns(); ++slot)
            if (!IsSentinel(m_distances(row, slot)))
                ++counts[row];
    return counts;
}

int NeighborTable::MaxFiniteColumns() const
{
    const std::vector<int> counts = NumbersOfNeighbors();
    if (counts.empty())
        return 0;
    return *std::max_element(counts.begin(), counts.end());
}

void NeighborTable::TrimColumns(int first, int last)
{
    last = std::min(last, Columns());
    first = std::min(first, last);
    const int width = last - first;
    m_distances = Matrix(m_distances.middleCols(first, width));
    m_indices = IndexMatrix(m_indices.middleCols(first, width));
    m_extended_indices = IndexMatrix(m_extended_indices.middleCols(first, width));
    m_vectors_ready = false;
    m_vectors.resize(0, 3);
}

bool NeighborTable::CheckWidth(double width, const Periodicity& pbc, int norm_order) const
{
    if (!(pbc[0] || pbc[1] || pbc[2]) || m_distances.size() == 0)
        return false;

    const Geometry& vecs = vectors();
    const int cols = Columns();
    for (int row = 0; row < Rows(); ++row)
        for (int slot = 0; slot < cols; ++slot) {
            if (IsSentinel(m_distances(row, slot)))
                continue;
            Position periodic = vecs.row(row * cols + slot).transpose();
            for (int axis = 0; axis < 3; ++axis)
                if (!pbc[axis])
                    periodic(axis) = 0;
            if (LpNorm(periodic, norm_order) > width)
                return true;
        }
    return false;
}

} // namespace halo
