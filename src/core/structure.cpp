/*
 * <Reference structure implementation>
 * Copyright (C) 2019 - 2025 Conrad Hübler <Conrad.Huebler@gmx.net>
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

#include "structure.h"

#include "src/core/neighbor_errors.h"
#include "src/tools/pbc_utils.h"

#include <fmt/core.h>

#include <cmath>

namespace halo {

Structure::Structure(const Geometry& positions, const Cell& cell, const Periodicity& pbc, const StringList& symbols)
    : m_positions(positions)
    , m_cell(cell)
    , m_pbc(pbc)
    , m_symbols(symbols)
{
    Validate();
}

Structure::Structure(const Geometry& positions, const StringList& symbols)
    : m_positions(positions)
    , m_symbols(symbols)
{
    Validate();
}

Structure Structure::Cubic(const std::string& symbol, double a, const std::string& lattice, int repeat)
{
    std::vector<Position> basis = { Position(0.0, 0.0, 0.0) };
    if (lattice == "bcc") {
        basis.emplace_back(0.5, 0.5, 0.5);
    } else if (lattice == "fcc") {
        basis.emplace_back(0.0, 0.5, 0.5);
        basis.emplace_back(0.5, 0.0, 0.5);
        basis.emplace_back(0.5, 0.5, 0.0);
    } else if (lattice != "sc") {
        throw ConfigurationError(fmt::format("Unknown cubic lattice '{}'. Available: sc, bcc, fcc", lattice));
    }
    if (repeat < 1)
        throw ConfigurationError(fmt::format("repeat must be positive, got {}", repeat));

    const int atoms = static_cast<int>(basis.size()) * repeat * repeat * repeat;
    Geometry positions(atoms, 3);
    int index = 0;
    for (int i = 0; i < repeat; ++i)
        for (int j = 0; j < repeat; ++j)
            for (int k = 0; k < repeat; ++k)
                for (const auto& site : basis) {
                    const Position cartesian = (site + Position(double(i), double(j), double(k))) * a;
                    positions.row(index++) = cartesian.transpose();
                }

    const Cell cell = Cell::Identity() * (a * repeat);
    return Structure(positions, cell, { true, true, true }, StringList(atoms, symbol));
}

void Structure::Validate() const
{
    if (m_positions.rows() > 0 && m_positions.cols() != 3)
        throw ConfigurationError(fmt::format("Positions must have 3 columns, got {}", m_positions.cols()));
    if (static_cast<int>(m_symbols.size()) != m_positions.rows())
        throw ConfigurationError(fmt::format("Number of chemical symbols ({}) does not match number of positions ({})",
            m_symbols.size(), m_positions.rows()));
    if (isPeriodic() && !PBCUtils::isValidUnitCell(m_cell))
        throw ConfigurationError("Periodic structure requires a non-singular cell");
}

int Structure::PeriodicAxes() const
{
    return static_cast<int>(m_pbc[0]) + static_cast<int>(m_pbc[1]) + static_cast<int>(m_pbc[2]);
}

double Structure::Volume() const
{
    return std::abs(m_cell.determinant());
}

double Structure::VolumePerAtom() const
{
    if (AtomCount() == 0)
        return 0.0;
    return Volume() / AtomCount();
}

Geometry Structure::WrappedPositions(double epsilon) const
{
    return PBCUtils::wrapPositions(m_positions, m_cell, m_pbc, epsilon);
}

Eigen::Vector3d Structure::VerticalLengths(int p) const
{
    return PBCUtils::verticalLengths(m_cell, p);
}

Eigen::Vector3d Structure::CellLengths(int p) const
{
    return PBCUtils::cellLengths(m_cell, p);
}

} // namespace halo
