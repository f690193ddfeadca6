/*
 * <Resolution and freezing of the neighbor count>
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

#include <limits>
#include <optional>

namespace halo {

/*! \brief Turns (num_neighbors?, cutoff_radius) into a concrete search size
 *
 * The first successful resolution freezes the pair. Later calls without an
 * explicit count reuse the frozen value; calls asking for more neighbors than
 * frozen are honored with a warning, since the halo was sized for the smaller
 * search.
 */
class NeighborEstimator {
public:
    /*! \brief Lower bound of a density based estimate (empirical) */
    static constexpr int MinimumEstimate = 14;

    /*! \brief Number of neighbors to search for
     *
     *  k = max(14, floor((1 + width_buffer) * 8 Gamma(1+1/p)^3 / Gamma(1+3/p) * rc^3 / volume_per_atom))
     *
     * \throws ConfigurationError if neither a count, a finite cutoff nor a frozen value is available
     */
    int Resolve(std::optional<int> num_neighbors, double cutoff_radius, double width_buffer,
        double volume_per_atom, int norm_order);

    /*! \brief Lower the frozen count by one, used after a query that reserved a slot for the atom itself */
    void Decrement();

    inline bool isFrozen() const { return m_num_neighbors.has_value(); }
    inline std::optional<int> NumNeighbors() const { return m_num_neighbors; }
    inline double CutoffRadius() const { return m_cutoff_radius; }

private:
    std::optional<int> m_num_neighbors;
    double m_cutoff_radius = std::numeric_limits<double>::infinity();
};

} // namespace halo
