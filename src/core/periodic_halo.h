/*
 * <Periodic halo: replicated images around the primary cell>
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

#include <optional>
#include <vector>

#include "src/core/global.h"
#include "src/core/structure.h"

namespace halo {

/*! \brief Extended positions: the atoms of the structure plus periodic images
 *
 * Rows 0..N-1 are the atoms of the structure (folded into the cell along
 * periodic axes), all further rows are images. WrappedIndices() maps every row
 * back to the atom it replicates. The object is immutable once built and is
 * shared between all engines that reuse the same spatial index.
 */
class PeriodicHalo {
public:
    /*! \brief Halo thickness required for a search
     *
     * - no periodic axis: 0
     * - finite cutoff_radius: the cutoff itself
     * - otherwise the side length of an Lp ball holding max(num_neighbors, 8)
     *   atoms at the density of the structure, restricted to the n periodic
     *   axes and scaled by width_buffer:
     *
     *       W = 2^n Gamma(1+1/p)^2 / Gamma(1+n/p) * max(k, 8) / N * prod_axis((|a_axis|_p - 1) pbc_axis + 1)
     *       width = width_buffer * W^(1/n)
     *
     * The exponent 2 on Gamma(1+1/p) and the floor of 8 neighbors are empirical
     * and kept for compatibility of the generated halos.
     *
     * \throws ConfigurationError if neither num_neighbors nor a finite cutoff_radius is given
     */
    static double EstimateWidth(const Structure& structure, std::optional<int> num_neighbors,
        double cutoff_radius, double width_buffer, int norm_order);

    /*! \brief Materialize the halo of the given thickness (Cartesian, Angstroms) */
    PeriodicHalo(const Structure& structure, double width, int norm_order = 2);

    inline const Geometry& Positions() const { return m_positions; }
    inline const std::vector<int>& WrappedIndices() const { return m_wrapped_indices; }
    inline int Size() const { return static_cast<int>(m_positions.rows()); }
    inline double Width() const { return m_width; }

private:
    Geometry m_positions;
    std::vector<int> m_wrapped_indices;
    double m_width = 0;
};

} // namespace halo
