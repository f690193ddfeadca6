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

#include "neighbor_estimator.h"

#include "src/core/halo_logger.h"
#include "src/core/neighbor_errors.h"

#include <fmt/core.h>

#include <algorithm>
#include <cmath>

namespace halo {

int NeighborEstimator::Resolve(std::optional<int> num_neighbors, double cutoff_radius, double width_buffer,
    double volume_per_atom, int norm_order)
{
    const bool unbounded = std::isinf(cutoff_radius);
    if (!num_neighbors && unbounded && !m_num_neighbors)
        throw ConfigurationError("Specify num_neighbors or cutoff_radius");

    int resolved = 0;
    if (num_neighbors) {
        resolved = *num_neighbors;
    } else if (!m_num_neighbors && !unbounded) {
        if (!(volume_per_atom > 0))
            throw ConfigurationError(fmt::format(
                "Cannot estimate num_neighbors for cutoff_radius {}: the structure has no volume, pass num_neighbors explicitly",
                cutoff_radius));
        const double p = norm_order;
        const double prefactor = 8.0 * std::pow(std::tgamma(1.0 + 1.0 / p), 3) / std::tgamma(1.0 + 3.0 / p);
        const double estimate = (1.0 + width_buffer) * prefactor * std::pow(cutoff_radius, 3) / volume_per_atom;
        resolved = std::max(MinimumEstimate, static_cast<int>(estimate));
    } else {
        resolved = *m_num_neighbors;
    }

    if (!m_num_neighbors) {
        m_num_neighbors = resolved;
        m_cutoff_radius = cutoff_radius;
    } else if (resolved > *m_num_neighbors) {
        HaloLogger::warn_fmt("Taking a larger search area after initialization has the risk of missing neighborhood atoms "
                             "(num_neighbors {} > {})",
            resolved, *m_num_neighbors);
    }
    return resolved;
}

void NeighborEstimator::Decrement()
{
    if (m_num_neighbors)
        *m_num_neighbors -= 1;
}

} // namespace halo
