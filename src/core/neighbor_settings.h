/*
 * <Typed settings of the neighbor engine>
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
#include <string>

#include "src/core/global.h"

namespace halo {

/*! \brief Presentation of the neighbor table, the storage itself is always filled */
enum class Mode {
    Filled,
    Ragged,
    Flattened
};

/*! \brief "filled", "ragged" or "flattened" (case-insensitive)
 * \throws ConfigurationError for any other string
 */
Mode ParseMode(const std::string& name);
std::string ModeName(Mode mode);

/*! \brief Settings of one neighbor search
 *
 * Defaults are registered in the ParameterRegistry under the module
 * "neighbors"; FromJson merges a user controller on top of them.
 *
 * \code
 * json controller = { { "num_neighbors", 8 }, { "mode", "ragged" } };
 * auto settings = halo::NeighborSettings::FromJson(controller);
 * \endcode
 */
struct NeighborSettings {
    std::optional<int> num_neighbors = 12; //!< none: estimated from cutoff_radius
    double cutoff_radius = std::numeric_limits<double>::infinity();
    double width_buffer = 1.2;
    int norm_order = 2;
    Mode mode = Mode::Filled;
    bool wrap_positions = false;
    int tolerance = 2; //!< decimal places used to round distances into shells
    std::string linkage = "complete";
    std::string affinity = "euclidean";
    int seed = -1; //!< rotation generator seed, negative: std::random_device

    static NeighborSettings FromJson(const json& controller);
    json toJson() const;

    /*! \throws ConfigurationError for non-positive counts, negative buffers or norm orders below 1 */
    void Validate() const;
};

} // namespace halo
