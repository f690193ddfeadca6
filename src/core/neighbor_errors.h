/*
 * <Error types of the periodic neighbor engine>
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

#include <stdexcept>
#include <string>

namespace halo {

/**
 * @brief Invalid or missing configuration: unresolvable search size, unknown mode,
 * norm order change, mismatched array shapes
 */
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& message)
        : std::invalid_argument(message)
    {
    }
};

/**
 * @brief More neighbors requested than extended points exist for an unbounded search
 */
class InfeasibleSearchError : public std::runtime_error {
public:
    explicit InfeasibleSearchError(const std::string& message)
        : std::runtime_error(message)
    {
    }
};

/**
 * @brief An atom has no neighbor where at least one is required
 */
class DegenerateGeometryError : public std::runtime_error {
public:
    explicit DegenerateGeometryError(const std::string& message)
        : std::runtime_error(message)
    {
    }
};

} // namespace halo
