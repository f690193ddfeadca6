/*
 * <Reference structures shared by the test executables>
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

#include <map>
#include <string>

#include "src/core/structure.h"

namespace TestStructures {

struct StructureData {
    std::string name;
    std::string description;
    double lattice_constant = 0;
    double first_shell_distance = 0;
    int first_shell_count = 0;
    double second_shell_distance = 0;
    int second_shell_count = 0;
};

class TestStructureRegistry {
public:
    static const StructureData& getStructure(const std::string& name);

    /*! \brief Build the structure, throws std::runtime_error for unknown names */
    static halo::Structure createStructure(const std::string& name);

    /*! \brief Copy of a structure with every atom displaced uniformly within +-amplitude */
    static halo::Structure perturb(const halo::Structure& structure, double amplitude, unsigned seed = 42);

private:
    static const std::map<std::string, StructureData> s_structure_registry;
};

} // namespace TestStructures
