/*
 * <Global definitions for the periodic neighbor engine.>
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

#pragma once

#include <array>
#include <cmath>
#include <complex>
#include <limits>
#include <string>
#include <utility>
#include <vector>

#include <Eigen/Dense>

#include <nlohmann/json.hpp>

// for convenience
using json = nlohmann::json;

const double pi = 3.14159265359;

typedef Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor> Geometry;
typedef Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor> Matrix;
typedef Eigen::Matrix<int, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor> IndexMatrix;
typedef Eigen::Matrix<std::complex<double>, Eigen::Dynamic, 1> ComplexVector;
typedef Eigen::Vector3d Position;
typedef Eigen::Matrix3d Cell;

typedef Eigen::VectorXd Vector;
typedef std::pair<int, int> IntPair;
typedef std::vector<std::string> StringList;
typedef std::array<bool, 3> Periodicity;

namespace halo {

/*! \brief Sentinel encoding of empty neighbor slots
 *
 * An empty slot carries all three sentinels at once:
 *  - distance  : +inf
 *  - index     : INT32_MAX (larger than any valid atom id)
 *  - vector    : (+inf, +inf, +inf)
 *  - shell id  : -1
 */
constexpr double SentinelDistance = std::numeric_limits<double>::infinity();
constexpr int SentinelIndex = std::numeric_limits<int>::max();
constexpr int SentinelShell = -1;

inline bool IsSentinel(double distance) { return distance == SentinelDistance; }

/*! \brief Lp norm of a 3-vector, p >= 1 */
inline double LpNorm(const Position& vector, int p)
{
    if (p == 2)
        return vector.norm();
    if (p == 1)
        return vector.cwiseAbs().sum();
    double sum = 0;
    for (int i = 0; i < 3; ++i)
        sum += std::pow(std::abs(vector(i)), p);
    return std::pow(sum, 1.0 / p);
}

}
