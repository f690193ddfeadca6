/*
 * <Minimal assertion helper shared by the test executables>
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

#include <cmath>
#include <exception>
#include <iostream>
#include <string>

class HaloTester {
public:
    int tests_run = 0;
    int tests_passed = 0;

    void assert_equal(int expected, int actual, const std::string& msg = "")
    {
        tests_run++;
        if (expected == actual) {
            tests_passed++;
            std::cout << "✓ " << msg << std::endl;
        } else {
            std::cout << "✗ FAIL: " << msg << " - Expected: " << expected
                      << ", Got: " << actual << std::endl;
        }
    }

    void assert_near(double expected, double actual, double tolerance, const std::string& msg = "")
    {
        tests_run++;
        if (std::abs(expected - actual) <= tolerance) {
            tests_passed++;
            std::cout << "✓ " << msg << std::endl;
        } else {
            std::cout << "✗ FAIL: " << msg << " - Expected: " << expected
                      << ", Got: " << actual << " (tolerance " << tolerance << ")" << std::endl;
        }
    }

    void assert_true(bool condition, const std::string& msg = "")
    {
        tests_run++;
        if (condition) {
            tests_passed++;
            std::cout << "✓ " << msg << std::endl;
        } else {
            std::cout << "✗ FAIL: " << msg << std::endl;
        }
    }

    void assert_false(bool condition, const std::string& msg = "")
    {
        assert_true(!condition, msg);
    }

    template <typename Exception, typename Function>
    void assert_throws(Function&& function, const std::string& msg = "")
    {
        tests_run++;
        try {
            function();
            std::cout << "✗ FAIL: " << msg << " - nothing thrown" << std::endl;
        } catch (const Exception& e) {
            tests_passed++;
            std::cout << "✓ " << msg << " (" << e.what() << ")" << std::endl;
        } catch (const std::exception& e) {
            std::cout << "✗ FAIL: " << msg << " - unexpected exception: " << e.what() << std::endl;
        }
    }

    void section(const std::string& title)
    {
        std::cout << "\n=== " << title << " ===" << std::endl;
    }

    int print_summary()
    {
        std::cout << "\n============================================" << std::endl;
        std::cout << "Tests: " << tests_passed << "/" << tests_run << " passed" << std::endl;
        std::cout << "============================================" << std::endl;
        return tests_passed == tests_run ? 0 : 1;
    }
};
