#pragma once

#include <tinge.hpp>

#include <gtest/gtest.h>

#include <cmath>
#include <ostream>
#include <sstream>
#include <vector>

namespace tinge::test {
    inline std::ostream& print_values(std::ostream& stream, const glm::vec3& values) {
        return stream << '{' << values.x << ", " << values.y << ", " << values.z << '}';
    }

    inline ::testing::AssertionResult VectorIsNear(const glm::vec3& a, const glm::vec3& b, float epsilon) {
        for (int i = 0; i < 3; i++) {
            if (!(std::fabs(a[i] - b[i]) <= epsilon)) {
                auto failure = ::testing::AssertionFailure();
                std::ostringstream stream;
                print_values(stream, a) << " != ";
                print_values(stream, b) << " (epsilon " << epsilon << ")";
                return failure << stream.str();
            }
        }
        return ::testing::AssertionSuccess();
    }

    // Evenly spaced sRGB samples, n per channel
    inline std::vector<SRGB> srgb_grid(int n) {
        std::vector<SRGB> grid;
        for (int r = 0; r < n; r++) {
            for (int g = 0; g < n; g++) {
                for (int b = 0; b < n; b++) {
                    grid.emplace_back(static_cast<float>(r) / (n - 1), static_cast<float>(g) / (n - 1),
                            static_cast<float>(b) / (n - 1));
                }
            }
        }
        return grid;
    }
}
