#include "lightness.hpp"

#include <cmath>

namespace {
    constexpr float k_1 = 0.206f;
    constexpr float k_2 = 0.03f;
    constexpr float k_3 = (1 + k_1) / (1 + k_2);
}

namespace tinge {
    float toe(float x) {
        const auto b = k_3 * x - k_1;
        return 0.5f * (b + std::sqrt(b * b + 4 * k_2 * k_3 * x));
    }

    // Exact inverse of the positive root solved by toe(): y^2 + k_1 y = k_3 x (y + k_2)
    float toe_inv(float x) {
        return (x * x + k_1 * x) / (k_3 * (x + k_2));
    }
}
