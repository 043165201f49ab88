#include "tinge.hpp"

namespace {
    // Piecewise sRGB transfer function, not clamped so extended values survive a round trip
    constexpr float decode_threshold = 0.04045f;
    constexpr float encode_threshold = 0.0031308f;
    constexpr float linear_slope = 12.92f;
    constexpr float gamma = 2.4f;
    constexpr float offset = 0.055f;
}

namespace tinge {
    LinearRGB srgb_to_linear_rgb(const SRGB& srgb) {
        const glm::vec3 encoded = srgb;
        const auto curve = glm::pow((encoded + offset) / (1 + offset), glm::vec3{gamma});
        const auto line = encoded / linear_slope;
        return LinearRGB{glm::mix(curve, line, glm::lessThan(encoded, glm::vec3{decode_threshold}))};
    }

    SRGB linear_rgb_to_srgb(const LinearRGB& rgb) {
        const glm::vec3 linear = rgb;
        const auto curve = (1 + offset) * glm::pow(linear, glm::vec3{1 / gamma}) - offset;
        const auto line = linear * linear_slope;
        return SRGB{glm::mix(curve, line, glm::lessThan(linear, glm::vec3{encode_threshold}))};
    }
}
