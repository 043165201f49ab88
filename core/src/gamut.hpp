#pragma once

#include "tinge.hpp"

#include <optional>

namespace tinge {
    // Lightness and chroma of a point in a constant hue slice of Oklab
    struct LC {
        float l;
        float c;
    };

    // Saturation (C / L) and its counterpart towards white (C / (1 - L))
    struct ST {
        float s;
        float t;
    };

    // Chroma anchors of the okhsl saturation curve at one lightness
    struct Cs {
        float c_0;
        float c_mid;
        float c_max;
    };

    glm::vec2 hue_vector(float h);

    // Hue in turns of a direction in the a/b plane; 0 points along +a
    float hue_angle(const glm::vec2& ab);

    // Maximum saturation reachable at the hue. The hue must be normalized.
    float compute_max_saturation(const glm::vec2& hue);

    LC find_cusp(const glm::vec2& hue);

    // Finds t such that (L0 * (1 - t) + t * L1, t * C1) lies on the sRGB gamut boundary
    float find_gamut_intersection(const glm::vec2& hue, float l1, float c1, float l0,
            const std::optional<LC>& cusp = std::nullopt);

    ST get_st_max(const glm::vec2& hue, const std::optional<LC>& cusp = std::nullopt);

    ST get_st_mid(const glm::vec2& hue);

    Cs get_cs(float l, const glm::vec2& hue);
}
