#include "tinge.hpp"

#define GLM_ENABLE_EXPERIMENTAL
#include <glm/gtx/component_wise.hpp>

#include <cmath>
#include <limits>

namespace {
    // Hue in turns of a color that isn't gray, given its largest channel and its channel range
    float rgb_hue(const glm::vec3& rgb, float max, float range) {
        float h;
        if (max == rgb.r) {
            h = (rgb.g - rgb.b) / range + (rgb.g < rgb.b ? 6 : 0);
        } else if (max == rgb.g) {
            h = (rgb.b - rgb.r) / range + 2;
        } else {
            h = (rgb.r - rgb.g) / range + 4;
        }
        return h / 6;
    }

    constexpr float nan = std::numeric_limits<float>::quiet_NaN();

    float hue_to_channel(float p, float q, float t) {
        t -= std::floor(t);
        if (t < 1.f / 6) {
            return p + (q - p) * 6 * t;
        }
        if (t < 1.f / 2) {
            return q;
        }
        if (t < 2.f / 3) {
            return p + (q - p) * (2.f / 3 - t) * 6;
        }
        return p;
    }
}

namespace tinge {
    HSL srgb_to_hsl(const SRGB& srgb) {
        const auto max = glm::compMax(glm::vec3{srgb});
        const auto min = glm::compMin(glm::vec3{srgb});
        const auto l = (max + min) / 2;
        if (max == min) {
            return HSL{0.f, 0.f, l};
        }

        const auto range = max - min;
        const auto s = l > 0.5f ? range / (2 - max - min) : range / (max + min);
        return HSL{rgb_hue(srgb, max, range), s, l};
    }

    SRGB hsl_to_srgb(const HSL& hsl) {
        const auto h = hsl.x;
        const auto s = hsl.y;
        const auto l = hsl.z;
        if (s == 0) {
            return SRGB{l, l, l};
        }
        if (!std::isfinite(h)) {
            return SRGB{nan, nan, nan};
        }

        const auto q = l < 0.5f ? l * (1 + s) : l + s - l * s;
        const auto p = 2 * l - q;
        const auto hue = h - std::floor(h);
        return SRGB{hue_to_channel(p, q, hue + 1.f / 3), hue_to_channel(p, q, hue),
                hue_to_channel(p, q, hue - 1.f / 3)};
    }

    HSV srgb_to_hsv(const SRGB& srgb) {
        const auto max = glm::compMax(glm::vec3{srgb});
        const auto min = glm::compMin(glm::vec3{srgb});
        const auto range = max - min;
        const auto s = max == 0 ? 0.f : range / max;
        const auto h = max == min ? 0.f : rgb_hue(srgb, max, range);
        return HSV{h, s, max};
    }

    SRGB hsv_to_srgb(const HSV& hsv) {
        const auto h = hsv.x;
        const auto s = hsv.y;
        const auto v = hsv.z;

        if (!std::isfinite(h)) {
            return SRGB{nan, nan, nan};
        }

        // Wrap in float before the sector index is cast
        const auto wrapped = h - std::floor(h);
        const auto sector = std::floor(wrapped * 6);
        const auto f = wrapped * 6 - sector;
        const auto p = v * (1 - s);
        const auto q = v * (1 - f * s);
        const auto t = v * (1 - (1 - f) * s);

        switch (static_cast<int>(sector) % 6) {
            case 0:
            default:
                return SRGB{v, t, p};
            case 1:
                return SRGB{q, v, p};
            case 2:
                return SRGB{p, v, t};
            case 3:
                return SRGB{p, q, v};
            case 4:
                return SRGB{t, p, v};
            case 5:
                return SRGB{v, p, q};
        }
    }
}
