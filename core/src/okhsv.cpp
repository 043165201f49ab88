#include "tinge.hpp"

#include "gamut.hpp"
#include "lightness.hpp"

#define GLM_ENABLE_EXPERIMENTAL
#include <glm/gtx/component_wise.hpp>
#include <glm/gtx/vec_swizzle.hpp>

#include <algorithm>
#include <cmath>

namespace {
    constexpr float epsilon = 1e-5;

    // Saturation of the softened edge of the triangle between black, white and the cusp
    constexpr float s_0 = 0.5f;

    // Uniform lightness and chroma scale that brings the v = 1 point of the triangle onto the gamut boundary
    float gamut_scale(const glm::vec2& hue, float l_vt, float c_vt) {
        const auto rgb_scale = tinge::oklab_to_linear_rgb(tinge::Oklab{l_vt, c_vt * hue});
        return std::cbrt(1 / std::max(glm::compMax(glm::vec3{rgb_scale}), 0.f));
    }
}

namespace tinge {
    Okhsv oklab_to_okhsv(const Oklab& lab) {
        auto l = lab.x;
        const auto c = glm::length(glm::yz(lab));
        if (c < epsilon) {
            return Okhsv{0.f, 0.f, toe(l)};
        }

        const auto hue = glm::yz(lab) / c;
        const auto [s_max, t_max] = get_st_max(hue);
        const auto k = 1 - s_0 / s_max;

        // Point where the line from black through the color meets the triangle's upper edge
        const auto t = t_max / (c + l * t_max);
        const auto l_v = t * l;
        const auto c_v = t * c;

        const auto l_vt = toe_inv(l_v);
        const auto c_vt = c_v * l_vt / l_v;

        l /= gamut_scale(hue, l_vt, c_vt);
        l = toe(l);

        const auto v = l / l_v;
        const auto s = (s_0 + t_max) * c_v / ((t_max * s_0) + t_max * k * c_v);

        return Okhsv{hue_angle(hue), s, v};
    }

    Oklab okhsv_to_oklab(const Okhsv& hsv) {
        const auto h = hsv.x;
        const auto s = hsv.y;
        const auto v = hsv.z;

        if (v == 0) {
            return Oklab{0.f, 0.f, 0.f};
        }

        const auto hue = hue_vector(h);
        const auto [s_max, t_max] = get_st_max(hue);
        const auto k = 1 - s_0 / s_max;

        // Lightness and chroma at v = 1 for this saturation
        const auto l_v = 1 - s * s_0 / (s_0 + t_max - t_max * k * s);
        const auto c_v = s * t_max * s_0 / (s_0 + t_max - t_max * k * s);

        auto l = v * l_v;
        auto c = v * c_v;

        // The unscaled v = 1 point decides the scale, before the toe is undone on the color itself
        const auto l_vt = toe_inv(l_v);
        const auto c_vt = c_v * l_vt / l_v;

        const auto l_new = toe_inv(l);
        c = c * l_new / l;
        l = l_new;

        const auto scale_l = gamut_scale(hue, l_vt, c_vt);
        l *= scale_l;
        c *= scale_l;

        return Oklab{l, c * hue};
    }
}
