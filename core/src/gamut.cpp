#include "gamut.hpp"

#include "oklab.hpp"

#include <glm/gtc/constants.hpp>
#include <glm/gtc/matrix_access.hpp>
#define GLM_ENABLE_EXPERIMENTAL
#include <glm/gtx/component_wise.hpp>

#include <algorithm>
#include <cmath>
#include <limits>

namespace {
    // Polynomial fit of the maximum saturation over the hues where one RGB channel clips to 0 first.
    // From https://bottosson.github.io/posts/gamutclipping/#intersection-with-srgb-gamut
    struct SaturationFit {
        float k_0, k_1, k_2, k_3, k_4;
        int channel;
    };

    constexpr SaturationFit red_fit{1.19086277f, 1.76576728f, 0.59662641f, 0.75515197f, 0.56771245f, 0};
    constexpr SaturationFit green_fit{0.73956515f, -0.45954404f, 0.08285427f, 0.12541070f, 0.14503204f, 1};
    constexpr SaturationFit blue_fit{1.35733652f, -0.00915799f, -1.15130210f, -0.50559606f, 0.00692167f, 2};

    const SaturationFit& saturation_fit(const glm::vec2& hue) {
        if (-1.88170328f * hue.x - 0.80936493f * hue.y > 1) {
            return red_fit;
        }
        if (1.81444104f * hue.x - 1.19445276f * hue.y > 1) {
            return green_fit;
        }
        return blue_fit;
    }

    constexpr float no_intersection = std::numeric_limits<float>::max();
}

namespace tinge {
    glm::vec2 hue_vector(float h) {
        const auto angle = glm::two_pi<float>() * h;
        return {std::cos(angle), std::sin(angle)};
    }

    float hue_angle(const glm::vec2& ab) {
        return 0.5f + 0.5f * std::atan2(-ab.y, -ab.x) / glm::pi<float>();
    }

    float compute_max_saturation(const glm::vec2& hue) {
        const auto a = hue.x;
        const auto b = hue.y;
        const auto& fit = saturation_fit(hue);
        const auto s = fit.k_0 + fit.k_1 * a + fit.k_2 * b + fit.k_3 * a * a + fit.k_4 * a * b;

        // One Halley step on the clipping channel, f(S) = channel(L = 1, C = S) = 0
        const auto k_lms = lmsP_per_chroma(hue);
        const auto lmsP = 1.f + s * k_lms;
        const auto lms = lmsP * lmsP * lmsP;
        const auto lms_ds = 3.f * k_lms * lmsP * lmsP;
        const auto lms_ds2 = 6.f * k_lms * k_lms * lmsP;

        const auto weights = glm::row(lms_to_linear_rgb, fit.channel);
        const auto f = glm::dot(weights, lms);
        const auto f1 = glm::dot(weights, lms_ds);
        const auto f2 = glm::dot(weights, lms_ds2);

        return s - f * f1 / (f1 * f1 - 0.5f * f * f2);
    }

    LC find_cusp(const glm::vec2& hue) {
        const auto s_cusp = compute_max_saturation(hue);

        // Scale the lightness so the first channel to clip at the top lands exactly on 1
        const auto rgb_at_max = oklab_to_linear_rgb(Oklab{1.f, s_cusp * hue});
        const auto l_cusp = std::cbrt(1 / glm::compMax(glm::vec3{rgb_at_max}));
        return {l_cusp, l_cusp * s_cusp};
    }

    float find_gamut_intersection(const glm::vec2& hue, float l1, float c1, float l0, const std::optional<LC>& cusp) {
        const auto [l_cusp, c_cusp] = cusp ? *cusp : find_cusp(hue);

        if ((l1 - l0) * c_cusp - (l_cusp - l0) * c1 <= 0) {
            // Below the cusp the boundary is the straight line from black
            return c_cusp * l0 / (c1 * l_cusp + c_cusp * (l0 - l1));
        }

        // Above the cusp, start from the line through white and refine with one Halley step per channel
        const auto t = c_cusp * (l0 - 1) / (c1 * (l_cusp - 1) + c_cusp * (l0 - l1));

        const auto k_lms = lmsP_per_chroma(hue);
        const auto lms_dt = (l1 - l0) + c1 * k_lms;

        const auto l = l0 * (1 - t) + t * l1;
        const auto c = t * c1;

        const auto lmsP = l + c * k_lms;
        const auto lms = lmsP * lmsP * lmsP;
        const auto lms_dt1 = 3.f * lms_dt * lmsP * lmsP;
        const auto lms_dt2 = 6.f * lms_dt * lms_dt * lmsP;

        const auto f = lms_to_linear_rgb * lms - 1.f;
        const auto f1 = lms_to_linear_rgb * lms_dt1;
        const auto f2 = lms_to_linear_rgb * lms_dt2;

        const auto u = f1 / (f1 * f1 - 0.5f * f * f2);

        // Channels heading away from 1 along the ray don't bound it
        const auto t_rgb = glm::mix(glm::vec3{no_intersection}, -f * u, glm::greaterThanEqual(u, glm::vec3{0}));

        return t + glm::compMin(t_rgb);
    }

    ST get_st_max(const glm::vec2& hue, const std::optional<LC>& cusp) {
        const auto [l, c] = cusp ? *cusp : find_cusp(hue);
        return {c / l, c / (1 - l)};
    }

    // Smooth approximation of the gamut's saturation around the middle of the lightness range
    ST get_st_mid(const glm::vec2& hue) {
        const auto a = hue.x;
        const auto b = hue.y;

        const auto s = 0.11516993f + 1.f / (
                7.44778970f + 4.15901240f * b
                + a * (-2.19557347f + 1.75198401f * b
                + a * (-2.13704948f - 10.02301043f * b
                + a * (-4.24894561f + 5.38770819f * b + 4.69891013f * a))));

        const auto t = 0.11239642f + 1.f / (
                1.61320320f - 0.68124379f * b
                + a * (0.40370612f + 0.90148123f * b
                + a * (-0.27087943f + 0.61223990f * b
                + a * (0.00299215f - 0.45399568f * b - 0.14661872f * a))));

        return {s, t};
    }

    Cs get_cs(float l, const glm::vec2& hue) {
        const auto cusp = find_cusp(hue);

        const auto c_max = find_gamut_intersection(hue, l, 1, l, cusp);
        const auto st_max = get_st_max(hue, cusp);

        // Compensates for the curved part of the gamut shape
        const auto k = c_max / std::min(l * st_max.s, (1 - l) * st_max.t);

        const auto st_mid = get_st_mid(hue);
        const auto c_mid_a = l * st_mid.s;
        const auto c_mid_b = (1 - l) * st_mid.t;
        const auto c_mid = 0.9f * k * std::sqrt(std::sqrt(1 / (1 / (c_mid_a * c_mid_a * c_mid_a * c_mid_a) +
                1 / (c_mid_b * c_mid_b * c_mid_b * c_mid_b))));

        // Fixed saturation anchors at the dark and bright ends
        const auto c_0_a = l * 0.4f;
        const auto c_0_b = (1 - l) * 0.8f;
        const auto c_0 = std::sqrt(1 / (1 / (c_0_a * c_0_a) + 1 / (c_0_b * c_0_b)));

        return {c_0, c_mid, c_max};
    }
}
