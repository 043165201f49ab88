#include "tinge.hpp"

#include "gamut.hpp"
#include "lightness.hpp"

#define GLM_ENABLE_EXPERIMENTAL
#include <glm/gtx/vec_swizzle.hpp>

namespace {
    // Below this chroma the hue is numerically meaningless
    constexpr float epsilon = 1e-5;

    // Saturation at which the curve passes through c_mid
    constexpr float mid = 0.8f;
    constexpr float mid_inv = 1.25f;

    // Coefficients of c(t) = k_0 + t k_1 / (1 - k_2 t)
    struct Curve {
        float k_1;
        float k_2;
    };

    // Rational curve through (0, 0) and (mid, c_mid) with slope c_0 at 0, parameterized by t = s / mid
    Curve low_chroma_curve(const tinge::Cs& cs) {
        const auto k_1 = mid * cs.c_0;
        const auto k_2 = 1 - k_1 / cs.c_mid;
        return {k_1, k_2};
    }

    // Rational curve through (mid, c_mid) and (1, c_max), continuous in slope with the low curve
    Curve high_chroma_curve(const tinge::Cs& cs) {
        const auto k_1 = (1 - mid) * cs.c_mid * cs.c_mid * mid_inv * mid_inv / cs.c_0;
        const auto k_2 = 1 - k_1 / (cs.c_max - cs.c_mid);
        return {k_1, k_2};
    }
}

namespace tinge {
    Okhsl oklab_to_okhsl(const Oklab& lab) {
        const auto l = lab.x;
        const auto c = glm::length(glm::yz(lab));
        if (c < epsilon) {
            return Okhsl{0.f, 0.f, toe(l)};
        }

        const auto hue = glm::yz(lab) / c;
        const auto cs = get_cs(l, hue);

        float s;
        if (c < cs.c_mid) {
            const auto [k_1, k_2] = low_chroma_curve(cs);
            const auto t = c / (k_1 + k_2 * c);
            s = t * mid;
        } else {
            const auto [k_1, k_2] = high_chroma_curve(cs);
            const auto t = (c - cs.c_mid) / (k_1 + k_2 * (c - cs.c_mid));
            s = mid + (1 - mid) * t;
        }

        return Okhsl{hue_angle(hue), s, toe(l)};
    }

    Oklab okhsl_to_oklab(const Okhsl& hsl) {
        const auto h = hsl.x;
        const auto s = hsl.y;
        const auto l = hsl.z;

        if (l == 1) {
            return Oklab{1.f, 0.f, 0.f};
        }
        if (l == 0) {
            return Oklab{0.f, 0.f, 0.f};
        }

        const auto lightness = toe_inv(l);
        if (s == 0) {
            return Oklab{lightness, 0.f, 0.f};
        }

        const auto hue = hue_vector(h);
        const auto cs = get_cs(lightness, hue);

        float c;
        if (s < mid) {
            const auto [k_1, k_2] = low_chroma_curve(cs);
            const auto t = mid_inv * s;
            c = t * k_1 / (1 - k_2 * t);
        } else {
            const auto [k_1, k_2] = high_chroma_curve(cs);
            const auto t = (s - mid) / (1 - mid);
            c = cs.c_mid + t * k_1 / (1 - k_2 * t);
        }

        return Oklab{lightness, c * hue};
    }
}
