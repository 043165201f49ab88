#include "oklab.hpp"

namespace tinge {
    Oklab linear_rgb_to_oklab(const LinearRGB& rgb) {
        const auto lms = linear_rgb_to_lms * rgb;
        return Oklab{lmsP_to_oklab * cbrt(lms)};
    }

    LinearRGB oklab_to_linear_rgb(const Oklab& lab) {
        const auto lmsP = oklab_to_lmsP * lab;
        const auto lms = lmsP * lmsP * lmsP;
        return LinearRGB{lms_to_linear_rgb * lms};
    }
}
