#pragma once

#include "tinge.hpp"

#include <cmath>

namespace tinge {
    // Matrices are column major, coefficients from https://bottosson.github.io/posts/oklab/
    constexpr glm::mat3 linear_rgb_to_lms{
        {0.4122214708f, 0.2119034982f, 0.0883024619f},
        {0.5363325363f, 0.6806995451f, 0.2817188376f},
        {0.0514459929f, 0.1073969566f, 0.6299787005f}
    };
    constexpr glm::mat3 lms_to_linear_rgb{
        {4.0767416621f, -1.2684380046f, -0.0041960863f},
        {-3.3077115913f, 2.6097574011f, -0.7034186147f},
        {0.2309699292f, -0.3413193965f, 1.7076147010f}
    };
    constexpr glm::mat3 lmsP_to_oklab{
        {0.2104542553f, 1.9779984951f, 0.0259040371f},
        {0.7936177850f, -2.4285922050f, 0.7827717662f},
        {-0.0040720468f, 0.4505937099f, -0.8086757660f}
    };
    constexpr glm::mat3 oklab_to_lmsP{
        {1.f, 1.f, 1.f},
        {0.3963377774f, -0.1055613458f, -0.0894841775f},
        {0.2158037573f, -0.0638541728f, -1.2914855480f}
    };

    inline glm::vec3 cbrt(const glm::vec3& v) {
        return {std::cbrt(v.x), std::cbrt(v.y), std::cbrt(v.z)};
    }

    // Rate of change of the cube rooted LMS response per unit of chroma along a hue
    inline glm::vec3 lmsP_per_chroma(const glm::vec2& hue) {
        return oklab_to_lmsP * glm::vec3{0, hue};
    }
}
