#pragma once

#include "tinge_export.hpp"

#include <glm/glm.hpp>

#include <array>
#include <concepts>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace tinge {
    struct RGB : glm::vec3 {
        using glm::vec3::vec3;

        constexpr explicit RGB(const glm::vec3& v) : glm::vec3(v) {
        }
    };

    // Gamma encoded sRGB
    struct SRGB : RGB {
        using RGB::RGB;

        constexpr explicit SRGB(const glm::vec3& v) : RGB(v) {
        }
    };

    struct LinearRGB : RGB {
        using RGB::RGB;

        constexpr explicit LinearRGB(const glm::vec3& v) : RGB(v) {
        }
    };

    struct Lab : glm::vec3 {
        using glm::vec3::vec3;

        constexpr explicit Lab(const glm::vec3& v) : glm::vec3(v) {
        }
    };

    struct Oklab : Lab {
        using Lab::Lab;

        constexpr explicit Oklab(const glm::vec3& v) : Lab(v) {
        }
    };

    // Hue in turns, saturation and lightness relative to the sRGB gamut, in Oklab's perceptual terms
    struct Okhsl : glm::vec3 {
        using glm::vec3::vec3;

        constexpr explicit Okhsl(const glm::vec3& v) : glm::vec3(v) {
        }
    };

    struct Okhsv : glm::vec3 {
        using glm::vec3::vec3;

        constexpr explicit Okhsv(const glm::vec3& v) : glm::vec3(v) {
        }
    };

    struct HSL : glm::vec3 {
        using glm::vec3::vec3;

        constexpr explicit HSL(const glm::vec3& v) : glm::vec3(v) {
        }
    };

    struct HSV : glm::vec3 {
        using glm::vec3::vec3;

        constexpr explicit HSV(const glm::vec3& v) : glm::vec3(v) {
        }
    };

    enum class ColorSpace {
        srgb,
        linear_rgb,
        oklab,
        okhsl,
        okhsv,
        hsl,
        hsv
    };

    // Alternatives are in ColorSpace order
    using AnyColor = std::variant<SRGB, LinearRGB, Oklab, Okhsl, Okhsv, HSL, HSV>;

    struct FormatOptions {
        static constexpr int default_precision = 6;
        static constexpr bool default_show_space = true;

        int precision = default_precision;
        bool show_space = default_show_space;
    };

    namespace colors {
        constexpr SRGB white{1.f, 1.f, 1.f};
        constexpr SRGB black{0.f, 0.f, 0.f};
        constexpr SRGB red{1.f, 0.f, 0.f};
        constexpr SRGB yellow{1.f, 1.f, 0.f};
        constexpr SRGB green{0.f, 1.f, 0.f};
        constexpr SRGB aqua{0.f, 1.f, 1.f};
        constexpr SRGB blue{0.f, 0.f, 1.f};
        constexpr SRGB purple{1.f, 0.f, 1.f};
    }

    // Using std::map to keep the name ordering consistent
    TINGE_EXPORT extern const std::map<std::string, ColorSpace> color_space_by_name;

    TINGE_EXPORT extern const std::map<std::string, SRGB> color_by_name;

    TINGE_EXPORT LinearRGB srgb_to_linear_rgb(const SRGB& srgb);

    TINGE_EXPORT SRGB linear_rgb_to_srgb(const LinearRGB& rgb);

    TINGE_EXPORT Oklab linear_rgb_to_oklab(const LinearRGB& rgb);

    TINGE_EXPORT LinearRGB oklab_to_linear_rgb(const Oklab& lab);

    TINGE_EXPORT Okhsl oklab_to_okhsl(const Oklab& lab);

    TINGE_EXPORT Oklab okhsl_to_oklab(const Okhsl& hsl);

    TINGE_EXPORT Okhsv oklab_to_okhsv(const Oklab& lab);

    TINGE_EXPORT Oklab okhsv_to_oklab(const Okhsv& hsv);

    TINGE_EXPORT HSL srgb_to_hsl(const SRGB& srgb);

    TINGE_EXPORT SRGB hsl_to_srgb(const HSL& hsl);

    TINGE_EXPORT HSV srgb_to_hsv(const SRGB& srgb);

    TINGE_EXPORT SRGB hsv_to_srgb(const HSV& hsv);

    // Each hub conversion takes the shortest path through HSL/HSV - SRGB - LinearRGB - Oklab - Okhsl/Okhsv
    inline SRGB to_srgb(const SRGB& color) {
        return color;
    }

    inline SRGB to_srgb(const LinearRGB& color) {
        return linear_rgb_to_srgb(color);
    }

    inline SRGB to_srgb(const Oklab& color) {
        return linear_rgb_to_srgb(oklab_to_linear_rgb(color));
    }

    inline SRGB to_srgb(const Okhsl& color) {
        return to_srgb(okhsl_to_oklab(color));
    }

    inline SRGB to_srgb(const Okhsv& color) {
        return to_srgb(okhsv_to_oklab(color));
    }

    inline SRGB to_srgb(const HSL& color) {
        return hsl_to_srgb(color);
    }

    inline SRGB to_srgb(const HSV& color) {
        return hsv_to_srgb(color);
    }

    inline LinearRGB to_linear_rgb(const SRGB& color) {
        return srgb_to_linear_rgb(color);
    }

    inline LinearRGB to_linear_rgb(const LinearRGB& color) {
        return color;
    }

    inline LinearRGB to_linear_rgb(const Oklab& color) {
        return oklab_to_linear_rgb(color);
    }

    inline LinearRGB to_linear_rgb(const Okhsl& color) {
        return oklab_to_linear_rgb(okhsl_to_oklab(color));
    }

    inline LinearRGB to_linear_rgb(const Okhsv& color) {
        return oklab_to_linear_rgb(okhsv_to_oklab(color));
    }

    inline LinearRGB to_linear_rgb(const HSL& color) {
        return srgb_to_linear_rgb(hsl_to_srgb(color));
    }

    inline LinearRGB to_linear_rgb(const HSV& color) {
        return srgb_to_linear_rgb(hsv_to_srgb(color));
    }

    inline Oklab to_oklab(const SRGB& color) {
        return linear_rgb_to_oklab(srgb_to_linear_rgb(color));
    }

    inline Oklab to_oklab(const LinearRGB& color) {
        return linear_rgb_to_oklab(color);
    }

    inline Oklab to_oklab(const Oklab& color) {
        return color;
    }

    inline Oklab to_oklab(const Okhsl& color) {
        return okhsl_to_oklab(color);
    }

    inline Oklab to_oklab(const Okhsv& color) {
        return okhsv_to_oklab(color);
    }

    inline Oklab to_oklab(const HSL& color) {
        return to_oklab(hsl_to_srgb(color));
    }

    inline Oklab to_oklab(const HSV& color) {
        return to_oklab(hsv_to_srgb(color));
    }

    // Anything that can reach the three hubs can be converted to every color space.
    // Client types opt in by providing the overloads in their own namespace.
    template<typename T>
    concept Color = requires(const T& color) {
        { to_srgb(color) } -> std::convertible_to<SRGB>;
        { to_linear_rgb(color) } -> std::convertible_to<LinearRGB>;
        { to_oklab(color) } -> std::convertible_to<Oklab>;
    };

    template<typename To, Color From>
    To convert(const From& color) {
        if constexpr (std::same_as<To, From>) {
            return color;
        } else if constexpr (std::same_as<To, SRGB>) {
            return to_srgb(color);
        } else if constexpr (std::same_as<To, LinearRGB>) {
            return to_linear_rgb(color);
        } else if constexpr (std::same_as<To, Oklab>) {
            return to_oklab(color);
        } else if constexpr (std::same_as<To, Okhsl>) {
            return oklab_to_okhsl(to_oklab(color));
        } else if constexpr (std::same_as<To, Okhsv>) {
            return oklab_to_okhsv(to_oklab(color));
        } else if constexpr (std::same_as<To, HSL>) {
            return srgb_to_hsl(to_srgb(color));
        } else {
            static_assert(std::same_as<To, HSV>, "Conversion target must be one of the AnyColor alternatives");
            return srgb_to_hsv(to_srgb(color));
        }
    }

    template<typename T>
    std::array<float, 3> to_array(const T& color) {
        return {color.x, color.y, color.z};
    }

    template<typename T>
    T from_array(const std::array<float, 3>& components) {
        return T{components[0], components[1], components[2]};
    }

    TINGE_EXPORT AnyColor make_color(ColorSpace space, const glm::vec3& components);

    TINGE_EXPORT ColorSpace color_space_of(const AnyColor& color);

    TINGE_EXPORT std::string_view color_space_name(ColorSpace space);

    TINGE_EXPORT AnyColor convert(const AnyColor& color, ColorSpace space);

    TINGE_EXPORT std::optional<SRGB> parse_hex(std::string_view text);

    TINGE_EXPORT std::string to_hex(const SRGB& color);

    TINGE_EXPORT std::optional<AnyColor> parse_color(std::string_view text);

    TINGE_EXPORT std::string to_string(const AnyColor& color, const FormatOptions& options = {});
}
