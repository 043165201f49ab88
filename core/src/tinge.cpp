#include "tinge.hpp"

namespace tinge {
    // Using std::map to keep the name ordering consistent
    const std::map<std::string, ColorSpace> color_space_by_name{
        {"srgb", ColorSpace::srgb},
        {"rgb", ColorSpace::linear_rgb},
        {"oklab", ColorSpace::oklab},
        {"okhsl", ColorSpace::okhsl},
        {"okhsv", ColorSpace::okhsv},
        {"hsl", ColorSpace::hsl},
        {"hsv", ColorSpace::hsv}
    };

    const std::map<std::string, SRGB> color_by_name{
        {"white", colors::white},
        {"black", colors::black},
        {"red", colors::red},
        {"yellow", colors::yellow},
        {"green", colors::green},
        {"aqua", colors::aqua},
        {"blue", colors::blue},
        {"purple", colors::purple}
    };

    AnyColor make_color(ColorSpace space, const glm::vec3& components) {
        switch (space) {
            case ColorSpace::srgb:
            default:
                return SRGB{components};
            case ColorSpace::linear_rgb:
                return LinearRGB{components};
            case ColorSpace::oklab:
                return Oklab{components};
            case ColorSpace::okhsl:
                return Okhsl{components};
            case ColorSpace::okhsv:
                return Okhsv{components};
            case ColorSpace::hsl:
                return HSL{components};
            case ColorSpace::hsv:
                return HSV{components};
        }
    }

    ColorSpace color_space_of(const AnyColor& color) {
        return static_cast<ColorSpace>(color.index());
    }

    std::string_view color_space_name(ColorSpace space) {
        for (const auto& [name, value] : color_space_by_name) {
            if (value == space) {
                return name;
            }
        }

        return {};
    }

    AnyColor convert(const AnyColor& color, ColorSpace space) {
        return std::visit([space](const auto& value) -> AnyColor {
            switch (space) {
                case ColorSpace::srgb:
                default:
                    return convert<SRGB>(value);
                case ColorSpace::linear_rgb:
                    return convert<LinearRGB>(value);
                case ColorSpace::oklab:
                    return convert<Oklab>(value);
                case ColorSpace::okhsl:
                    return convert<Okhsl>(value);
                case ColorSpace::okhsv:
                    return convert<Okhsv>(value);
                case ColorSpace::hsl:
                    return convert<HSL>(value);
                case ColorSpace::hsv:
                    return convert<HSV>(value);
            }
        }, color);
    }
}
