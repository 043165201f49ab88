#include <tinge.hpp>

#include <emscripten/emscripten.h>
#include <emscripten/bind.h>

#include <array>
#include <optional>
#include <string>

namespace em = emscripten;

template<typename Lambda>
static auto lambda_to_ptr(Lambda&& function) ->
        em::internal::remove_class<decltype(&Lambda::operator())>::type* {
    return function;
}

static std::array<float, 3> bind_convert(tinge::ColorSpace from, const std::array<float, 3>& components,
        tinge::ColorSpace to) {
    const auto converted = tinge::convert(tinge::make_color(from, {components[0], components[1], components[2]}), to);
    return std::visit([](const auto& color) { return tinge::to_array(color); }, converted);
}

static std::optional<std::string> bind_reformat(const std::string& text, tinge::ColorSpace to,
        const tinge::FormatOptions& options) {
    const auto color = tinge::parse_color(text);
    if (!color) {
        return std::nullopt;
    }
    return tinge::to_string(tinge::convert(*color, to), options);
}

static std::optional<std::string> bind_to_hex(const std::string& text) {
    const auto color = tinge::parse_color(text);
    if (!color) {
        return std::nullopt;
    }
    return tinge::to_hex(std::get<tinge::SRGB>(tinge::convert(*color, tinge::ColorSpace::srgb)));
}

EMSCRIPTEN_BINDINGS(js_tinge) {
    em::value_array<std::array<float, 3>>("Components").
        element(em::index<0>()).
        element(em::index<1>()).
        element(em::index<2>());

    em::value_object<tinge::SRGB>("SRGB").
        field("r", &tinge::SRGB::x).
        field("g", &tinge::SRGB::y).
        field("b", &tinge::SRGB::z);

    em::value_object<tinge::LinearRGB>("LinearRGB").
        field("r", &tinge::LinearRGB::x).
        field("g", &tinge::LinearRGB::y).
        field("b", &tinge::LinearRGB::z);

    em::value_object<tinge::Oklab>("Oklab").
        field("l", &tinge::Oklab::x).
        field("a", &tinge::Oklab::y).
        field("b", &tinge::Oklab::z);

    em::value_object<tinge::Okhsl>("Okhsl").
        field("h", &tinge::Okhsl::x).
        field("s", &tinge::Okhsl::y).
        field("l", &tinge::Okhsl::z);

    em::value_object<tinge::Okhsv>("Okhsv").
        field("h", &tinge::Okhsv::x).
        field("s", &tinge::Okhsv::y).
        field("v", &tinge::Okhsv::z);

    em::value_object<tinge::HSL>("HSL").
        field("h", &tinge::HSL::x).
        field("s", &tinge::HSL::y).
        field("l", &tinge::HSL::z);

    em::value_object<tinge::HSV>("HSV").
        field("h", &tinge::HSV::x).
        field("s", &tinge::HSV::y).
        field("v", &tinge::HSV::z);

    em::enum_<tinge::ColorSpace>("ColorSpace").
        value("srgb", tinge::ColorSpace::srgb).
        value("linear_rgb", tinge::ColorSpace::linear_rgb).
        value("oklab", tinge::ColorSpace::oklab).
        value("okhsl", tinge::ColorSpace::okhsl).
        value("okhsv", tinge::ColorSpace::okhsv).
        value("hsl", tinge::ColorSpace::hsl).
        value("hsv", tinge::ColorSpace::hsv);

    em::register_map<std::string, tinge::ColorSpace>("ColorSpaceNameMap");
    em::function("color_space_by_name", lambda_to_ptr([] { return tinge::color_space_by_name; }),
            em::return_value_policy::take_ownership());

    em::register_map<std::string, tinge::SRGB>("ColorNameMap");
    em::function("color_by_name", lambda_to_ptr([] { return tinge::color_by_name; }),
            em::return_value_policy::take_ownership());

    em::constant("default_precision", tinge::FormatOptions::default_precision);
    em::constant("default_show_space", tinge::FormatOptions::default_show_space);
    em::value_object<tinge::FormatOptions>("FormatOptions").
        field("precision", &tinge::FormatOptions::precision).
        field("show_space", &tinge::FormatOptions::show_space);
    em::function("default_format_options", lambda_to_ptr([] { return tinge::FormatOptions{}; }));

    em::register_optional<std::string>();
    em::register_optional<tinge::SRGB>();

    em::function("srgb_to_linear_rgb", &tinge::srgb_to_linear_rgb);
    em::function("linear_rgb_to_srgb", &tinge::linear_rgb_to_srgb);
    em::function("linear_rgb_to_oklab", &tinge::linear_rgb_to_oklab);
    em::function("oklab_to_linear_rgb", &tinge::oklab_to_linear_rgb);
    em::function("oklab_to_okhsl", &tinge::oklab_to_okhsl);
    em::function("okhsl_to_oklab", &tinge::okhsl_to_oklab);
    em::function("oklab_to_okhsv", &tinge::oklab_to_okhsv);
    em::function("okhsv_to_oklab", &tinge::okhsv_to_oklab);
    em::function("srgb_to_hsl", &tinge::srgb_to_hsl);
    em::function("hsl_to_srgb", &tinge::hsl_to_srgb);
    em::function("srgb_to_hsv", &tinge::srgb_to_hsv);
    em::function("hsv_to_srgb", &tinge::hsv_to_srgb);

    em::function("convert", &bind_convert);
    em::function("reformat", &bind_reformat);
    em::function("to_hex", &bind_to_hex);
    em::function("parse_hex", lambda_to_ptr([](const std::string& text) { return tinge::parse_hex(text); }));
}
