#include <tinge.hpp>

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

namespace py = pybind11;

namespace {
    template<typename T>
    void bind_color(py::module_& m, const char* name, const char* c0, const char* c1, const char* c2) {
        py::class_<T>(m, name).
            def(py::init<float, float, float>(), py::arg(c0), py::arg(c1), py::arg(c2)).
            def_readwrite(c0, &T::x).
            def_readwrite(c1, &T::y).
            def_readwrite(c2, &T::z).
            def("__eq__", [](const T& self, const T& other) { return self == other; }).
            def("__repr__", [](const T& self) { return tinge::to_string(self); });
    }
}

PYBIND11_MODULE(py_tinge, m) {
    m.doc() = "Python bindings for Tinge";

    bind_color<tinge::SRGB>(m, "SRGB", "r", "g", "b");
    bind_color<tinge::LinearRGB>(m, "LinearRGB", "r", "g", "b");
    bind_color<tinge::Oklab>(m, "Oklab", "l", "a", "b");
    bind_color<tinge::Okhsl>(m, "Okhsl", "h", "s", "l");
    bind_color<tinge::Okhsv>(m, "Okhsv", "h", "s", "v");
    bind_color<tinge::HSL>(m, "HSL", "h", "s", "l");
    bind_color<tinge::HSV>(m, "HSV", "h", "s", "v");

    py::enum_<tinge::ColorSpace>(m, "ColorSpace").
        value("srgb", tinge::ColorSpace::srgb).
        value("linear_rgb", tinge::ColorSpace::linear_rgb).
        value("oklab", tinge::ColorSpace::oklab).
        value("okhsl", tinge::ColorSpace::okhsl).
        value("okhsv", tinge::ColorSpace::okhsv).
        value("hsl", tinge::ColorSpace::hsl).
        value("hsv", tinge::ColorSpace::hsv);

    py::class_<tinge::FormatOptions>(m, "FormatOptions").
        def(py::init<>()).
        def(py::init<int, bool>(), py::arg("precision") = tinge::FormatOptions::default_precision,
                py::arg("show_space") = tinge::FormatOptions::default_show_space).
        def_readwrite("precision", &tinge::FormatOptions::precision).
        def_readwrite("show_space", &tinge::FormatOptions::show_space);

    m.attr("default_precision") = tinge::FormatOptions::default_precision;
    m.attr("color_space_by_name") = tinge::color_space_by_name;
    m.attr("color_by_name") = tinge::color_by_name;

    m.def("srgb_to_linear_rgb", &tinge::srgb_to_linear_rgb, py::arg("srgb"));
    m.def("linear_rgb_to_srgb", &tinge::linear_rgb_to_srgb, py::arg("rgb"));
    m.def("linear_rgb_to_oklab", &tinge::linear_rgb_to_oklab, py::arg("rgb"));
    m.def("oklab_to_linear_rgb", &tinge::oklab_to_linear_rgb, py::arg("lab"));
    m.def("oklab_to_okhsl", &tinge::oklab_to_okhsl, py::arg("lab"));
    m.def("okhsl_to_oklab", &tinge::okhsl_to_oklab, py::arg("hsl"));
    m.def("oklab_to_okhsv", &tinge::oklab_to_okhsv, py::arg("lab"));
    m.def("okhsv_to_oklab", &tinge::okhsv_to_oklab, py::arg("hsv"));
    m.def("srgb_to_hsl", &tinge::srgb_to_hsl, py::arg("srgb"));
    m.def("hsl_to_srgb", &tinge::hsl_to_srgb, py::arg("hsl"));
    m.def("srgb_to_hsv", &tinge::srgb_to_hsv, py::arg("srgb"));
    m.def("hsv_to_srgb", &tinge::hsv_to_srgb, py::arg("hsv"));

    m.def("color_space_of", &tinge::color_space_of, py::arg("color"));
    m.def("convert", [](const tinge::AnyColor& color, tinge::ColorSpace space) {
                return tinge::convert(color, space);
            }, py::arg("color"), py::arg("space"), "Convert a color to another color space");

    m.def("parse_hex", &tinge::parse_hex, py::arg("text"), "Parse '#rgb' or '#rrggbb', returns None on failure");
    m.def("to_hex", &tinge::to_hex, py::arg("srgb"));
    m.def("parse_color", &tinge::parse_color, py::arg("text"),
            "Parse '<space> <c0> <c1> <c2>', a hex triplet or a color name, returns None on failure");
    m.def("to_string", &tinge::to_string, py::arg("color"), py::arg("options") = tinge::FormatOptions{});
}
