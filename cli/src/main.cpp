#include <tinge.hpp>

#include <argparse/argparse.hpp>

#include <iostream>
#include <string>
#include <vector>

namespace {
    template<typename T, typename S = T>
    void read_option(const argparse::ArgumentParser& arguments, std::string_view name, T& storage) {
        if (const auto value = arguments.present<S>(name))
            storage = *value;
    }

    std::string join_words(const std::vector<std::string>& words) {
        std::string joined;
        for (const auto& word : words) {
            if (!joined.empty()) {
                joined += ' ';
            }
            joined += word;
        }
        return joined;
    }

    void print_color(const tinge::AnyColor& color, tinge::ColorSpace space, const tinge::FormatOptions& options,
            bool print_hex) {
        const auto converted = tinge::convert(color, space);
        std::cout << tinge::to_string(converted, options);
        if (print_hex && space == tinge::ColorSpace::srgb) {
            std::cout << ' ' << tinge::to_hex(std::get<tinge::SRGB>(converted));
        }
        std::cout << '\n';
    }
}

int main(int arg_count, char** arg_values) {
    argparse::ArgumentParser arguments("tinge-cli", "0.1.0");
    arguments.add_description("Convert a color between sRGB, linear RGB, Oklab, Okhsl, Okhsv, HSL and HSV");
    arguments.add_argument("color").nargs(argparse::nargs_pattern::at_least_one).
            help("'<space> <c0> <c1> <c2>', a hex triplet or a color name");
    auto& space_argument = arguments.add_argument("-t", "--to").metavar("space").help("output color space");
    for (const auto& [name, _] : tinge::color_space_by_name) {
        space_argument.add_choice(name);
    }
    arguments.add_argument("-p", "--precision").scan<'i', int>().metavar("digits").help("significant digits");
    arguments.add_argument("--bare").flag().help("omit the color space name");
    arguments.add_argument("--hex").flag().help("also print sRGB as a hex triplet");

    try {
        arguments.parse_args(arg_count, arg_values);
    } catch (const std::exception& err) {
        std::cerr << err.what() << std::endl;
        std::cerr << arguments;
        return 1;
    }

    tinge::FormatOptions options{};
    read_option(arguments, "-p", options.precision);
    options.show_space = !arguments.get<bool>("--bare");
    const auto print_hex = arguments.get<bool>("--hex");

    const auto text = join_words(arguments.get<std::vector<std::string>>("color"));
    const auto color = tinge::parse_color(text);
    if (!color) {
        std::cerr << "Couldn't parse color \"" << text << "\"" << std::endl;
        return 1;
    }

    if (const auto value = arguments.present("-t")) {
        print_color(*color, tinge::color_space_by_name.at(*value), options, print_hex);
        return 0;
    }

    for (const auto space : {tinge::ColorSpace::srgb, tinge::ColorSpace::linear_rgb, tinge::ColorSpace::oklab,
            tinge::ColorSpace::okhsl, tinge::ColorSpace::okhsv, tinge::ColorSpace::hsl, tinge::ColorSpace::hsv}) {
        print_color(*color, space, options, print_hex);
    }
}
