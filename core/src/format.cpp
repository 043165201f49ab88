#include "tinge.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <locale>
#include <sstream>
#include <vector>

namespace {
    constexpr std::string_view separators = " \t\n,()";

    std::vector<std::string_view> split_words(std::string_view text) {
        std::vector<std::string_view> words;
        while (!text.empty()) {
            const auto start = text.find_first_not_of(separators);
            if (start == std::string_view::npos) {
                break;
            }
            text.remove_prefix(start);

            const auto end = std::min(text.find_first_of(separators), text.size());
            words.push_back(text.substr(0, end));
            text.remove_prefix(end);
        }

        return words;
    }

    std::optional<float> parse_float(std::string_view word) {
        float value{};
        const auto [end, error] = std::from_chars(word.data(), word.data() + word.size(), value);
        if (error != std::errc{} || end != word.data() + word.size()) {
            return std::nullopt;
        }

        return value;
    }

    std::optional<uint8_t> parse_hex_digit(char digit) {
        if (digit >= '0' && digit <= '9') {
            return digit - '0';
        }
        if (digit >= 'a' && digit <= 'f') {
            return digit - 'a' + 10;
        }
        if (digit >= 'A' && digit <= 'F') {
            return digit - 'A' + 10;
        }

        return std::nullopt;
    }

    std::string to_lower(std::string_view text) {
        std::string lower{text};
        std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        return lower;
    }
}

namespace tinge {
    std::optional<SRGB> parse_hex(std::string_view text) {
        if (text.starts_with('#')) {
            text.remove_prefix(1);
        }

        const auto digits_per_channel = text.size() / 3;
        if (text.size() != 3 && text.size() != 6) {
            return std::nullopt;
        }

        std::array<float, 3> channels{};
        for (size_t i = 0; i < channels.size(); i++) {
            uint32_t value = 0;
            for (size_t d = 0; d < digits_per_channel; d++) {
                const auto digit = parse_hex_digit(text[i * digits_per_channel + d]);
                if (!digit) {
                    return std::nullopt;
                }
                value = value * 16 + *digit;
            }

            // A single digit is repeated: #f80 is #ff8800
            if (digits_per_channel == 1) {
                value *= 17;
            }
            channels[i] = static_cast<float>(value) / 255;
        }

        return from_array<SRGB>(channels);
    }

    std::string to_hex(const SRGB& color) {
        static constexpr std::string_view digits = "0123456789abcdef";

        std::string hex = "#";
        for (const auto channel : to_array(color)) {
            const auto clamped = std::isfinite(channel) ? std::clamp(channel, 0.f, 1.f) : 0.f;
            const auto value = static_cast<uint32_t>(std::lround(clamped * 255));
            hex += digits[value >> 4];
            hex += digits[value & 0xf];
        }

        return hex;
    }

    std::optional<AnyColor> parse_color(std::string_view text) {
        const auto words = split_words(text);
        if (words.size() == 1) {
            const auto name = to_lower(words[0]);
            if (const auto named = color_by_name.find(name); named != color_by_name.end()) {
                return named->second;
            }
            if (const auto hex = parse_hex(words[0])) {
                return *hex;
            }
            return std::nullopt;
        }

        if (words.size() != 4) {
            return std::nullopt;
        }

        const auto space = color_space_by_name.find(to_lower(words[0]));
        if (space == color_space_by_name.end()) {
            return std::nullopt;
        }

        glm::vec3 components{};
        for (int i = 0; i < 3; i++) {
            const auto value = parse_float(words[i + 1]);
            if (!value) {
                return std::nullopt;
            }
            components[i] = *value;
        }

        return make_color(space->second, components);
    }

    std::string to_string(const AnyColor& color, const FormatOptions& options) {
        std::ostringstream stream;
        stream.imbue(std::locale::classic());
        stream << std::setprecision(options.precision);

        if (options.show_space) {
            stream << color_space_name(color_space_of(color)) << ' ';
        }

        const auto components = std::visit([](const auto& value) { return to_array(value); }, color);
        stream << components[0] << ' ' << components[1] << ' ' << components[2];

        return stream.str();
    }
}
