/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "utils/ColorUtils.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <string>

namespace Snowfall {
namespace ColorUtils {

namespace {

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

std::optional<float> parseFloat(std::string_view text) {
    text = trim(text);
    float value = 0.0f;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr == text.data()) {
        return std::nullopt;
    }
    return value;
}

int hexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

float srgbToLinear(float c) {
    return (c <= 0.04045f) ? c / 12.92f : std::pow((c + 0.055f) / 1.055f, 2.4f);
}

std::optional<ColorF> parseFunctional(std::string_view body) {
    std::array<float, 4> parts{0.0f, 0.0f, 0.0f, 1.0f};
    size_t count = 0;
    while (count < parts.size()) {
        size_t comma = body.find(',');
        auto value = parseFloat(body.substr(0, comma));
        if (!value) {
            return std::nullopt;
        }
        parts[count++] = *value;
        if (comma == std::string_view::npos) {
            break;
        }
        body.remove_prefix(comma + 1);
    }
    if (count < 3) {
        return std::nullopt;
    }

    ColorF color;
    color.r = std::clamp(parts[0], 0.0f, 255.0f) / 255.0f;
    color.g = std::clamp(parts[1], 0.0f, 255.0f) / 255.0f;
    color.b = std::clamp(parts[2], 0.0f, 255.0f) / 255.0f;
    color.a = std::clamp(parts[3], 0.0f, 1.0f);
    return color;
}

std::optional<ColorF> parseHex(std::string_view hex) {
    std::string expanded;
    if (hex.size() == 3 || hex.size() == 4) {
        for (char ch : hex) {
            expanded += ch;
            expanded += ch;
        }
    } else if (hex.size() == 6 || hex.size() == 8) {
        expanded.assign(hex);
    } else {
        return std::nullopt;
    }
    if (expanded.size() == 6) {
        expanded += "ff";
    }

    std::array<float, 4> channels{};
    for (size_t i = 0; i < channels.size(); ++i) {
        int hi = hexDigit(expanded[i * 2]);
        int lo = hexDigit(expanded[i * 2 + 1]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        channels[i] = static_cast<float>(hi * 16 + lo) / 255.0f;
    }
    return ColorF{channels[0], channels[1], channels[2], channels[3]};
}

} // namespace

std::optional<ColorF> parseCssColor(std::string_view value) {
    std::string lowered(trim(value));
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    std::string_view text(lowered);

    if (text.empty() || text == "transparent") {
        return std::nullopt;
    }

    if ((text.starts_with("rgb(") || text.starts_with("rgba(")) && text.ends_with(")")) {
        size_t open = text.find('(');
        return parseFunctional(text.substr(open + 1, text.size() - open - 2));
    }

    if (text.starts_with("#")) {
        return parseHex(text.substr(1));
    }

    return std::nullopt;
}

ColorF hexToRgb(std::string_view hex) {
    std::string lowered(trim(hex));
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    std::string_view digits(lowered);
    if (digits.starts_with("#")) {
        digits.remove_prefix(1);
    }
    if (digits.size() != 6) {
        return ColorF{};
    }
    auto parsed = parseHex(digits);
    return parsed ? ColorF{parsed->r, parsed->g, parsed->b, 1.0f} : ColorF{};
}

float computeLuminance(const ColorF& color) {
    return 0.2126f * srgbToLinear(color.r) +
           0.7152f * srgbToLinear(color.g) +
           0.0722f * srgbToLinear(color.b);
}

} // namespace ColorUtils
} // namespace Snowfall
