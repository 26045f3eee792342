/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COLOR_UTILS_HPP
#define COLOR_UTILS_HPP

#include <optional>
#include <string_view>

namespace Snowfall {

// Normalized color, every channel in [0, 1]
struct ColorF {
    float r{1.0f};
    float g{1.0f};
    float b{1.0f};
    float a{1.0f};
};

namespace ColorUtils {

/**
 * Parse a CSS color: rgb(), rgba(), #rgb, #rgba, #rrggbb, #rrggbbaa.
 * "transparent", empty strings and anything unrecognized yield nullopt.
 * rgb channels are clamped to [0, 255] and alpha to [0, 1].
 */
std::optional<ColorF> parseCssColor(std::string_view value);

// "#rrggbb" (or "rrggbb") to RGB; alpha is always 1, malformed input is white
ColorF hexToRgb(std::string_view hex);

// WCAG relative luminance of the sRGB color (alpha ignored)
float computeLuminance(const ColorF& color);

} // namespace ColorUtils
} // namespace Snowfall

#endif // COLOR_UTILS_HPP
