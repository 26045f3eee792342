/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GLOW_MODEL_HPP
#define GLOW_MODEL_HPP

#include "utils/ColorUtils.hpp"
#include <optional>
#include <string>

namespace Snowfall {

/**
 * @brief Decides whether flakes glow, and the glow curve both backends draw.
 *
 * The glow is suppressed on bright backgrounds (WCAG luminance >= 0.9).
 * The background is the configured CSS color; when none is set, or it is
 * fully transparent, the OS theme decides (dark -> black, light -> white).
 */
class GlowModel {
public:
    static constexpr float LUMINANCE_THRESHOLD = 0.9f;
    static constexpr float FALLOFF = 3.5f;
    static constexpr float GLOW_ALPHA = 0.35f;
    static constexpr float FLICKER_BASE = 0.85f;
    static constexpr float FLICKER_RANGE = 0.15f;
    static constexpr float FLICKER_SPEED = 3.0f;

    void setBackgroundColor(const std::string& cssColor);
    void setDarkTheme(bool dark) { m_darkTheme = dark; }
    bool isDarkTheme() const { return m_darkTheme; }

    ColorF getEffectiveBackground() const;
    float getGlowStrength() const { return glowStrengthFor(getEffectiveBackground()); }

    static float glowStrengthFor(const ColorF& background);

    // exp(-3.5 |c|^2), c in [-1, 1]^2 across the quad
    static float falloff(float cx, float cy);

    // Slow per-flake shimmer in [0.85, 1.0]
    static float flicker(float time, float phase);

private:
    std::optional<ColorF> m_background;
    bool m_darkTheme{false};
};

} // namespace Snowfall

#endif // GLOW_MODEL_HPP
