/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "render/GlowModel.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <format>

namespace Snowfall {

void GlowModel::setBackgroundColor(const std::string& cssColor) {
    m_background = ColorUtils::parseCssColor(cssColor);
    if (m_background && m_background->a <= 0.0f) {
        m_background.reset();
    }
    if (!cssColor.empty() && !m_background) {
        RENDER_DEBUG(std::format("Background '{}' is unset or transparent, following OS theme",
                                 cssColor));
    }
}

ColorF GlowModel::getEffectiveBackground() const {
    if (m_background) {
        return *m_background;
    }
    return m_darkTheme ? ColorF{0.0f, 0.0f, 0.0f, 1.0f} : ColorF{1.0f, 1.0f, 1.0f, 1.0f};
}

float GlowModel::glowStrengthFor(const ColorF& background) {
    return ColorUtils::computeLuminance(background) >= LUMINANCE_THRESHOLD ? 0.0f : 1.0f;
}

float GlowModel::falloff(float cx, float cy) {
    return std::exp(-FALLOFF * (cx * cx + cy * cy));
}

float GlowModel::flicker(float time, float phase) {
    // GLSL smoothstep(-1, 1, x)
    float t = std::clamp((std::sin(time * FLICKER_SPEED + phase) + 1.0f) * 0.5f, 0.0f, 1.0f);
    float smooth = t * t * (3.0f - 2.0f * t);
    return FLICKER_BASE + FLICKER_RANGE * smooth;
}

} // namespace Snowfall
