/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef WIND_FORCE_HPP
#define WIND_FORCE_HPP

#include "physics/Particle.hpp"
#include "utils/Vector2D.hpp"

namespace Snowfall {

enum class WindDirection { Left, Right, Random };

struct WindSettings {
    bool enabled{false};
    WindDirection direction{WindDirection::Left};
    float strength{0.5f};
    float gustFrequency{3.0f};
};

/**
 * @brief Turbulent horizontal wind built from three frequency bands.
 *
 * raw = clamp(low + mid + high, -1, 1)
 *   low  = 0.6 sin(2 pi t / (20 / f))
 *   mid  = 0.25 sin(phaseMid) cos(0.3 t)
 *   high = 0.05 sin(p) + 0.04 sin(1.7 p + 1.3) + 0.03 e^(-1.5 age) sin(2.9 p)
 *
 * Force and lift are exponentially smoothed, so |force| <= strength and
 * |lift| <= 0.3 * strength at all times.
 */
class WindForce {
public:
    WindForce() = default;
    explicit WindForce(const WindSettings& settings);

    void setSettings(const WindSettings& settings);
    const WindSettings& getSettings() const { return m_settings; }

    // Advance the signal once per frame
    void update(float deltaTime);
    void reset();

    // Size-dependent acceleration in px/s^2; smaller flakes are pushed more
    Vector2D accelerationFor(float size) const;
    void apply(Particle& particle, float deltaTime) const;

    float getCurrentForce() const { return m_currentForce; }
    float getCurrentLift() const { return m_currentLift; }
    float getRawSignal() const { return m_rawSignal; }
    float getElapsed() const { return m_elapsed; }

private:
    float sampleRaw() const;

    WindSettings m_settings;
    float m_elapsed{0.0f};
    float m_phaseMid{0.0f};
    float m_phaseHigh{0.0f};
    float m_gustAge{0.0f};
    float m_rawSignal{0.0f};
    float m_smoothedMagnitude{0.0f};
    float m_smoothedLift{0.0f};
    float m_currentForce{0.0f};
    float m_currentLift{0.0f};
};

} // namespace Snowfall

#endif // WIND_FORCE_HPP
