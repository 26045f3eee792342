/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "physics/WindForce.hpp"
#include "core/Logger.hpp"
#include "physics/PhysicsConstants.hpp"
#include <algorithm>
#include <cmath>
#include <format>

namespace Snowfall {

using namespace PhysicsConstants;

namespace {

// Band periods relative to the low band's 20 / f seconds
constexpr float LOW_PERIOD = 20.0f;
constexpr float MID_PERIOD = 4.0f;
constexpr float HIGH_PERIOD = 1.0f;

float sanitizedFrequency(float frequency) {
    return std::max(frequency, WIND_MIN_GUST_FREQUENCY);
}

} // namespace

WindForce::WindForce(const WindSettings& settings) {
    setSettings(settings);
}

void WindForce::setSettings(const WindSettings& settings) {
    m_settings = settings;
    m_settings.strength = std::max(0.0f, m_settings.strength);
    m_settings.gustFrequency = sanitizedFrequency(m_settings.gustFrequency);
    FORCE_DEBUG(std::format("Wind {} strength {} gust {}",
                            m_settings.enabled ? "enabled" : "disabled",
                            m_settings.strength, m_settings.gustFrequency));
}

void WindForce::reset() {
    m_elapsed = 0.0f;
    m_phaseMid = 0.0f;
    m_phaseHigh = 0.0f;
    m_gustAge = 0.0f;
    m_rawSignal = 0.0f;
    m_smoothedMagnitude = 0.0f;
    m_smoothedLift = 0.0f;
    m_currentForce = 0.0f;
    m_currentLift = 0.0f;
}

float WindForce::sampleRaw() const {
    float f = m_settings.gustFrequency;
    float low = 0.6f * std::sin(TWO_PI * m_elapsed / (LOW_PERIOD / f));
    float mid = 0.25f * std::sin(m_phaseMid) * std::cos(0.3f * m_elapsed);
    float high = 0.05f * std::sin(m_phaseHigh) +
                 0.04f * std::sin(1.7f * m_phaseHigh + 1.3f) +
                 0.03f * std::exp(-1.5f * m_gustAge) * std::sin(2.9f * m_phaseHigh);
    return std::clamp(low + mid + high, -1.0f, 1.0f);
}

void WindForce::update(float deltaTime) {
    float dt = std::max(0.0f, deltaTime);
    float f = m_settings.gustFrequency;

    m_elapsed += dt;
    m_phaseMid = std::fmod(m_phaseMid + TWO_PI * f / MID_PERIOD * dt, TWO_PI);
    m_phaseHigh += TWO_PI * f / HIGH_PERIOD * dt;
    m_gustAge += dt;
    if (m_phaseHigh >= TWO_PI) {
        // New gust: restart the decaying envelope
        m_phaseHigh = std::fmod(m_phaseHigh, TWO_PI);
        m_gustAge = 0.0f;
    }

    m_rawSignal = sampleRaw();

    float targetMagnitude = 0.0f;
    float targetLift = 0.0f;
    if (m_settings.enabled) {
        switch (m_settings.direction) {
            case WindDirection::Left:
                targetMagnitude = -std::fabs(m_rawSignal);
                break;
            case WindDirection::Right:
                targetMagnitude = std::fabs(m_rawSignal);
                break;
            case WindDirection::Random:
                targetMagnitude = m_rawSignal;
                break;
        }
        targetLift = std::fabs(m_rawSignal) * WIND_LIFT_RATIO;
    }

    // Frame-rate independent: 0.1 of the gap per 60 Hz frame
    float alpha = 1.0f - std::pow(1.0f - WIND_SMOOTHING, dt * REFERENCE_FPS);
    m_smoothedMagnitude += (targetMagnitude - m_smoothedMagnitude) * alpha;
    m_smoothedLift += (targetLift - m_smoothedLift) * alpha;

    m_currentForce = m_smoothedMagnitude * m_settings.strength;
    m_currentLift = m_smoothedLift * m_settings.strength;
}

Vector2D WindForce::accelerationFor(float size) const {
    if (m_currentForce == 0.0f && m_currentLift == 0.0f) {
        return Vector2D();
    }
    float k = std::sqrt(WIND_REFERENCE_SIZE / std::max(size, 1.0f));
    return Vector2D(m_currentForce * WIND_ACCELERATION * k,
                    -m_currentLift * WIND_ACCELERATION * k);
}

void WindForce::apply(Particle& particle, float deltaTime) const {
    if (particle.isGrabbed) {
        return;
    }
    particle.velocity += accelerationFor(particle.size) * deltaTime;
}

} // namespace Snowfall
