/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef POINTER_FORCE_HPP
#define POINTER_FORCE_HPP

#include "physics/Particle.hpp"
#include "physics/PhysicsConstants.hpp"
#include "utils/Vector2D.hpp"
#include <cstdint>

namespace Snowfall {

enum class BurstMode : uint8_t { None, Explode, Suction };

// Host button numbering: 0 = left, 2 = right
constexpr int POINTER_BUTTON_LEFT = 0;
constexpr int POINTER_BUTTON_RIGHT = 2;

struct PointerSettings {
    float radius{100.0f};
    float force{300.0f};
    float impulseStrength{0.5f};
    float dragThreshold{500.0f};   // px/s
    float dragStrength{0.8f};
};

/**
 * @brief Pointer state plus the force it exerts on particles.
 *
 * Mode selection per particle, first match wins:
 *  - burst explode (left click within the last 0.2 s of simulation time)
 *  - burst suction (right click)
 *  - drag airflow (pointer faster than dragThreshold)
 *  - idle repulsion
 * Every mode also transfers pointer momentum and spin.
 */
class PointerForce {
public:
    PointerForce() = default;
    explicit PointerForce(const PointerSettings& settings) : m_settings(settings) {}

    void setSettings(const PointerSettings& settings) { m_settings = settings; }
    const PointerSettings& getSettings() const { return m_settings; }

    void updatePosition(float x, float y, float vx, float vy);
    void onMouseDown(float x, float y, int button);
    void onMouseUp(int button);
    void onMouseLeave();

    // Counts the burst window down; call once per frame after the particle loop
    void advance(float deltaTime);

    /**
     * @brief Call once per frame before any force is applied.
     *
     * A pointer with no motion since the previous frame is at rest: its
     * velocity drops to zero so drag and idle repulsion stop.
     */
    void beginFrame();

    /**
     * @brief Apply pointer influence to one particle.
     *
     * Handles grab/release: a grabbed particle is pinned to the pointer and
     * receives no force.
     */
    void apply(Particle& particle, float deltaTime) const;

    // Read-only variant for populations that must not grab (image layer)
    void applyForce(Particle& particle, float deltaTime) const;

    bool isLeftPressed() const { return m_leftPressed; }
    bool isRightPressed() const { return m_rightPressed; }
    bool isAnyButtonPressed() const { return m_leftPressed || m_rightPressed; }
    bool isBurstActive() const { return m_burstRemaining > 0.0f; }
    BurstMode getBurstMode() const { return isBurstActive() ? m_burstMode : BurstMode::None; }
    float getBurstRemaining() const { return m_burstRemaining; }
    float getEffectiveRadius() const;

    const Vector2D& getPosition() const { return m_position; }
    const Vector2D& getVelocity() const { return m_velocity; }

private:
    void updateGrab(Particle& particle) const;

    PointerSettings m_settings;
    Vector2D m_position{PhysicsConstants::OFFSCREEN_POINTER,
                        PhysicsConstants::OFFSCREEN_POINTER};
    Vector2D m_velocity;
    bool m_movedThisFrame{false};
    bool m_leftPressed{false};
    bool m_rightPressed{false};
    float m_burstRemaining{0.0f};
    BurstMode m_burstMode{BurstMode::None};
};

} // namespace Snowfall

#endif // POINTER_FORCE_HPP
