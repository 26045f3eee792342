/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "physics/PointerForce.hpp"
#include "core/Logger.hpp"
#include "physics/PhysicsConstants.hpp"
#include <algorithm>
#include <cmath>
#include <format>

namespace Snowfall {

using namespace PhysicsConstants;

void PointerForce::updatePosition(float x, float y, float vx, float vy) {
    m_position = Vector2D(x, y);
    m_velocity = Vector2D(vx, vy);
    m_movedThisFrame = true;
}

void PointerForce::beginFrame() {
    if (!m_movedThisFrame) {
        m_velocity = Vector2D();
    }
    m_movedThisFrame = false;
}

void PointerForce::onMouseDown(float x, float y, int button) {
    if (button == POINTER_BUTTON_LEFT) {
        m_leftPressed = true;
        m_burstMode = BurstMode::Explode;
        m_burstRemaining = BURST_DURATION;
    } else if (button == POINTER_BUTTON_RIGHT) {
        m_rightPressed = true;
        m_burstMode = BurstMode::Suction;
        m_burstRemaining = BURST_DURATION;
    }
    m_position = Vector2D(x, y);
    FORCE_DEBUG(std::format("Pointer button {} down at ({}, {})", button, x, y));
}

void PointerForce::onMouseUp(int button) {
    if (button == POINTER_BUTTON_LEFT) {
        m_leftPressed = false;
    } else if (button == POINTER_BUTTON_RIGHT) {
        m_rightPressed = false;
    }
}

void PointerForce::onMouseLeave() {
    m_leftPressed = false;
    m_rightPressed = false;
    m_burstRemaining = 0.0f;
    m_burstMode = BurstMode::None;
    m_position = Vector2D(OFFSCREEN_POINTER, OFFSCREEN_POINTER);
    m_velocity = Vector2D();
    m_movedThisFrame = false;
}

void PointerForce::advance(float deltaTime) {
    if (m_burstRemaining <= 0.0f) {
        return;
    }
    m_burstRemaining = std::max(0.0f, m_burstRemaining - deltaTime);
    if (m_burstRemaining == 0.0f) {
        m_burstMode = BurstMode::None;
    }
}

float PointerForce::getEffectiveRadius() const {
    return m_settings.radius * (isBurstActive() ? BURST_RADIUS_MULTIPLIER : 1.0f);
}

void PointerForce::updateGrab(Particle& particle) const {
    if (!isAnyButtonPressed()) {
        if (particle.isGrabbed) {
            particle.isGrabbed = false;
            particle.swayLimit = 1.0f;
        }
        return;
    }

    if (!particle.isGrabbed && m_leftPressed && !isBurstActive()) {
        float grabRadius = m_settings.radius * GRAB_RADIUS_FACTOR;
        if (Vector2D::distanceSquared(particle.rest, m_position) < grabRadius * grabRadius) {
            particle.isGrabbed = true;
            particle.grabOffset = particle.rest - m_position;
            particle.velocity = Vector2D();
            particle.rotationSpeed = 0.0f;
            particle.swayLimit = 0.0f;
        }
    }

    if (particle.isGrabbed) {
        particle.rest = m_position + particle.grabOffset;
    }
}

void PointerForce::apply(Particle& particle, float deltaTime) const {
    updateGrab(particle);
    if (particle.isGrabbed) {
        return;
    }
    applyForce(particle, deltaTime);
}

void PointerForce::applyForce(Particle& particle, float deltaTime) const {
    Vector2D offset = particle.rest - m_position;
    float distance = offset.length();

    bool burstActive = isBurstActive();
    float radius = getEffectiveRadius();
    if (distance >= radius) {
        return;
    }

    float influence = 1.0f - distance / radius;
    float speed = m_velocity.length();
    float activity = speed > 0.0f ? 1.0f : 0.0f;
    if (!burstActive && activity == 0.0f) {
        return;
    }

    float burstFactor = burstActive ? std::min(1.0f, m_burstRemaining / BURST_DURATION) : 0.0f;
    float activeInfluence = influence * std::max(activity, burstFactor);
    Vector2D normal = offset / std::max(distance, EPSILON);

    if (burstActive && m_burstMode == BurstMode::Explode) {
        particle.velocity += normal * (activeInfluence * m_settings.force * BURST_FORCE_MULTIPLIER * deltaTime);
    } else if (burstActive && m_burstMode == BurstMode::Suction) {
        particle.velocity -= normal * (activeInfluence * m_settings.force * BURST_FORCE_MULTIPLIER * deltaTime);
    } else if (speed > m_settings.dragThreshold) {
        // Airflow along the pointer direction
        Vector2D direction = m_velocity / std::max(speed, 0.001f);
        float dragForce = activeInfluence * m_settings.dragStrength * (speed / DRAG_SPEED_SCALE);
        particle.velocity += direction * (dragForce * deltaTime * DRAG_SPEED_SCALE);
    } else {
        float accel = activeInfluence * m_settings.force * deltaTime;
        float verticalBias = normal.getY() < 0.0f ? UPWARD_REPULSION_BIAS : 1.0f;
        particle.velocity += Vector2D(normal.getX() * accel, normal.getY() * accel * verticalBias);
    }

    particle.velocity += m_velocity * (activeInfluence * m_settings.impulseStrength * deltaTime);

    float cross = offset.cross(m_velocity);
    float spinDirection = (cross > 0.0f) ? 1.0f : ((cross < 0.0f) ? -1.0f : 0.0f);
    particle.rotationSpeed += activeInfluence * speed * POINTER_SPIN_FACTOR * spinDirection * deltaTime;
}

} // namespace Snowfall
