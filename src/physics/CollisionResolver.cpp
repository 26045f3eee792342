/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "physics/CollisionResolver.hpp"
#include "core/Logger.hpp"
#include "physics/PhysicsConstants.hpp"
#include <algorithm>
#include <cmath>
#include <format>

namespace Snowfall {

using namespace PhysicsConstants;

namespace {

// Horizontal velocity contributed by the sway oscillation
float swayVelocity(const CollisionBody& body) {
    return std::cos(body.phase) * body.freq * body.sway * body.swayLimit;
}

float predictedSwayOffset(const CollisionBody& body, float deltaTime) {
    return std::sin(body.phase + body.freq * deltaTime) * body.sway * body.swayLimit;
}

} // namespace

void CollisionResolver::limitSway(CollisionBodies& bodies, float deltaTime) const {
    for (auto& body : bodies) {
        if (body.type == BodyType::DYNAMIC) {
            body.swayLimit = 1.0f;
        } else if (body.type == BodyType::GRABBED) {
            body.swayLimit = 0.0f;
        }
    }

    if (!m_settings.enabled || bodies.size() < 2) {
        return;
    }

    const float checkRadiusSq = m_settings.checkRadius * m_settings.checkRadius;
    for (size_t i = 0; i < bodies.size(); ++i) {
        CollisionBody& a = bodies[i];
        for (size_t j = i + 1; j < bodies.size(); ++j) {
            CollisionBody& b = bodies[j];
            if (a.isPinned() && b.isPinned()) {
                continue;
            }

            float distSq = Vector2D::distanceSquared(a.position, b.position);
            if (distSq > checkRadiusSq) {
                continue;
            }
            float minDistance = a.radius + b.radius;
            // Overlap at rest is the resolver's job, not the swing's
            if (distSq < minDistance * minDistance) {
                continue;
            }

            Vector2D nextA(a.position.getX() + predictedSwayOffset(a, deltaTime), a.position.getY());
            Vector2D nextB(b.position.getX() + predictedSwayOffset(b, deltaTime), b.position.getY());
            if (Vector2D::distanceSquared(nextA, nextB) < minDistance * minDistance) {
                if (a.type == BodyType::DYNAMIC) {
                    a.swayLimit = std::max(0.0f, a.swayLimit * 0.5f);
                }
                if (b.type == BodyType::DYNAMIC) {
                    b.swayLimit = std::max(0.0f, b.swayLimit * 0.5f);
                }
            }
        }
    }
}

size_t CollisionResolver::resolve(CollisionBodies& bodies, float deltaTime) const {
    if (!m_settings.enabled || bodies.size() < 2) {
        return 0;
    }

    size_t contacts = 0;
    const float checkRadiusSq = m_settings.checkRadius * m_settings.checkRadius;
    for (size_t i = 0; i < bodies.size(); ++i) {
        for (size_t j = i + 1; j < bodies.size(); ++j) {
            if (Vector2D::distanceSquared(bodies[i].position, bodies[j].position) > checkRadiusSq) {
                continue;
            }
            if (resolvePair(bodies[i], bodies[j], deltaTime)) {
                ++contacts;
            }
        }
    }

    if (contacts == 0) {
        return 0;
    }

    // Corrections from later pairs can push a body back into an earlier one
    int passes = 0;
    float worstOverlap = 0.0f;
    while (passes < MAX_RELAXATION_PASSES) {
        worstOverlap = relaxOverlaps(bodies);
        ++passes;
        if (worstOverlap < EPSILON) {
            break;
        }
    }

    COLLISION_DEBUG(std::format("Resolved {} contacts among {} bodies ({} relaxation passes, residual {:.5f})",
                                contacts, bodies.size(), passes, worstOverlap));
    return contacts;
}

float CollisionResolver::relaxOverlaps(CollisionBodies& bodies) const {
    float worstOverlap = 0.0f;
    const float checkRadiusSq = m_settings.checkRadius * m_settings.checkRadius;
    for (size_t i = 0; i < bodies.size(); ++i) {
        for (size_t j = i + 1; j < bodies.size(); ++j) {
            if (Vector2D::distanceSquared(bodies[i].position, bodies[j].position) > checkRadiusSq) {
                continue;
            }
            worstOverlap = std::max(worstOverlap, separatePair(bodies[i], bodies[j]));
        }
    }
    return worstOverlap;
}

bool CollisionResolver::resolvePair(CollisionBody& a, CollisionBody& b, float deltaTime) const {
    const bool pinnedA = a.isPinned();
    const bool pinnedB = b.isPinned();
    if (pinnedA && pinnedB) {
        return false;
    }

    Vector2D delta = b.position - a.position;
    float distance = delta.length();
    // Coincident centers fall back to +x
    Vector2D normal = (distance > EPSILON) ? delta / distance : Vector2D(1.0f, 0.0f);

    float relVelNormal = (b.velocity - a.velocity).dot(normal);
    float contactDistance = a.radius + b.radius;
    float minDistance = contactDistance + std::max(0.0f, -relVelNormal) * deltaTime;
    if (distance >= minDistance) {
        return false;
    }

    if (relVelNormal < 0.0f) {
        float fullImpulse = -(1.0f + RESTITUTION) * relVelNormal;
        if (!pinnedA && !pinnedB) {
            float j = std::min(fullImpulse * 0.5f, MAX_COLLISION_IMPULSE);
            a.velocity -= normal * j;
            b.velocity += normal * j;
        } else {
            float j = std::min(fullImpulse, MAX_COLLISION_IMPULSE);
            if (pinnedA) {
                b.velocity += normal * j;
            } else {
                a.velocity -= normal * j;
            }
        }

        // Sway bumps turn into opposite spin on the two bodies
        Vector2D tangent = normal.perpendicular();
        float relTangential = (swayVelocity(b) - swayVelocity(a)) * tangent.getX();
        float spinImpulse = std::clamp(relTangential * SWAY_COUPLING * m_settings.damping,
                                       -MAX_SPIN_IMPULSE, MAX_SPIN_IMPULSE);
        if (!pinnedA) {
            a.rotationSpeed += spinImpulse;
        }
        if (!pinnedB) {
            b.rotationSpeed -= spinImpulse;
        }
    }

    separatePair(a, b);
    return true;
}

float CollisionResolver::separatePair(CollisionBody& a, CollisionBody& b) const {
    const bool pinnedA = a.isPinned();
    const bool pinnedB = b.isPinned();
    if (pinnedA && pinnedB) {
        return 0.0f;
    }

    Vector2D delta = b.position - a.position;
    float distance = delta.length();
    float overlap = (a.radius + b.radius) - distance;
    if (overlap <= 0.0f) {
        return 0.0f;
    }

    Vector2D normal = (distance > EPSILON) ? delta / distance : Vector2D(1.0f, 0.0f);
    if (pinnedA) {
        b.position += normal * overlap;
    } else if (pinnedB) {
        a.position -= normal * overlap;
    } else {
        Vector2D correction = normal * (overlap * 0.5f);
        a.position -= correction;
        b.position += correction;
    }
    return overlap;
}

} // namespace Snowfall
