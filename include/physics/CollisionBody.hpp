/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COLLISION_BODY_HPP
#define COLLISION_BODY_HPP

#include "physics/Particle.hpp"
#include "utils/Vector2D.hpp"
#include <cstdint>
#include <vector>

namespace Snowfall {

// How a body takes part in resolution
enum class BodyType : uint8_t {
    DYNAMIC,     // receives impulses and positional correction
    GRABBED,     // pinned to the pointer
    IMMOVABLE    // read-only body borrowed from another population
};

/**
 * Resolver-facing view of a particle. Only position, radius, velocity,
 * spin and sway state are needed, so any population can be merged.
 */
struct CollisionBody {
    Vector2D position;
    Vector2D velocity;
    float radius{1.0f};
    float rotationSpeed{0.0f};

    float phase{0.0f};
    float freq{0.0f};
    float sway{0.0f};
    float swayLimit{1.0f};

    BodyType type{BodyType::DYNAMIC};

    bool isPinned() const { return type != BodyType::DYNAMIC; }

    static CollisionBody fromParticle(const Particle& particle,
                                      bool immovable = false) {
        CollisionBody body;
        body.position = particle.rest;
        body.velocity = particle.velocity;
        body.radius = particle.collisionRadius();
        body.rotationSpeed = particle.rotationSpeed;
        body.phase = particle.phase;
        body.freq = particle.freq;
        body.sway = particle.sway;
        body.swayLimit = particle.swayLimit;
        if (immovable) {
            body.type = BodyType::IMMOVABLE;
        } else if (particle.isGrabbed) {
            body.type = BodyType::GRABBED;
        }
        return body;
    }

    // Copy resolved state back; pinned bodies are left untouched
    void writeBack(Particle& particle) const {
        particle.swayLimit = swayLimit;
        if (isPinned()) {
            return;
        }
        particle.rest = position;
        particle.velocity = velocity;
        particle.rotationSpeed = rotationSpeed;
    }
};

using CollisionBodies = std::vector<CollisionBody>;

} // namespace Snowfall

#endif // COLLISION_BODY_HPP
