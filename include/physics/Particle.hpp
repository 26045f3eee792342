/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PARTICLE_HPP
#define PARTICLE_HPP

#include "utils/Vector2D.hpp"
#include <cmath>
#include <cstdint>

namespace Snowfall {

/**
 * One falling flake (glyph, sentence banner or image).
 *
 * Only the rest position is stored; the drawn position adds the sway
 * offset derived from the current phase.
 */
struct Particle {
    Vector2D rest;
    Vector2D velocity;          // impulse driven, decays through damping
    Vector2D grabOffset;

    float size{20.0f};          // drawn edge length in logical pixels
    float collisionSize{20.0f}; // diameter used by the collision resolver
    float fallSpeed{0.0f};

    float phase{0.0f};
    float freq{1.0f};
    float sway{0.0f};           // maximum horizontal sway offset
    float swayLimit{1.0f};      // 0..1, shrunk near contacts and while grabbed

    float rotation{0.0f};       // drawn rotation
    float rotationSpeed{0.0f};
    float cumulativeSpin{0.0f};

    float r{1.0f};
    float g{1.0f};
    float b{1.0f};

    uint32_t glyphIndex{0};     // combined atlas index, or image index in layers
    uint32_t sentenceIndex{0};
    bool isSentence{false};
    bool isGrabbed{false};

    float collisionRadius() const { return collisionSize * 0.5f; }

    float swayOffset() const { return std::sin(phase) * sway * swayLimit; }

    Vector2D renderPosition() const {
        return Vector2D(rest.getX() + swayOffset(), rest.getY());
    }
};

} // namespace Snowfall

#endif // PARTICLE_HPP
