/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef INTEGRATOR_HPP
#define INTEGRATOR_HPP

#include "physics/CollisionBody.hpp"
#include "physics/Particle.hpp"
#include <vector>

namespace Snowfall {

class CollisionResolver;
class FlakeSpawner;
class PointerForce;
class WindForce;

// Drawn rotation = cumulative spin + sin(phase * phaseScale) * amplitude * swayLimit
struct SwingSettings {
    float amplitude{0.35f};
    float phaseScale{1.0f};
};

/**
 * Everything one population needs for a frame. Pointer may be null (no
 * interaction); extraBodies are merged into collision resolution as
 * immovable bodies.
 */
struct StepContext {
    float deltaTime{0.016f};
    float viewportWidth{0.0f};
    float viewportHeight{0.0f};
    PointerForce* pointer{nullptr};
    bool allowGrab{true};
    const WindForce* wind{nullptr};
    const CollisionResolver* resolver{nullptr};
    const CollisionBodies* extraBodies{nullptr};
};

/**
 * @brief Per-frame motion pipeline for one particle population.
 *
 * Order: pointer, wind, translate, damping, phase/spin, collisions,
 * horizontal wrap, recycle below the viewport.
 */
class Integrator {
public:
    explicit Integrator(FlakeSpawner& spawner, const SwingSettings& swing = {});

    void step(std::vector<Particle>& particles, const StepContext& context);

    // Snapshot as read-only bodies for another population's resolver
    static void exportBodies(const std::vector<Particle>& particles, CollisionBodies& out);

    size_t getLastContactCount() const { return m_lastContacts; }

private:
    void advanceParticle(Particle& particle, const StepContext& context, float dt) const;
    void resolveCollisions(std::vector<Particle>& particles, const StepContext& context, float dt);
    void applyEdges(std::vector<Particle>& particles, const StepContext& context);

    FlakeSpawner& m_spawner;
    SwingSettings m_swing;
    CollisionBodies m_bodies; // reused every frame
    size_t m_lastContacts{0};
};

} // namespace Snowfall

#endif // INTEGRATOR_HPP
