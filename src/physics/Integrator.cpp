/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "physics/Integrator.hpp"
#include "physics/CollisionResolver.hpp"
#include "physics/FlakeSpawner.hpp"
#include "physics/PhysicsConstants.hpp"
#include "physics/PointerForce.hpp"
#include "physics/WindForce.hpp"
#include <algorithm>
#include <cmath>

namespace Snowfall {

using namespace PhysicsConstants;

Integrator::Integrator(FlakeSpawner& spawner, const SwingSettings& swing)
    : m_spawner(spawner), m_swing(swing) {}

void Integrator::step(std::vector<Particle>& particles, const StepContext& context) {
    const float dt = std::max(MIN_DELTA, context.deltaTime);

    for (auto& particle : particles) {
        advanceParticle(particle, context, dt);
    }

    resolveCollisions(particles, context, dt);
    applyEdges(particles, context);
}

void Integrator::advanceParticle(Particle& particle, const StepContext& context, float dt) const {
    if (context.pointer) {
        if (context.allowGrab) {
            context.pointer->apply(particle, dt);
        } else {
            context.pointer->applyForce(particle, dt);
        }
    }
    if (context.wind) {
        context.wind->apply(particle, dt);
    }

    if (particle.isGrabbed) {
        particle.velocity = Vector2D();
        particle.rotationSpeed = 0.0f;
        return;
    }

    particle.rest += particle.velocity * dt;
    particle.rest += Vector2D(0.0f, particle.fallSpeed * dt);

    const float damping = std::pow(DAMPING_PER_FRAME, dt * REFERENCE_FPS);
    particle.velocity *= damping;
    particle.velocity.zeroBelow(EPSILON);
    particle.rotationSpeed *= damping;
    if (std::fabs(particle.rotationSpeed) < EPSILON) {
        particle.rotationSpeed = 0.0f;
    }

    particle.phase = std::fmod(particle.phase + particle.freq * dt, TWO_PI * 64.0f);
    particle.cumulativeSpin += particle.rotationSpeed * dt;
    particle.rotation = particle.cumulativeSpin +
        std::sin(particle.phase * m_swing.phaseScale) * m_swing.amplitude * particle.swayLimit;
}

void Integrator::resolveCollisions(std::vector<Particle>& particles, const StepContext& context,
                                   float dt) {
    m_lastContacts = 0;
    if (!context.resolver) {
        return;
    }

    m_bodies.clear();
    m_bodies.reserve(particles.size() + (context.extraBodies ? context.extraBodies->size() : 0));
    for (const auto& particle : particles) {
        m_bodies.push_back(CollisionBody::fromParticle(particle));
    }
    if (context.extraBodies) {
        for (const auto& body : *context.extraBodies) {
            m_bodies.push_back(body);
            m_bodies.back().type = BodyType::IMMOVABLE;
        }
    }

    context.resolver->limitSway(m_bodies, dt);
    m_lastContacts = context.resolver->resolve(m_bodies, dt);

    for (size_t i = 0; i < particles.size(); ++i) {
        m_bodies[i].writeBack(particles[i]);
    }
}

void Integrator::exportBodies(const std::vector<Particle>& particles, CollisionBodies& out) {
    out.clear();
    out.reserve(particles.size());
    for (const auto& particle : particles) {
        out.push_back(CollisionBody::fromParticle(particle, true));
    }
}

void Integrator::applyEdges(std::vector<Particle>& particles, const StepContext& context) {
    const float width = context.viewportWidth;
    const float height = context.viewportHeight;

    for (auto& particle : particles) {
        // Wrap horizontally
        const float span = width + 2.0f * particle.size;
        if (particle.rest.getX() < -particle.size) {
            particle.rest.setX(particle.rest.getX() + span);
        } else if (particle.rest.getX() > width + particle.size) {
            particle.rest.setX(particle.rest.getX() - span);
        }

        if (!particle.isGrabbed && particle.rest.getY() - particle.size > height) {
            m_spawner.recycle(particle, width);
        }
    }
}

} // namespace Snowfall
