/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "physics/FlakeSpawner.hpp"
#include "core/Logger.hpp"
#include "physics/PhysicsConstants.hpp"
#include <algorithm>
#include <format>

namespace Snowfall {

using namespace PhysicsConstants;

FlakeSpawner::FlakeSpawner() : m_rng(std::random_device{}()) {}

FlakeSpawner::FlakeSpawner(uint32_t seed) : m_rng(seed) {}

void FlakeSpawner::configure(const SpawnSettings& settings) {
    m_settings = settings;
    m_settings.count = std::max(1, m_settings.count);
    m_settings.glyphCount = std::max(1u, m_settings.glyphCount);
    m_settings.maxSize = std::max(m_settings.maxSize, m_settings.minSize);
    if (m_settings.colors.empty()) {
        m_settings.colors.push_back(ColorF{});
    }
    if (m_settings.sentenceCount == 0) {
        m_settings.sentenceFlakes = 0;
    }
    m_settings.sentenceFlakes = std::clamp(m_settings.sentenceFlakes, 0, m_settings.count);
    m_sentenceCursor = 0;
}

float FlakeSpawner::uniform(float min, float max) {
    std::uniform_real_distribution<float> dist(0.0f, 1.0f);
    return min + dist(m_rng) * (max - min);
}

uint32_t FlakeSpawner::nextSentenceIndex() {
    if (m_settings.sentenceCount == 0) {
        return 0;
    }
    uint32_t index = m_sentenceCursor % m_settings.sentenceCount;
    m_sentenceCursor = (m_sentenceCursor + 1) % m_settings.sentenceCount;
    return index;
}

std::vector<Particle> FlakeSpawner::spawnPopulation(float viewportWidth, float viewportHeight) {
    std::vector<Particle> particles;
    particles.reserve(static_cast<size_t>(m_settings.count));
    for (int i = 0; i < m_settings.count; ++i) {
        particles.push_back(spawnFlake(i, viewportWidth, viewportHeight));
    }
    INTEGRATOR_INFO(std::format("Spawned {} flakes ({} sentences, {} glyph cells)",
                                particles.size(), m_settings.sentenceFlakes,
                                m_settings.glyphCount));
    return particles;
}

Particle FlakeSpawner::spawnFlake(int index, float viewportWidth, float viewportHeight) {
    Particle p;
    p.isSentence = index < m_settings.sentenceFlakes;

    if (p.isSentence) {
        p.sentenceIndex = nextSentenceIndex();
        p.glyphIndex = m_settings.glyphCount + p.sentenceIndex;
        p.size = std::max(m_settings.maxSize * SENTENCE_SIZE_SCALE, SENTENCE_MIN_SIZE) +
                 uniform(0.0f, SENTENCE_SIZE_RANGE);
        // Text occupies the middle of the banner cell
        p.collisionSize = std::max(m_settings.minSize, SENTENCE_MIN_COLLISION) +
                          uniform(0.0f, SENTENCE_COLLISION_RANGE);
    } else {
        p.glyphIndex = static_cast<uint32_t>(index - m_settings.sentenceFlakes) %
                       m_settings.glyphCount;
        p.size = uniform(m_settings.minSize, m_settings.maxSize);
        p.collisionSize = p.size;
    }

    const ColorF& color = m_settings.colors[static_cast<size_t>(index) % m_settings.colors.size()];
    p.r = color.r;
    p.g = color.g;
    p.b = color.b;

    p.fallSpeed = m_settings.sinkspeed * (p.size / FALL_REFERENCE_SIZE) * FALL_SPEED_SCALE;
    p.sway = uniform(SWAY_MIN, SWAY_MIN + SWAY_RANGE);
    p.phase = uniform(0.0f, TWO_PI);
    p.freq = uniform(FREQ_MIN, FREQ_MIN + FREQ_RANGE);
    p.rotation = uniform(0.0f, TWO_PI);
    p.cumulativeSpin = p.rotation;
    p.rotationSpeed = uniform(-0.5f, 0.5f) * SPIN_RANGE;

    p.rest = Vector2D(uniform(0.0f, viewportWidth), -p.size - uniform(0.0f, viewportHeight));
    return p;
}

Particle FlakeSpawner::spawnImageFlake(uint32_t imageIndex, float viewportWidth,
                                       float viewportHeight) {
    Particle p;
    p.glyphIndex = imageIndex;
    p.size = uniform(m_settings.minSize, m_settings.maxSize);
    p.collisionSize = p.size;
    p.fallSpeed = m_settings.sinkspeed * (p.size / FALL_REFERENCE_SIZE) * FALL_SPEED_SCALE;
    p.sway = uniform(SWAY_MIN, SWAY_MIN + SWAY_RANGE);
    p.phase = uniform(0.0f, TWO_PI);
    p.freq = uniform(IMAGE_FREQ_MIN, IMAGE_FREQ_MIN + IMAGE_FREQ_RANGE);
    p.rest = Vector2D(uniform(0.0f, viewportWidth), -p.size - uniform(0.0f, viewportHeight));
    return p;
}

void FlakeSpawner::recycle(Particle& particle, float viewportWidth) {
    particle.rest = Vector2D(uniform(0.0f, viewportWidth), -particle.size);
    particle.phase = uniform(0.0f, TWO_PI);
    particle.rotation = uniform(0.0f, TWO_PI);
    particle.cumulativeSpin = particle.rotation;
    particle.rotationSpeed = 0.0f;
    particle.velocity = Vector2D();
    particle.swayLimit = 1.0f;

    if (particle.isSentence && m_settings.sentenceCount > 0) {
        particle.sentenceIndex = nextSentenceIndex();
        particle.glyphIndex = m_settings.glyphCount + particle.sentenceIndex;
    }
}

} // namespace Snowfall
