/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef FLAKE_SPAWNER_HPP
#define FLAKE_SPAWNER_HPP

#include "physics/Particle.hpp"
#include "utils/ColorUtils.hpp"
#include <cstdint>
#include <random>
#include <vector>

namespace Snowfall {

struct SpawnSettings {
    int count{80};
    float sinkspeed{0.4f};
    float minSize{15.0f};
    float maxSize{40.0f};
    std::vector<ColorF> colors{ColorF{}};

    uint32_t glyphCount{1};      // cells in the glyph atlas (at least 1)
    uint32_t sentenceCount{0};   // cells in the sentence atlas
    int sentenceFlakes{0};       // leading flakes that carry sentences
};

/**
 * @brief Creates and recycles flakes.
 *
 * Owns the RNG and the round-robin cursor over sentences so every recycled
 * sentence banner shows the next sentence in order.
 */
class FlakeSpawner {
public:
    FlakeSpawner();
    explicit FlakeSpawner(uint32_t seed);

    void configure(const SpawnSettings& settings);
    const SpawnSettings& getSettings() const { return m_settings; }

    // Batch at session start; count is at least 1
    std::vector<Particle> spawnPopulation(float viewportWidth, float viewportHeight);

    // Image layer flake referencing texture imageIndex
    Particle spawnImageFlake(uint32_t imageIndex, float viewportWidth, float viewportHeight);

    // Back above the top edge at a random x with motion state cleared
    void recycle(Particle& particle, float viewportWidth);

    uint32_t nextSentenceIndex();
    void resetSentenceCursor() { m_sentenceCursor = 0; }

    float uniform(float min, float max);

private:
    Particle spawnFlake(int index, float viewportWidth, float viewportHeight);

    SpawnSettings m_settings;
    std::mt19937 m_rng;
    uint32_t m_sentenceCursor{0};
};

} // namespace Snowfall

#endif // FLAKE_SPAWNER_HPP
