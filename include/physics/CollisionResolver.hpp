/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COLLISION_RESOLVER_HPP
#define COLLISION_RESOLVER_HPP

#include "physics/CollisionBody.hpp"
#include <cstddef>

namespace Snowfall {

struct CollisionSettings {
    bool enabled{true};
    float checkRadius{200.0f};  // pairs farther apart are skipped
    float damping{0.7f};        // scales sway-to-spin coupling
};

/**
 * @brief Pairwise impulse resolver for circular bodies.
 *
 * O(n^2) over the whole set; intended for a few hundred bodies. Pinned
 * bodies (grabbed or immovable) behave as infinite mass: they never move
 * and the free partner receives the full impulse.
 */
class CollisionResolver {
public:
    CollisionResolver() = default;
    explicit CollisionResolver(const CollisionSettings& settings) : m_settings(settings) {}

    void setSettings(const CollisionSettings& settings) { m_settings = settings; }
    const CollisionSettings& getSettings() const { return m_settings; }

    /**
     * @brief Shrink swayLimit where next frame's swing would interpenetrate.
     *
     * Resets limits first (1 for free bodies, 0 for grabbed ones).
     */
    void limitSway(CollisionBodies& bodies, float deltaTime) const;

    /**
     * @brief Resolve every overlapping, closing pair.
     *
     * One impulse pass over all pairs, then overlap-only relaxation passes
     * until the deepest remaining overlap is below EPSILON, so clusters of
     * three or more bodies also end up separated.
     * @return number of contacts resolved in the impulse pass
     */
    size_t resolve(CollisionBodies& bodies, float deltaTime) const;

private:
    bool resolvePair(CollisionBody& a, CollisionBody& b, float deltaTime) const;
    // Returns the overlap that was corrected, 0 when the pair is clear
    float separatePair(CollisionBody& a, CollisionBody& b) const;
    float relaxOverlaps(CollisionBodies& bodies) const;

    CollisionSettings m_settings;
};

} // namespace Snowfall

#endif // COLLISION_RESOLVER_HPP
