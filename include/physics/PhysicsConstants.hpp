/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PHYSICS_CONSTANTS_HPP
#define PHYSICS_CONSTANTS_HPP

// Single constant set shared by the GPU backend, the software backend and the
// image layer. Tunables that users may change live in SnowConfig instead.

namespace Snowfall {
namespace PhysicsConstants {

constexpr float TWO_PI = 6.28318530717958647692f;

// Numerical guards
constexpr float EPSILON = 1e-4f;
constexpr float MIN_DELTA = 0.001f;
constexpr float OFFSCREEN_POINTER = -1000.0f;

// Integrator
constexpr float DAMPING_PER_FRAME = 0.98f;   // applied as DAMPING^(dt*60)
constexpr float REFERENCE_FPS = 60.0f;
constexpr float SWING_AMPLITUDE = 0.35f;     // rad, glyph swing around spin
constexpr float IMAGE_SWING_AMPLITUDE = 0.4f;
constexpr float IMAGE_SWING_PHASE_SCALE = 0.5f;

// Pointer
constexpr float BURST_DURATION = 0.2f;       // seconds of simulation time
constexpr float BURST_RADIUS_MULTIPLIER = 3.5f;
constexpr float BURST_FORCE_MULTIPLIER = 5.0f;
constexpr float UPWARD_REPULSION_BIAS = 0.35f;
constexpr float POINTER_SPIN_FACTOR = 0.01f;
constexpr float GRAB_RADIUS_FACTOR = 0.5f;
constexpr float DRAG_SPEED_SCALE = 1000.0f;

// Wind
constexpr float WIND_REFERENCE_SIZE = 20.0f;
constexpr float WIND_ACCELERATION = 120.0f;
constexpr float WIND_LIFT_RATIO = 0.3f;
constexpr float WIND_SMOOTHING = 0.1f;       // per 60 Hz frame
constexpr float WIND_MIN_GUST_FREQUENCY = 0.1f;

// Collisions
constexpr float RESTITUTION = 0.95f;
constexpr float MAX_COLLISION_IMPULSE = 600.0f;
constexpr float SWAY_COUPLING = 0.02f;
constexpr float MAX_SPIN_IMPULSE = 0.5f;
constexpr int MAX_RELAXATION_PASSES = 16;  // overlap-only passes after the impulse pass

// Spawning
constexpr float SWAY_MIN = 10.0f;
constexpr float SWAY_RANGE = 25.0f;
constexpr float FREQ_MIN = 0.8f;
constexpr float FREQ_RANGE = 1.4f;
constexpr float IMAGE_FREQ_MIN = 0.6f;
constexpr float IMAGE_FREQ_RANGE = 1.2f;
constexpr float SPIN_RANGE = 0.6f;
constexpr float FALL_REFERENCE_SIZE = 20.0f;
constexpr float FALL_SPEED_SCALE = 20.0f;
constexpr float SENTENCE_SIZE_SCALE = 1.2f;
constexpr float SENTENCE_MIN_SIZE = 60.0f;
constexpr float SENTENCE_SIZE_RANGE = 20.0f;
constexpr float SENTENCE_MIN_COLLISION = 20.0f;
constexpr float SENTENCE_COLLISION_RANGE = 15.0f;

} // namespace PhysicsConstants
} // namespace Snowfall

#endif // PHYSICS_CONSTANTS_HPP
