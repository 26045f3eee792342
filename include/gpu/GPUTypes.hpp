/* Copyright (c) 2025 Hammer Forged Games
 * Licensed under the MIT License */

#ifndef GPU_TYPES_HPP
#define GPU_TYPES_HPP

#include <cstdint>
#include <cstddef>  // for offsetof

namespace Snowfall {

/**
 * Unit quad corner: position in [-0.5, 0.5], texcoord in [0, 1].
 * Six of these (two triangles) live in a static vertex buffer.
 */
struct QuadVertex {
    float x, y;
    float u, v;
};

static_assert(sizeof(QuadVertex) == 16, "QuadVertex must be 16 bytes");

/**
 * Per-instance record for one flake (vertex buffer slot 1).
 *
 * Shader locations:
 *   1 = x, y, size, fallSpeed
 *   2 = phase, freq, sway, rotation
 *   3 = rotationSpeed, r, g, b
 *   4 = glyphIndex, monotone
 *
 * `x, y` is the rest position; the vertex stage adds the sway offset
 * sin(phase) * sway so the render position is never stored. `sway` is
 * already scaled by the flake's sway limit.
 */
struct SnowInstance {
    float x, y;
    float size;
    float fallSpeed;
    float phase;
    float freq;
    float sway;
    float rotation;
    float rotationSpeed;
    float r, g, b;
    float glyphIndex;
    float monotone;
};

static_assert(sizeof(SnowInstance) == 56, "SnowInstance must be 56 bytes");
static_assert(offsetof(SnowInstance, phase) == 16, "SnowInstance::phase must be at offset 16");
static_assert(offsetof(SnowInstance, rotationSpeed) == 32, "SnowInstance::rotationSpeed must be at offset 32");
static_assert(offsetof(SnowInstance, glyphIndex) == 48, "SnowInstance::glyphIndex must be at offset 48");

/**
 * Uniform block shared by snow.vert (set 1) and snow.frag (set 3).
 */
struct SnowUniforms {
    float viewportWidth;
    float viewportHeight;
    float glyphCount;
    float glyphColumns;
    float sentenceCount;
    float sentenceColumns;
    float glowStrength;
    float time;
    float opacity;
    float glyphRows;
    float sentenceRows;
    float _pad0;
};

// Verify SnowUniforms layout matches std140 shader expectations
static_assert(sizeof(SnowUniforms) == 48, "SnowUniforms must be 48 bytes for std140");
static_assert(offsetof(SnowUniforms, glyphCount) == 8, "SnowUniforms::glyphCount must be at offset 8");
static_assert(offsetof(SnowUniforms, glowStrength) == 24, "SnowUniforms::glowStrength must be at offset 24");
static_assert(offsetof(SnowUniforms, opacity) == 32, "SnowUniforms::opacity must be at offset 32");

} // namespace Snowfall

#endif // GPU_TYPES_HPP
