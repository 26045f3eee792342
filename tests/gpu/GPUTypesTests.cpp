/* Copyright (c) 2025 Hammer Forged Games
 * Licensed under the MIT License */

/**
 * Layout tests for the records shared with snow.vert / snow.frag.
 * No GPU required.
 */

#define BOOST_TEST_MODULE GPUTypesTests
#include <boost/test/unit_test.hpp>

#include "gpu/GPUTypes.hpp"
#include <cstddef>
#include <type_traits>

using namespace Snowfall;

// ============================================================================
// QUAD VERTEX
// ============================================================================

BOOST_AUTO_TEST_SUITE(QuadVertexTests)

BOOST_AUTO_TEST_CASE(QuadVertexLayout) {
    BOOST_CHECK_EQUAL(sizeof(QuadVertex), 16u);
    BOOST_CHECK_EQUAL(offsetof(QuadVertex, x), 0u);
    BOOST_CHECK_EQUAL(offsetof(QuadVertex, u), 8u);
    BOOST_CHECK_EQUAL(offsetof(QuadVertex, v), 12u);
}

BOOST_AUTO_TEST_CASE(QuadVertexUploadable) {
    BOOST_CHECK(std::is_trivially_copyable_v<QuadVertex>);
    BOOST_CHECK(std::is_standard_layout_v<QuadVertex>);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// SNOW INSTANCE
// Four attribute groups, read as float4/float4/float4/float2
// ============================================================================

BOOST_AUTO_TEST_SUITE(SnowInstanceTests)

BOOST_AUTO_TEST_CASE(InstanceSize) {
    // 14 floats
    BOOST_CHECK_EQUAL(sizeof(SnowInstance), 56u);
}

BOOST_AUTO_TEST_CASE(InstanceAttributeGroups) {
    BOOST_CHECK_EQUAL(offsetof(SnowInstance, x), 0u);
    BOOST_CHECK_EQUAL(offsetof(SnowInstance, fallSpeed), 12u);
    BOOST_CHECK_EQUAL(offsetof(SnowInstance, phase), 16u);
    BOOST_CHECK_EQUAL(offsetof(SnowInstance, rotation), 28u);
    BOOST_CHECK_EQUAL(offsetof(SnowInstance, rotationSpeed), 32u);
    BOOST_CHECK_EQUAL(offsetof(SnowInstance, b), 44u);
    BOOST_CHECK_EQUAL(offsetof(SnowInstance, glyphIndex), 48u);
    BOOST_CHECK_EQUAL(offsetof(SnowInstance, monotone), 52u);
}

BOOST_AUTO_TEST_CASE(InstanceUploadable) {
    BOOST_CHECK(std::is_trivially_copyable_v<SnowInstance>);
    BOOST_CHECK(std::is_standard_layout_v<SnowInstance>);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// SNOW UNIFORMS
// std140 block, 16-byte aligned
// ============================================================================

BOOST_AUTO_TEST_SUITE(SnowUniformsTests)

BOOST_AUTO_TEST_CASE(UniformsAreStd140Sized) {
    BOOST_CHECK_EQUAL(sizeof(SnowUniforms), 48u);
    BOOST_CHECK_EQUAL(sizeof(SnowUniforms) % 16, 0u);
}

BOOST_AUTO_TEST_CASE(UniformOffsets) {
    BOOST_CHECK_EQUAL(offsetof(SnowUniforms, viewportWidth), 0u);
    BOOST_CHECK_EQUAL(offsetof(SnowUniforms, glyphCount), 8u);
    BOOST_CHECK_EQUAL(offsetof(SnowUniforms, sentenceCount), 16u);
    BOOST_CHECK_EQUAL(offsetof(SnowUniforms, glowStrength), 24u);
    BOOST_CHECK_EQUAL(offsetof(SnowUniforms, time), 28u);
    BOOST_CHECK_EQUAL(offsetof(SnowUniforms, opacity), 32u);
    BOOST_CHECK_EQUAL(offsetof(SnowUniforms, sentenceRows), 40u);
}

BOOST_AUTO_TEST_CASE(UniformsZeroInitialize) {
    SnowUniforms uniforms{};
    BOOST_CHECK_EQUAL(uniforms.glowStrength, 0.0f);
    BOOST_CHECK_EQUAL(uniforms.opacity, 0.0f);
    BOOST_CHECK(std::is_trivially_copyable_v<SnowUniforms>);
}

BOOST_AUTO_TEST_SUITE_END()
