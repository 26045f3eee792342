/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE SnowBackendBaseTests
#include <boost/test/unit_test.hpp>

#include "physics/PhysicsConstants.hpp"
#include "render/SnowBackendBase.hpp"

using namespace Snowfall;

namespace {

// Draws nothing; counts the hooks the base class calls
class HeadlessBackend : public SnowBackendBase {
public:
    explicit HeadlessBackend(const SnowConfig& config, bool failCreate = false)
        : SnowBackendBase(nullptr, config), m_failCreate(failCreate) {}

    ~HeadlessBackend() override { stop(); }

    const char* getName() const override { return "Headless"; }

    int creates{0};
    int releases{0};
    int rebuilds{0};
    int renders{0};

protected:
    bool createResources() override {
        ++creates;
        return !m_failCreate;
    }
    void releaseResources() override { ++releases; }
    void onAtlasesRebuilt() override { ++rebuilds; }
    void render() override { ++renders; }

    bool queryViewport(float& width, float& height) const override {
        width = 800.0f;
        height = 600.0f;
        return true;
    }

private:
    bool m_failCreate;
};

SnowConfig smallConfig() {
    SnowConfig config;
    config.snowmax = 10;
    config.snowletters = {"*"};
    return config;
}

} // namespace

BOOST_AUTO_TEST_SUITE(LifecycleTests)

BOOST_AUTO_TEST_CASE(InitSpawnsPopulation) {
    HeadlessBackend backend(smallConfig());
    BOOST_CHECK(backend.getState() == BackendState::Uninitialized);

    BOOST_REQUIRE(backend.init());
    BOOST_CHECK(backend.getState() == BackendState::Ready);
    BOOST_CHECK_EQUAL(backend.creates, 1);
    BOOST_CHECK_EQUAL(backend.getParticles().size(), 10u);
    BOOST_CHECK_EQUAL(backend.getAtlases().glyphCount(), 1u);
}

BOOST_AUTO_TEST_CASE(FailedInitReleasesPartialResources) {
    HeadlessBackend backend(smallConfig(), true);
    BOOST_CHECK(!backend.init());
    BOOST_CHECK(backend.getState() == BackendState::Uninitialized);
    BOOST_CHECK_EQUAL(backend.releases, 1);
    BOOST_CHECK(backend.getParticles().empty());
}

BOOST_AUTO_TEST_CASE(FramesOnlyRunWhileRunning) {
    HeadlessBackend backend(smallConfig());
    BOOST_REQUIRE(backend.init());

    backend.frame(1.0);
    BOOST_CHECK_EQUAL(backend.renders, 0);

    backend.start();
    BOOST_CHECK(backend.getState() == BackendState::Running);
    backend.frame(1.0);
    backend.frame(1.016);
    BOOST_CHECK_EQUAL(backend.renders, 2);

    backend.pause();
    BOOST_CHECK(backend.getState() == BackendState::Paused);
    backend.frame(1.032);
    BOOST_CHECK_EQUAL(backend.renders, 2);
}

BOOST_AUTO_TEST_CASE(StopReturnsToUninitialized) {
    HeadlessBackend backend(smallConfig());
    BOOST_REQUIRE(backend.init());
    backend.start();
    backend.onMouseDown(10.0f, 10.0f, POINTER_BUTTON_LEFT);
    backend.stop();

    BOOST_CHECK(backend.getState() == BackendState::Uninitialized);
    BOOST_CHECK_EQUAL(backend.releases, 1);
    BOOST_CHECK(backend.getParticles().empty());
    BOOST_CHECK(!backend.getPointer().isAnyButtonPressed());

    // Restartable
    BOOST_REQUIRE(backend.init());
    BOOST_CHECK_EQUAL(backend.creates, 2);
}

BOOST_AUTO_TEST_CASE(StartBeforeInitIsIgnored) {
    HeadlessBackend backend(smallConfig());
    backend.start();
    BOOST_CHECK(backend.getState() == BackendState::Uninitialized);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(TimingTests)

BOOST_AUTO_TEST_CASE(PointerVelocityClearsWhenMotionStops) {
    HeadlessBackend backend(smallConfig());
    BOOST_REQUIRE(backend.init());
    backend.start();

    backend.updateMousePosition(400.0f, 300.0f, 2000.0f, 0.0f);
    backend.frame(1.0);
    BOOST_CHECK_EQUAL(backend.getPointer().getVelocity().getX(), 2000.0f);

    backend.frame(1.016);
    BOOST_CHECK_EQUAL(backend.getPointer().getVelocity().length(), 0.0f);
    BOOST_CHECK_EQUAL(backend.getPointer().getPosition().getX(), 400.0f);
}

BOOST_AUTO_TEST_CASE(DeltaFromTimestamps) {
    HeadlessBackend backend(smallConfig());
    BOOST_REQUIRE(backend.init());
    backend.start();

    backend.frame(5.0);
    BOOST_CHECK_CLOSE(backend.getLastDelta(), PhysicsConstants::MIN_DELTA, 0.001);

    backend.frame(5.02);
    BOOST_CHECK_CLOSE(backend.getLastDelta(), 0.02f, 0.1);
}

BOOST_AUTO_TEST_CASE(ResumeResetsBaseline) {
    HeadlessBackend backend(smallConfig());
    BOOST_REQUIRE(backend.init());
    backend.start();
    backend.frame(1.0);

    backend.pause();
    backend.resume();
    BOOST_CHECK(backend.getState() == BackendState::Running);

    // A minute later the first frame still uses the minimum step
    backend.frame(61.0);
    BOOST_CHECK_CLOSE(backend.getLastDelta(), PhysicsConstants::MIN_DELTA, 0.001);
}

BOOST_AUTO_TEST_CASE(BackwardsTimestampUsesMinimumDelta) {
    HeadlessBackend backend(smallConfig());
    BOOST_REQUIRE(backend.init());
    backend.start();
    backend.frame(10.0);
    backend.frame(9.0);
    BOOST_CHECK_CLOSE(backend.getLastDelta(), PhysicsConstants::MIN_DELTA, 0.001);
}

BOOST_AUTO_TEST_CASE(SimulationTimeAccumulates) {
    HeadlessBackend backend(smallConfig());
    BOOST_REQUIRE(backend.init());
    backend.start();
    backend.frame(0.0);
    backend.frame(0.5);
    backend.frame(1.0);
    BOOST_CHECK_CLOSE(backend.getSimulationTime(), 1.0 + PhysicsConstants::MIN_DELTA, 0.01);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(ConfigUpdateTests)

BOOST_AUTO_TEST_CASE(PatchAppliesOnNextFrame) {
    HeadlessBackend backend(smallConfig());
    BOOST_REQUIRE(backend.init());
    backend.start();

    SnowConfigPatch patch;
    patch.snowmax = 25;
    backend.updateConfig(patch);
    BOOST_CHECK(backend.hasPendingConfig());
    BOOST_CHECK_EQUAL(backend.getParticles().size(), 10u);

    backend.frame(1.0);
    BOOST_CHECK(!backend.hasPendingConfig());
    BOOST_CHECK_EQUAL(backend.getConfig().snowmax, 25);
    BOOST_CHECK_EQUAL(backend.getParticles().size(), 25u);
}

BOOST_AUTO_TEST_CASE(PatchesMergeUntilApplied) {
    HeadlessBackend backend(smallConfig());
    BOOST_REQUIRE(backend.init());
    backend.start();

    SnowConfigPatch first;
    first.windEnabled = true;
    first.windStrength = 0.2f;
    SnowConfigPatch second;
    second.windStrength = 0.9f;
    backend.updateConfig(first);
    backend.updateConfig(second);

    backend.frame(1.0);
    BOOST_CHECK(backend.getWind().getSettings().enabled);
    BOOST_CHECK_CLOSE(backend.getWind().getSettings().strength, 0.9f, 0.001);
    // Wind-only changes keep the current flakes
    BOOST_CHECK_EQUAL(backend.getParticles().size(), 10u);
}

BOOST_AUTO_TEST_CASE(GlyphChangeRebuildsAtlas) {
    HeadlessBackend backend(smallConfig());
    BOOST_REQUIRE(backend.init());
    backend.start();

    SnowConfigPatch patch;
    patch.snowletters = std::vector<std::string>{"*", "+", "o"};
    backend.updateConfig(patch);
    backend.frame(1.0);

    BOOST_CHECK_EQUAL(backend.rebuilds, 1);
    BOOST_CHECK_EQUAL(backend.getAtlases().glyphCount(), 3u);
    for (const auto& particle : backend.getParticles()) {
        BOOST_CHECK_LT(particle.glyphIndex, backend.getAtlases().totalCount());
    }
}

BOOST_AUTO_TEST_CASE(SentenceFlakesFollowAtlas) {
    SnowConfig config = smallConfig();
    config.snowsentences = {"Let it snow"};
    config.sentenceCount = 2;
    HeadlessBackend backend(config);
    BOOST_REQUIRE(backend.init());

    const auto& particles = backend.getParticles();
    BOOST_REQUIRE_EQUAL(particles.size(), 10u);
    BOOST_CHECK(particles[0].isSentence);
    BOOST_CHECK(particles[1].isSentence);
    BOOST_CHECK(!particles[2].isSentence);
    BOOST_CHECK_EQUAL(particles[0].glyphIndex, 1u);
}

BOOST_AUTO_TEST_CASE(BackgroundPatchUpdatesGlow) {
    HeadlessBackend backend(smallConfig());
    backend.setDarkTheme(true);
    BOOST_REQUIRE(backend.init());
    backend.start();
    BOOST_CHECK_EQUAL(backend.getGlowStrength(), 1.0f);

    SnowConfigPatch patch;
    patch.backgroundColor = std::string("#fafafa");
    backend.updateConfig(patch);
    backend.frame(1.0);
    BOOST_CHECK_EQUAL(backend.getGlowStrength(), 0.0f);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(ImageLayerTests)

BOOST_AUTO_TEST_CASE(AttachedLayerStepsWithBackend) {
    HeadlessBackend backend(smallConfig());
    BOOST_REQUIRE(backend.init());

    ImageFlakeLayer layer;
    ImageFlakeLayer::Settings settings;
    settings.imagePaths = {"missing/flake.png"};
    settings.count = 5;
    layer.configure(settings);
    layer.start(800.0f, 600.0f);
    backend.attachImageLayer(&layer);
    backend.start();

    // Flakes spawn at once; decoding only swaps their textures in later
    BOOST_REQUIRE_EQUAL(layer.getFlakes().size(), 5u);

    const float before = layer.getFlakes()[0].rest.getY();
    backend.frame(1.0);
    backend.frame(1.1);
    BOOST_CHECK_NE(layer.getFlakes()[0].rest.getY(), before);

    backend.attachImageLayer(nullptr);
    layer.stop();
}

BOOST_AUTO_TEST_SUITE_END()
