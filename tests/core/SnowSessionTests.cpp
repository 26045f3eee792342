/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE SnowSessionTests
#include <boost/test/unit_test.hpp>

#include "core/SnowSession.hpp"
#include "render/SnowBackendBase.hpp"
#include <SDL3/SDL.h>
#include <cstring>

using namespace Snowfall;

namespace {

/**
 * Hidden window on the dummy video driver. The dummy driver has no GPU
 * surface support, so every session here ends up on the software backend.
 */
struct SessionWindowFixture {
    SessionWindowFixture() {
        SDL_SetHint(SDL_HINT_VIDEO_DRIVER, "dummy");
        if (!SDL_Init(SDL_INIT_VIDEO)) {
            BOOST_TEST_MESSAGE("SDL video unavailable: " << SDL_GetError());
            return;
        }
        window = SDL_CreateWindow("Snowfall Session Test", 320, 240,
                                  SDL_WINDOW_HIDDEN | SDL_WINDOW_TRANSPARENT);
        if (!window) {
            BOOST_TEST_MESSAGE("Failed to create test window: " << SDL_GetError());
        }
    }

    ~SessionWindowFixture() {
        if (window) {
            SDL_DestroyWindow(window);
        }
        SDL_Quit();
    }

    SDL_Window* window{nullptr};
};

#define SKIP_IF_NO_WINDOW() \
    do { \
        if (!window) { \
            BOOST_TEST_MESSAGE("Skipping test: no window"); \
            return; \
        } \
    } while (0)

SnowConfig sessionConfig() {
    SnowConfig config;
    config.snowmax = 12;
    config.snowletters = {"*"};
    return config;
}

} // namespace

BOOST_FIXTURE_TEST_SUITE(BackendSelectionTests, SessionWindowFixture)

BOOST_AUTO_TEST_CASE(StartFallsBackToSoftware) {
    SKIP_IF_NO_WINDOW();
    SnowSession session(window);

    BOOST_REQUIRE(session.start(sessionConfig()));
    BOOST_CHECK(session.isActive());
    BOOST_CHECK(session.isUsingSoftware());
    BOOST_CHECK_EQUAL(std::strcmp(session.getBackendName(), "Software"), 0);
    BOOST_REQUIRE(session.getBackend() != nullptr);
    BOOST_CHECK(session.getBackend()->getState() == BackendState::Running);
    BOOST_CHECK_EQUAL(session.getBackend()->getParticles().size(), 12u);
}

BOOST_AUTO_TEST_CASE(ForceSoftwareSkipsGPU) {
    SKIP_IF_NO_WINDOW();
    SnowConfig config = sessionConfig();
    config.forceSoftware = true;
    SnowSession session(window);

    BOOST_REQUIRE(session.start(config));
    BOOST_CHECK(session.isUsingSoftware());
    BOOST_CHECK(session.getConfig().forceSoftware);
}

BOOST_AUTO_TEST_CASE(FramesStepTheActiveBackend) {
    SKIP_IF_NO_WINDOW();
    SnowSession session(window);
    BOOST_REQUIRE(session.start(sessionConfig()));

    session.frame();
    session.frame();
    BOOST_CHECK_GT(session.getBackend()->getSimulationTime(), 0.0);
}

BOOST_AUTO_TEST_CASE(StopLeavesNoBackend) {
    SKIP_IF_NO_WINDOW();
    SnowSession session(window);
    BOOST_REQUIRE(session.start(sessionConfig()));

    session.stop();
    BOOST_CHECK(!session.isActive());
    BOOST_CHECK(session.getBackend() == nullptr);
    BOOST_CHECK_EQUAL(std::strcmp(session.getBackendName(), "none"), 0);

    // Forwarding calls on a stopped session are no-ops
    session.frame();
    session.updateMousePosition(10.0f, 10.0f, 1.0f, 1.0f);
    session.pause();
    BOOST_CHECK(!session.isPaused());
}

BOOST_AUTO_TEST_CASE(RestartReplacesActiveBackend) {
    SKIP_IF_NO_WINDOW();
    SnowSession session(window);
    BOOST_REQUIRE(session.start(sessionConfig()));

    SnowConfig bigger = sessionConfig();
    bigger.snowmax = 30;
    BOOST_REQUIRE(session.start(bigger));
    BOOST_CHECK(session.isActive());
    BOOST_CHECK_EQUAL(session.getBackend()->getParticles().size(), 30u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(BackendSwitchTests, SessionWindowFixture)

BOOST_AUTO_TEST_CASE(ForceSoftwarePatchSwapsBackendWithMergedConfig) {
    SKIP_IF_NO_WINDOW();
    SnowSession session(window);
    BOOST_REQUIRE(session.start(sessionConfig()));

    SnowConfigPatch patch;
    patch.forceSoftware = true;
    patch.snowmax = 25;
    session.updateConfig(patch);

    BOOST_REQUIRE(session.isActive());
    BOOST_CHECK(session.isUsingSoftware());
    BOOST_CHECK(session.getConfig().forceSoftware);
    BOOST_CHECK_EQUAL(session.getConfig().snowmax, 25);
    // The replacement backend was built from the merged config, nothing queued
    BOOST_CHECK(!session.getBackend()->hasPendingConfig());
    BOOST_CHECK(session.getBackend()->getConfig().forceSoftware);
    BOOST_CHECK_EQUAL(session.getBackend()->getParticles().size(), 25u);
    BOOST_CHECK(session.getBackend()->getState() == BackendState::Running);
}

BOOST_AUTO_TEST_CASE(SwitchBackToGPUFallsBackAgain) {
    SKIP_IF_NO_WINDOW();
    SnowConfig config = sessionConfig();
    config.forceSoftware = true;
    SnowSession session(window);
    BOOST_REQUIRE(session.start(config));

    SnowConfigPatch patch;
    patch.forceSoftware = false;
    session.updateConfig(patch);

    BOOST_CHECK(session.isActive());
    BOOST_CHECK(!session.getConfig().forceSoftware);
    BOOST_CHECK(session.isUsingSoftware());
}

BOOST_AUTO_TEST_CASE(PauseSurvivesBackendSwap) {
    SKIP_IF_NO_WINDOW();
    SnowSession session(window);
    BOOST_REQUIRE(session.start(sessionConfig()));
    session.pause();
    BOOST_REQUIRE(session.isPaused());

    SnowConfigPatch patch;
    patch.forceSoftware = true;
    session.updateConfig(patch);

    BOOST_CHECK(session.isActive());
    BOOST_CHECK(session.isPaused());
}

BOOST_AUTO_TEST_CASE(OtherPatchesAreQueuedOnTheSameBackend) {
    SKIP_IF_NO_WINDOW();
    SnowSession session(window);
    BOOST_REQUIRE(session.start(sessionConfig()));
    const SnowBackendBase* before = session.getBackend();

    SnowConfigPatch patch;
    patch.snowmax = 5;
    session.updateConfig(patch);

    BOOST_CHECK(session.getBackend() == before);
    BOOST_CHECK(session.getBackend()->hasPendingConfig());
    BOOST_CHECK_EQUAL(session.getConfig().snowmax, 5);

    session.frame();
    BOOST_CHECK(!session.getBackend()->hasPendingConfig());
    BOOST_CHECK_EQUAL(session.getBackend()->getParticles().size(), 5u);
}

BOOST_AUTO_TEST_SUITE_END()
