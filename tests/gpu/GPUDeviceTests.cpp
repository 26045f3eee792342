/* Copyright (c) 2025 Hammer Forged Games
 * Licensed under the MIT License */

/**
 * Integration tests for the owned GPUDevice.
 * Tests that need a real device skip themselves when none is available.
 */

#define BOOST_TEST_MODULE GPUDeviceTests
#include <boost/test/unit_test.hpp>

#include "GPUTestFixture.hpp"
#include "gpu/GPUDevice.hpp"
#include <SDL3/SDL.h>
#include <cstring>

using namespace Snowfall;
using namespace Snowfall::Test;

BOOST_GLOBAL_FIXTURE(GPUGlobalFixture);

// ============================================================================
// GPU DEVICE LIFECYCLE TESTS
// ============================================================================

BOOST_AUTO_TEST_SUITE(GPUDeviceLifecycleTests)

BOOST_FIXTURE_TEST_CASE(DefaultConstructedIsEmpty, GPUTestFixture) {
    GPUDevice device;
    BOOST_CHECK(!device.isInitialized());
    BOOST_CHECK(device.get() == nullptr);
    BOOST_CHECK(device.getWindow() == nullptr);
    BOOST_CHECK(device.getShaderFormats() == SDL_GPU_SHADERFORMAT_INVALID);
}

BOOST_FIXTURE_TEST_CASE(InitWithNullWindowFails, GPUTestFixture) {
    GPUDevice device;
    BOOST_CHECK(!device.init(nullptr));
    BOOST_CHECK(!device.isInitialized());
}

BOOST_FIXTURE_TEST_CASE(ShutdownWithoutInitIsSafe, GPUTestFixture) {
    GPUDevice device;
    device.shutdown();
    device.shutdown();
    BOOST_CHECK(!device.isInitialized());
}

BOOST_FIXTURE_TEST_CASE(InitWithValidWindow, GPUTestFixture) {
    SKIP_IF_NO_GPU();

    SDL_Window* window = getTestWindow();
    BOOST_REQUIRE(window != nullptr);

    GPUDevice device;
    BOOST_CHECK(device.init(window, false));
    BOOST_CHECK(device.isInitialized());
    BOOST_CHECK(device.get() != nullptr);
    BOOST_CHECK(device.getWindow() == window);

    device.shutdown();
    BOOST_CHECK(!device.isInitialized());
    BOOST_CHECK(device.getWindow() == nullptr);
}

BOOST_FIXTURE_TEST_CASE(DoubleInitKeepsDevice, GPUTestFixture) {
    SKIP_IF_NO_GPU();

    GPUDevice device;
    BOOST_REQUIRE(device.init(getTestWindow(), false));
    SDL_GPUDevice* first = device.get();

    BOOST_CHECK(device.init(getTestWindow(), false));
    BOOST_CHECK(device.get() == first);
}

BOOST_FIXTURE_TEST_CASE(WindowCanBeReclaimedAfterShutdown, GPUTestFixture) {
    SKIP_IF_NO_GPU();

    // A backend swap shuts one device down and claims the window with the next
    {
        GPUDevice first;
        BOOST_REQUIRE(first.init(getTestWindow(), false));
    }
    GPUDevice second;
    BOOST_CHECK(second.init(getTestWindow(), false));
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// GPU DEVICE QUERY TESTS
// ============================================================================

BOOST_AUTO_TEST_SUITE(GPUDeviceQueryTests)

BOOST_FIXTURE_TEST_CASE(ShaderFormatsIncludeSupportedBackend, GPUTestFixture) {
    SKIP_IF_NO_GPU();

    ScopedTestDevice scoped;
    BOOST_REQUIRE(scoped.ok());

    SDL_GPUShaderFormat formats = scoped.device.getShaderFormats();
    BOOST_CHECK((formats & (SDL_GPU_SHADERFORMAT_SPIRV | SDL_GPU_SHADERFORMAT_MSL)) != 0);
}

BOOST_FIXTURE_TEST_CASE(SwapchainFormatIsValid, GPUTestFixture) {
    SKIP_IF_NO_GPU();

    ScopedTestDevice scoped;
    BOOST_REQUIRE(scoped.ok());
    BOOST_CHECK(scoped.device.getSwapchainFormat() != SDL_GPU_TEXTUREFORMAT_INVALID);
}

BOOST_FIXTURE_TEST_CASE(DriverNameReported, GPUTestFixture) {
    SKIP_IF_NO_GPU();

    ScopedTestDevice scoped;
    BOOST_REQUIRE(scoped.ok());

    const char* driver = scoped.device.getDriverName();
    BOOST_REQUIRE(driver != nullptr);
    BOOST_CHECK(std::strlen(driver) > 0);
    BOOST_TEST_MESSAGE("GPU driver: " << driver);
}

BOOST_FIXTURE_TEST_CASE(VSyncToggle, GPUTestFixture) {
    SKIP_IF_NO_GPU();

    ScopedTestDevice scoped;
    BOOST_REQUIRE(scoped.ok());

    // VSYNC is always supported
    BOOST_CHECK(scoped.device.setVSync(true));
    scoped.device.setVSync(false);
}

BOOST_AUTO_TEST_SUITE_END()
