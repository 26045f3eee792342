/* Copyright (c) 2025 Hammer Forged Games
 * Licensed under the MIT License */

#ifndef GPU_TEST_FIXTURE_HPP
#define GPU_TEST_FIXTURE_HPP

#include "gpu/GPUDevice.hpp"
#include <SDL3/SDL.h>
#include <boost/test/unit_test.hpp>

namespace Snowfall {
namespace Test {

/**
 * Ends the current test early when no SDL_gpu device can be created
 * (CI containers, remote shells without a display).
 */
#define SKIP_IF_NO_GPU() \
    do { \
        if (!GPUTestFixture::isGPUAvailable()) { \
            BOOST_TEST_MESSAGE("Skipping test: No GPU available"); \
            return; \
        } \
    } while (0)

/**
 * Shared setup for GPU tests.
 *
 * The first fixture brings up SDL video and probes once for a usable
 * device; every later fixture reuses the answer. Overlay windows are
 * transparent, so the shared window is created the same way.
 */
class GPUTestFixture {
public:
    GPUTestFixture() {
        if (s_probed) {
            return;
        }
        s_probed = true;

        if (!SDL_Init(SDL_INIT_VIDEO)) {
            BOOST_TEST_MESSAGE("SDL video unavailable: " << SDL_GetError());
            return;
        }
        s_sdlInitialized = true;
        s_gpuAvailable = probeDevice();
    }

    virtual ~GPUTestFixture() = default;

    static bool isGPUAvailable() { return s_gpuAvailable; }

    // Hidden 64x64 overlay-style window, created on first use
    static SDL_Window* getTestWindow() {
        if (!s_testWindow && s_sdlInitialized) {
            s_testWindow = SDL_CreateWindow("Snowfall GPU Test", 64, 64,
                                            SDL_WINDOW_HIDDEN | SDL_WINDOW_TRANSPARENT);
            if (!s_testWindow) {
                BOOST_TEST_MESSAGE("Failed to create test window: " << SDL_GetError());
            }
        }
        return s_testWindow;
    }

    static void cleanup() {
        if (s_testWindow) {
            SDL_DestroyWindow(s_testWindow);
            s_testWindow = nullptr;
        }
        if (s_sdlInitialized) {
            SDL_Quit();
            s_sdlInitialized = false;
        }
        s_gpuAvailable = false;
        s_probed = false;
    }

private:
    static bool probeDevice() {
        SDL_GPUDevice* device = SDL_CreateGPUDevice(
            SDL_GPU_SHADERFORMAT_SPIRV | SDL_GPU_SHADERFORMAT_MSL, false, nullptr);
        if (!device) {
            BOOST_TEST_MESSAGE("No GPU device: " << SDL_GetError());
            return false;
        }
        BOOST_TEST_MESSAGE("GPU available, driver " << SDL_GetGPUDeviceDriver(device));
        SDL_DestroyGPUDevice(device);
        return true;
    }

    static inline bool s_probed = false;
    static inline bool s_sdlInitialized = false;
    static inline bool s_gpuAvailable = false;
    static inline SDL_Window* s_testWindow = nullptr;
};

/**
 * Device claimed on the shared test window for the length of one test.
 * GPUDevice is owned, so each test gets a fresh one and the window is
 * released again on destruction.
 */
struct ScopedTestDevice {
    GPUDevice device;

    ScopedTestDevice() {
        if (SDL_Window* window = GPUTestFixture::getTestWindow()) {
            device.init(window, false);
        }
    }

    bool ok() const { return device.isInitialized(); }
    SDL_GPUDevice* get() const { return device.get(); }
};

// Tears SDL down once every test in the module has run
struct GPUGlobalFixture {
    ~GPUGlobalFixture() { GPUTestFixture::cleanup(); }
};

} // namespace Test
} // namespace Snowfall

#endif // GPU_TEST_FIXTURE_HPP
