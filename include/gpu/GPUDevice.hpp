/* Copyright (c) 2025 Hammer Forged Games
 * Licensed under the MIT License */

#ifndef GPU_DEVICE_HPP
#define GPU_DEVICE_HPP

#include <SDL3/SDL_gpu.h>
#include <SDL3/SDL_video.h>

namespace Snowfall {

/**
 * Owned wrapper for SDL_GPUDevice and the window swapchain claim.
 *
 * One instance per GPU backend. Create after the window exists and destroy
 * before it goes away; the destructor releases the claim and the device.
 */
class GPUDevice {
public:
    GPUDevice() = default;
    ~GPUDevice();

    GPUDevice(const GPUDevice&) = delete;
    GPUDevice& operator=(const GPUDevice&) = delete;
    GPUDevice(GPUDevice&&) = delete;
    GPUDevice& operator=(GPUDevice&&) = delete;

    /**
     * Create the device and claim the window for presentation.
     * @param window Host window (must outlive this device)
     * @param vsync Present with VSYNC when true, otherwise the fastest
     *              supported mode
     * @return true on success; on failure nothing is left allocated
     */
    bool init(SDL_Window* window, bool vsync = true);

    void shutdown();

    SDL_GPUDevice* get() const { return m_device; }
    SDL_Window* getWindow() const { return m_window; }
    bool isInitialized() const { return m_device != nullptr; }

    SDL_GPUShaderFormat getShaderFormats() const;
    SDL_GPUTextureFormat getSwapchainFormat() const;
    const char* getDriverName() const;

    /**
     * Switch the swapchain between VSYNC and the lowest latency mode the
     * driver offers (MAILBOX, then IMMEDIATE).
     */
    bool setVSync(bool enabled);

private:
    SDL_GPUDevice* m_device{nullptr};
    SDL_Window* m_window{nullptr};
};

} // namespace Snowfall

#endif // GPU_DEVICE_HPP
