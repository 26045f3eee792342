/* Copyright (c) 2025 Hammer Forged Games
 * Licensed under the MIT License */

#include "gpu/GPUDevice.hpp"
#include "core/Logger.hpp"
#include <format>

namespace Snowfall {

GPUDevice::~GPUDevice() {
    shutdown();
}

bool GPUDevice::init(SDL_Window* window, bool vsync) {
    if (m_device) {
        GPU_WARN("GPUDevice already initialized");
        return true;
    }

    if (!window) {
        GPU_ERROR("GPUDevice::init called with null window");
        return false;
    }

    // SPIR-V for Vulkan, MSL for Metal
    m_device = SDL_CreateGPUDevice(
        SDL_GPU_SHADERFORMAT_SPIRV | SDL_GPU_SHADERFORMAT_MSL,
#ifdef DEBUG
        true,
#else
        false,
#endif
        nullptr);

    if (!m_device) {
        GPU_ERROR(std::format("Failed to create GPU device: {}", SDL_GetError()));
        return false;
    }

    if (!SDL_ClaimWindowForGPUDevice(m_device, window)) {
        GPU_ERROR(std::format("Failed to claim window for GPU: {}", SDL_GetError()));
        SDL_DestroyGPUDevice(m_device);
        m_device = nullptr;
        return false;
    }

    m_window = window;

    if (!setVSync(vsync)) {
        GPU_WARN("Keeping default swapchain present mode");
    }

    SDL_GPUShaderFormat formats = getShaderFormats();
    const char* driver = getDriverName();
    GPU_INFO(std::format("GPUDevice initialized: driver={}, SPIRV={}, MSL={}",
                         driver ? driver : "unknown",
                         (formats & SDL_GPU_SHADERFORMAT_SPIRV) != 0,
                         (formats & SDL_GPU_SHADERFORMAT_MSL) != 0));
    return true;
}

void GPUDevice::shutdown() {
    if (!m_device) {
        return;
    }
    if (m_window) {
        SDL_ReleaseWindowFromGPUDevice(m_device, m_window);
        m_window = nullptr;
    }
    SDL_DestroyGPUDevice(m_device);
    m_device = nullptr;
    GPU_INFO("GPUDevice shutdown complete");
}

SDL_GPUShaderFormat GPUDevice::getShaderFormats() const {
    if (!m_device) {
        return SDL_GPU_SHADERFORMAT_INVALID;
    }
    return SDL_GetGPUShaderFormats(m_device);
}

SDL_GPUTextureFormat GPUDevice::getSwapchainFormat() const {
    if (!m_device || !m_window) {
        return SDL_GPU_TEXTUREFORMAT_INVALID;
    }
    return SDL_GetGPUSwapchainTextureFormat(m_device, m_window);
}

const char* GPUDevice::getDriverName() const {
    if (!m_device) {
        return nullptr;
    }
    return SDL_GetGPUDeviceDriver(m_device);
}

bool GPUDevice::setVSync(bool enabled) {
    if (!m_device || !m_window) {
        return false;
    }

    SDL_GPUPresentMode mode = SDL_GPU_PRESENTMODE_VSYNC;
    if (!enabled) {
        if (SDL_WindowSupportsGPUPresentMode(m_device, m_window, SDL_GPU_PRESENTMODE_MAILBOX)) {
            mode = SDL_GPU_PRESENTMODE_MAILBOX;
        } else if (SDL_WindowSupportsGPUPresentMode(m_device, m_window, SDL_GPU_PRESENTMODE_IMMEDIATE)) {
            mode = SDL_GPU_PRESENTMODE_IMMEDIATE;
        }
    }

    if (!SDL_SetGPUSwapchainParameters(m_device, m_window,
                                       SDL_GPU_SWAPCHAINCOMPOSITION_SDR, mode)) {
        GPU_WARN(std::format("SDL_SetGPUSwapchainParameters failed: {}", SDL_GetError()));
        return false;
    }
    return true;
}

} // namespace Snowfall
