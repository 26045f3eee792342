/* Copyright (c) 2025 Hammer Forged Games
 * Licensed under the MIT License */

#include "gpu/GPUTexture.hpp"
#include "gpu/GPUBuffer.hpp"
#include "core/Logger.hpp"
#include <cstring>
#include <format>
#include <memory>
#include <utility>

namespace Snowfall {

// ---------------------------------------------------------------------------
// GPUSampler
// ---------------------------------------------------------------------------

GPUSampler::GPUSampler(SDL_GPUDevice* device, SDL_GPUFilter filter,
                       SDL_GPUSamplerAddressMode addressMode)
    : m_device(device)
{
    if (!device) {
        GPU_ERROR("GPUSampler: null device");
        return;
    }

    SDL_GPUSamplerCreateInfo createInfo{};
    createInfo.min_filter = filter;
    createInfo.mag_filter = filter;
    createInfo.mipmap_mode = SDL_GPU_SAMPLERMIPMAPMODE_NEAREST;
    createInfo.address_mode_u = addressMode;
    createInfo.address_mode_v = addressMode;
    createInfo.address_mode_w = addressMode;
    createInfo.max_anisotropy = 1.0f;
    createInfo.compare_op = SDL_GPU_COMPAREOP_NEVER;
    createInfo.max_lod = 1000.0f;

    m_sampler = SDL_CreateGPUSampler(device, &createInfo);
    if (!m_sampler) {
        GPU_ERROR(std::format("Failed to create GPU sampler: {}", SDL_GetError()));
    }
}

GPUSampler::~GPUSampler() {
    release();
}

GPUSampler::GPUSampler(GPUSampler&& other) noexcept
    : m_sampler(std::exchange(other.m_sampler, nullptr))
    , m_device(std::exchange(other.m_device, nullptr))
{
}

GPUSampler& GPUSampler::operator=(GPUSampler&& other) noexcept {
    if (this != &other) {
        release();
        m_sampler = std::exchange(other.m_sampler, nullptr);
        m_device = std::exchange(other.m_device, nullptr);
    }
    return *this;
}

void GPUSampler::release() {
    if (m_sampler && m_device) {
        SDL_ReleaseGPUSampler(m_device, m_sampler);
    }
    m_sampler = nullptr;
}

GPUSampler GPUSampler::createLinear(SDL_GPUDevice* device) {
    return GPUSampler(device, SDL_GPU_FILTER_LINEAR);
}

// ---------------------------------------------------------------------------
// GPUTexture
// ---------------------------------------------------------------------------

GPUTexture::GPUTexture(SDL_GPUDevice* device, uint32_t width, uint32_t height,
                       SDL_GPUTextureFormat format, SDL_GPUTextureUsageFlags usage)
    : m_device(device)
    , m_width(width)
    , m_height(height)
{
    if (!device) {
        GPU_ERROR("GPUTexture: null device");
        return;
    }
    if (width == 0 || height == 0) {
        GPU_ERROR(std::format("GPUTexture: invalid dimensions {}x{}", width, height));
        return;
    }

    SDL_GPUTextureCreateInfo createInfo{};
    createInfo.type = SDL_GPU_TEXTURETYPE_2D;
    createInfo.format = format;
    createInfo.usage = usage;
    createInfo.width = width;
    createInfo.height = height;
    createInfo.layer_count_or_depth = 1;
    createInfo.num_levels = 1;
    createInfo.sample_count = SDL_GPU_SAMPLECOUNT_1;

    m_texture = SDL_CreateGPUTexture(device, &createInfo);
    if (!m_texture) {
        GPU_ERROR(std::format("Failed to create GPU texture {}x{}: {}",
                              width, height, SDL_GetError()));
    }
}

GPUTexture::~GPUTexture() {
    release();
}

GPUTexture::GPUTexture(GPUTexture&& other) noexcept
    : m_texture(std::exchange(other.m_texture, nullptr))
    , m_device(std::exchange(other.m_device, nullptr))
    , m_width(std::exchange(other.m_width, 0))
    , m_height(std::exchange(other.m_height, 0))
{
}

GPUTexture& GPUTexture::operator=(GPUTexture&& other) noexcept {
    if (this != &other) {
        release();
        m_texture = std::exchange(other.m_texture, nullptr);
        m_device = std::exchange(other.m_device, nullptr);
        m_width = std::exchange(other.m_width, 0);
        m_height = std::exchange(other.m_height, 0);
    }
    return *this;
}

void GPUTexture::release() {
    if (m_texture && m_device) {
        SDL_ReleaseGPUTexture(m_device, m_texture);
    }
    m_texture = nullptr;
}

SDL_GPUTextureSamplerBinding GPUTexture::asSamplerBinding(SDL_GPUSampler* sampler) const {
    if (!m_texture || !sampler) {
        GPU_WARN("GPUTexture::asSamplerBinding() with invalid texture or sampler");
    }
    SDL_GPUTextureSamplerBinding binding{};
    binding.texture = m_texture;
    binding.sampler = sampler;
    return binding;
}

GPUTexture GPUTexture::fromSurface(SDL_GPUDevice* device, SDL_Surface* surface) {
    if (!device || !surface || surface->w <= 0 || surface->h <= 0) {
        GPU_ERROR("GPUTexture::fromSurface: invalid device or surface");
        return GPUTexture();
    }

    std::unique_ptr<SDL_Surface, decltype(&SDL_DestroySurface)> converted(nullptr, SDL_DestroySurface);
    SDL_Surface* source = surface;
    if (surface->format != SDL_PIXELFORMAT_RGBA32) {
        converted.reset(SDL_ConvertSurface(surface, SDL_PIXELFORMAT_RGBA32));
        if (!converted) {
            GPU_ERROR(std::format("GPUTexture::fromSurface: convert failed: {}", SDL_GetError()));
            return GPUTexture();
        }
        source = converted.get();
    }

    const auto width = static_cast<uint32_t>(source->w);
    const auto height = static_cast<uint32_t>(source->h);
    const uint32_t rowBytes = width * 4;

    GPUTexture texture(device, width, height);
    if (!texture.isValid()) {
        return GPUTexture();
    }

    GPUTransferBuffer staging(device, SDL_GPU_TRANSFERBUFFERUSAGE_UPLOAD, rowBytes * height);
    auto* dst = static_cast<uint8_t*>(staging.map(false));
    if (!dst) {
        return GPUTexture();
    }

    const bool mustLock = SDL_MUSTLOCK(source);
    if (mustLock && !SDL_LockSurface(source)) {
        staging.unmap();
        GPU_ERROR(std::format("GPUTexture::fromSurface: lock failed: {}", SDL_GetError()));
        return GPUTexture();
    }
    const auto* src = static_cast<const uint8_t*>(source->pixels);
    for (uint32_t row = 0; row < height; ++row) {
        std::memcpy(dst + row * rowBytes, src + row * static_cast<size_t>(source->pitch), rowBytes);
    }
    if (mustLock) {
        SDL_UnlockSurface(source);
    }
    staging.unmap();

    SDL_GPUCommandBuffer* cmd = SDL_AcquireGPUCommandBuffer(device);
    if (!cmd) {
        GPU_ERROR(std::format("GPUTexture::fromSurface: no command buffer: {}", SDL_GetError()));
        return GPUTexture();
    }

    SDL_GPUTextureTransferInfo transferInfo{};
    transferInfo.transfer_buffer = staging.get();
    transferInfo.offset = 0;
    transferInfo.pixels_per_row = width;
    transferInfo.rows_per_layer = height;

    SDL_GPUTextureRegion region{};
    region.texture = texture.get();
    region.w = width;
    region.h = height;
    region.d = 1;

    SDL_GPUCopyPass* copyPass = SDL_BeginGPUCopyPass(cmd);
    SDL_UploadToGPUTexture(copyPass, &transferInfo, &region, false);
    SDL_EndGPUCopyPass(copyPass);

    if (!SDL_SubmitGPUCommandBuffer(cmd)) {
        GPU_ERROR(std::format("GPUTexture::fromSurface: submit failed: {}", SDL_GetError()));
        return GPUTexture();
    }
    return texture;
}

} // namespace Snowfall
