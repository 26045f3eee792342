/* Copyright (c) 2025 Hammer Forged Games
 * Licensed under the MIT License */

#ifndef GPU_TEXTURE_HPP
#define GPU_TEXTURE_HPP

#include <SDL3/SDL_gpu.h>
#include <SDL3/SDL_surface.h>
#include <cstdint>

namespace Snowfall {

/**
 * RAII wrapper for SDL_GPUSampler.
 */
class GPUSampler {
public:
    GPUSampler() = default;
    GPUSampler(SDL_GPUDevice* device, SDL_GPUFilter filter,
               SDL_GPUSamplerAddressMode addressMode = SDL_GPU_SAMPLERADDRESSMODE_CLAMP_TO_EDGE);
    ~GPUSampler();

    GPUSampler(GPUSampler&& other) noexcept;
    GPUSampler& operator=(GPUSampler&& other) noexcept;
    GPUSampler(const GPUSampler&) = delete;
    GPUSampler& operator=(const GPUSampler&) = delete;

    SDL_GPUSampler* get() const { return m_sampler; }
    bool isValid() const { return m_sampler != nullptr; }

    // Bilinear, clamped: glyphs are drawn scaled and rotated
    static GPUSampler createLinear(SDL_GPUDevice* device);

private:
    void release();

    SDL_GPUSampler* m_sampler{nullptr};
    SDL_GPUDevice* m_device{nullptr};
};

/**
 * RAII wrapper for a sampled 2D SDL_GPUTexture.
 */
class GPUTexture {
public:
    GPUTexture() = default;
    GPUTexture(SDL_GPUDevice* device, uint32_t width, uint32_t height,
               SDL_GPUTextureFormat format = SDL_GPU_TEXTUREFORMAT_R8G8B8A8_UNORM,
               SDL_GPUTextureUsageFlags usage = SDL_GPU_TEXTUREUSAGE_SAMPLER);
    ~GPUTexture();

    GPUTexture(GPUTexture&& other) noexcept;
    GPUTexture& operator=(GPUTexture&& other) noexcept;
    GPUTexture(const GPUTexture&) = delete;
    GPUTexture& operator=(const GPUTexture&) = delete;

    SDL_GPUTexture* get() const { return m_texture; }
    uint32_t getWidth() const { return m_width; }
    uint32_t getHeight() const { return m_height; }
    bool isValid() const { return m_texture != nullptr; }

    SDL_GPUTextureSamplerBinding asSamplerBinding(SDL_GPUSampler* sampler) const;

    /**
     * Create an RGBA8 texture holding a copy of the surface pixels.
     * The surface is converted to SDL_PIXELFORMAT_RGBA32 when needed and
     * uploaded on its own command buffer.
     * @return Invalid texture on any failure (already logged)
     */
    static GPUTexture fromSurface(SDL_GPUDevice* device, SDL_Surface* surface);

private:
    void release();

    SDL_GPUTexture* m_texture{nullptr};
    SDL_GPUDevice* m_device{nullptr};
    uint32_t m_width{0};
    uint32_t m_height{0};
};

} // namespace Snowfall

#endif // GPU_TEXTURE_HPP
