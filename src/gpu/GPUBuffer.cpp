/* Copyright (c) 2025 Hammer Forged Games
 * Licensed under the MIT License */

#include "gpu/GPUBuffer.hpp"
#include "core/Logger.hpp"
#include <cstring>
#include <format>
#include <utility>

namespace Snowfall {

// ---------------------------------------------------------------------------
// GPUTransferBuffer
// ---------------------------------------------------------------------------

GPUTransferBuffer::GPUTransferBuffer(SDL_GPUDevice* device,
                                     SDL_GPUTransferBufferUsage usage,
                                     uint32_t size)
    : m_device(device)
    , m_size(size)
{
    if (!device || size == 0) {
        GPU_ERROR(std::format("GPUTransferBuffer: invalid arguments (device={}, size={})",
                              device != nullptr, size));
        return;
    }

    SDL_GPUTransferBufferCreateInfo createInfo{};
    createInfo.usage = usage;
    createInfo.size = size;

    m_buffer = SDL_CreateGPUTransferBuffer(device, &createInfo);
    if (!m_buffer) {
        GPU_ERROR(std::format("Failed to create GPU transfer buffer ({} bytes): {}",
                              size, SDL_GetError()));
    }
}

GPUTransferBuffer::~GPUTransferBuffer() {
    release();
}

GPUTransferBuffer::GPUTransferBuffer(GPUTransferBuffer&& other) noexcept
    : m_buffer(std::exchange(other.m_buffer, nullptr))
    , m_device(std::exchange(other.m_device, nullptr))
    , m_size(std::exchange(other.m_size, 0))
    , m_mapped(std::exchange(other.m_mapped, false))
{
}

GPUTransferBuffer& GPUTransferBuffer::operator=(GPUTransferBuffer&& other) noexcept {
    if (this != &other) {
        release();
        m_buffer = std::exchange(other.m_buffer, nullptr);
        m_device = std::exchange(other.m_device, nullptr);
        m_size = std::exchange(other.m_size, 0);
        m_mapped = std::exchange(other.m_mapped, false);
    }
    return *this;
}

void GPUTransferBuffer::release() {
    if (m_buffer && m_device) {
        unmap();
        SDL_ReleaseGPUTransferBuffer(m_device, m_buffer);
    }
    m_buffer = nullptr;
}

void* GPUTransferBuffer::map(bool cycle) {
    if (!m_buffer) {
        GPU_ERROR("GPUTransferBuffer::map: invalid buffer");
        return nullptr;
    }
    if (m_mapped) {
        GPU_WARN("GPUTransferBuffer::map: already mapped");
        return nullptr;
    }

    void* ptr = SDL_MapGPUTransferBuffer(m_device, m_buffer, cycle);
    if (!ptr) {
        GPU_ERROR(std::format("Failed to map GPU transfer buffer: {}", SDL_GetError()));
        return nullptr;
    }
    m_mapped = true;
    return ptr;
}

void GPUTransferBuffer::unmap() {
    if (m_buffer && m_mapped) {
        SDL_UnmapGPUTransferBuffer(m_device, m_buffer);
        m_mapped = false;
    }
}

SDL_GPUTransferBufferLocation GPUTransferBuffer::asLocation(uint32_t offset) const {
    SDL_GPUTransferBufferLocation location{};
    location.transfer_buffer = m_buffer;
    location.offset = offset;
    return location;
}

// ---------------------------------------------------------------------------
// GPUBuffer
// ---------------------------------------------------------------------------

GPUBuffer::GPUBuffer(SDL_GPUDevice* device, SDL_GPUBufferUsageFlags usage, uint32_t size)
    : m_device(device)
    , m_size(size)
{
    if (!device || size == 0) {
        GPU_ERROR(std::format("GPUBuffer: invalid arguments (device={}, size={})",
                              device != nullptr, size));
        return;
    }

    SDL_GPUBufferCreateInfo createInfo{};
    createInfo.usage = usage;
    createInfo.size = size;

    m_buffer = SDL_CreateGPUBuffer(device, &createInfo);
    if (!m_buffer) {
        GPU_ERROR(std::format("Failed to create GPU buffer ({} bytes): {}",
                              size, SDL_GetError()));
    }
}

GPUBuffer::~GPUBuffer() {
    release();
}

GPUBuffer::GPUBuffer(GPUBuffer&& other) noexcept
    : m_buffer(std::exchange(other.m_buffer, nullptr))
    , m_device(std::exchange(other.m_device, nullptr))
    , m_size(std::exchange(other.m_size, 0))
{
}

GPUBuffer& GPUBuffer::operator=(GPUBuffer&& other) noexcept {
    if (this != &other) {
        release();
        m_buffer = std::exchange(other.m_buffer, nullptr);
        m_device = std::exchange(other.m_device, nullptr);
        m_size = std::exchange(other.m_size, 0);
    }
    return *this;
}

void GPUBuffer::release() {
    if (m_buffer && m_device) {
        SDL_ReleaseGPUBuffer(m_device, m_buffer);
    }
    m_buffer = nullptr;
}

SDL_GPUBufferBinding GPUBuffer::asBinding(uint32_t offset) const {
    if (!m_buffer) {
        GPU_WARN("GPUBuffer::asBinding() called on invalid buffer");
    }
    SDL_GPUBufferBinding binding{};
    binding.buffer = m_buffer;
    binding.offset = offset;
    return binding;
}

SDL_GPUBufferRegion GPUBuffer::asRegion(uint32_t offset, uint32_t size) const {
    if (offset > m_size) {
        GPU_WARN(std::format("GPUBuffer::asRegion() offset {} exceeds buffer size {}",
                             offset, m_size));
        offset = m_size;
    }
    SDL_GPUBufferRegion region{};
    region.buffer = m_buffer;
    region.offset = offset;
    region.size = (size == 0) ? (m_size - offset) : size;
    return region;
}

bool GPUBuffer::uploadImmediate(const void* data, uint32_t size) {
    if (!m_buffer || !data || size == 0 || size > m_size) {
        GPU_ERROR(std::format("GPUBuffer::uploadImmediate: invalid upload of {} bytes into {}",
                              size, m_size));
        return false;
    }

    GPUTransferBuffer staging(m_device, SDL_GPU_TRANSFERBUFFERUSAGE_UPLOAD, size);
    void* mapped = staging.map(false);
    if (!mapped) {
        return false;
    }
    std::memcpy(mapped, data, size);
    staging.unmap();

    SDL_GPUCommandBuffer* cmd = SDL_AcquireGPUCommandBuffer(m_device);
    if (!cmd) {
        GPU_ERROR(std::format("GPUBuffer::uploadImmediate: no command buffer: {}", SDL_GetError()));
        return false;
    }

    SDL_GPUCopyPass* copyPass = SDL_BeginGPUCopyPass(cmd);
    SDL_GPUTransferBufferLocation src = staging.asLocation();
    SDL_GPUBufferRegion dst = asRegion(0, size);
    SDL_UploadToGPUBuffer(copyPass, &src, &dst, false);
    SDL_EndGPUCopyPass(copyPass);

    if (!SDL_SubmitGPUCommandBuffer(cmd)) {
        GPU_ERROR(std::format("GPUBuffer::uploadImmediate: submit failed: {}", SDL_GetError()));
        return false;
    }
    return true;
}

} // namespace Snowfall
