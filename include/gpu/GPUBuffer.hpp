/* Copyright (c) 2025 Hammer Forged Games
 * Licensed under the MIT License */

#ifndef GPU_BUFFER_HPP
#define GPU_BUFFER_HPP

#include <SDL3/SDL_gpu.h>
#include <cstdint>

namespace Snowfall {

/**
 * RAII wrapper for SDL_GPUTransferBuffer (CPU -> GPU staging).
 */
class GPUTransferBuffer {
public:
    GPUTransferBuffer() = default;
    GPUTransferBuffer(SDL_GPUDevice* device, SDL_GPUTransferBufferUsage usage,
                      uint32_t size);
    ~GPUTransferBuffer();

    GPUTransferBuffer(GPUTransferBuffer&& other) noexcept;
    GPUTransferBuffer& operator=(GPUTransferBuffer&& other) noexcept;
    GPUTransferBuffer(const GPUTransferBuffer&) = delete;
    GPUTransferBuffer& operator=(const GPUTransferBuffer&) = delete;

    SDL_GPUTransferBuffer* get() const { return m_buffer; }
    uint32_t getSize() const { return m_size; }
    bool isValid() const { return m_buffer != nullptr; }
    bool isMapped() const { return m_mapped; }

    /**
     * Map for CPU writes.
     * @param cycle Let SDL hand out fresh memory if the previous contents
     *              are still referenced by an in-flight upload
     * @return Mapped pointer, or nullptr on failure / double map
     */
    void* map(bool cycle = true);
    void unmap();

    SDL_GPUTransferBufferLocation asLocation(uint32_t offset = 0) const;

private:
    void release();

    SDL_GPUTransferBuffer* m_buffer{nullptr};
    SDL_GPUDevice* m_device{nullptr};
    uint32_t m_size{0};
    bool m_mapped{false};
};

/**
 * RAII wrapper for SDL_GPUBuffer (vertex / instance data on the GPU).
 *
 * Contents arrive through a GPUTransferBuffer inside a copy pass. For data
 * that never changes (the unit quad) uploadImmediate() does the whole
 * staging round trip on its own command buffer.
 */
class GPUBuffer {
public:
    GPUBuffer() = default;
    GPUBuffer(SDL_GPUDevice* device, SDL_GPUBufferUsageFlags usage, uint32_t size);
    ~GPUBuffer();

    GPUBuffer(GPUBuffer&& other) noexcept;
    GPUBuffer& operator=(GPUBuffer&& other) noexcept;
    GPUBuffer(const GPUBuffer&) = delete;
    GPUBuffer& operator=(const GPUBuffer&) = delete;

    SDL_GPUBuffer* get() const { return m_buffer; }
    uint32_t getSize() const { return m_size; }
    bool isValid() const { return m_buffer != nullptr; }

    SDL_GPUBufferBinding asBinding(uint32_t offset = 0) const;

    /**
     * @param size Region size in bytes; 0 means "to the end of the buffer"
     */
    SDL_GPUBufferRegion asRegion(uint32_t offset = 0, uint32_t size = 0) const;

    /**
     * Copy bytes into the buffer and wait for nothing; the upload is
     * submitted immediately and ordered before later command buffers.
     * @return false if staging, mapping or submission failed
     */
    bool uploadImmediate(const void* data, uint32_t size);

private:
    void release();

    SDL_GPUBuffer* m_buffer{nullptr};
    SDL_GPUDevice* m_device{nullptr};
    uint32_t m_size{0};
};

} // namespace Snowfall

#endif // GPU_BUFFER_HPP
