/* Copyright (c) 2025 Hammer Forged Games
 * Licensed under the MIT License */

#ifndef GPU_INSTANCE_POOL_HPP
#define GPU_INSTANCE_POOL_HPP

#include "gpu/GPUBuffer.hpp"
#include "gpu/GPUTypes.hpp"
#include <array>
#include <cstdint>

namespace Snowfall {

/**
 * Triple-buffered SnowInstance stream for per-frame uploads.
 *
 * Cycling transfer buffers keep the CPU from waiting on the GPU:
 * - Frame N: GPU reads from staging 0
 * - Frame N+1: GPU reads from staging 1, CPU writes staging 0
 * - Frame N+2: GPU reads from staging 2, CPU writes staging 1
 *
 * Several draws can share one frame's stream: write them back to back and
 * bind the instance buffer at `firstInstance * sizeof(SnowInstance)`.
 */
class GPUInstancePool {
public:
    static constexpr size_t FRAME_COUNT = 3;

    GPUInstancePool() = default;
    ~GPUInstancePool() = default;

    GPUInstancePool(GPUInstancePool&&) = default;
    GPUInstancePool& operator=(GPUInstancePool&&) = default;
    GPUInstancePool(const GPUInstancePool&) = delete;
    GPUInstancePool& operator=(const GPUInstancePool&) = delete;

    bool init(SDL_GPUDevice* device, size_t maxInstances);
    void shutdown();

    /**
     * Grow the buffers if `instances` exceeds the current capacity.
     * Must not be called between beginFrame() and endFrame().
     */
    bool ensureCapacity(size_t instances);

    /**
     * Advance to the next staging buffer and map it.
     * @return Write pointer for up to getCapacity() instances, or nullptr
     */
    SnowInstance* beginFrame();

    /**
     * Unmap and record how many instances were written (clamped to capacity).
     */
    void endFrame(size_t instanceCount);

    /**
     * Copy this frame's instances into the GPU buffer. Call inside a copy pass.
     */
    void upload(SDL_GPUCopyPass* copyPass);

    /**
     * Binding for slot 1 starting at the given instance.
     */
    SDL_GPUBufferBinding bindingAt(size_t firstInstance) const;

    size_t getInstanceCount() const { return m_instanceCount; }
    size_t getCapacity() const { return m_capacity; }
    bool isInitialized() const { return m_device != nullptr; }

private:
    SDL_GPUDevice* m_device{nullptr};
    std::array<GPUTransferBuffer, FRAME_COUNT> m_staging;
    GPUBuffer m_gpuBuffer;

    uint32_t m_frameIndex{0};
    size_t m_capacity{0};
    size_t m_instanceCount{0};
};

} // namespace Snowfall

#endif // GPU_INSTANCE_POOL_HPP
