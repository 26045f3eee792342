/* Copyright (c) 2025 Hammer Forged Games
 * Licensed under the MIT License */

#include "gpu/GPUInstancePool.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <format>

namespace Snowfall {

bool GPUInstancePool::init(SDL_GPUDevice* device, size_t maxInstances) {
    if (!device || maxInstances == 0) {
        GPU_ERROR(std::format("GPUInstancePool::init: invalid parameters (device={}, maxInstances={})",
                              device != nullptr, maxInstances));
        return false;
    }

    shutdown();
    m_device = device;
    m_capacity = maxInstances;

    const auto bufferSize = static_cast<uint32_t>(maxInstances * sizeof(SnowInstance));

    for (size_t i = 0; i < FRAME_COUNT; ++i) {
        m_staging[i] = GPUTransferBuffer(device, SDL_GPU_TRANSFERBUFFERUSAGE_UPLOAD, bufferSize);
        if (!m_staging[i].isValid()) {
            GPU_ERROR(std::format("GPUInstancePool: failed to create transfer buffer {}", i));
            shutdown();
            return false;
        }
    }

    m_gpuBuffer = GPUBuffer(device, SDL_GPU_BUFFERUSAGE_VERTEX, bufferSize);
    if (!m_gpuBuffer.isValid()) {
        GPU_ERROR("GPUInstancePool: failed to create GPU instance buffer");
        shutdown();
        return false;
    }

    GPU_INFO(std::format("GPUInstancePool initialized: {} instances x {} bytes = {} KB",
                         maxInstances, sizeof(SnowInstance), bufferSize / 1024));
    return true;
}

void GPUInstancePool::shutdown() {
    m_gpuBuffer = GPUBuffer();
    std::generate(m_staging.begin(), m_staging.end(),
                  []() { return GPUTransferBuffer(); });

    m_device = nullptr;
    m_frameIndex = 0;
    m_capacity = 0;
    m_instanceCount = 0;
}

bool GPUInstancePool::ensureCapacity(size_t instances) {
    if (instances <= m_capacity) {
        return true;
    }
    if (!m_device) {
        GPU_ERROR("GPUInstancePool::ensureCapacity: not initialized");
        return false;
    }
    // Round up so a slowly growing population does not realloc every change
    size_t grown = std::max(instances, m_capacity + m_capacity / 2);
    return init(m_device, grown);
}

SnowInstance* GPUInstancePool::beginFrame() {
    if (!m_device) {
        GPU_ERROR("GPUInstancePool::beginFrame: not initialized");
        return nullptr;
    }

    m_frameIndex = (m_frameIndex + 1) % FRAME_COUNT;
    m_instanceCount = 0;

    void* mapped = m_staging[m_frameIndex].map(true);
    if (!mapped) {
        GPU_ERROR("GPUInstancePool::beginFrame: failed to map transfer buffer");
    }
    return static_cast<SnowInstance*>(mapped);
}

void GPUInstancePool::endFrame(size_t instanceCount) {
    if (!m_device) {
        return;
    }
    if (instanceCount > m_capacity) {
        GPU_WARN(std::format("GPUInstancePool::endFrame: {} instances exceed capacity {}, clamping",
                             instanceCount, m_capacity));
        instanceCount = m_capacity;
    }
    m_instanceCount = instanceCount;
    m_staging[m_frameIndex].unmap();
}

void GPUInstancePool::upload(SDL_GPUCopyPass* copyPass) {
    if (!copyPass || m_instanceCount == 0) {
        return;
    }
    SDL_GPUTransferBufferLocation src = m_staging[m_frameIndex].asLocation(0);
    SDL_GPUBufferRegion dst = m_gpuBuffer.asRegion(
        0, static_cast<uint32_t>(m_instanceCount * sizeof(SnowInstance)));
    SDL_UploadToGPUBuffer(copyPass, &src, &dst, true);
}

SDL_GPUBufferBinding GPUInstancePool::bindingAt(size_t firstInstance) const {
    return m_gpuBuffer.asBinding(static_cast<uint32_t>(firstInstance * sizeof(SnowInstance)));
}

} // namespace Snowfall
