/* Copyright (c) 2025 Hammer Forged Games
 * Licensed under the MIT License */

#ifndef GPU_PIPELINE_HPP
#define GPU_PIPELINE_HPP

#include <SDL3/SDL_gpu.h>
#include <array>
#include <cstdint>

namespace Snowfall {

/**
 * Configuration for creating a graphics pipeline.
 * Uses value semantics with embedded arrays so a config can be built,
 * copied and tweaked without dangling pointers.
 */
struct PipelineConfig {
    static constexpr size_t MAX_VERTEX_BUFFERS = 2;
    static constexpr size_t MAX_VERTEX_ATTRIBUTES = 8;

    SDL_GPUShader* vertexShader{nullptr};
    SDL_GPUShader* fragmentShader{nullptr};

    std::array<SDL_GPUVertexBufferDescription, MAX_VERTEX_BUFFERS> vertexBuffers{};
    std::array<SDL_GPUVertexAttribute, MAX_VERTEX_ATTRIBUTES> vertexAttributes{};
    uint32_t vertexBufferCount{0};
    uint32_t vertexAttributeCount{0};

    SDL_GPUPrimitiveType primitiveType{SDL_GPU_PRIMITIVETYPE_TRIANGLELIST};

    bool enableBlend{true};
    SDL_GPUBlendFactor srcColorFactor{SDL_GPU_BLENDFACTOR_SRC_ALPHA};
    SDL_GPUBlendFactor dstColorFactor{SDL_GPU_BLENDFACTOR_ONE_MINUS_SRC_ALPHA};
    SDL_GPUBlendFactor srcAlphaFactor{SDL_GPU_BLENDFACTOR_ONE};
    SDL_GPUBlendFactor dstAlphaFactor{SDL_GPU_BLENDFACTOR_ONE_MINUS_SRC_ALPHA};
    SDL_GPUBlendOp colorBlendOp{SDL_GPU_BLENDOP_ADD};
    SDL_GPUBlendOp alphaBlendOp{SDL_GPU_BLENDOP_ADD};

    SDL_GPUTextureFormat colorFormat{SDL_GPU_TEXTUREFORMAT_R8G8B8A8_UNORM};

    /**
     * Append a vertex buffer description.
     * @return false when the fixed capacity is exhausted
     */
    bool addVertexBuffer(uint32_t slot, uint32_t pitch, SDL_GPUVertexInputRate rate);

    /**
     * Append a vertex attribute reading `format` at `offset` from `slot`.
     * Locations are assigned in call order starting at 0.
     */
    bool addVertexAttribute(uint32_t slot, SDL_GPUVertexElementFormat format, uint32_t offset);
};

/**
 * RAII wrapper for SDL_GPUGraphicsPipeline.
 */
class GPUPipeline {
public:
    GPUPipeline() = default;
    ~GPUPipeline();

    GPUPipeline(GPUPipeline&& other) noexcept;
    GPUPipeline& operator=(GPUPipeline&& other) noexcept;
    GPUPipeline(const GPUPipeline&) = delete;
    GPUPipeline& operator=(const GPUPipeline&) = delete;

    /**
     * Create a graphics pipeline from configuration.
     * Any previously held pipeline is released first.
     */
    bool create(SDL_GPUDevice* device, const PipelineConfig& config);
    void release();

    SDL_GPUGraphicsPipeline* get() const { return m_pipeline; }
    bool isValid() const { return m_pipeline != nullptr; }

    /**
     * Instanced flake pipeline: slot 0 is the per-vertex unit quad
     * (QuadVertex), slot 1 the per-instance SnowInstance stream.
     * Straight alpha blending over the cleared swapchain.
     */
    static PipelineConfig createSnowConfig(SDL_GPUShader* vertShader,
                                           SDL_GPUShader* fragShader,
                                           SDL_GPUTextureFormat colorFormat);

private:
    SDL_GPUGraphicsPipeline* m_pipeline{nullptr};
    SDL_GPUDevice* m_device{nullptr};
};

} // namespace Snowfall

#endif // GPU_PIPELINE_HPP
