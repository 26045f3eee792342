/* Copyright (c) 2025 Hammer Forged Games
 * Licensed under the MIT License */

#ifndef GPU_SNOW_RENDERER_HPP
#define GPU_SNOW_RENDERER_HPP

#include "gpu/GPUBuffer.hpp"
#include "gpu/GPUDevice.hpp"
#include "gpu/GPUInstancePool.hpp"
#include "gpu/GPUPipeline.hpp"
#include "gpu/GPUShaderManager.hpp"
#include "gpu/GPUTexture.hpp"
#include "gpu/GPUTypes.hpp"
#include "render/SnowBackendBase.hpp"
#include <array>
#include <cstdint>
#include <vector>

namespace Snowfall {

/**
 * SDL_GPU snow renderer.
 *
 * Per frame:
 * - Acquires command buffer and swapchain texture
 * - Writes one SnowInstance per flake into the instance ring and uploads it
 * - One instanced draw for glyph/sentence flakes, one per image for the
 *   image layer, all through the same pipeline
 *
 * Owns its device and shader manager, so stop() (or destruction) returns
 * the window to a state where another renderer can claim it.
 */
class GPUSnowRenderer : public SnowBackendBase {
public:
    static constexpr size_t INITIAL_INSTANCE_CAPACITY = 512;

    GPUSnowRenderer(SDL_Window* window, const SnowConfig& config);
    ~GPUSnowRenderer() override;

    const char* getName() const override { return "GPU"; }

    // Flake -> instance record; sway already scaled by the sway limit
    static SnowInstance makeInstance(const Particle& particle, bool monotone);

    // Six corners of the unit quad, two counter-clockwise triangles
    static std::array<QuadVertex, 6> unitQuad();

protected:
    bool createResources() override;
    void releaseResources() override;
    void onAtlasesRebuilt() override;
    void render() override;

private:
    struct ImageRange {
        size_t imageIndex{0};
        size_t first{0};
        size_t count{0};
    };

    bool loadShaders();
    bool createPipeline();
    bool uploadAtlases();
    void syncImageTextures();
    size_t writeInstances(SnowInstance* out, size_t capacity);
    SnowUniforms makeGlyphUniforms() const;
    SnowUniforms makeImageUniforms() const;
    void drawRange(SDL_GPUCommandBuffer* cmd, SDL_GPURenderPass* pass,
                   const SnowUniforms& uniforms, const GPUTexture& primary,
                   const GPUTexture& secondary, size_t first, size_t count);

    GPUDevice m_device;
    GPUShaderManager m_shaders;
    SDL_GPUShader* m_vertShader{nullptr};  // owned by m_shaders
    SDL_GPUShader* m_fragShader{nullptr};
    GPUPipeline m_pipeline;
    GPUSampler m_sampler;
    GPUBuffer m_quadBuffer;
    GPUInstancePool m_instances;
    GPUTexture m_glyphTexture;
    GPUTexture m_sentenceTexture;
    std::vector<GPUTexture> m_imageTextures;
    uint64_t m_imageGeneration{0};

    size_t m_primaryInstanceCount{0};
    std::vector<ImageRange> m_imageRanges;
};

} // namespace Snowfall

#endif // GPU_SNOW_RENDERER_HPP
