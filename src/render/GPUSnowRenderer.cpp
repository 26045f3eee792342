/* Copyright (c) 2025 Hammer Forged Games
 * Licensed under the MIT License */

#include "render/GPUSnowRenderer.hpp"
#include "core/Logger.hpp"
#include "layer/ImageFlakeLayer.hpp"
#include <SDL3/SDL.h>
#include <algorithm>
#include <format>

namespace Snowfall {

namespace {

constexpr const char* SNOW_VERT = "res/shaders/snow.vert";
constexpr const char* SNOW_FRAG = "res/shaders/snow.frag";

} // anonymous namespace

GPUSnowRenderer::GPUSnowRenderer(SDL_Window* window, const SnowConfig& config)
    : SnowBackendBase(window, config)
{
}

GPUSnowRenderer::~GPUSnowRenderer() {
    stop();
}

std::array<QuadVertex, 6> GPUSnowRenderer::unitQuad() {
    return {{
        {-0.5f, -0.5f, 0.0f, 0.0f},
        { 0.5f, -0.5f, 1.0f, 0.0f},
        { 0.5f,  0.5f, 1.0f, 1.0f},
        {-0.5f, -0.5f, 0.0f, 0.0f},
        { 0.5f,  0.5f, 1.0f, 1.0f},
        {-0.5f,  0.5f, 0.0f, 1.0f},
    }};
}

SnowInstance GPUSnowRenderer::makeInstance(const Particle& particle, bool monotone) {
    SnowInstance instance{};
    instance.x = particle.rest.getX();
    instance.y = particle.rest.getY();
    instance.size = particle.size;
    instance.fallSpeed = particle.fallSpeed;
    instance.phase = particle.phase;
    instance.freq = particle.freq;
    instance.sway = particle.sway * particle.swayLimit;
    instance.rotation = particle.rotation;
    instance.rotationSpeed = particle.rotationSpeed;
    instance.r = particle.r;
    instance.g = particle.g;
    instance.b = particle.b;
    instance.glyphIndex = static_cast<float>(particle.glyphIndex);
    instance.monotone = monotone ? 1.0f : 0.0f;
    return instance;
}

bool GPUSnowRenderer::createResources() {
    if (!m_device.init(m_window)) {
        return false;
    }

    if (!m_shaders.init(m_device.get())) {
        GPU_ERROR("GPUSnowRenderer: failed to init shader manager");
        return false;
    }

    if (!loadShaders()) {
        GPU_ERROR("GPUSnowRenderer: failed to load shaders");
        return false;
    }

    if (!createPipeline()) {
        GPU_ERROR("GPUSnowRenderer: failed to create pipeline");
        return false;
    }

    m_sampler = GPUSampler::createLinear(m_device.get());
    if (!m_sampler.isValid()) {
        GPU_ERROR("GPUSnowRenderer: failed to create sampler");
        return false;
    }

    const auto quad = unitQuad();
    m_quadBuffer = GPUBuffer(m_device.get(), SDL_GPU_BUFFERUSAGE_VERTEX, sizeof(quad));
    if (!m_quadBuffer.isValid() || !m_quadBuffer.uploadImmediate(quad.data(), sizeof(quad))) {
        GPU_ERROR("GPUSnowRenderer: failed to create quad buffer");
        return false;
    }

    const size_t capacity = std::max(INITIAL_INSTANCE_CAPACITY,
                                     static_cast<size_t>(m_config.snowmax) +
                                     static_cast<size_t>(ImageFlakeLayer::MAX_FLAKES));
    if (!m_instances.init(m_device.get(), capacity)) {
        GPU_ERROR("GPUSnowRenderer: failed to init instance pool");
        return false;
    }

    if (!uploadAtlases()) {
        GPU_ERROR("GPUSnowRenderer: failed to upload atlases");
        return false;
    }

    GPU_INFO(std::format("GPUSnowRenderer ready on {}", m_device.getDriverName()
                                                            ? m_device.getDriverName() : "unknown"));
    return true;
}

void GPUSnowRenderer::releaseResources() {
    // Everything created from the device goes before the device itself
    m_imageTextures.clear();
    m_imageRanges.clear();
    m_imageGeneration = 0;
    m_glyphTexture = GPUTexture();
    m_sentenceTexture = GPUTexture();
    m_instances.shutdown();
    m_quadBuffer = GPUBuffer();
    m_sampler = GPUSampler();
    m_pipeline.release();
    m_vertShader = nullptr;
    m_fragShader = nullptr;
    m_shaders.shutdown();
    m_device.shutdown();
}

void GPUSnowRenderer::onAtlasesRebuilt() {
    if (!uploadAtlases()) {
        GPU_ERROR("GPUSnowRenderer: failed to re-upload atlases");
    }
}

bool GPUSnowRenderer::loadShaders() {
    ShaderInfo vertInfo{};
    vertInfo.numUniformBuffers = 1;  // SnowUniforms

    ShaderInfo fragInfo{};
    fragInfo.numSamplers = 2;        // glyph atlas, sentence atlas
    fragInfo.numUniformBuffers = 1;  // SnowUniforms

    m_vertShader = m_shaders.loadShader(SNOW_VERT, SDL_GPU_SHADERSTAGE_VERTEX, vertInfo);
    m_fragShader = m_shaders.loadShader(SNOW_FRAG, SDL_GPU_SHADERSTAGE_FRAGMENT, fragInfo);
    return m_vertShader && m_fragShader;
}

bool GPUSnowRenderer::createPipeline() {
    auto config = GPUPipeline::createSnowConfig(m_vertShader, m_fragShader,
                                                m_device.getSwapchainFormat());
    return m_pipeline.create(m_device.get(), config);
}

bool GPUSnowRenderer::uploadAtlases() {
    GPUTexture glyphs = GPUTexture::fromSurface(m_device.get(), m_atlases.glyphs.surface.get());
    GPUTexture sentences = GPUTexture::fromSurface(m_device.get(), m_atlases.sentences.surface.get());
    if (!glyphs.isValid() || !sentences.isValid()) {
        return false;
    }
    m_glyphTexture = std::move(glyphs);
    m_sentenceTexture = std::move(sentences);
    GPU_DEBUG(std::format("Atlases uploaded: glyph {}x{}, sentence {}x{}",
                          m_glyphTexture.getWidth(), m_glyphTexture.getHeight(),
                          m_sentenceTexture.getWidth(), m_sentenceTexture.getHeight()));
    return true;
}

void GPUSnowRenderer::syncImageTextures() {
    if (!m_layer || m_layer->getImageGeneration() == m_imageGeneration) {
        return;
    }
    m_imageGeneration = m_layer->getImageGeneration();

    m_imageTextures.clear();
    for (const auto& surface : m_layer->getImages()) {
        GPUTexture texture = GPUTexture::fromSurface(m_device.get(), surface.get());
        if (!texture.isValid()) {
            // Keep indices aligned with the layer's image list
            auto placeholder = ImageFlakeLayer::createPlaceholder();
            texture = GPUTexture::fromSurface(m_device.get(), placeholder.get());
        }
        m_imageTextures.push_back(std::move(texture));
    }
    GPU_DEBUG(std::format("Image layer textures: {}", m_imageTextures.size()));
}

size_t GPUSnowRenderer::writeInstances(SnowInstance* out, size_t capacity) {
    size_t written = 0;
    for (const auto& particle : m_particles) {
        if (written == capacity) {
            break;
        }
        out[written++] = makeInstance(particle, m_atlases.isMonotone(particle.glyphIndex));
    }
    m_primaryInstanceCount = written;

    // Image flakes grouped by image so each group is one draw
    m_imageRanges.clear();
    if (m_layer && !m_imageTextures.empty()) {
        const auto& flakes = m_layer->getFlakes();
        for (size_t image = 0; image < m_imageTextures.size(); ++image) {
            ImageRange range{image, written, 0};
            for (const auto& flake : flakes) {
                if (flake.glyphIndex != image || written == capacity) {
                    continue;
                }
                SnowInstance instance = makeInstance(flake, false);
                instance.glyphIndex = 0.0f;
                out[written++] = instance;
                ++range.count;
            }
            if (range.count > 0) {
                m_imageRanges.push_back(range);
            }
        }
    }
    return written;
}

SnowUniforms GPUSnowRenderer::makeGlyphUniforms() const {
    SnowUniforms uniforms{};
    uniforms.viewportWidth = m_viewportWidth;
    uniforms.viewportHeight = m_viewportHeight;
    uniforms.glyphCount = static_cast<float>(m_atlases.glyphCount());
    uniforms.glyphColumns = static_cast<float>(m_atlases.glyphs.columns);
    uniforms.glyphRows = static_cast<float>(m_atlases.glyphs.rows);
    uniforms.sentenceCount = static_cast<float>(m_atlases.sentenceCount());
    uniforms.sentenceColumns = static_cast<float>(m_atlases.sentences.columns);
    uniforms.sentenceRows = static_cast<float>(m_atlases.sentences.rows);
    uniforms.glowStrength = m_glow.getGlowStrength();
    uniforms.time = static_cast<float>(m_time);
    uniforms.opacity = 1.0f;
    return uniforms;
}

SnowUniforms GPUSnowRenderer::makeImageUniforms() const {
    // Each image is a one-cell "glyph atlas"; images neither glow nor tint
    SnowUniforms uniforms{};
    uniforms.viewportWidth = m_viewportWidth;
    uniforms.viewportHeight = m_viewportHeight;
    uniforms.glyphCount = 1.0f;
    uniforms.glyphColumns = 1.0f;
    uniforms.glyphRows = 1.0f;
    uniforms.sentenceColumns = 1.0f;
    uniforms.sentenceRows = 1.0f;
    uniforms.glowStrength = 0.0f;
    uniforms.time = static_cast<float>(m_time);
    uniforms.opacity = ImageFlakeLayer::OPACITY;
    return uniforms;
}

void GPUSnowRenderer::drawRange(SDL_GPUCommandBuffer* cmd, SDL_GPURenderPass* pass,
                                const SnowUniforms& uniforms, const GPUTexture& primary,
                                const GPUTexture& secondary, size_t first, size_t count) {
    SDL_PushGPUVertexUniformData(cmd, 0, &uniforms, sizeof(SnowUniforms));
    SDL_PushGPUFragmentUniformData(cmd, 0, &uniforms, sizeof(SnowUniforms));

    std::array<SDL_GPUTextureSamplerBinding, 2> samplers{
        primary.asSamplerBinding(m_sampler.get()),
        secondary.asSamplerBinding(m_sampler.get())};
    SDL_BindGPUFragmentSamplers(pass, 0, samplers.data(), static_cast<Uint32>(samplers.size()));

    std::array<SDL_GPUBufferBinding, 2> buffers{
        m_quadBuffer.asBinding(), m_instances.bindingAt(first)};
    SDL_BindGPUVertexBuffers(pass, 0, buffers.data(), static_cast<Uint32>(buffers.size()));

    SDL_DrawGPUPrimitives(pass, 6, static_cast<Uint32>(count), 0, 0);
}

void GPUSnowRenderer::render() {
    if (!m_device.isInitialized()) {
        return;
    }
    syncImageTextures();

    SDL_GPUCommandBuffer* cmd = SDL_AcquireGPUCommandBuffer(m_device.get());
    if (!cmd) {
        GPU_ERROR(std::format("Failed to acquire GPU command buffer: {}", SDL_GetError()));
        return;
    }

    SDL_GPUTexture* swapchain = nullptr;
    if (!SDL_WaitAndAcquireGPUSwapchainTexture(cmd, m_window, &swapchain, nullptr, nullptr)) {
        GPU_ERROR(std::format("Failed to acquire swapchain texture: {}", SDL_GetError()));
        SDL_CancelGPUCommandBuffer(cmd);
        return;
    }

    if (!swapchain) {
        // Window minimized or occluded
        SDL_SubmitGPUCommandBuffer(cmd);
        return;
    }

    const size_t layerFlakes = m_layer ? m_layer->getFlakes().size() : 0;
    if (!m_instances.ensureCapacity(m_particles.size() + layerFlakes)) {
        SDL_CancelGPUCommandBuffer(cmd);
        return;
    }

    size_t instanceCount = 0;
    if (SnowInstance* mapped = m_instances.beginFrame()) {
        instanceCount = writeInstances(mapped, m_instances.getCapacity());
    }
    m_instances.endFrame(instanceCount);

    SDL_GPUCopyPass* copyPass = SDL_BeginGPUCopyPass(cmd);
    m_instances.upload(copyPass);
    SDL_EndGPUCopyPass(copyPass);

    SDL_GPUColorTargetInfo colorTarget{};
    colorTarget.texture = swapchain;
    colorTarget.load_op = SDL_GPU_LOADOP_CLEAR;
    colorTarget.store_op = SDL_GPU_STOREOP_STORE;
    colorTarget.clear_color = {0.0f, 0.0f, 0.0f, 0.0f};  // transparent overlay

    SDL_GPURenderPass* pass = SDL_BeginGPURenderPass(cmd, &colorTarget, 1, nullptr);
    if (pass) {
        SDL_BindGPUGraphicsPipeline(pass, m_pipeline.get());

        if (m_primaryInstanceCount > 0) {
            drawRange(cmd, pass, makeGlyphUniforms(), m_glyphTexture, m_sentenceTexture,
                      0, m_primaryInstanceCount);
        }

        if (!m_imageRanges.empty()) {
            const SnowUniforms imageUniforms = makeImageUniforms();
            for (const auto& range : m_imageRanges) {
                const GPUTexture& image = m_imageTextures[range.imageIndex];
                drawRange(cmd, pass, imageUniforms, image, image, range.first, range.count);
            }
        }

        SDL_EndGPURenderPass(pass);
    }

    if (!SDL_SubmitGPUCommandBuffer(cmd)) {
        GPU_ERROR(std::format("Failed to submit GPU command buffer: {}", SDL_GetError()));
    }
}

} // namespace Snowfall
