/* Copyright (c) 2025 Hammer Forged Games
 * Licensed under the MIT License */

#include "gpu/GPUPipeline.hpp"
#include "gpu/GPUTypes.hpp"
#include "core/Logger.hpp"
#include <format>
#include <utility>

namespace Snowfall {

bool PipelineConfig::addVertexBuffer(uint32_t slot, uint32_t pitch, SDL_GPUVertexInputRate rate) {
    if (vertexBufferCount >= MAX_VERTEX_BUFFERS) {
        GPU_ERROR("PipelineConfig: too many vertex buffers");
        return false;
    }
    SDL_GPUVertexBufferDescription& desc = vertexBuffers[vertexBufferCount++];
    desc.slot = slot;
    desc.pitch = pitch;
    desc.input_rate = rate;
    desc.instance_step_rate = 0;
    return true;
}

bool PipelineConfig::addVertexAttribute(uint32_t slot, SDL_GPUVertexElementFormat format,
                                        uint32_t offset) {
    if (vertexAttributeCount >= MAX_VERTEX_ATTRIBUTES) {
        GPU_ERROR("PipelineConfig: too many vertex attributes");
        return false;
    }
    SDL_GPUVertexAttribute& attr = vertexAttributes[vertexAttributeCount];
    attr.location = vertexAttributeCount;
    attr.buffer_slot = slot;
    attr.format = format;
    attr.offset = offset;
    ++vertexAttributeCount;
    return true;
}

GPUPipeline::~GPUPipeline() {
    release();
}

GPUPipeline::GPUPipeline(GPUPipeline&& other) noexcept
    : m_pipeline(std::exchange(other.m_pipeline, nullptr))
    , m_device(std::exchange(other.m_device, nullptr))
{
}

GPUPipeline& GPUPipeline::operator=(GPUPipeline&& other) noexcept {
    if (this != &other) {
        release();
        m_pipeline = std::exchange(other.m_pipeline, nullptr);
        m_device = std::exchange(other.m_device, nullptr);
    }
    return *this;
}

bool GPUPipeline::create(SDL_GPUDevice* device, const PipelineConfig& config) {
    if (!device) {
        GPU_ERROR("GPUPipeline::create: null device");
        return false;
    }
    if (!config.vertexShader || !config.fragmentShader) {
        GPU_ERROR("GPUPipeline::create: missing shaders");
        return false;
    }

    release();
    m_device = device;

    SDL_GPUColorTargetDescription colorTarget{};
    colorTarget.format = config.colorFormat;
    colorTarget.blend_state.enable_blend = config.enableBlend;
    colorTarget.blend_state.color_write_mask = SDL_GPU_COLORCOMPONENT_R |
                                               SDL_GPU_COLORCOMPONENT_G |
                                               SDL_GPU_COLORCOMPONENT_B |
                                               SDL_GPU_COLORCOMPONENT_A;
    if (config.enableBlend) {
        colorTarget.blend_state.src_color_blendfactor = config.srcColorFactor;
        colorTarget.blend_state.dst_color_blendfactor = config.dstColorFactor;
        colorTarget.blend_state.color_blend_op = config.colorBlendOp;
        colorTarget.blend_state.src_alpha_blendfactor = config.srcAlphaFactor;
        colorTarget.blend_state.dst_alpha_blendfactor = config.dstAlphaFactor;
        colorTarget.blend_state.alpha_blend_op = config.alphaBlendOp;
    }

    SDL_GPURasterizerState rasterizer{};
    rasterizer.fill_mode = SDL_GPU_FILLMODE_FILL;
    rasterizer.cull_mode = SDL_GPU_CULLMODE_NONE;
    rasterizer.front_face = SDL_GPU_FRONTFACE_COUNTER_CLOCKWISE;
    rasterizer.enable_depth_clip = true;

    SDL_GPUVertexInputState vertexInput{};
    vertexInput.num_vertex_buffers = config.vertexBufferCount;
    vertexInput.vertex_buffer_descriptions = config.vertexBufferCount > 0
        ? config.vertexBuffers.data() : nullptr;
    vertexInput.num_vertex_attributes = config.vertexAttributeCount;
    vertexInput.vertex_attributes = config.vertexAttributeCount > 0
        ? config.vertexAttributes.data() : nullptr;

    SDL_GPUGraphicsPipelineCreateInfo createInfo{};
    createInfo.vertex_shader = config.vertexShader;
    createInfo.fragment_shader = config.fragmentShader;
    createInfo.vertex_input_state = vertexInput;
    createInfo.primitive_type = config.primitiveType;
    createInfo.rasterizer_state = rasterizer;
    createInfo.target_info.num_color_targets = 1;
    createInfo.target_info.color_target_descriptions = &colorTarget;
    createInfo.target_info.has_depth_stencil_target = false;

    m_pipeline = SDL_CreateGPUGraphicsPipeline(device, &createInfo);
    if (!m_pipeline) {
        GPU_ERROR(std::format("Failed to create GPU pipeline: {}", SDL_GetError()));
        return false;
    }
    return true;
}

void GPUPipeline::release() {
    if (m_pipeline && m_device) {
        SDL_ReleaseGPUGraphicsPipeline(m_device, m_pipeline);
    }
    m_pipeline = nullptr;
}

PipelineConfig GPUPipeline::createSnowConfig(SDL_GPUShader* vertShader,
                                             SDL_GPUShader* fragShader,
                                             SDL_GPUTextureFormat colorFormat) {
    PipelineConfig config{};
    config.vertexShader = vertShader;
    config.fragmentShader = fragShader;
    config.colorFormat = colorFormat;

    config.addVertexBuffer(0, sizeof(QuadVertex), SDL_GPU_VERTEXINPUTRATE_VERTEX);
    config.addVertexBuffer(1, sizeof(SnowInstance), SDL_GPU_VERTEXINPUTRATE_INSTANCE);

    // location 0: corner.xy + uv
    config.addVertexAttribute(0, SDL_GPU_VERTEXELEMENTFORMAT_FLOAT4, 0);
    // locations 1-4: instance record
    config.addVertexAttribute(1, SDL_GPU_VERTEXELEMENTFORMAT_FLOAT4, offsetof(SnowInstance, x));
    config.addVertexAttribute(1, SDL_GPU_VERTEXELEMENTFORMAT_FLOAT4, offsetof(SnowInstance, phase));
    config.addVertexAttribute(1, SDL_GPU_VERTEXELEMENTFORMAT_FLOAT4, offsetof(SnowInstance, rotationSpeed));
    config.addVertexAttribute(1, SDL_GPU_VERTEXELEMENTFORMAT_FLOAT2, offsetof(SnowInstance, glyphIndex));

    config.enableBlend = true;
    config.srcColorFactor = SDL_GPU_BLENDFACTOR_SRC_ALPHA;
    config.dstColorFactor = SDL_GPU_BLENDFACTOR_ONE_MINUS_SRC_ALPHA;
    return config;
}

} // namespace Snowfall
