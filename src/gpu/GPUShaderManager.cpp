/* Copyright (c) 2025 Hammer Forged Games
 * Licensed under the MIT License */

#include "gpu/GPUShaderManager.hpp"
#include "core/Logger.hpp"
#include "utils/ResourcePath.hpp"
#include <format>
#include <fstream>
#include <iterator>
#include <vector>

namespace Snowfall {

GPUShaderManager::~GPUShaderManager() {
    shutdown();
}

bool GPUShaderManager::init(SDL_GPUDevice* device) {
    if (!device) {
        GPU_ERROR("GPUShaderManager::init: null device");
        return false;
    }

    SDL_GPUShaderFormat formats = SDL_GetGPUShaderFormats(device);
    if (formats & SDL_GPU_SHADERFORMAT_SPIRV) {
        m_useSPIRV = true;
    } else if (formats & SDL_GPU_SHADERFORMAT_MSL) {
        m_useSPIRV = false;
    } else {
        GPU_ERROR("GPUShaderManager: no supported shader format");
        return false;
    }

    m_device = device;
    GPU_INFO(std::format("GPUShaderManager: using {} shaders", m_useSPIRV ? "SPIR-V" : "MSL"));
    return true;
}

void GPUShaderManager::shutdown() {
    if (!m_device) {
        return;
    }
    for (auto& [name, shader] : m_shaders) {
        if (shader) {
            SDL_ReleaseGPUShader(m_device, shader);
        }
    }
    GPU_INFO(std::format("GPUShaderManager shutdown: released {} shaders", m_shaders.size()));
    m_shaders.clear();
    m_device = nullptr;
}

SDL_GPUShader* GPUShaderManager::loadShader(const std::string& basePath,
                                            SDL_GPUShaderStage stage,
                                            const ShaderInfo& info) {
    if (!m_device) {
        GPU_ERROR("GPUShaderManager::loadShader: not initialized");
        return nullptr;
    }

    auto it = m_shaders.find(basePath);
    if (it != m_shaders.end()) {
        return it->second;
    }

    const std::string path = ResourcePath::resolve(basePath + (m_useSPIRV ? ".spv" : ".metal"));
    SDL_GPUShader* shader = createFromFile(path, stage, info);
    if (shader) {
        m_shaders.emplace(basePath, shader);
        GPU_DEBUG(std::format("Loaded shader: {}", basePath));
    }
    return shader;
}

bool GPUShaderManager::hasShader(const std::string& basePath) const {
    return m_shaders.contains(basePath);
}

SDL_GPUShader* GPUShaderManager::createFromFile(const std::string& path,
                                                SDL_GPUShaderStage stage,
                                                const ShaderInfo& info) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        GPU_ERROR(std::format("Failed to open shader file: {}", path));
        return nullptr;
    }

    std::vector<uint8_t> code((std::istreambuf_iterator<char>(file)),
                              std::istreambuf_iterator<char>());
    if (code.empty()) {
        GPU_ERROR(std::format("Shader file is empty: {}", path));
        return nullptr;
    }

    const char* entryPoint = "main";
    if (!m_useSPIRV) {
        // MSL source is text; SDL expects it NUL terminated
        code.push_back(0);
        entryPoint = (stage == SDL_GPU_SHADERSTAGE_VERTEX) ? "vertexMain" : "fragmentMain";
    }

    SDL_GPUShaderCreateInfo createInfo{};
    createInfo.code = code.data();
    createInfo.code_size = m_useSPIRV ? code.size() : code.size() - 1;
    createInfo.entrypoint = entryPoint;
    createInfo.format = m_useSPIRV ? SDL_GPU_SHADERFORMAT_SPIRV : SDL_GPU_SHADERFORMAT_MSL;
    createInfo.stage = stage;
    createInfo.num_samplers = info.numSamplers;
    createInfo.num_storage_textures = info.numStorageTextures;
    createInfo.num_storage_buffers = info.numStorageBuffers;
    createInfo.num_uniform_buffers = info.numUniformBuffers;

    SDL_GPUShader* shader = SDL_CreateGPUShader(m_device, &createInfo);
    if (!shader) {
        GPU_ERROR(std::format("Failed to create shader {}: {}", path, SDL_GetError()));
    }
    return shader;
}

} // namespace Snowfall
