/* Copyright (c) 2025 Hammer Forged Games
 * Licensed under the MIT License */

#ifndef GPU_SHADER_MANAGER_HPP
#define GPU_SHADER_MANAGER_HPP

#include <SDL3/SDL_gpu.h>
#include <boost/container/flat_map.hpp>
#include <cstdint>
#include <string>

namespace Snowfall {

/**
 * Shader resource counts, must match the bindings declared in the shader.
 */
struct ShaderInfo {
    uint32_t numSamplers{0};
    uint32_t numStorageTextures{0};
    uint32_t numStorageBuffers{0};
    uint32_t numUniformBuffers{0};
};

/**
 * Loads and owns the GPU shaders of one device.
 *
 * Picks the shader flavour from the device: SPIR-V (`<base>.spv`, entry
 * point "main") or MSL (`<base>.metal`, entry points vertexMain /
 * fragmentMain). All shaders are released on shutdown() or destruction.
 */
class GPUShaderManager {
public:
    GPUShaderManager() = default;
    ~GPUShaderManager();

    GPUShaderManager(const GPUShaderManager&) = delete;
    GPUShaderManager& operator=(const GPUShaderManager&) = delete;

    bool init(SDL_GPUDevice* device);
    void shutdown();

    /**
     * Load (or fetch from cache) a shader.
     * @param basePath Path without extension, e.g. "res/shaders/snow.vert"
     * @return Shader owned by this manager, or nullptr on failure
     */
    SDL_GPUShader* loadShader(const std::string& basePath,
                              SDL_GPUShaderStage stage,
                              const ShaderInfo& info);

    bool hasShader(const std::string& basePath) const;
    size_t getShaderCount() const { return m_shaders.size(); }
    bool usesSPIRV() const { return m_useSPIRV; }

private:
    SDL_GPUShader* createFromFile(const std::string& path,
                                  SDL_GPUShaderStage stage,
                                  const ShaderInfo& info);

    SDL_GPUDevice* m_device{nullptr};
    boost::container::flat_map<std::string, SDL_GPUShader*> m_shaders;
    bool m_useSPIRV{true};
};

} // namespace Snowfall

#endif // GPU_SHADER_MANAGER_HPP
