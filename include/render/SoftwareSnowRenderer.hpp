/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SOFTWARE_SNOW_RENDERER_HPP
#define SOFTWARE_SNOW_RENDERER_HPP

#include "render/SnowBackendBase.hpp"
#include <SDL3/SDL.h>
#include <memory>
#include <vector>

namespace Snowfall {

using TexturePtr = std::unique_ptr<SDL_Texture, decltype(&SDL_DestroyTexture)>;

inline TexturePtr makeTexturePtr(SDL_Texture* texture = nullptr) {
    return TexturePtr(texture, SDL_DestroyTexture);
}

/**
 * @brief CPU fallback that draws the same flakes through SDL's software
 * renderer.
 *
 * Flakes become rotated textured quads batched per texture with
 * SDL_RenderGeometry. The glow is a precomputed falloff sprite drawn under
 * each flake and modulated by the flicker and glow strength, so the result
 * tracks the GPU shader closely.
 */
class SoftwareSnowRenderer : public SnowBackendBase {
public:
    static constexpr int GLOW_SPRITE_SIZE = 64;

    struct GeometryBatch {
        std::vector<SDL_Vertex> vertices;
        std::vector<int> indices;

        void clear() {
            vertices.clear();
            indices.clear();
        }
        bool empty() const { return indices.empty(); }
    };

    SoftwareSnowRenderer(SDL_Window* window, const SnowConfig& config);
    ~SoftwareSnowRenderer() override;

    const char* getName() const override { return "Software"; }

    /**
     * @brief Append one rotated quad (two triangles) centered on (cx, cy).
     * @param uv Source rectangle in normalized texture coordinates
     */
    static void appendQuad(GeometryBatch& batch, float cx, float cy, float size,
                           float rotation, const SDL_FRect& uv, const SDL_FColor& color);

    // Normalized source rectangle of one atlas cell
    static SDL_FRect cellUV(const AtlasImage& atlas, uint32_t localIndex);

    // RGBA32 glow falloff sprite: white, alpha = falloff * GLOW_ALPHA
    static SurfacePtr createGlowSurface(int size = GLOW_SPRITE_SIZE);

protected:
    bool createResources() override;
    void releaseResources() override;
    void onAtlasesRebuilt() override;
    void render() override;

private:
    TexturePtr createTexture(SDL_Surface* surface) const;
    bool uploadAtlases();
    void syncImageTextures();
    void buildBatches();
    void drawBatch(SDL_Texture* texture, const GeometryBatch& batch);

    SDL_Renderer* m_renderer{nullptr};
    TexturePtr m_glyphTexture{makeTexturePtr()};
    TexturePtr m_sentenceTexture{makeTexturePtr()};
    TexturePtr m_glowTexture{makeTexturePtr()};
    std::vector<TexturePtr> m_imageTextures;
    uint64_t m_imageGeneration{0};

    GeometryBatch m_glowBatch;
    GeometryBatch m_glyphBatch;
    GeometryBatch m_sentenceBatch;
    std::vector<GeometryBatch> m_imageBatches;
};

} // namespace Snowfall

#endif // SOFTWARE_SNOW_RENDERER_HPP
