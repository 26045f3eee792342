/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "render/SoftwareSnowRenderer.hpp"
#include "core/Logger.hpp"
#include "layer/ImageFlakeLayer.hpp"
#include "render/GlowModel.hpp"
#include <cmath>
#include <cstring>
#include <format>

namespace Snowfall {

SoftwareSnowRenderer::SoftwareSnowRenderer(SDL_Window* window, const SnowConfig& config)
    : SnowBackendBase(window, config)
{
}

SoftwareSnowRenderer::~SoftwareSnowRenderer() {
    stop();
}

void SoftwareSnowRenderer::appendQuad(GeometryBatch& batch, float cx, float cy, float size,
                                      float rotation, const SDL_FRect& uv,
                                      const SDL_FColor& color) {
    // Same corner order and rotation as the instanced vertex shader
    static constexpr float CORNERS[4][2] = {
        {-0.5f, -0.5f}, {0.5f, -0.5f}, {0.5f, 0.5f}, {-0.5f, 0.5f}};

    const float c = std::cos(rotation);
    const float s = std::sin(rotation);
    const int base = static_cast<int>(batch.vertices.size());

    for (const auto& corner : CORNERS) {
        const float x = corner[0] * size;
        const float y = corner[1] * size;

        SDL_Vertex vertex;
        vertex.position.x = cx + x * c - y * s;
        vertex.position.y = cy + x * s + y * c;
        vertex.color = color;
        vertex.tex_coord.x = uv.x + (corner[0] + 0.5f) * uv.w;
        vertex.tex_coord.y = uv.y + (corner[1] + 0.5f) * uv.h;
        batch.vertices.push_back(vertex);
    }

    const int quadIndices[6] = {0, 1, 2, 0, 2, 3};
    for (int index : quadIndices) {
        batch.indices.push_back(base + index);
    }
}

SDL_FRect SoftwareSnowRenderer::cellUV(const AtlasImage& atlas, uint32_t localIndex) {
    if (!atlas.surface || atlas.surface->w <= 0 || atlas.surface->h <= 0 || atlas.cellSize == 0) {
        return SDL_FRect{0.0f, 0.0f, 1.0f, 1.0f};
    }
    const SDL_Rect cell = atlas.cellRect(localIndex);
    const float w = static_cast<float>(atlas.surface->w);
    const float h = static_cast<float>(atlas.surface->h);
    return SDL_FRect{cell.x / w, cell.y / h, cell.w / w, cell.h / h};
}

SurfacePtr SoftwareSnowRenderer::createGlowSurface(int size) {
    auto surface = makeSurfacePtr(SDL_CreateSurface(size, size, SDL_PIXELFORMAT_RGBA32));
    if (!surface) {
        RENDER_ERROR(std::format("Failed to create glow surface: {}", SDL_GetError()));
        return surface;
    }

    auto* pixels = static_cast<uint8_t*>(surface->pixels);
    for (int y = 0; y < size; ++y) {
        uint8_t* row = pixels + static_cast<size_t>(y) * surface->pitch;
        const float cy = ((static_cast<float>(y) + 0.5f) / size) * 2.0f - 1.0f;
        for (int x = 0; x < size; ++x) {
            const float cx = ((static_cast<float>(x) + 0.5f) / size) * 2.0f - 1.0f;
            const float alpha = GlowModel::falloff(cx, cy) * GlowModel::GLOW_ALPHA;
            uint8_t* px = row + x * 4;
            px[0] = 255;
            px[1] = 255;
            px[2] = 255;
            px[3] = static_cast<uint8_t>(std::lround(alpha * 255.0f));
        }
    }
    return surface;
}

TexturePtr SoftwareSnowRenderer::createTexture(SDL_Surface* surface) const {
    if (!surface) {
        return makeTexturePtr();
    }
    auto texture = makeTexturePtr(SDL_CreateTextureFromSurface(m_renderer, surface));
    if (!texture) {
        RENDER_ERROR(std::format("Could not create texture: {}", SDL_GetError()));
        return texture;
    }
    SDL_SetTextureScaleMode(texture.get(), SDL_SCALEMODE_LINEAR);
    SDL_SetTextureBlendMode(texture.get(), SDL_BLENDMODE_BLEND);
    return texture;
}

bool SoftwareSnowRenderer::createResources() {
    m_renderer = SDL_CreateRenderer(m_window, "software");
    if (!m_renderer) {
        RENDER_ERROR(std::format("Software renderer creation failed: {}", SDL_GetError()));
        return false;
    }

    auto glow = createGlowSurface();
    m_glowTexture = createTexture(glow.get());
    if (!m_glowTexture) {
        return false;
    }

    if (!uploadAtlases()) {
        return false;
    }

    RENDER_INFO("Software renderer online");
    return true;
}

void SoftwareSnowRenderer::releaseResources() {
    m_imageTextures.clear();
    m_imageBatches.clear();
    m_imageGeneration = 0;
    m_glyphTexture.reset();
    m_sentenceTexture.reset();
    m_glowTexture.reset();
    if (m_renderer) {
        SDL_DestroyRenderer(m_renderer);
        m_renderer = nullptr;
    }
}

void SoftwareSnowRenderer::onAtlasesRebuilt() {
    if (!uploadAtlases()) {
        RENDER_ERROR("Failed to re-create atlas textures");
    }
}

bool SoftwareSnowRenderer::uploadAtlases() {
    auto glyphs = createTexture(m_atlases.glyphs.surface.get());
    auto sentences = createTexture(m_atlases.sentences.surface.get());
    if (!glyphs || !sentences) {
        return false;
    }
    m_glyphTexture = std::move(glyphs);
    m_sentenceTexture = std::move(sentences);
    return true;
}

void SoftwareSnowRenderer::syncImageTextures() {
    if (!m_layer || m_layer->getImageGeneration() == m_imageGeneration) {
        return;
    }
    m_imageGeneration = m_layer->getImageGeneration();

    m_imageTextures.clear();
    for (const auto& surface : m_layer->getImages()) {
        m_imageTextures.push_back(createTexture(surface.get()));
    }
    m_imageBatches.resize(m_imageTextures.size());
}

void SoftwareSnowRenderer::buildBatches() {
    m_glowBatch.clear();
    m_glyphBatch.clear();
    m_sentenceBatch.clear();
    for (auto& batch : m_imageBatches) {
        batch.clear();
    }

    const float glowStrength = m_glow.getGlowStrength();
    const SDL_FRect fullUV{0.0f, 0.0f, 1.0f, 1.0f};

    for (const auto& particle : m_particles) {
        const Vector2D position = particle.renderPosition();
        const bool monotone = m_atlases.isMonotone(particle.glyphIndex);
        const SDL_FColor tint = monotone
            ? SDL_FColor{particle.r, particle.g, particle.b, 1.0f}
            : SDL_FColor{1.0f, 1.0f, 1.0f, 1.0f};

        if (glowStrength > 0.0f) {
            SDL_FColor glowColor = tint;
            glowColor.a = GlowModel::flicker(static_cast<float>(m_time), particle.phase) *
                          glowStrength;
            appendQuad(m_glowBatch, position.getX(), position.getY(), particle.size,
                       particle.rotation, fullUV, glowColor);
        }

        const AtlasLocation location = m_atlases.locate(particle.glyphIndex);
        const AtlasImage& atlas = m_atlases.imageFor(location);
        GeometryBatch& batch = location.kind == AtlasKind::Sentence ? m_sentenceBatch : m_glyphBatch;
        appendQuad(batch, position.getX(), position.getY(), particle.size, particle.rotation,
                   cellUV(atlas, location.localIndex), tint);
    }

    if (m_layer) {
        const SDL_FColor imageColor{1.0f, 1.0f, 1.0f, ImageFlakeLayer::OPACITY};
        for (const auto& flake : m_layer->getFlakes()) {
            if (flake.glyphIndex >= m_imageBatches.size()) {
                continue;
            }
            const Vector2D position = flake.renderPosition();
            appendQuad(m_imageBatches[flake.glyphIndex], position.getX(), position.getY(),
                       flake.size, flake.rotation, fullUV, imageColor);
        }
    }
}

void SoftwareSnowRenderer::drawBatch(SDL_Texture* texture, const GeometryBatch& batch) {
    if (!texture || batch.empty()) {
        return;
    }
    if (!SDL_RenderGeometry(m_renderer, texture, batch.vertices.data(),
                            static_cast<int>(batch.vertices.size()), batch.indices.data(),
                            static_cast<int>(batch.indices.size()))) {
        RENDER_WARN(std::format("SDL_RenderGeometry failed: {}", SDL_GetError()));
    }
}

void SoftwareSnowRenderer::render() {
    if (!m_renderer) {
        return;
    }
    syncImageTextures();
    buildBatches();

    // Geometry is in logical pixels
    const float density = SDL_GetWindowPixelDensity(m_window);
    const float scale = density > 0.0f ? density : 1.0f;
    SDL_SetRenderScale(m_renderer, scale, scale);

    SDL_SetRenderDrawBlendMode(m_renderer, SDL_BLENDMODE_NONE);
    SDL_SetRenderDrawColor(m_renderer, 0, 0, 0, 0);
    SDL_RenderClear(m_renderer);

    drawBatch(m_glowTexture.get(), m_glowBatch);
    drawBatch(m_glyphTexture.get(), m_glyphBatch);
    drawBatch(m_sentenceTexture.get(), m_sentenceBatch);
    for (size_t i = 0; i < m_imageBatches.size() && i < m_imageTextures.size(); ++i) {
        drawBatch(m_imageTextures[i].get(), m_imageBatches[i]);
    }

    SDL_RenderPresent(m_renderer);
}

} // namespace Snowfall
