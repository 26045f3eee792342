/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ATLAS_BUILDER_HPP
#define ATLAS_BUILDER_HPP

#include <SDL3/SDL.h>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace Snowfall {

using SurfacePtr = std::unique_ptr<SDL_Surface, decltype(&SDL_DestroySurface)>;

inline SurfacePtr makeSurfacePtr(SDL_Surface* surface = nullptr) {
    return SurfacePtr(surface, SDL_DestroySurface);
}

enum class AtlasKind : uint8_t { Glyph, Sentence };

/**
 * One RGBA32 atlas: square cells laid out row-major in a grid of
 * ceil(sqrt(count)) columns. An empty atlas is a 1x1 transparent surface.
 */
struct AtlasImage {
    SurfacePtr surface{makeSurfacePtr()};
    uint32_t count{0};
    uint32_t columns{1};
    uint32_t rows{1};
    uint32_t cellSize{0};
    std::vector<uint8_t> monotone; // one flag per cell

    SDL_Rect cellRect(uint32_t localIndex) const;
};

struct AtlasLocation {
    AtlasKind kind{AtlasKind::Glyph};
    uint32_t localIndex{0};
};

/**
 * Glyph and sentence atlases addressed through one combined index:
 * [0, glyphCount) are glyphs, [glyphCount, glyphCount + sentenceCount)
 * are sentences.
 */
struct AtlasSet {
    AtlasImage glyphs;
    AtlasImage sentences;

    uint32_t glyphCount() const { return glyphs.count; }
    uint32_t sentenceCount() const { return sentences.count; }
    uint32_t totalCount() const { return glyphs.count + sentences.count; }

    // Out of range indices clamp to the last cell
    AtlasLocation locate(uint32_t combinedIndex) const;
    bool isMonotone(uint32_t combinedIndex) const;
    const AtlasImage& imageFor(const AtlasLocation& location) const;
};

struct AtlasSettings {
    std::vector<std::string> glyphs;
    std::vector<std::string> sentences;
    std::string glyphFont;     // empty = bundled/system bold serif
    std::string sentenceFont;  // empty = bundled/system bold sans
    int glyphCellSize{64};
    int sentenceCellSize{128};
};

/**
 * @brief Rasterizes glyphs and word-wrapped sentences with SDL3_ttf.
 *
 * Glyphs are drawn white at 0.7 x cell and centered by ink; sentences at
 * 0.18 x cell, wrapped under 85% of the cell width and centered as a block.
 * Font load failures are logged and leave transparent cells.
 */
class AtlasBuilder {
public:
    static constexpr int MONOTONE_TOLERANCE = 5;
    static constexpr float GLYPH_FONT_SCALE = 0.7f;
    static constexpr float SENTENCE_FONT_SCALE = 0.18f;
    static constexpr float SENTENCE_WRAP_RATIO = 0.85f;
    static constexpr float SENTENCE_LINE_SPACING = 1.2f;

    using MeasureFn = std::function<int(const std::string&)>;

    /**
     * @brief Build both atlases.
     * @return false only if surface allocation failed
     */
    bool build(const AtlasSettings& settings, AtlasSet& out);

    // Greedy word wrap; a single over-long word gets a line of its own
    static std::vector<std::string> wrapWords(const std::string& text, int maxWidth,
                                              const MeasureFn& measure);

    /**
     * @brief True if every opaque pixel matches the first opaque pixel's RGB
     * within tolerance. Cells without opaque pixels are monotone.
     */
    static bool isCellMonotone(SDL_Surface* surface, const SDL_Rect& cell,
                               int tolerance = MONOTONE_TOLERANCE);

    // Grid size for count cells; an empty atlas is one 1x1 cell
    static void gridFor(uint32_t count, uint32_t& columns, uint32_t& rows);

    static AtlasImage createAtlasImage(uint32_t count, int cellSize);

private:
    bool buildGlyphAtlas(const AtlasSettings& settings, AtlasImage& out);
    bool buildSentenceAtlas(const AtlasSettings& settings, AtlasImage& out);
};

} // namespace Snowfall

#endif // ATLAS_BUILDER_HPP
