/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "graphics/AtlasBuilder.hpp"
#include "core/Logger.hpp"
#include "utils/ResourcePath.hpp"
#include <SDL3_ttf/SDL_ttf.h>
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <optional>
#include <sstream>

namespace Snowfall {

namespace {

using FontPtr = std::unique_ptr<TTF_Font, decltype(&TTF_CloseFont)>;

const char* const DEFAULT_GLYPH = "\xE2\x9D\x84"; // U+2744

const std::vector<std::string>& glyphFontCandidates() {
    static const std::vector<std::string> fonts = {
        "res/fonts/DejaVuSerif-Bold.ttf",
        "/usr/share/fonts/truetype/dejavu/DejaVuSerif-Bold.ttf",
        "/usr/share/fonts/dejavu/DejaVuSerif-Bold.ttf"};
    return fonts;
}

const std::vector<std::string>& sentenceFontCandidates() {
    static const std::vector<std::string> fonts = {
        "res/fonts/DejaVuSans-Bold.ttf",
        "/usr/share/fonts/truetype/dejavu/DejaVuSans-Bold.ttf",
        "/usr/share/fonts/dejavu/DejaVuSans-Bold.ttf"};
    return fonts;
}

FontPtr openFont(const std::string& configured, const std::vector<std::string>& fallbacks,
                 float pointSize) {
    std::vector<std::string> candidates;
    if (!configured.empty()) {
        candidates.push_back(configured);
    }
    candidates.insert(candidates.end(), fallbacks.begin(), fallbacks.end());

    std::error_code ec;
    for (const auto& candidate : candidates) {
        std::string path = ResourcePath::resolve(candidate);
        if (!std::filesystem::exists(path, ec)) {
            continue;
        }
        FontPtr font(TTF_OpenFont(path.c_str(), pointSize), TTF_CloseFont);
        if (font) {
            TTF_SetFontHinting(font.get(), TTF_HINTING_NORMAL);
            TTF_SetFontKerning(font.get(), true);
            ATLAS_DEBUG(std::format("Using font {} at {}pt", path, pointSize));
            return font;
        }
        ATLAS_WARN(std::format("Failed to open font {}: {}", path, SDL_GetError()));
    }
    ATLAS_ERROR(std::format("No usable font found (configured '{}')", configured));
    return FontPtr(nullptr, TTF_CloseFont);
}

// Single code point strings use glyph metrics for ink centering
std::optional<uint32_t> singleCodepoint(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    auto lead = static_cast<unsigned char>(text[0]);
    size_t length = 1;
    uint32_t codepoint = lead;
    if (lead >= 0xF0) {
        length = 4;
        codepoint = lead & 0x07;
    } else if (lead >= 0xE0) {
        length = 3;
        codepoint = lead & 0x0F;
    } else if (lead >= 0xC0) {
        length = 2;
        codepoint = lead & 0x1F;
    }
    if (text.size() != length) {
        return std::nullopt;
    }
    for (size_t i = 1; i < length; ++i) {
        codepoint = (codepoint << 6) | (static_cast<unsigned char>(text[i]) & 0x3F);
    }
    return codepoint;
}

// Copy src into dst at (x, y), clipped to the cell so neighbors stay intact
bool blitIntoCell(SDL_Surface* src, SDL_Surface* dst, const SDL_Rect& cell, int x, int y) {
    SDL_Rect placed{x, y, src->w, src->h};
    SDL_Rect clipped;
    if (!SDL_GetRectIntersection(&placed, &cell, &clipped)) {
        return true;
    }
    SDL_Rect srcRect{clipped.x - x, clipped.y - y, clipped.w, clipped.h};
    // Straight copy: cells start transparent and never overlap
    SDL_SetSurfaceBlendMode(src, SDL_BLENDMODE_NONE);
    if (!SDL_BlitSurface(src, &srcRect, dst, &clipped)) {
        ATLAS_ERROR(std::format("Blit into atlas failed: {}", SDL_GetError()));
        return false;
    }
    return true;
}

class TTFSession {
public:
    TTFSession() : m_ok(TTF_Init()) {
        if (!m_ok) {
            ATLAS_ERROR(std::format("TTF_Init failed: {}", SDL_GetError()));
        }
    }
    ~TTFSession() {
        if (m_ok) {
            TTF_Quit();
        }
    }
    TTFSession(const TTFSession&) = delete;
    TTFSession& operator=(const TTFSession&) = delete;

    bool ok() const { return m_ok; }

private:
    bool m_ok;
};

} // namespace

SDL_Rect AtlasImage::cellRect(uint32_t localIndex) const {
    uint32_t col = localIndex % columns;
    uint32_t row = localIndex / columns;
    int cell = static_cast<int>(cellSize);
    return SDL_Rect{static_cast<int>(col) * cell, static_cast<int>(row) * cell, cell, cell};
}

AtlasLocation AtlasSet::locate(uint32_t combinedIndex) const {
    uint32_t total = totalCount();
    if (total == 0) {
        return AtlasLocation{};
    }
    uint32_t index = std::min(combinedIndex, total - 1);
    if (index < glyphs.count) {
        return AtlasLocation{AtlasKind::Glyph, index};
    }
    return AtlasLocation{AtlasKind::Sentence, index - glyphs.count};
}

bool AtlasSet::isMonotone(uint32_t combinedIndex) const {
    if (totalCount() == 0) {
        return false;
    }
    AtlasLocation location = locate(combinedIndex);
    const AtlasImage& image = imageFor(location);
    return location.localIndex < image.monotone.size() && image.monotone[location.localIndex] != 0;
}

const AtlasImage& AtlasSet::imageFor(const AtlasLocation& location) const {
    return location.kind == AtlasKind::Glyph ? glyphs : sentences;
}

void AtlasBuilder::gridFor(uint32_t count, uint32_t& columns, uint32_t& rows) {
    if (count == 0) {
        columns = 1;
        rows = 1;
        return;
    }
    columns = static_cast<uint32_t>(std::ceil(std::sqrt(static_cast<double>(count))));
    rows = (count + columns - 1) / columns;
}

AtlasImage AtlasBuilder::createAtlasImage(uint32_t count, int cellSize) {
    AtlasImage image;
    image.count = count;
    gridFor(count, image.columns, image.rows);

    int width = 1;
    int height = 1;
    if (count > 0) {
        image.cellSize = static_cast<uint32_t>(cellSize);
        width = static_cast<int>(image.columns) * cellSize;
        height = static_cast<int>(image.rows) * cellSize;
    }

    image.surface.reset(SDL_CreateSurface(width, height, SDL_PIXELFORMAT_RGBA32));
    if (!image.surface) {
        ATLAS_ERROR(std::format("Failed to create {}x{} atlas surface: {}", width, height,
                                SDL_GetError()));
        return image;
    }
    SDL_FillSurfaceRect(image.surface.get(), nullptr, 0);
    image.monotone.assign(count, 1);
    return image;
}

std::vector<std::string> AtlasBuilder::wrapWords(const std::string& text, int maxWidth,
                                                 const MeasureFn& measure) {
    std::vector<std::string> lines;
    std::istringstream words(text);
    std::string word;
    std::string workingLine;

    while (words >> word) {
        std::string testLine = workingLine.empty() ? word : workingLine + " " + word;
        if (measure(testLine) <= maxWidth || workingLine.empty()) {
            workingLine = std::move(testLine);
        } else {
            lines.push_back(std::move(workingLine));
            workingLine = word;
        }
    }
    if (!workingLine.empty()) {
        lines.push_back(std::move(workingLine));
    }
    return lines;
}

bool AtlasBuilder::isCellMonotone(SDL_Surface* surface, const SDL_Rect& cell, int tolerance) {
    if (!surface) {
        return true;
    }

    SurfacePtr converted = makeSurfacePtr();
    SDL_Surface* pixels = surface;
    if (surface->format != SDL_PIXELFORMAT_RGBA32) {
        converted.reset(SDL_ConvertSurface(surface, SDL_PIXELFORMAT_RGBA32));
        if (!converted) {
            ATLAS_WARN(std::format("Monotone check conversion failed: {}", SDL_GetError()));
            return false;
        }
        pixels = converted.get();
    }

    SDL_Rect bounds{0, 0, pixels->w, pixels->h};
    SDL_Rect area;
    if (!SDL_GetRectIntersection(&cell, &bounds, &area)) {
        return true;
    }

    if (SDL_MUSTLOCK(pixels) && !SDL_LockSurface(pixels)) {
        return false;
    }

    bool haveReference = false;
    bool monotone = true;
    int ref[3] = {0, 0, 0};
    const auto* base = static_cast<const uint8_t*>(pixels->pixels);
    for (int y = area.y; y < area.y + area.h && monotone; ++y) {
        const uint8_t* row = base + static_cast<size_t>(y) * static_cast<size_t>(pixels->pitch);
        for (int x = area.x; x < area.x + area.w; ++x) {
            const uint8_t* px = row + static_cast<size_t>(x) * 4;
            if (px[3] == 0) {
                continue;
            }
            if (!haveReference) {
                ref[0] = px[0];
                ref[1] = px[1];
                ref[2] = px[2];
                haveReference = true;
                continue;
            }
            if (std::abs(px[0] - ref[0]) > tolerance || std::abs(px[1] - ref[1]) > tolerance ||
                std::abs(px[2] - ref[2]) > tolerance) {
                monotone = false;
                break;
            }
        }
    }

    if (SDL_MUSTLOCK(pixels)) {
        SDL_UnlockSurface(pixels);
    }
    return monotone;
}

bool AtlasBuilder::build(const AtlasSettings& settings, AtlasSet& out) {
    TTFSession ttf;
    AtlasSet result;
    if (!buildGlyphAtlas(settings, result.glyphs) ||
        !buildSentenceAtlas(settings, result.sentences)) {
        return false;
    }
    if (!ttf.ok()) {
        ATLAS_WARN("Atlases built without text rendering; cells are transparent");
    }

    ATLAS_INFO(std::format("Built atlases: {} glyphs ({}x{}), {} sentences ({}x{})",
                           result.glyphs.count, result.glyphs.columns, result.glyphs.rows,
                           result.sentences.count, result.sentences.columns,
                           result.sentences.rows));
    out = std::move(result);
    return true;
}

bool AtlasBuilder::buildGlyphAtlas(const AtlasSettings& settings, AtlasImage& out) {
    std::vector<std::string> glyphs = settings.glyphs;
    if (glyphs.empty()) {
        glyphs.push_back(DEFAULT_GLYPH);
    }

    const int cellSize = settings.glyphCellSize;
    out = createAtlasImage(static_cast<uint32_t>(glyphs.size()), cellSize);
    if (!out.surface) {
        return false;
    }

    const float pointSize = std::floor(cellSize * GLYPH_FONT_SCALE);
    FontPtr font = openFont(settings.glyphFont, glyphFontCandidates(), pointSize);
    if (!font) {
        return true;
    }
    const int ascent = TTF_GetFontAscent(font.get());
    const SDL_Color white{255, 255, 255, 255};

    for (uint32_t i = 0; i < out.count; ++i) {
        const std::string& glyph = glyphs[i];
        SurfacePtr rendered(TTF_RenderText_Blended(font.get(), glyph.c_str(), 0, white),
                            SDL_DestroySurface);
        SDL_Rect cell = out.cellRect(i);
        if (!rendered) {
            ATLAS_WARN(std::format("Failed to render glyph '{}': {}", glyph, SDL_GetError()));
            continue;
        }

        // Ink center inside the rendered surface
        float inkX = rendered->w * 0.5f;
        float inkY = rendered->h * 0.5f;
        int minx = 0, maxx = 0, miny = 0, maxy = 0, advance = 0;
        if (auto codepoint = singleCodepoint(glyph);
            codepoint && TTF_GetGlyphMetrics(font.get(), *codepoint, &minx, &maxx, &miny, &maxy,
                                             &advance) && maxx > minx && maxy > miny) {
            inkX = (minx + maxx) * 0.5f;
            inkY = ascent - (miny + maxy) * 0.5f;
        }

        int x = cell.x + static_cast<int>(std::lround(cellSize * 0.5f - inkX));
        int y = cell.y + static_cast<int>(std::lround(cellSize * 0.5f - inkY));
        if (!blitIntoCell(rendered.get(), out.surface.get(), cell, x, y)) {
            return false;
        }
        out.monotone[i] = isCellMonotone(out.surface.get(), cell) ? 1 : 0;
    }
    return true;
}

bool AtlasBuilder::buildSentenceAtlas(const AtlasSettings& settings, AtlasImage& out) {
    const int cellSize = settings.sentenceCellSize;
    out = createAtlasImage(static_cast<uint32_t>(settings.sentences.size()), cellSize);
    if (!out.surface) {
        return false;
    }
    if (out.count == 0) {
        return true;
    }

    const float fontSize = std::floor(cellSize * SENTENCE_FONT_SCALE);
    FontPtr font = openFont(settings.sentenceFont, sentenceFontCandidates(), fontSize);
    if (!font) {
        return true;
    }

    const int maxWidth = static_cast<int>(cellSize * SENTENCE_WRAP_RATIO);
    const float lineHeight = fontSize * SENTENCE_LINE_SPACING;
    const SDL_Color white{255, 255, 255, 255};
    TTF_Font* ttf = font.get();
    auto measure = [ttf](const std::string& line) {
        int width = 0;
        if (!TTF_GetStringSize(ttf, line.c_str(), 0, &width, nullptr)) {
            return 0;
        }
        return width;
    };

    for (uint32_t i = 0; i < out.count; ++i) {
        SDL_Rect cell = out.cellRect(i);
        std::vector<std::string> lines = wrapWords(settings.sentences[i], maxWidth, measure);
        const float blockHeight = static_cast<float>(lines.size()) * lineHeight;
        const float top = cell.y + (cellSize - blockHeight) * 0.5f;

        for (size_t line = 0; line < lines.size(); ++line) {
            SurfacePtr rendered(TTF_RenderText_Blended(ttf, lines[line].c_str(), 0, white),
                                SDL_DestroySurface);
            if (!rendered) {
                ATLAS_WARN(std::format("Failed to render sentence line: {}", SDL_GetError()));
                continue;
            }
            // Center each line inside its slot
            float slotCenter = top + (static_cast<float>(line) + 0.5f) * lineHeight;
            int x = cell.x + (cellSize - rendered->w) / 2;
            int y = static_cast<int>(std::lround(slotCenter - rendered->h * 0.5f));
            if (!blitIntoCell(rendered.get(), out.surface.get(), cell, x, y)) {
                return false;
            }
        }
        // Rendered white so every banner is tinted per flake
        out.monotone[i] = 1;
    }
    return true;
}

} // namespace Snowfall
