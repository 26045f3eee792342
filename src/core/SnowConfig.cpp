/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/SnowConfig.hpp"
#include "core/Logger.hpp"
#include "utils/ColorUtils.hpp"
#include "utils/JsonReader.hpp"
#include <algorithm>
#include <format>

namespace Snowfall {

namespace {

constexpr int MAX_GIF_COUNT = 160;
constexpr float MIN_GUST_FREQUENCY = 0.1f;

template <typename T>
void mergeField(std::optional<T>& into, const std::optional<T>& from) {
    if (from) {
        into = from;
    }
}

template <typename T>
void applyField(T& into, const std::optional<T>& from) {
    if (from) {
        into = *from;
    }
}

class PatchReader {
public:
    explicit PatchReader(const JsonValue& root) : m_root(root) {}

    void number(const char* key, std::optional<float>& out) {
        const JsonValue& value = m_root[key];
        if (value.isNull()) return;
        if (auto num = value.tryAsNumber()) {
            out = static_cast<float>(*num);
        } else {
            typeMismatch(key, "number");
        }
    }

    void integer(const char* key, std::optional<int>& out) {
        const JsonValue& value = m_root[key];
        if (value.isNull()) return;
        if (auto num = value.tryAsInt()) {
            out = *num;
        } else {
            typeMismatch(key, "integer");
        }
    }

    void boolean(const char* key, std::optional<bool>& out) {
        const JsonValue& value = m_root[key];
        if (value.isNull()) return;
        if (auto flag = value.tryAsBool()) {
            out = *flag;
        } else {
            typeMismatch(key, "boolean");
        }
    }

    void string(const char* key, std::optional<std::string>& out) {
        const JsonValue& value = m_root[key];
        if (value.isNull()) return;
        if (auto text = value.tryAsString()) {
            out = std::move(*text);
        } else {
            typeMismatch(key, "string");
        }
    }

    void stringList(const char* key, std::optional<std::vector<std::string>>& out) {
        const JsonValue& value = m_root[key];
        if (value.isNull()) return;
        const JsonArray* array = value.tryAsArray();
        if (!array) {
            typeMismatch(key, "array of strings");
            return;
        }
        std::vector<std::string> items;
        items.reserve(array->size());
        for (const auto& item : *array) {
            if (auto text = item.tryAsString()) {
                items.push_back(std::move(*text));
            } else {
                CONFIG_WARN(std::format("Skipping non-string entry in '{}'", key));
            }
        }
        out = std::move(items);
    }

private:
    void typeMismatch(const char* key, const char* expected) {
        CONFIG_WARN(std::format("'{}' should be a {}, ignoring", key, expected));
    }

    const JsonValue& m_root;
};

const std::vector<std::string>& knownKeys() {
    static const std::vector<std::string> keys = {
        "snowmax", "sinkspeed", "snowminsize", "snowmaxsize", "snowcolor",
        "snowletters", "snowsentences", "sentenceCount", "gifUrls", "gifCount",
        "mouseRadius", "mouseForce", "mouseImpulseStrength", "mouseDragThreshold",
        "mouseDragStrength", "enableCollisions", "collisionDamping",
        "collisionCheckRadius", "windEnabled", "windDirection", "windStrength",
        "windGustFrequency", "glyphFont", "sentenceFont", "backgroundColor",
        "forceSoftware"};
    return keys;
}

void clampMin(const char* name, float& value, float minimum) {
    if (value < minimum) {
        CONFIG_WARN(std::format("{} = {} below {}, clamping", name, value, minimum));
        value = minimum;
    }
}

void clampMin(const char* name, int& value, int minimum) {
    if (value < minimum) {
        CONFIG_WARN(std::format("{} = {} below {}, clamping", name, value, minimum));
        value = minimum;
    }
}

} // namespace

std::optional<WindDirection> windDirectionFromString(std::string_view name) {
    if (name == "left") return WindDirection::Left;
    if (name == "right") return WindDirection::Right;
    if (name == "random") return WindDirection::Random;
    return std::nullopt;
}

const char* windDirectionToString(WindDirection direction) {
    switch (direction) {
        case WindDirection::Left: return "left";
        case WindDirection::Right: return "right";
        case WindDirection::Random: return "random";
    }
    return "left";
}

bool SnowConfigPatch::empty() const {
    return !snowmax && !sinkspeed && !snowminsize && !snowmaxsize && !snowcolor &&
           !snowletters && !snowsentences && !sentenceCount && !gifUrls &&
           !gifCount && !mouseRadius && !mouseForce && !mouseImpulseStrength &&
           !mouseDragThreshold && !mouseDragStrength && !enableCollisions &&
           !collisionDamping && !collisionCheckRadius && !windEnabled &&
           !windDirection && !windStrength && !windGustFrequency && !glyphFont &&
           !sentenceFont && !backgroundColor && !forceSoftware;
}

bool SnowConfigPatch::touchesAtlas() const {
    return snowletters || snowsentences || sentenceCount || glyphFont || sentenceFont;
}

bool SnowConfigPatch::touchesPopulation() const {
    return touchesAtlas() || snowmax || sinkspeed || snowminsize || snowmaxsize ||
           snowcolor;
}

bool SnowConfigPatch::touchesImageLayer() const {
    return gifUrls || gifCount;
}

void SnowConfigPatch::merge(const SnowConfigPatch& other) {
    mergeField(snowmax, other.snowmax);
    mergeField(sinkspeed, other.sinkspeed);
    mergeField(snowminsize, other.snowminsize);
    mergeField(snowmaxsize, other.snowmaxsize);
    mergeField(snowcolor, other.snowcolor);
    mergeField(snowletters, other.snowletters);
    mergeField(snowsentences, other.snowsentences);
    mergeField(sentenceCount, other.sentenceCount);
    mergeField(gifUrls, other.gifUrls);
    mergeField(gifCount, other.gifCount);
    mergeField(mouseRadius, other.mouseRadius);
    mergeField(mouseForce, other.mouseForce);
    mergeField(mouseImpulseStrength, other.mouseImpulseStrength);
    mergeField(mouseDragThreshold, other.mouseDragThreshold);
    mergeField(mouseDragStrength, other.mouseDragStrength);
    mergeField(enableCollisions, other.enableCollisions);
    mergeField(collisionDamping, other.collisionDamping);
    mergeField(collisionCheckRadius, other.collisionCheckRadius);
    mergeField(windEnabled, other.windEnabled);
    mergeField(windDirection, other.windDirection);
    mergeField(windStrength, other.windStrength);
    mergeField(windGustFrequency, other.windGustFrequency);
    mergeField(glyphFont, other.glyphFont);
    mergeField(sentenceFont, other.sentenceFont);
    mergeField(backgroundColor, other.backgroundColor);
    mergeField(forceSoftware, other.forceSoftware);
}

std::optional<SnowConfigPatch> parseConfigPatch(const JsonValue& root) {
    const JsonObject* object = root.tryAsObject();
    if (!object) {
        CONFIG_ERROR("Configuration root is not a JSON object");
        return std::nullopt;
    }

    for (const auto& [key, value] : *object) {
        const auto& keys = knownKeys();
        if (std::find(keys.begin(), keys.end(), key) == keys.end()) {
            CONFIG_WARN(std::format("Unknown configuration key '{}'", key));
        }
    }

    SnowConfigPatch patch;
    PatchReader reader(root);
    reader.integer("snowmax", patch.snowmax);
    reader.number("sinkspeed", patch.sinkspeed);
    reader.number("snowminsize", patch.snowminsize);
    reader.number("snowmaxsize", patch.snowmaxsize);
    reader.stringList("snowcolor", patch.snowcolor);
    reader.stringList("snowletters", patch.snowletters);
    reader.stringList("snowsentences", patch.snowsentences);
    reader.integer("sentenceCount", patch.sentenceCount);
    reader.stringList("gifUrls", patch.gifUrls);
    reader.integer("gifCount", patch.gifCount);
    reader.number("mouseRadius", patch.mouseRadius);
    reader.number("mouseForce", patch.mouseForce);
    reader.number("mouseImpulseStrength", patch.mouseImpulseStrength);
    reader.number("mouseDragThreshold", patch.mouseDragThreshold);
    reader.number("mouseDragStrength", patch.mouseDragStrength);
    reader.boolean("enableCollisions", patch.enableCollisions);
    reader.number("collisionDamping", patch.collisionDamping);
    reader.number("collisionCheckRadius", patch.collisionCheckRadius);
    reader.boolean("windEnabled", patch.windEnabled);
    reader.number("windStrength", patch.windStrength);
    reader.number("windGustFrequency", patch.windGustFrequency);
    reader.string("glyphFont", patch.glyphFont);
    reader.string("sentenceFont", patch.sentenceFont);
    reader.string("backgroundColor", patch.backgroundColor);
    reader.boolean("forceSoftware", patch.forceSoftware);

    std::optional<std::string> direction;
    reader.string("windDirection", direction);
    if (direction) {
        patch.windDirection = windDirectionFromString(*direction);
        if (!patch.windDirection) {
            CONFIG_WARN(std::format("Unknown windDirection '{}', expected left/right/random",
                                    *direction));
        }
    }

    return patch;
}

std::optional<SnowConfigPatch> loadConfigFile(const std::string& path) {
    JsonReader reader;
    if (!reader.loadFromFile(path)) {
        CONFIG_ERROR(std::format("Failed to load configuration {}: {}", path,
                                 reader.getLastError()));
        return std::nullopt;
    }
    CONFIG_INFO(std::format("Loaded configuration from {}", path));
    return parseConfigPatch(reader.getRoot());
}

void applyPatch(SnowConfig& config, const SnowConfigPatch& patch) {
    applyField(config.snowmax, patch.snowmax);
    applyField(config.sinkspeed, patch.sinkspeed);
    applyField(config.snowminsize, patch.snowminsize);
    applyField(config.snowmaxsize, patch.snowmaxsize);
    applyField(config.snowcolor, patch.snowcolor);
    applyField(config.snowletters, patch.snowletters);
    applyField(config.snowsentences, patch.snowsentences);
    applyField(config.sentenceCount, patch.sentenceCount);
    applyField(config.gifUrls, patch.gifUrls);
    applyField(config.gifCount, patch.gifCount);
    applyField(config.mouseRadius, patch.mouseRadius);
    applyField(config.mouseForce, patch.mouseForce);
    applyField(config.mouseImpulseStrength, patch.mouseImpulseStrength);
    applyField(config.mouseDragThreshold, patch.mouseDragThreshold);
    applyField(config.mouseDragStrength, patch.mouseDragStrength);
    applyField(config.enableCollisions, patch.enableCollisions);
    applyField(config.collisionDamping, patch.collisionDamping);
    applyField(config.collisionCheckRadius, patch.collisionCheckRadius);
    applyField(config.windEnabled, patch.windEnabled);
    applyField(config.windDirection, patch.windDirection);
    applyField(config.windStrength, patch.windStrength);
    applyField(config.windGustFrequency, patch.windGustFrequency);
    applyField(config.glyphFont, patch.glyphFont);
    applyField(config.sentenceFont, patch.sentenceFont);
    applyField(config.backgroundColor, patch.backgroundColor);
    applyField(config.forceSoftware, patch.forceSoftware);
}

void sanitize(SnowConfig& config) {
    clampMin("snowmax", config.snowmax, 1);
    clampMin("sinkspeed", config.sinkspeed, 0.0f);
    clampMin("snowminsize", config.snowminsize, 1.0f);
    clampMin("snowmaxsize", config.snowmaxsize, config.snowminsize);
    clampMin("sentenceCount", config.sentenceCount, 0);

    if (config.gifCount < 0 || config.gifCount > MAX_GIF_COUNT) {
        CONFIG_WARN(std::format("gifCount = {} outside [0, {}], clamping",
                                config.gifCount, MAX_GIF_COUNT));
        config.gifCount = std::clamp(config.gifCount, 0, MAX_GIF_COUNT);
    }

    clampMin("mouseRadius", config.mouseRadius, 1.0f);
    clampMin("mouseForce", config.mouseForce, 0.0f);
    clampMin("mouseImpulseStrength", config.mouseImpulseStrength, 0.0f);
    clampMin("mouseDragThreshold", config.mouseDragThreshold, 0.0f);
    clampMin("mouseDragStrength", config.mouseDragStrength, 0.0f);
    clampMin("collisionCheckRadius", config.collisionCheckRadius, 1.0f);
    if (config.collisionDamping < 0.0f || config.collisionDamping > 1.0f) {
        CONFIG_WARN(std::format("collisionDamping = {} outside [0, 1], clamping",
                                config.collisionDamping));
        config.collisionDamping = std::clamp(config.collisionDamping, 0.0f, 1.0f);
    }
    clampMin("windStrength", config.windStrength, 0.0f);
    clampMin("windGustFrequency", config.windGustFrequency, MIN_GUST_FREQUENCY);

    if (config.snowcolor.empty()) {
        config.snowcolor.push_back("#ffffff");
    }
    for (auto& color : config.snowcolor) {
        if (!ColorUtils::parseCssColor(color)) {
            CONFIG_WARN(std::format("Invalid snow color '{}', using white", color));
            color = "#ffffff";
        }
    }

    auto isBlank = [](const std::string& text) { return text.empty(); };
    std::erase_if(config.snowletters, isBlank);
    std::erase_if(config.snowsentences, isBlank);
    std::erase_if(config.gifUrls, isBlank);
}

} // namespace Snowfall
