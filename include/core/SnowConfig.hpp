/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SNOW_CONFIG_HPP
#define SNOW_CONFIG_HPP

#include "physics/WindForce.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Snowfall {

class JsonValue;

std::optional<WindDirection> windDirectionFromString(std::string_view name);
const char* windDirectionToString(WindDirection direction);

/**
 * @brief Complete snowfall configuration with defaults.
 *
 * Key names mirror the JSON file (res/config/snowfall.json). Values are
 * trusted only after sanitize().
 */
struct SnowConfig {
    // Population
    int snowmax{80};
    float sinkspeed{0.4f};
    float snowminsize{15.0f};
    float snowmaxsize{40.0f};
    std::vector<std::string> snowcolor{"#ffffff"};
    std::vector<std::string> snowletters{"\xE2\x9D\x84"}; // U+2744 snowflake
    std::vector<std::string> snowsentences;
    int sentenceCount{0};

    // Image layer
    std::vector<std::string> gifUrls;
    int gifCount{0};

    // Pointer
    float mouseRadius{100.0f};
    float mouseForce{300.0f};
    float mouseImpulseStrength{0.5f};
    float mouseDragThreshold{500.0f};
    float mouseDragStrength{0.8f};

    // Collisions
    bool enableCollisions{true};
    float collisionDamping{0.7f};
    float collisionCheckRadius{200.0f};

    // Wind
    bool windEnabled{false};
    WindDirection windDirection{WindDirection::Left};
    float windStrength{0.5f};
    float windGustFrequency{3.0f};

    // Host
    std::string glyphFont;
    std::string sentenceFont;
    std::string backgroundColor;
    bool forceSoftware{false};
};

/**
 * @brief Partial configuration update; unset fields keep their value.
 */
struct SnowConfigPatch {
    std::optional<int> snowmax;
    std::optional<float> sinkspeed;
    std::optional<float> snowminsize;
    std::optional<float> snowmaxsize;
    std::optional<std::vector<std::string>> snowcolor;
    std::optional<std::vector<std::string>> snowletters;
    std::optional<std::vector<std::string>> snowsentences;
    std::optional<int> sentenceCount;

    std::optional<std::vector<std::string>> gifUrls;
    std::optional<int> gifCount;

    std::optional<float> mouseRadius;
    std::optional<float> mouseForce;
    std::optional<float> mouseImpulseStrength;
    std::optional<float> mouseDragThreshold;
    std::optional<float> mouseDragStrength;

    std::optional<bool> enableCollisions;
    std::optional<float> collisionDamping;
    std::optional<float> collisionCheckRadius;

    std::optional<bool> windEnabled;
    std::optional<WindDirection> windDirection;
    std::optional<float> windStrength;
    std::optional<float> windGustFrequency;

    std::optional<std::string> glyphFont;
    std::optional<std::string> sentenceFont;
    std::optional<std::string> backgroundColor;
    std::optional<bool> forceSoftware;

    bool empty() const;
    // Glyphs, sentences or fonts changed: atlases must be rebuilt
    bool touchesAtlas() const;
    // Count, size, speed or colors changed: flakes must be respawned
    bool touchesPopulation() const;
    bool touchesImageLayer() const;

    // Later values win
    void merge(const SnowConfigPatch& other);
};

/**
 * @brief Extract a patch from a JSON object.
 *
 * Unknown keys and values of the wrong type are skipped with a warning.
 * @return nullopt if root is not an object
 */
std::optional<SnowConfigPatch> parseConfigPatch(const JsonValue& root);

/**
 * @brief Read and parse a JSON configuration file.
 * @return nullopt on I/O or syntax errors (logged)
 */
std::optional<SnowConfigPatch> loadConfigFile(const std::string& path);

void applyPatch(SnowConfig& config, const SnowConfigPatch& patch);

// Clamp out-of-range values in place, logging each correction
void sanitize(SnowConfig& config);

} // namespace Snowfall

#endif // SNOW_CONFIG_HPP
