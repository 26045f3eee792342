/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "render/SnowBackendBase.hpp"
#include "core/Logger.hpp"
#include "physics/PhysicsConstants.hpp"
#include "utils/ColorUtils.hpp"
#include <SDL3/SDL.h>
#include <algorithm>
#include <exception>
#include <format>

namespace Snowfall {

SnowBackendBase::SnowBackendBase(SDL_Window* window, const SnowConfig& config)
    : m_window(window)
    , m_config(config)
    , m_integrator(m_spawner)
{
}

ImageFlakeLayer::Settings SnowBackendBase::layerSettingsFrom(const SnowConfig& config) {
    ImageFlakeLayer::Settings settings;
    settings.imagePaths = config.gifUrls;
    settings.count = config.gifCount;
    settings.sinkspeed = config.sinkspeed;
    settings.minSize = config.snowminsize;
    settings.maxSize = config.snowmaxsize;
    return settings;
}

bool SnowBackendBase::init() {
    if (m_state != BackendState::Uninitialized) {
        RENDER_WARN(std::format("{}: already initialized", getName()));
        return true;
    }

    try {
        sanitize(m_config);
        applySettings();
        m_glow.setBackgroundColor(m_config.backgroundColor);

        if (!rebuildAtlases()) {
            RENDER_ERROR(std::format("{}: atlas build failed", getName()));
            return false;
        }
        if (!createResources()) {
            RENDER_ERROR(std::format("{}: resource creation failed", getName()));
            releaseResources();
            m_atlases = AtlasSet{};
            return false;
        }
    } catch (const std::exception& e) {
        RENDER_ERROR(std::format("{}: init threw: {}", getName(), e.what()));
        releaseResources();
        m_atlases = AtlasSet{};
        return false;
    }

    if (!queryViewport(m_viewportWidth, m_viewportHeight)) {
        m_viewportWidth = 1.0f;
        m_viewportHeight = 1.0f;
    }
    respawn();

    m_state = BackendState::Ready;
    RENDER_INFO(std::format("{} initialized: {} flakes, {} glyph cells, {} sentence cells",
                            getName(), m_particles.size(), m_atlases.glyphCount(),
                            m_atlases.sentenceCount()));
    return true;
}

void SnowBackendBase::start() {
    if (m_state == BackendState::Uninitialized) {
        RENDER_WARN(std::format("{}: start() before init()", getName()));
        return;
    }
    if (m_state == BackendState::Paused) {
        resume();
        return;
    }
    m_lastTimestamp.reset();
    m_state = BackendState::Running;
}

void SnowBackendBase::pause() {
    if (m_state == BackendState::Running) {
        m_state = BackendState::Paused;
    }
}

void SnowBackendBase::resume() {
    if (m_state != BackendState::Paused) {
        return;
    }
    // Fresh baseline so the pause length never shows up as one huge delta
    m_lastTimestamp.reset();
    m_state = BackendState::Running;
}

void SnowBackendBase::stop() {
    if (m_state == BackendState::Uninitialized) {
        return;
    }
    releaseResources();
    m_particles.clear();
    m_atlases = AtlasSet{};
    m_pendingPatch.reset();
    m_lastTimestamp.reset();
    m_pointer.onMouseLeave();
    m_wind.reset();
    m_state = BackendState::Uninitialized;
    RENDER_INFO(std::format("{} stopped", getName()));
}

void SnowBackendBase::frame(double timestampSeconds) {
    if (m_state != BackendState::Running) {
        return;
    }

    applyPendingConfig();

    float dt = PhysicsConstants::MIN_DELTA;
    if (m_lastTimestamp) {
        dt = std::max(PhysicsConstants::MIN_DELTA,
                      static_cast<float>(timestampSeconds - *m_lastTimestamp));
    }
    m_lastTimestamp = timestampSeconds;
    m_lastDelta = dt;

    if (!queryViewport(m_viewportWidth, m_viewportHeight)) {
        return;
    }

    simulate(dt);
    render();
}

void SnowBackendBase::simulate(float deltaTime) {
    m_pointer.beginFrame();
    m_wind.update(deltaTime);

    StepContext context;
    context.deltaTime = deltaTime;
    context.viewportWidth = m_viewportWidth;
    context.viewportHeight = m_viewportHeight;
    context.pointer = &m_pointer;
    context.allowGrab = true;
    context.wind = &m_wind;
    context.resolver = &m_resolver;
    m_integrator.step(m_particles, context);

    if (m_layer) {
        m_layer->step(deltaTime, m_viewportWidth, m_viewportHeight,
                      m_pointer, m_wind, m_resolver, m_particles);
    }

    m_pointer.advance(deltaTime);
    m_time += deltaTime;
}

void SnowBackendBase::updateMousePosition(float x, float y, float vx, float vy) {
    m_pointer.updatePosition(x, y, vx, vy);
}

void SnowBackendBase::onMouseDown(float x, float y, int button) {
    m_pointer.onMouseDown(x, y, button);
}

void SnowBackendBase::onMouseUp(int button) {
    m_pointer.onMouseUp(button);
}

void SnowBackendBase::onMouseLeave() {
    m_pointer.onMouseLeave();
}

void SnowBackendBase::updateConfig(const SnowConfigPatch& patch) {
    if (patch.empty()) {
        return;
    }
    if (m_pendingPatch) {
        m_pendingPatch->merge(patch);
    } else {
        m_pendingPatch = patch;
    }
}

void SnowBackendBase::setDarkTheme(bool dark) {
    m_glow.setDarkTheme(dark);
    RENDER_DEBUG(std::format("{}: theme {}, glow strength {}", getName(),
                             dark ? "dark" : "light", m_glow.getGlowStrength()));
}

void SnowBackendBase::attachImageLayer(ImageFlakeLayer* layer) {
    m_layer = layer;
}

bool SnowBackendBase::queryViewport(float& width, float& height) const {
    int w = 0;
    int h = 0;
    if (!m_window || !SDL_GetWindowSize(m_window, &w, &h) || w <= 0 || h <= 0) {
        return false;
    }
    width = static_cast<float>(w);
    height = static_cast<float>(h);
    return true;
}

void SnowBackendBase::applySettings() {
    PointerSettings pointer;
    pointer.radius = m_config.mouseRadius;
    pointer.force = m_config.mouseForce;
    pointer.impulseStrength = m_config.mouseImpulseStrength;
    pointer.dragThreshold = m_config.mouseDragThreshold;
    pointer.dragStrength = m_config.mouseDragStrength;
    m_pointer.setSettings(pointer);

    WindSettings wind;
    wind.enabled = m_config.windEnabled;
    wind.direction = m_config.windDirection;
    wind.strength = m_config.windStrength;
    wind.gustFrequency = m_config.windGustFrequency;
    m_wind.setSettings(wind);

    CollisionSettings collision;
    collision.enabled = m_config.enableCollisions;
    collision.checkRadius = m_config.collisionCheckRadius;
    collision.damping = m_config.collisionDamping;
    m_resolver.setSettings(collision);
}

bool SnowBackendBase::rebuildAtlases() {
    AtlasSettings settings;
    settings.glyphs = m_config.snowletters;
    settings.sentences = m_config.snowsentences;
    settings.glyphFont = m_config.glyphFont;
    settings.sentenceFont = m_config.sentenceFont;

    AtlasSet rebuilt;
    AtlasBuilder builder;
    if (!builder.build(settings, rebuilt)) {
        return false;
    }
    m_atlases = std::move(rebuilt);
    return true;
}

void SnowBackendBase::respawn() {
    SpawnSettings spawn;
    spawn.count = m_config.snowmax;
    spawn.sinkspeed = m_config.sinkspeed;
    spawn.minSize = m_config.snowminsize;
    spawn.maxSize = m_config.snowmaxsize;
    spawn.colors.clear();
    for (const auto& css : m_config.snowcolor) {
        spawn.colors.push_back(ColorUtils::parseCssColor(css).value_or(ColorF{}));
    }
    spawn.glyphCount = m_atlases.glyphCount();
    spawn.sentenceCount = m_atlases.sentenceCount();
    spawn.sentenceFlakes = m_atlases.sentenceCount() > 0 ? m_config.sentenceCount : 0;

    m_spawner.configure(spawn);
    m_particles = m_spawner.spawnPopulation(m_viewportWidth, m_viewportHeight);
}

void SnowBackendBase::applyPendingConfig() {
    if (!m_pendingPatch) {
        return;
    }
    SnowConfigPatch patch = std::move(*m_pendingPatch);
    m_pendingPatch.reset();

    applyPatch(m_config, patch);
    sanitize(m_config);
    applySettings();

    if (patch.backgroundColor) {
        m_glow.setBackgroundColor(m_config.backgroundColor);
    }

    if (patch.touchesAtlas()) {
        if (rebuildAtlases()) {
            onAtlasesRebuilt();
        } else {
            RENDER_ERROR(std::format("{}: atlas rebuild failed, keeping previous atlases", getName()));
        }
        respawn();
    } else if (patch.touchesPopulation()) {
        respawn();
    }

    if (m_layer && (patch.touchesImageLayer() || patch.touchesPopulation())) {
        m_layer->configure(layerSettingsFrom(m_config));
    }

    RENDER_DEBUG(std::format("{}: applied configuration update", getName()));
}

} // namespace Snowfall
