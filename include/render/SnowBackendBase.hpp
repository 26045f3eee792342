/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SNOW_BACKEND_BASE_HPP
#define SNOW_BACKEND_BASE_HPP

#include "core/SnowConfig.hpp"
#include "graphics/AtlasBuilder.hpp"
#include "layer/ImageFlakeLayer.hpp"
#include "physics/CollisionResolver.hpp"
#include "physics/FlakeSpawner.hpp"
#include "physics/Integrator.hpp"
#include "physics/Particle.hpp"
#include "physics/PointerForce.hpp"
#include "physics/WindForce.hpp"
#include "render/GlowModel.hpp"
#include "render/IRenderBackend.hpp"
#include <optional>
#include <vector>

struct SDL_Window;

namespace Snowfall {

/**
 * @brief Simulation, lifecycle and configuration handling shared by both
 * renderers. Subclasses only create/release their drawing resources and
 * draw the current particle state.
 *
 * Frame order: pending config patch, viewport query, pointer rest check,
 * wind update, primary step, image layer step, pointer burst timer, render.
 */
class SnowBackendBase : public IRenderBackend {
public:
    SnowBackendBase(SDL_Window* window, const SnowConfig& config);
    ~SnowBackendBase() override = default;

    SnowBackendBase(const SnowBackendBase&) = delete;
    SnowBackendBase& operator=(const SnowBackendBase&) = delete;

    bool init() override;
    void start() override;
    void pause() override;
    void resume() override;
    void stop() override;
    void frame(double timestampSeconds) override;

    void updateMousePosition(float x, float y, float vx, float vy) override;
    void onMouseDown(float x, float y, int button) override;
    void onMouseUp(int button) override;
    void onMouseLeave() override;

    void updateConfig(const SnowConfigPatch& patch) override;
    void setDarkTheme(bool dark) override;
    void attachImageLayer(ImageFlakeLayer* layer) override;

    BackendState getState() const override { return m_state; }

    const std::vector<Particle>& getParticles() const { return m_particles; }
    const SnowConfig& getConfig() const { return m_config; }
    const AtlasSet& getAtlases() const { return m_atlases; }
    const PointerForce& getPointer() const { return m_pointer; }
    const WindForce& getWind() const { return m_wind; }
    const CollisionResolver& getResolver() const { return m_resolver; }
    float getGlowStrength() const { return m_glow.getGlowStrength(); }
    double getSimulationTime() const { return m_time; }
    float getLastDelta() const { return m_lastDelta; }
    bool hasPendingConfig() const { return m_pendingPatch.has_value(); }

    static ImageFlakeLayer::Settings layerSettingsFrom(const SnowConfig& config);

protected:
    // Called by init() after the atlases exist. Must clean up after itself
    // only through releaseResources(), which init() calls on failure.
    virtual bool createResources() = 0;
    virtual void releaseResources() = 0;
    // Atlases were rebuilt from a config change; re-upload them
    virtual void onAtlasesRebuilt() = 0;
    virtual void render() = 0;

    // Logical window size; false while the window has no area
    virtual bool queryViewport(float& width, float& height) const;

    SDL_Window* m_window{nullptr};
    SnowConfig m_config;
    AtlasSet m_atlases;
    std::vector<Particle> m_particles;
    ImageFlakeLayer* m_layer{nullptr};
    GlowModel m_glow;
    double m_time{0.0};
    float m_viewportWidth{0.0f};
    float m_viewportHeight{0.0f};

private:
    void applySettings();
    bool rebuildAtlases();
    void respawn();
    void applyPendingConfig();
    void simulate(float deltaTime);

    BackendState m_state{BackendState::Uninitialized};
    PointerForce m_pointer;
    WindForce m_wind;
    CollisionResolver m_resolver;
    FlakeSpawner m_spawner;
    Integrator m_integrator;

    std::optional<SnowConfigPatch> m_pendingPatch;
    std::optional<double> m_lastTimestamp;
    float m_lastDelta{0.0f};
};

} // namespace Snowfall

#endif // SNOW_BACKEND_BASE_HPP
