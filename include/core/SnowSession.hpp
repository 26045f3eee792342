/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SNOW_SESSION_HPP
#define SNOW_SESSION_HPP

#include "core/SnowConfig.hpp"
#include "layer/ImageFlakeLayer.hpp"
#include "render/SnowBackendBase.hpp"
#include <memory>

struct SDL_Window;

namespace Snowfall {

/**
 * @brief One running overlay: the active render backend plus the image layer.
 *
 * start() tries the GPU backend first and falls back to the software one if
 * it cannot initialize; `forceSoftware` skips the GPU attempt. Changing
 * `forceSoftware` through updateConfig() swaps backends in place.
 * Starting an active session stops it first, so there is never more than one
 * backend bound to the window.
 */
class SnowSession {
public:
    explicit SnowSession(SDL_Window* window);
    ~SnowSession();

    SnowSession(const SnowSession&) = delete;
    SnowSession& operator=(const SnowSession&) = delete;

    bool start(const SnowConfig& config);
    void stop();
    void pause();
    void resume();

    // Poll the layer's decode task and step the active backend
    void frame();

    void updateMousePosition(float x, float y, float vx, float vy);
    void onMouseDown(float x, float y, int button);
    void onMouseUp(int button);
    void onMouseLeave();

    void updateConfig(const SnowConfigPatch& patch);
    void setDarkTheme(bool dark);

    bool isActive() const { return m_backend != nullptr; }
    bool isPaused() const;
    bool isUsingSoftware() const { return m_usingSoftware; }
    const char* getBackendName() const;
    const SnowBackendBase* getBackend() const { return m_backend.get(); }
    const SnowConfig& getConfig() const { return m_config; }
    const ImageFlakeLayer& getImageLayer() const { return m_layer; }

private:
    bool startBackend();
    std::unique_ptr<SnowBackendBase> createBackend(bool software) const;

    SDL_Window* mp_window{nullptr};
    SnowConfig m_config;
    ImageFlakeLayer m_layer;
    std::unique_ptr<SnowBackendBase> m_backend;
    bool m_usingSoftware{false};
    bool m_darkTheme{false};
};

} // namespace Snowfall

#endif // SNOW_SESSION_HPP
