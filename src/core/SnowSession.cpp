/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/SnowSession.hpp"
#include "core/Logger.hpp"
#include "render/GPUSnowRenderer.hpp"
#include "render/SoftwareSnowRenderer.hpp"
#include <SDL3/SDL.h>
#include <format>

namespace Snowfall {

SnowSession::SnowSession(SDL_Window* window)
    : mp_window(window)
{
}

SnowSession::~SnowSession() {
    stop();
}

std::unique_ptr<SnowBackendBase> SnowSession::createBackend(bool software) const {
    if (software) {
        return std::make_unique<SoftwareSnowRenderer>(mp_window, m_config);
    }
    return std::make_unique<GPUSnowRenderer>(mp_window, m_config);
}

bool SnowSession::startBackend() {
    const bool wasPaused = isPaused();
    if (m_backend) {
        m_backend->stop();
        m_backend.reset();
    }

    if (!m_config.forceSoftware) {
        auto gpu = createBackend(false);
        gpu->setDarkTheme(m_darkTheme);
        if (gpu->init()) {
            m_backend = std::move(gpu);
            m_usingSoftware = false;
        } else {
            SESSION_WARN("GPU backend unavailable, falling back to software rendering");
        }
    }

    if (!m_backend) {
        auto software = createBackend(true);
        software->setDarkTheme(m_darkTheme);
        if (!software->init()) {
            SESSION_ERROR("Software backend failed to initialize");
            return false;
        }
        m_backend = std::move(software);
        m_usingSoftware = true;
    }

    m_backend->attachImageLayer(&m_layer);
    m_backend->start();
    if (wasPaused) {
        m_backend->pause();
    }
    SESSION_INFO(std::format("Active backend: {}", m_backend->getName()));
    return true;
}

bool SnowSession::start(const SnowConfig& config) {
    if (isActive()) {
        SESSION_INFO("Restarting active session");
        stop();
    }

    m_config = config;
    sanitize(m_config);

    try {
        int w = 0;
        int h = 0;
        if (!mp_window || !SDL_GetWindowSize(mp_window, &w, &h)) {
            SESSION_WARN(std::format("Window size unavailable: {}", SDL_GetError()));
        }
        m_layer.configure(SnowBackendBase::layerSettingsFrom(m_config));
        m_layer.start(static_cast<float>(w > 0 ? w : 1), static_cast<float>(h > 0 ? h : 1));

        if (!startBackend()) {
            m_layer.stop();
            return false;
        }
    } catch (const std::exception& e) {
        SESSION_CRITICAL(std::format("Exception during session start: {}", e.what()));
        if (m_backend) {
            m_backend->stop();
            m_backend.reset();
        }
        m_layer.stop();
        return false;
    }
    return true;
}

void SnowSession::stop() {
    if (m_backend) {
        m_backend->attachImageLayer(nullptr);
        m_backend->stop();
        m_backend.reset();
        SESSION_INFO("Session stopped");
    }
    m_layer.stop();
}

void SnowSession::pause() {
    if (m_backend) {
        m_backend->pause();
    }
}

void SnowSession::resume() {
    if (m_backend) {
        m_backend->resume();
    }
}

bool SnowSession::isPaused() const {
    return m_backend && m_backend->getState() == BackendState::Paused;
}

const char* SnowSession::getBackendName() const {
    return m_backend ? m_backend->getName() : "none";
}

void SnowSession::frame() {
    if (!m_backend) {
        return;
    }
    m_layer.pollLoads();
    m_backend->frame(static_cast<double>(SDL_GetTicksNS()) / 1e9);
}

void SnowSession::updateMousePosition(float x, float y, float vx, float vy) {
    if (m_backend) {
        m_backend->updateMousePosition(x, y, vx, vy);
    }
}

void SnowSession::onMouseDown(float x, float y, int button) {
    if (m_backend) {
        m_backend->onMouseDown(x, y, button);
    }
}

void SnowSession::onMouseUp(int button) {
    if (m_backend) {
        m_backend->onMouseUp(button);
    }
}

void SnowSession::onMouseLeave() {
    if (m_backend) {
        m_backend->onMouseLeave();
    }
}

void SnowSession::updateConfig(const SnowConfigPatch& patch) {
    if (patch.empty()) {
        return;
    }
    const bool wasSoftware = m_config.forceSoftware;
    applyPatch(m_config, patch);
    sanitize(m_config);

    if (!m_backend) {
        return;
    }

    if (m_config.forceSoftware != wasSoftware) {
        SESSION_INFO(std::format("forceSoftware changed to {}, switching backend",
                                 m_config.forceSoftware));
        // The new backend starts from the merged config
        if (patch.touchesImageLayer() || patch.touchesPopulation()) {
            m_layer.configure(SnowBackendBase::layerSettingsFrom(m_config));
        }
        if (!startBackend()) {
            SESSION_ERROR("Backend switch failed, session stopped");
            m_layer.stop();
        }
        return;
    }
    m_backend->updateConfig(patch);
}

void SnowSession::setDarkTheme(bool dark) {
    m_darkTheme = dark;
    if (m_backend) {
        m_backend->setDarkTheme(dark);
    }
}

} // namespace Snowfall
