/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/SnowApplication.hpp"
#include "core/Logger.hpp"
#include "utils/ResourcePath.hpp"
#include <algorithm>
#include <format>

namespace Snowfall {

namespace {

constexpr int FALLBACK_WIDTH = 1280;
constexpr int FALLBACK_HEIGHT = 720;
constexpr float MIN_MOTION_INTERVAL = 0.001f;  // seconds

} // anonymous namespace

SnowApplication::~SnowApplication() {
    clean();
}

bool SnowApplication::init(const std::string& title, const std::string& configPath) {
    m_configPath = configPath;

    if (!SDL_Init(SDL_INIT_VIDEO | SDL_INIT_EVENTS)) {
        SNOWFALL_CRITICAL(std::format("SDL Video initialization failed: {}", SDL_GetError()));
        return false;
    }
    m_sdlInitialized = true;

    ResourcePath::init();

    SDL_Rect bounds{0, 0, FALLBACK_WIDTH, FALLBACK_HEIGHT};
    const SDL_DisplayID display = SDL_GetPrimaryDisplay();
    if (display == 0 || !SDL_GetDisplayUsableBounds(display, &bounds)) {
        SNOWFALL_WARN(std::format("Display bounds unavailable, using {}x{}: {}",
                                  FALLBACK_WIDTH, FALLBACK_HEIGHT, SDL_GetError()));
    }

    const SDL_WindowFlags flags = SDL_WINDOW_TRANSPARENT | SDL_WINDOW_BORDERLESS |
                                  SDL_WINDOW_HIGH_PIXEL_DENSITY | SDL_WINDOW_ALWAYS_ON_TOP |
                                  SDL_WINDOW_RESIZABLE;
    mp_window.reset(SDL_CreateWindow(title.c_str(), bounds.w, bounds.h, flags));
    if (!mp_window) {
        SNOWFALL_CRITICAL(std::format("Window creation failed: {}", SDL_GetError()));
        return false;
    }
    SDL_SetWindowPosition(mp_window.get(), bounds.x, bounds.y);

    SnowConfig config;
    if (!loadConfig(config)) {
        SNOWFALL_WARN("Using default snow configuration");
        config = SnowConfig{};
    }

    mp_session = std::make_unique<SnowSession>(mp_window.get());
    mp_session->setDarkTheme(SDL_GetSystemTheme() == SDL_SYSTEM_THEME_DARK);
    if (!mp_session->start(config)) {
        SNOWFALL_CRITICAL("No render backend could be started");
        return false;
    }

    SNOWFALL_INFO(std::format("{} running on the {} backend", title, mp_session->getBackendName()));
    m_running = true;
    return true;
}

bool SnowApplication::loadConfig(SnowConfig& out) const {
    if (m_configPath.empty()) {
        return false;
    }
    auto patch = loadConfigFile(ResourcePath::resolve(m_configPath));
    if (!patch) {
        return false;
    }
    out = SnowConfig{};
    applyPatch(out, *patch);
    sanitize(out);
    return true;
}

void SnowApplication::reloadConfig() {
    if (!mp_session) {
        return;
    }
    auto patch = loadConfigFile(ResourcePath::resolve(m_configPath));
    if (!patch) {
        SNOWFALL_WARN(std::format("Reload of {} failed, keeping current settings", m_configPath));
        return;
    }
    SNOWFALL_INFO(std::format("Reloaded {}", m_configPath));
    mp_session->updateConfig(*patch);
}

void SnowApplication::run() {
    while (m_running) {
        handleEvents();
        if (!m_running) {
            break;
        }
        // Presentation is VSync paced by either backend
        mp_session->frame();
    }
}

int SnowApplication::toPointerButton(Uint8 sdlButton) {
    switch (sdlButton) {
        case SDL_BUTTON_LEFT:
            return POINTER_BUTTON_LEFT;
        case SDL_BUTTON_RIGHT:
            return POINTER_BUTTON_RIGHT;
        default:
            return -1;
    }
}

void SnowApplication::onMouseMotion(const SDL_MouseMotionEvent& event) {
    float seconds = MIN_MOTION_INTERVAL;
    if (m_lastMotionTimestamp != 0 && event.timestamp > m_lastMotionTimestamp) {
        seconds = std::max(MIN_MOTION_INTERVAL,
                           static_cast<float>(event.timestamp - m_lastMotionTimestamp) / 1e9f);
    }
    m_lastMotionTimestamp = event.timestamp;
    mp_session->updateMousePosition(event.x, event.y, event.xrel / seconds, event.yrel / seconds);
}

void SnowApplication::onKeyDown(const SDL_KeyboardEvent& event) {
    if (event.repeat) {
        return;
    }
    switch (event.key) {
        case SDLK_ESCAPE:
            setRunning(false);
            break;
        case SDLK_SPACE:
            if (mp_session->isPaused()) {
                mp_session->resume();
            } else {
                mp_session->pause();
            }
            break;
        case SDLK_F2: {
            SnowConfigPatch patch;
            patch.forceSoftware = !mp_session->getConfig().forceSoftware;
            mp_session->updateConfig(patch);
            break;
        }
        case SDLK_F5:
            reloadConfig();
            break;
        default:
            break;
    }
}

void SnowApplication::onWindowEvent(const SDL_Event& event) {
    switch (event.type) {
        case SDL_EVENT_WINDOW_MINIMIZED:
        case SDL_EVENT_WINDOW_HIDDEN:
            mp_session->pause();
            break;
        case SDL_EVENT_WINDOW_RESTORED:
        case SDL_EVENT_WINDOW_SHOWN:
            mp_session->resume();
            break;
        case SDL_EVENT_WINDOW_MOUSE_LEAVE:
            m_lastMotionTimestamp = 0;
            mp_session->onMouseLeave();
            break;
        default:
            break;
    }
}

void SnowApplication::handleEvents() {
    SDL_Event event;
    while (SDL_PollEvent(&event)) {
        switch (event.type) {
            case SDL_EVENT_QUIT:
            case SDL_EVENT_WINDOW_CLOSE_REQUESTED:
                SNOWFALL_INFO("Shutting down");
                setRunning(false);
                break;

            case SDL_EVENT_KEY_DOWN:
                onKeyDown(event.key);
                break;
            case SDL_EVENT_MOUSE_MOTION:
                onMouseMotion(event.motion);
                break;
            case SDL_EVENT_MOUSE_BUTTON_DOWN: {
                const int button = toPointerButton(event.button.button);
                if (button >= 0) {
                    mp_session->onMouseDown(event.button.x, event.button.y, button);
                }
                break;
            }
            case SDL_EVENT_MOUSE_BUTTON_UP: {
                const int button = toPointerButton(event.button.button);
                if (button >= 0) {
                    mp_session->onMouseUp(button);
                }
                break;
            }

            case SDL_EVENT_WINDOW_MINIMIZED:
            case SDL_EVENT_WINDOW_HIDDEN:
            case SDL_EVENT_WINDOW_RESTORED:
            case SDL_EVENT_WINDOW_SHOWN:
            case SDL_EVENT_WINDOW_MOUSE_LEAVE:
                onWindowEvent(event);
                break;

            case SDL_EVENT_SYSTEM_THEME_CHANGED:
                mp_session->setDarkTheme(SDL_GetSystemTheme() == SDL_SYSTEM_THEME_DARK);
                break;

            default:
                break;
        }
    }
}

void SnowApplication::clean() {
    if (mp_session) {
        mp_session->stop();
        mp_session.reset();
    }
    mp_window.reset();
    if (m_sdlInitialized) {
        SDL_Quit();
        m_sdlInitialized = false;
    }
    m_running = false;
}

} // namespace Snowfall
