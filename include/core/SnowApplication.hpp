/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SNOW_APPLICATION_HPP
#define SNOW_APPLICATION_HPP

#include "core/SnowConfig.hpp"
#include "core/SnowSession.hpp"
#include <SDL3/SDL.h>
#include <cstdint>
#include <memory>
#include <string>

namespace Snowfall {

/**
 * @brief Host process: transparent borderless window over the primary
 * display, the SDL event pump and the frame loop driving one SnowSession.
 *
 * Keys: Escape quits, Space pauses/resumes, F2 toggles software rendering,
 * F5 reloads the configuration file.
 */
class SnowApplication {
public:
    SnowApplication() = default;
    ~SnowApplication();

    SnowApplication(const SnowApplication&) = delete;
    SnowApplication& operator=(const SnowApplication&) = delete;

    bool init(const std::string& title, const std::string& configPath);
    void run();
    void clean();

    bool isRunning() const { return m_running; }
    void setRunning(bool running) { m_running = running; }

private:
    bool loadConfig(SnowConfig& out) const;
    void reloadConfig();
    void handleEvents();
    void onKeyDown(const SDL_KeyboardEvent& event);
    void onMouseMotion(const SDL_MouseMotionEvent& event);
    void onWindowEvent(const SDL_Event& event);

    static int toPointerButton(Uint8 sdlButton);

    std::unique_ptr<SDL_Window, decltype(&SDL_DestroyWindow)> mp_window{nullptr, SDL_DestroyWindow};
    std::unique_ptr<SnowSession> mp_session;
    std::string m_configPath;
    uint64_t m_lastMotionTimestamp{0};
    bool m_running{false};
    bool m_sdlInitialized{false};
};

} // namespace Snowfall

#endif // SNOW_APPLICATION_HPP
