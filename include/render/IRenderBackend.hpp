/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef I_RENDER_BACKEND_HPP
#define I_RENDER_BACKEND_HPP

#include <cstdint>
#include <ostream>

namespace Snowfall {

struct SnowConfigPatch;
class ImageFlakeLayer;

// Uninitialized -> init() -> Ready -> start() -> Running <-> Paused; stop() -> Uninitialized
enum class BackendState : uint8_t { Uninitialized, Ready, Running, Paused };

inline std::ostream& operator<<(std::ostream& os, BackendState state) {
    switch (state) {
    case BackendState::Uninitialized: return os << "Uninitialized";
    case BackendState::Ready: return os << "Ready";
    case BackendState::Running: return os << "Running";
    case BackendState::Paused: return os << "Paused";
    }
    return os << "Unknown";
}

/**
 * @brief Contract shared by the GPU and software snow renderers.
 *
 * init() never throws: on failure every partial resource is released and
 * false is returned so the caller can fall back to the other backend.
 */
class IRenderBackend {
public:
    virtual ~IRenderBackend() = default;

    virtual bool init() = 0;
    virtual void start() = 0;
    virtual void pause() = 0;
    virtual void resume() = 0;
    virtual void stop() = 0;

    /**
     * @brief Simulate and draw one frame.
     * @param timestampSeconds Monotonic host clock
     */
    virtual void frame(double timestampSeconds) = 0;

    virtual void updateMousePosition(float x, float y, float vx, float vy) = 0;
    virtual void onMouseDown(float x, float y, int button) = 0;
    virtual void onMouseUp(int button) = 0;
    virtual void onMouseLeave() = 0;

    // Queued; applied at the start of the next frame
    virtual void updateConfig(const SnowConfigPatch& patch) = 0;

    virtual void setDarkTheme(bool dark) = 0;
    virtual void attachImageLayer(ImageFlakeLayer* layer) = 0;

    virtual BackendState getState() const = 0;
    virtual const char* getName() const = 0;
};

} // namespace Snowfall

#endif // I_RENDER_BACKEND_HPP
