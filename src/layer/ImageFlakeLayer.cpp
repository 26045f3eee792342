/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "layer/ImageFlakeLayer.hpp"
#include "core/Logger.hpp"
#include "physics/PhysicsConstants.hpp"
#include "utils/ResourcePath.hpp"
#include <SDL3_image/SDL_image.h>
#include <algorithm>
#include <chrono>
#include <exception>
#include <format>

namespace Snowfall {

ImageFlakeLayer::ImageFlakeLayer()
    : m_integrator(m_spawner, SwingSettings{PhysicsConstants::IMAGE_SWING_AMPLITUDE,
                                            PhysicsConstants::IMAGE_SWING_PHASE_SCALE}) {}

ImageFlakeLayer::~ImageFlakeLayer() {
    stop();
}

void ImageFlakeLayer::configure(const Settings& settings) {
    const bool pathsChanged = settings.imagePaths != m_settings.imagePaths;

    m_settings = settings;
    m_settings.count = std::clamp(m_settings.count, 0, MAX_FLAKES);
    m_settings.maxSize = std::max(m_settings.maxSize, m_settings.minSize);

    SpawnSettings spawn;
    spawn.count = std::max(1, m_settings.count);
    spawn.sinkspeed = m_settings.sinkspeed;
    spawn.minSize = m_settings.minSize;
    spawn.maxSize = m_settings.maxSize;
    m_spawner.configure(spawn);

    if (pathsChanged) {
        m_images.clear();
        ++m_imageGeneration;
        if (m_pending.valid()) {
            m_superseded.push_back(std::move(m_pending));
            LAYER_DEBUG(std::format("Image list changed mid-decode, {} stale tasks outstanding",
                                    m_superseded.size()));
        }
        if (!m_settings.imagePaths.empty()) {
            LAYER_INFO(std::format("Decoding {} images in background", m_settings.imagePaths.size()));
            m_pending = std::async(std::launch::async, m_loader, m_settings.imagePaths);
        }
    }

    if (m_running) {
        respawn(m_viewportWidth, m_viewportHeight);
    }
}

void ImageFlakeLayer::start(float viewportWidth, float viewportHeight) {
    m_running = true;
    respawn(viewportWidth, viewportHeight);
}

void ImageFlakeLayer::stop() {
    // Decoding is bounded by the file list; wait so no task outlives us
    if (m_pending.valid()) {
        m_pending.wait();
        m_pending = {};
    }
    m_superseded.clear();
    m_flakes.clear();
    m_primaryBodies.clear();
    if (!m_images.empty()) {
        m_images.clear();
        ++m_imageGeneration;
    }
    m_settings.imagePaths.clear();
    m_running = false;
}

void ImageFlakeLayer::respawn(float viewportWidth, float viewportHeight) {
    m_viewportWidth = viewportWidth;
    m_viewportHeight = viewportHeight;
    m_flakes.clear();

    if (m_settings.count == 0 || m_settings.imagePaths.empty()) {
        return;
    }

    const auto imageCount = static_cast<uint32_t>(m_settings.imagePaths.size());
    m_flakes.reserve(static_cast<size_t>(m_settings.count));
    for (int i = 0; i < m_settings.count; ++i) {
        m_flakes.push_back(m_spawner.spawnImageFlake(static_cast<uint32_t>(i) % imageCount,
                                                     viewportWidth, viewportHeight));
    }
    LAYER_INFO(std::format("Spawned {} image flakes over {} images", m_flakes.size(), imageCount));
}

void ImageFlakeLayer::dropFinishedSuperseded() {
    std::erase_if(m_superseded, [](const auto& task) {
        return task.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    });
}

bool ImageFlakeLayer::pollLoads() {
    dropFinishedSuperseded();
    if (!m_pending.valid() ||
        m_pending.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
        return false;
    }

    try {
        m_images = m_pending.get();
    } catch (const std::exception& e) {
        LAYER_ERROR(std::format("Image decode task failed: {}", e.what()));
        m_images.clear();
        for (size_t i = 0; i < m_settings.imagePaths.size(); ++i) {
            m_images.push_back(createPlaceholder());
        }
    }
    ++m_imageGeneration;
    return true;
}

void ImageFlakeLayer::step(float deltaTime, float viewportWidth, float viewportHeight,
                           PointerForce& pointer, const WindForce& wind,
                           const CollisionResolver& resolver,
                           const std::vector<Particle>& primary) {
    m_viewportWidth = viewportWidth;
    m_viewportHeight = viewportHeight;
    if (!m_running || m_flakes.empty()) {
        return;
    }

    Integrator::exportBodies(primary, m_primaryBodies);

    StepContext context;
    context.deltaTime = deltaTime;
    context.viewportWidth = viewportWidth;
    context.viewportHeight = viewportHeight;
    context.pointer = &pointer;
    context.allowGrab = false;
    context.wind = &wind;
    context.resolver = &resolver;
    context.extraBodies = &m_primaryBodies;
    m_integrator.step(m_flakes, context);
}

SurfacePtr ImageFlakeLayer::createPlaceholder() {
    SurfacePtr surface = makeSurfacePtr(SDL_CreateSurface(1, 1, SDL_PIXELFORMAT_RGBA32));
    if (surface) {
        SDL_FillSurfaceRect(surface.get(), nullptr, 0);
    }
    return surface;
}

std::vector<SurfacePtr> ImageFlakeLayer::loadImages(const std::vector<std::string>& paths) {
    std::vector<SurfacePtr> images;
    images.reserve(paths.size());
    for (const auto& path : paths) {
        const std::string resolved = ResourcePath::resolve(path);
        SurfacePtr surface = makeSurfacePtr(IMG_Load(resolved.c_str()));
        if (!surface) {
            LAYER_WARN(std::format("Failed to load image '{}': {}, using placeholder",
                                   resolved, SDL_GetError()));
            surface = createPlaceholder();
        }
        images.push_back(std::move(surface));
    }
    return images;
}

} // namespace Snowfall
