/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef IMAGE_FLAKE_LAYER_HPP
#define IMAGE_FLAKE_LAYER_HPP

#include "graphics/AtlasBuilder.hpp"
#include "physics/CollisionBody.hpp"
#include "physics/FlakeSpawner.hpp"
#include "physics/Integrator.hpp"
#include "physics/Particle.hpp"
#include <cstdint>
#include <functional>
#include <future>
#include <string>
#include <vector>

namespace Snowfall {

class CollisionResolver;
class PointerForce;
class WindForce;

/**
 * @brief Second flake population drawn from image files.
 *
 * Images decode on a background task so the glyph animation starts at once;
 * files that fail to load are replaced with a 1x1 transparent placeholder.
 * Every frame the layer runs the shared force and collision model and
 * collides against the primary flakes, which it sees as immovable bodies.
 * The layer owns CPU surfaces only; backends turn them into textures and
 * watch getImageGeneration() for changes.
 */
class ImageFlakeLayer {
public:
    static constexpr int MAX_FLAKES = 160;
    static constexpr float OPACITY = 0.9f;

    struct Settings {
        std::vector<std::string> imagePaths;
        int count{0};
        float sinkspeed{0.4f};
        float minSize{15.0f};
        float maxSize{40.0f};
    };

    ImageFlakeLayer();
    ~ImageFlakeLayer();

    ImageFlakeLayer(const ImageFlakeLayer&) = delete;
    ImageFlakeLayer& operator=(const ImageFlakeLayer&) = delete;

    /**
     * @brief Apply settings; a changed path list starts a new decode task.
     * Running layers respawn their flakes.
     */
    void configure(const Settings& settings);

    void start(float viewportWidth, float viewportHeight);

    /**
     * @brief Drop flakes, surfaces and any pending decode result.
     */
    void stop();

    /**
     * @brief Pick up a finished decode task without blocking.
     * @return true if the image set changed this call
     */
    bool pollLoads();

    /**
     * @brief One frame of motion. Grabbing is disabled for image flakes.
     * @param primary Glyph flakes, read only, merged as immovable bodies
     */
    void step(float deltaTime, float viewportWidth, float viewportHeight,
              PointerForce& pointer, const WindForce& wind,
              const CollisionResolver& resolver, const std::vector<Particle>& primary);

    const std::vector<Particle>& getFlakes() const { return m_flakes; }
    const std::vector<SurfacePtr>& getImages() const { return m_images; }
    uint64_t getImageGeneration() const { return m_imageGeneration; }
    bool isRunning() const { return m_running; }
    bool isLoading() const { return m_pending.valid(); }
    // Decode tasks replaced by a newer path list that have not finished yet
    size_t getSupersededLoadCount() const { return m_superseded.size(); }

    using ImageLoader = std::function<std::vector<SurfacePtr>(const std::vector<std::string>&)>;
    // Replaces loadImages() for subsequent decode tasks
    void setImageLoader(ImageLoader loader) { m_loader = std::move(loader); }

    // Transparent 1x1 stand-in for images that fail to decode
    static SurfacePtr createPlaceholder();

    // Decodes every path; never throws, failures become placeholders
    static std::vector<SurfacePtr> loadImages(const std::vector<std::string>& paths);

private:
    void respawn(float viewportWidth, float viewportHeight);
    void dropFinishedSuperseded();

    Settings m_settings;
    FlakeSpawner m_spawner;
    Integrator m_integrator;
    std::vector<Particle> m_flakes;
    std::vector<SurfacePtr> m_images;
    CollisionBodies m_primaryBodies; // reused every frame
    std::future<std::vector<SurfacePtr>> m_pending;
    // Destroying an unfinished async future blocks, so old tasks park here
    std::vector<std::future<std::vector<SurfacePtr>>> m_superseded;
    ImageLoader m_loader{&ImageFlakeLayer::loadImages};
    uint64_t m_imageGeneration{0};
    float m_viewportWidth{0.0f};
    float m_viewportHeight{0.0f};
    bool m_running{false};
};

} // namespace Snowfall

#endif // IMAGE_FLAKE_LAYER_HPP
