/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE ImageFlakeLayerTests
#include <boost/test/unit_test.hpp>

#include "layer/ImageFlakeLayer.hpp"
#include "physics/CollisionResolver.hpp"
#include "physics/PointerForce.hpp"
#include "physics/WindForce.hpp"
#include <SDL3/SDL.h>
#include <chrono>
#include <filesystem>
#include <future>
#include <thread>

using namespace Snowfall;

namespace {

constexpr float VIEW_W = 800.0f;
constexpr float VIEW_H = 600.0f;

// Waits for the background decode to finish and picks it up
bool waitForImages(ImageFlakeLayer& layer) {
    for (int i = 0; i < 1000; ++i) {
        if (layer.pollLoads()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return false;
}

std::string writeTestBitmap(int width, int height) {
    const auto path = std::filesystem::temp_directory_path() / "snowfall_layer_test.bmp";
    SurfacePtr surface = makeSurfacePtr(SDL_CreateSurface(width, height, SDL_PIXELFORMAT_RGBA32));
    if (!surface) {
        return {};
    }
    SDL_FillSurfaceRect(surface.get(), nullptr, 0xFFFFFFFF);
    if (!SDL_SaveBMP(surface.get(), path.string().c_str())) {
        return {};
    }
    return path.string();
}

// Holds a decode task until opened; always opens on scope exit
struct DecodeGate {
    DecodeGate() : opened(promise.get_future().share()) {}
    ~DecodeGate() { open(); }

    void open() {
        if (!m_isOpen) {
            promise.set_value();
            m_isOpen = true;
        }
    }

    std::promise<void> promise;
    std::shared_future<void> opened;

private:
    bool m_isOpen{false};
};

ImageFlakeLayer::Settings layerSettings(std::vector<std::string> paths, int count) {
    ImageFlakeLayer::Settings settings;
    settings.imagePaths = std::move(paths);
    settings.count = count;
    return settings;
}

} // namespace

BOOST_AUTO_TEST_SUITE(ImageLoadingTests)

BOOST_AUTO_TEST_CASE(PlaceholderIsTransparentPixel) {
    SurfacePtr placeholder = ImageFlakeLayer::createPlaceholder();
    BOOST_REQUIRE(placeholder);
    BOOST_CHECK_EQUAL(placeholder->w, 1);
    BOOST_CHECK_EQUAL(placeholder->h, 1);
    const auto* pixel = static_cast<const uint8_t*>(placeholder->pixels);
    BOOST_CHECK_EQUAL(pixel[3], 0);
}

BOOST_AUTO_TEST_CASE(MissingFilesBecomePlaceholders) {
    auto images = ImageFlakeLayer::loadImages({"no/such/flake.png", "also/missing.gif"});
    BOOST_REQUIRE_EQUAL(images.size(), 2u);
    for (const auto& image : images) {
        BOOST_REQUIRE(image);
        BOOST_CHECK_EQUAL(image->w, 1);
    }
}

BOOST_AUTO_TEST_CASE(RealImageDecodes) {
    const std::string path = writeTestBitmap(6, 4);
    BOOST_REQUIRE(!path.empty());

    auto images = ImageFlakeLayer::loadImages({path, "missing.png"});
    BOOST_REQUIRE_EQUAL(images.size(), 2u);
    BOOST_CHECK_EQUAL(images[0]->w, 6);
    BOOST_CHECK_EQUAL(images[0]->h, 4);
    BOOST_CHECK_EQUAL(images[1]->w, 1);

    std::error_code ec;
    std::filesystem::remove(path, ec);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(LayerLifecycleTests)

BOOST_AUTO_TEST_CASE(EmptyPathListSpawnsNothing) {
    ImageFlakeLayer layer;
    layer.configure(layerSettings({}, 20));
    layer.start(VIEW_W, VIEW_H);

    BOOST_CHECK(layer.isRunning());
    BOOST_CHECK(layer.getFlakes().empty());
    BOOST_CHECK(!layer.isLoading());
}

BOOST_AUTO_TEST_CASE(FlakesCycleThroughImages) {
    ImageFlakeLayer layer;
    layer.configure(layerSettings({"a.png", "b.png", "c.png"}, 7));
    layer.start(VIEW_W, VIEW_H);

    const auto& flakes = layer.getFlakes();
    BOOST_REQUIRE_EQUAL(flakes.size(), 7u);
    for (size_t i = 0; i < flakes.size(); ++i) {
        BOOST_CHECK_EQUAL(flakes[i].glyphIndex, i % 3);
        BOOST_CHECK_LT(flakes[i].rest.getY(), 0.0f);
        BOOST_CHECK_GE(flakes[i].size, 15.0f);
        BOOST_CHECK_LE(flakes[i].size, 40.0f);
    }
    layer.stop();
}

BOOST_AUTO_TEST_CASE(CountIsCapped) {
    ImageFlakeLayer layer;
    layer.configure(layerSettings({"a.png"}, 10000));
    layer.start(VIEW_W, VIEW_H);
    BOOST_CHECK_EQUAL(layer.getFlakes().size(), static_cast<size_t>(ImageFlakeLayer::MAX_FLAKES));
    layer.stop();
}

BOOST_AUTO_TEST_CASE(DecodeResultBumpsGeneration) {
    ImageFlakeLayer layer;
    const uint64_t initial = layer.getImageGeneration();

    layer.configure(layerSettings({"missing.png"}, 2));
    BOOST_CHECK_GT(layer.getImageGeneration(), initial);
    const uint64_t afterConfigure = layer.getImageGeneration();

    BOOST_REQUIRE(waitForImages(layer));
    BOOST_CHECK_GT(layer.getImageGeneration(), afterConfigure);
    BOOST_REQUIRE_EQUAL(layer.getImages().size(), 1u);
    BOOST_CHECK(!layer.isLoading());

    // Nothing new to pick up
    BOOST_CHECK(!layer.pollLoads());
}

BOOST_AUTO_TEST_CASE(SamePathsDoNotReload) {
    ImageFlakeLayer layer;
    layer.configure(layerSettings({"missing.png"}, 2));
    BOOST_REQUIRE(waitForImages(layer));
    const uint64_t generation = layer.getImageGeneration();

    layer.configure(layerSettings({"missing.png"}, 4));
    BOOST_CHECK(!layer.isLoading());
    BOOST_CHECK_EQUAL(layer.getImageGeneration(), generation);
}

BOOST_AUTO_TEST_CASE(PathChangeDuringDecodeDoesNotWait) {
    ImageFlakeLayer layer;
    DecodeGate gate;
    std::shared_future<void> opened = gate.opened;
    layer.setImageLoader([opened](const std::vector<std::string>& paths) {
        if (paths.size() == 3) {
            opened.wait();
        }
        return ImageFlakeLayer::loadImages(paths);
    });

    layer.configure(layerSettings({"a.png", "b.png", "c.png"}, 4));
    BOOST_REQUIRE(layer.isLoading());

    // First decode is still held; the new list starts without waiting for it
    layer.configure(layerSettings({"missing.png"}, 4));
    BOOST_CHECK_EQUAL(layer.getSupersededLoadCount(), 1u);
    BOOST_REQUIRE(waitForImages(layer));
    BOOST_CHECK_EQUAL(layer.getImages().size(), 1u);
    BOOST_CHECK_EQUAL(layer.getSupersededLoadCount(), 1u);

    gate.open();
    for (int i = 0; i < 1000 && layer.getSupersededLoadCount() > 0; ++i) {
        layer.pollLoads();
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    BOOST_CHECK_EQUAL(layer.getSupersededLoadCount(), 0u);
    // The stale result is discarded
    BOOST_CHECK_EQUAL(layer.getImages().size(), 1u);
}

BOOST_AUTO_TEST_CASE(StopClearsEverything) {
    ImageFlakeLayer layer;
    layer.configure(layerSettings({"missing.png"}, 3));
    layer.start(VIEW_W, VIEW_H);
    layer.stop();

    BOOST_CHECK(!layer.isRunning());
    BOOST_CHECK(layer.getFlakes().empty());
    BOOST_CHECK(layer.getImages().empty());
    BOOST_CHECK(!layer.isLoading());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(LayerMotionTests)

BOOST_AUTO_TEST_CASE(PointerNeverGrabsImageFlakes) {
    ImageFlakeLayer layer;
    layer.configure(layerSettings({"missing.png"}, 1));
    layer.start(VIEW_W, VIEW_H);
    BOOST_REQUIRE_EQUAL(layer.getFlakes().size(), 1u);

    const Vector2D start = layer.getFlakes()[0].rest;

    PointerForce pointer;
    // Hold the left button right on top of the flake
    pointer.updatePosition(start.getX(), start.getY(), 0.0f, 0.0f);
    pointer.onMouseDown(start.getX(), start.getY(), POINTER_BUTTON_LEFT);
    WindForce wind;
    CollisionResolver resolver;
    std::vector<Particle> primary;

    layer.step(0.1f, VIEW_W, VIEW_H, pointer, wind, resolver, primary);

    BOOST_CHECK(!layer.getFlakes()[0].isGrabbed);
    layer.stop();
}

BOOST_AUTO_TEST_CASE(StoppedLayerDoesNotMove) {
    ImageFlakeLayer layer;
    layer.configure(layerSettings({"missing.png"}, 1));

    PointerForce pointer;
    WindForce wind;
    CollisionResolver resolver;
    std::vector<Particle> primary;
    layer.step(0.1f, VIEW_W, VIEW_H, pointer, wind, resolver, primary);
    BOOST_CHECK(layer.getFlakes().empty());
    layer.stop();
}

BOOST_AUTO_TEST_CASE(PrimaryFlakesPushImageFlakes) {
    ImageFlakeLayer layer;
    layer.configure(layerSettings({"missing.png"}, 1));
    layer.start(VIEW_W, VIEW_H);
    const Particle& flake = layer.getFlakes()[0];

    // Immovable glyph flake overlapping the image flake from the left
    Particle blocker;
    blocker.rest = Vector2D(flake.rest.getX() - 2.0f, flake.rest.getY());
    blocker.collisionSize = 40.0f;
    std::vector<Particle> primary{blocker};

    PointerForce pointer;
    WindForce wind;
    CollisionSettings settings;
    settings.enabled = true;
    CollisionResolver resolver(settings);

    const float beforeX = flake.rest.getX();
    layer.step(0.016f, VIEW_W, VIEW_H, pointer, wind, resolver, primary);
    BOOST_CHECK_GT(layer.getFlakes()[0].rest.getX(), beforeX);
    BOOST_CHECK_EQUAL(primary[0].rest.getX(), blocker.rest.getX());
    layer.stop();
}

BOOST_AUTO_TEST_SUITE_END()
