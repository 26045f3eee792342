/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "utils/ResourcePath.hpp"
#include "core/Logger.hpp"
#include <SDL3/SDL.h>
#include <algorithm>
#include <filesystem>
#include <format>

namespace Snowfall {

namespace fs = std::filesystem;

std::vector<ResourcePath::SearchPath> ResourcePath::s_searchPaths;
bool ResourcePath::s_initialized = false;

void ResourcePath::init() {
    if (s_initialized) {
        return;
    }

    // SDL3 owns the returned string
    const char* sdlBase = SDL_GetBasePath();
    fs::path exeDir = (sdlBase && sdlBase[0] != '\0') ? fs::path(sdlBase)
                                                      : fs::current_path();
    addSearchPath(exeDir.string(), 0);

    std::string generic = exeDir.generic_string();
    if (generic.find(".app/Contents") != std::string::npos) {
        fs::path contents = exeDir;
        while (!contents.empty() && contents.filename() != "Contents") {
            contents = contents.parent_path();
        }
        if (!contents.empty()) {
            addSearchPath((contents / "Resources").string(), 10);
            RESOURCEPATH_INFO("Running from macOS app bundle");
        }
    } else if (generic.find("/bin/debug") != std::string::npos ||
               generic.find("/bin/release") != std::string::npos) {
        // bin/<config>/ -> project root holds res/
        fs::path root = exeDir.lexically_normal();
        if (!root.has_filename()) {
            root = root.parent_path();
        }
        addSearchPath(root.parent_path().parent_path().string(), 10);
    }

    s_initialized = true;
    RESOURCEPATH_INFO(std::format("Base path = {}", getBasePath()));
}

std::string ResourcePath::resolve(const std::string& relativePath) {
    if (fs::path(relativePath).is_absolute()) {
        return relativePath;
    }

    std::error_code ec;
    for (const auto& searchPath : s_searchPaths) {
        fs::path fullPath = fs::path(searchPath.path) / relativePath;
        if (fs::exists(fullPath, ec)) {
            return fullPath.string();
        }
    }

    if (s_initialized) {
        RESOURCEPATH_WARN(std::format("Resource not found in search paths: {}",
                                      relativePath));
    }
    return relativePath;
}

bool ResourcePath::exists(const std::string& relativePath) {
    std::error_code ec;
    return fs::exists(resolve(relativePath), ec);
}

void ResourcePath::addSearchPath(const std::string& path, int priority) {
    auto it = std::find_if(s_searchPaths.begin(), s_searchPaths.end(),
        [&path](const SearchPath& sp) { return sp.path == path; });

    if (it != s_searchPaths.end()) {
        it->priority = priority;
    } else {
        s_searchPaths.push_back({path, priority});
    }

    std::stable_sort(s_searchPaths.begin(), s_searchPaths.end(),
        [](const SearchPath& a, const SearchPath& b) {
            return a.priority > b.priority;
        });
}

std::string ResourcePath::getBasePath() {
    return s_searchPaths.empty() ? std::string() : s_searchPaths.front().path;
}

} // namespace Snowfall
