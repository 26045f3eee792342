/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef RESOURCEPATH_HPP
#define RESOURCEPATH_HPP

#include <string>
#include <vector>

namespace Snowfall {

/**
 * ResourcePath - locates shaders, fonts and the default config.
 *
 * Search roots, highest priority first:
 * - directories added with addSearchPath() (e.g. the config file's folder)
 * - macOS bundle Contents/Resources, or the project root when the
 *   executable lives in bin/debug | bin/release
 * - the executable directory
 *
 * Usage:
 *   ResourcePath::init();
 *   std::string spv = ResourcePath::resolve("res/shaders/snow.vert.spv");
 */
class ResourcePath {
public:
    static void init();

    // Absolute path of the first match, or relativePath unchanged if none
    static std::string resolve(const std::string& relativePath);
    static bool exists(const std::string& relativePath);

    static void addSearchPath(const std::string& path, int priority = 0);
    static std::string getBasePath();
    static bool isInitialized() { return s_initialized; }

private:
    struct SearchPath {
        std::string path;
        int priority;
    };

    static std::vector<SearchPath> s_searchPaths;
    static bool s_initialized;
};

} // namespace Snowfall

#endif // RESOURCEPATH_HPP
