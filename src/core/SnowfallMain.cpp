/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/Logger.hpp"
#include "core/SnowApplication.hpp"
#include <exception>
#include <format>
#include <string>

// Application name goes here.
const std::string APP_NAME{"Snowfall"};
const std::string DEFAULT_CONFIG{"res/config/snowfall.json"};

// Usage: snowfall [config.json]
int main(int argc, char* argv[]) {
  const std::string configPath = argc > 1 ? std::string(argv[1]) : DEFAULT_CONFIG;
  SNOWFALL_INFO(std::format("Initializing {} with {}", APP_NAME, configPath));

  Snowfall::SnowApplication app;

  try {
    if (!app.init(APP_NAME, configPath)) {
      SNOWFALL_CRITICAL(std::format("Init {} Failed", APP_NAME));
      app.clean();
      return -1;
    }

    SNOWFALL_INFO("Starting Main Loop");
    app.run();
  } catch (const std::exception& e) {
    SNOWFALL_CRITICAL(std::format("Unhandled exception: {}", e.what()));
    app.clean();
    return -1;
  }

  SNOWFALL_INFO(std::format("{} shutting down", APP_NAME));
  app.clean();

  return 0;
}
