/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <atomic> // IWYU pragma: keep - benchmark mode flag
#include <cstdint> // IWYU pragma: keep - uint8_t level type
#include <cstdio> // IWYU pragma: keep - printf/fflush
#include <mutex> // IWYU pragma: keep - serialized output
#include <string> // IWYU pragma: keep - std::string messages in macros

namespace Snowfall {

enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs
  ERROR_LEVEL = 1,  // Logs in every build (file sink in release)
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only
};

class Logger {
public:
  static void SetBenchmarkMode(bool enabled) {
    s_benchmarkMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsBenchmarkMode() {
    return s_benchmarkMode.load(std::memory_order_relaxed);
  }

  static void Log(LogLevel level, const char *system,
                  const std::string &message) {
    Log(level, system, message.c_str());
  }

  static void Log(LogLevel level, const char *system, const char *message) {
    if (s_benchmarkMode.load(std::memory_order_relaxed)) {
      return;
    }

    std::lock_guard<std::mutex> lock(s_logMutex);
#ifdef DEBUG
    printf("Snowfall - [%s] %s: %s\n", system, getLevelString(level), message);
    fflush(stdout);
#else
    // Release builds keep the console quiet and persist errors for bug reports
    WriteToFile(getLevelString(level), system, message);
#endif
  }

  static const char *getLevelString(LogLevel level) {
    switch (level) {
    case LogLevel::CRITICAL:
      return "CRITICAL";
    case LogLevel::ERROR_LEVEL:
      return "ERROR";
    case LogLevel::WARNING:
      return "WARNING";
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::DEBUG_LEVEL:
      return "DEBUG";
    default:
      return "UNKNOWN";
    }
  }

private:
#ifndef DEBUG
  // Defined in Logger.cpp; caller holds s_logMutex.
  static void WriteToFile(const char *level, const char *system,
                          const char *message);
#endif

  static std::atomic<bool> s_benchmarkMode;
  static std::mutex s_logMutex;
};

inline std::atomic<bool> Logger::s_benchmarkMode{false};
inline std::mutex Logger::s_logMutex{};

#define SNOWFALL_LOG(level, system, msg)                                       \
  Snowfall::Logger::Log(Snowfall::LogLevel::level, system, msg)

#define SNOWFALL_LOG_CRITICAL(system, msg) SNOWFALL_LOG(CRITICAL, system, msg)
#define SNOWFALL_LOG_ERROR(system, msg) SNOWFALL_LOG(ERROR_LEVEL, system, msg)

#ifdef DEBUG
#define SNOWFALL_LOG_WARN(system, msg) SNOWFALL_LOG(WARNING, system, msg)
#define SNOWFALL_LOG_INFO(system, msg) SNOWFALL_LOG(INFO, system, msg)
#define SNOWFALL_LOG_DEBUG(system, msg) SNOWFALL_LOG(DEBUG_LEVEL, system, msg)
#else
#define SNOWFALL_LOG_WARN(system, msg) ((void)0)  // Zero overhead
#define SNOWFALL_LOG_INFO(system, msg) ((void)0)  // Zero overhead
#define SNOWFALL_LOG_DEBUG(system, msg) ((void)0) // Zero overhead
#endif

// Application / host
#define SNOWFALL_CRITICAL(msg) SNOWFALL_LOG_CRITICAL("Snowfall", msg)
#define SNOWFALL_ERROR(msg) SNOWFALL_LOG_ERROR("Snowfall", msg)
#define SNOWFALL_WARN(msg) SNOWFALL_LOG_WARN("Snowfall", msg)
#define SNOWFALL_INFO(msg) SNOWFALL_LOG_INFO("Snowfall", msg)
#define SNOWFALL_DEBUG(msg) SNOWFALL_LOG_DEBUG("Snowfall", msg)

#define SESSION_CRITICAL(msg) SNOWFALL_LOG_CRITICAL("SnowSession", msg)
#define SESSION_ERROR(msg) SNOWFALL_LOG_ERROR("SnowSession", msg)
#define SESSION_WARN(msg) SNOWFALL_LOG_WARN("SnowSession", msg)
#define SESSION_INFO(msg) SNOWFALL_LOG_INFO("SnowSession", msg)
#define SESSION_DEBUG(msg) SNOWFALL_LOG_DEBUG("SnowSession", msg)

#define CONFIG_ERROR(msg) SNOWFALL_LOG_ERROR("SnowConfig", msg)
#define CONFIG_WARN(msg) SNOWFALL_LOG_WARN("SnowConfig", msg)
#define CONFIG_INFO(msg) SNOWFALL_LOG_INFO("SnowConfig", msg)
#define CONFIG_DEBUG(msg) SNOWFALL_LOG_DEBUG("SnowConfig", msg)

#define RESOURCEPATH_ERROR(msg) SNOWFALL_LOG_ERROR("ResourcePath", msg)
#define RESOURCEPATH_WARN(msg) SNOWFALL_LOG_WARN("ResourcePath", msg)
#define RESOURCEPATH_INFO(msg) SNOWFALL_LOG_INFO("ResourcePath", msg)

// Rendering
#define GPU_CRITICAL(msg) SNOWFALL_LOG_CRITICAL("GPU", msg)
#define GPU_ERROR(msg) SNOWFALL_LOG_ERROR("GPU", msg)
#define GPU_WARN(msg) SNOWFALL_LOG_WARN("GPU", msg)
#define GPU_INFO(msg) SNOWFALL_LOG_INFO("GPU", msg)
#define GPU_DEBUG(msg) SNOWFALL_LOG_DEBUG("GPU", msg)

#define RENDER_CRITICAL(msg) SNOWFALL_LOG_CRITICAL("RenderBackend", msg)
#define RENDER_ERROR(msg) SNOWFALL_LOG_ERROR("RenderBackend", msg)
#define RENDER_WARN(msg) SNOWFALL_LOG_WARN("RenderBackend", msg)
#define RENDER_INFO(msg) SNOWFALL_LOG_INFO("RenderBackend", msg)
#define RENDER_DEBUG(msg) SNOWFALL_LOG_DEBUG("RenderBackend", msg)

#define ATLAS_ERROR(msg) SNOWFALL_LOG_ERROR("AtlasBuilder", msg)
#define ATLAS_WARN(msg) SNOWFALL_LOG_WARN("AtlasBuilder", msg)
#define ATLAS_INFO(msg) SNOWFALL_LOG_INFO("AtlasBuilder", msg)
#define ATLAS_DEBUG(msg) SNOWFALL_LOG_DEBUG("AtlasBuilder", msg)

// Simulation
#define FORCE_WARN(msg) SNOWFALL_LOG_WARN("ForceModel", msg)
#define FORCE_INFO(msg) SNOWFALL_LOG_INFO("ForceModel", msg)
#define FORCE_DEBUG(msg) SNOWFALL_LOG_DEBUG("ForceModel", msg)

#define COLLISION_WARN(msg) SNOWFALL_LOG_WARN("CollisionResolver", msg)
#define COLLISION_INFO(msg) SNOWFALL_LOG_INFO("CollisionResolver", msg)
#define COLLISION_DEBUG(msg) SNOWFALL_LOG_DEBUG("CollisionResolver", msg)

#define INTEGRATOR_INFO(msg) SNOWFALL_LOG_INFO("Integrator", msg)
#define INTEGRATOR_DEBUG(msg) SNOWFALL_LOG_DEBUG("Integrator", msg)

#define LAYER_ERROR(msg) SNOWFALL_LOG_ERROR("ImageFlakeLayer", msg)
#define LAYER_WARN(msg) SNOWFALL_LOG_WARN("ImageFlakeLayer", msg)
#define LAYER_INFO(msg) SNOWFALL_LOG_INFO("ImageFlakeLayer", msg)
#define LAYER_DEBUG(msg) SNOWFALL_LOG_DEBUG("ImageFlakeLayer", msg)

// Benchmark mode convenience macros
#define SNOWFALL_ENABLE_BENCHMARK_MODE() Snowfall::Logger::SetBenchmarkMode(true)
#define SNOWFALL_DISABLE_BENCHMARK_MODE()                                      \
  Snowfall::Logger::SetBenchmarkMode(false)

} // namespace Snowfall

#endif // LOGGER_HPP
