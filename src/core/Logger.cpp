/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

// Release builds only; debug builds log to stdout from the header
#ifndef DEBUG

#include "core/Logger.hpp"

#include <SDL3/SDL.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

#ifndef SNOWFALL_APP_NAME
#define SNOWFALL_APP_NAME "Snowfall"
#endif

namespace Snowfall {
namespace {

constexpr size_t MAX_KEPT_LOGS = 5;
constexpr size_t FLUSH_INTERVAL = 50;

std::tm localTime(std::chrono::system_clock::time_point when) {
  auto t = std::chrono::system_clock::to_time_t(when);
  std::tm timeinfo{};
#ifdef _WIN32
  localtime_s(&timeinfo, &t);
#else
  localtime_r(&t, &timeinfo);
#endif
  return timeinfo;
}

class LogFile {
public:
  static LogFile &Instance() {
    static LogFile instance;
    return instance;
  }

  void append(const char *level, const char *system, const char *message) {
    if (!m_opened) {
      open();
    }
    if (!m_stream.is_open()) {
      return;
    }

    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  now.time_since_epoch()) % 1000;
    std::tm timeinfo = localTime(now);

    m_stream << std::put_time(&timeinfo, "%Y-%m-%d %H:%M:%S") << '.'
             << std::setfill('0') << std::setw(3) << ms.count() << " ["
             << level << "] [" << system << "] " << message << '\n';

    if (std::strcmp(level, "CRITICAL") == 0 || ++m_pending >= FLUSH_INTERVAL) {
      m_stream.flush();
      m_pending = 0;
    }
  }

private:
  LogFile() = default;
  ~LogFile() {
    if (m_stream.is_open()) {
      m_stream.flush();
    }
  }

  LogFile(const LogFile &) = delete;
  LogFile &operator=(const LogFile &) = delete;

  void open() {
    namespace fs = std::filesystem;
    m_opened = true;

    char *prefPath = SDL_GetPrefPath("HammerForged", SNOWFALL_APP_NAME);
    if (!prefPath) {
      return;
    }
    fs::path logDir = fs::path(prefPath) / "logs";
    SDL_free(prefPath);

    std::error_code ec;
    fs::create_directories(logDir, ec);
    if (ec) {
      return;
    }
    pruneOldLogs(logDir);

    std::tm timeinfo = localTime(std::chrono::system_clock::now());
    std::ostringstream name;
    name << "snowfall_" << std::put_time(&timeinfo, "%Y%m%d_%H%M%S") << ".log";

    m_stream.open(logDir / name.str(), std::ios::out | std::ios::app);
    if (m_stream.is_open()) {
      m_stream << "=== " << SNOWFALL_APP_NAME << " Log ===\n"
               << "Started: " << std::put_time(&timeinfo, "%Y-%m-%d %H:%M:%S")
               << "\n\n";
      m_stream.flush();
    }
  }

  static void pruneOldLogs(const std::filesystem::path &logDir) {
    namespace fs = std::filesystem;
    std::vector<fs::directory_entry> logs;
    std::error_code ec;
    for (const auto &entry : fs::directory_iterator(logDir, ec)) {
      if (entry.path().extension() == ".log" &&
          entry.path().filename().string().starts_with("snowfall_")) {
        logs.push_back(entry);
      }
    }
    if (logs.size() < MAX_KEPT_LOGS) {
      return;
    }

    std::sort(logs.begin(), logs.end(),
              [](const fs::directory_entry &a, const fs::directory_entry &b) {
                return a.last_write_time() < b.last_write_time();
              });
    // Leave room for the file about to be created
    size_t excess = logs.size() - MAX_KEPT_LOGS + 1;
    for (size_t i = 0; i < excess; ++i) {
      fs::remove(logs[i].path(), ec);
    }
  }

  std::ofstream m_stream;
  bool m_opened{false};
  size_t m_pending{0};
};

} // anonymous namespace

void Logger::WriteToFile(const char *level, const char *system,
                         const char *message) {
  LogFile::Instance().append(level, system, message);
}

} // namespace Snowfall

#endif // ifndef DEBUG
