/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <atomic> // IWYU pragma: keep - Required for std::atomic<bool> benchmark mode flag
#include <cstdint> // IWYU pragma: keep - Required for uint8_t type
#include <cstdio> // IWYU pragma: keep - Required for printf() and fflush() functions
#include <mutex> // IWYU pragma: keep - Required for thread-safe logging
#include <string> // IWYU pragma: keep - Required for std::string() conversions in macros

namespace JournalEngine {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs
  ERROR_LEVEL = 1,  // Always logs (renamed to avoid macro conflicts)
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only (renamed to avoid macro conflicts)
};

#ifdef DEBUG
// Debug builds print every level to stdout
class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;
  static std::mutex s_logMutex;

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
    printf("Journal Engine - [%s] %s: %s\n", system, getLevelString(level),
           message);
    fflush(stdout);
  }

private:
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
};

#define JOURNAL_CRITICAL(system, msg)                                          \
  JournalEngine::Logger::Log(JournalEngine::LogLevel::CRITICAL, system, msg)
#define JOURNAL_ERROR(system, msg)                                             \
  JournalEngine::Logger::Log(JournalEngine::LogLevel::ERROR_LEVEL, system, msg)
#define JOURNAL_WARN(system, msg)                                              \
  JournalEngine::Logger::Log(JournalEngine::LogLevel::WARNING, system, msg)
#define JOURNAL_INFO(system, msg)                                              \
  JournalEngine::Logger::Log(JournalEngine::LogLevel::INFO, system, msg)
#define JOURNAL_DEBUG(system, msg)                                             \
  JournalEngine::Logger::Log(JournalEngine::LogLevel::DEBUG_LEVEL, system, msg)

#else
// Release builds write CRITICAL and ERROR to a log file (see Logger.cpp)
class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;

public:
  static std::mutex s_logMutex; // Public for macro access

  static void SetBenchmarkMode(bool enabled) {
    s_benchmarkMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsBenchmarkMode() {
    return s_benchmarkMode.load(std::memory_order_relaxed);
  }

  static void Log(const char *level, const char *system,
                  const std::string &message);
  static void Log(const char *level, const char *system, const char *message);
};

#define JOURNAL_CRITICAL(system, msg)                                          \
  JournalEngine::Logger::Log("CRITICAL", system, msg)

#define JOURNAL_ERROR(system, msg)                                             \
  JournalEngine::Logger::Log("ERROR", system, msg)

#define JOURNAL_WARN(system, msg) ((void)0)  // Zero overhead
#define JOURNAL_INFO(system, msg) ((void)0)  // Zero overhead
#define JOURNAL_DEBUG(system, msg) ((void)0) // Zero overhead
#endif

inline std::atomic<bool> Logger::s_benchmarkMode{false};
inline std::mutex Logger::s_logMutex{};

// Convenience macros for each system

#define APP_CRITICAL(msg) JOURNAL_CRITICAL("JournalApp", msg)
#define APP_ERROR(msg) JOURNAL_ERROR("JournalApp", msg)
#define APP_WARN(msg) JOURNAL_WARN("JournalApp", msg)
#define APP_INFO(msg) JOURNAL_INFO("JournalApp", msg)
#define APP_DEBUG(msg) JOURNAL_DEBUG("JournalApp", msg)

#define POOL_CRITICAL(msg) JOURNAL_CRITICAL("ObjectPool", msg)
#define POOL_ERROR(msg) JOURNAL_ERROR("ObjectPool", msg)
#define POOL_WARN(msg) JOURNAL_WARN("ObjectPool", msg)
#define POOL_INFO(msg) JOURNAL_INFO("ObjectPool", msg)
#define POOL_DEBUG(msg) JOURNAL_DEBUG("ObjectPool", msg)

#define SCENE_CRITICAL(msg) JOURNAL_CRITICAL("SceneGraph", msg)
#define SCENE_ERROR(msg) JOURNAL_ERROR("SceneGraph", msg)
#define SCENE_WARN(msg) JOURNAL_WARN("SceneGraph", msg)
#define SCENE_INFO(msg) JOURNAL_INFO("SceneGraph", msg)
#define SCENE_DEBUG(msg) JOURNAL_DEBUG("SceneGraph", msg)

#define SCREEN_CRITICAL(msg) JOURNAL_CRITICAL("ScreenManager", msg)
#define SCREEN_ERROR(msg) JOURNAL_ERROR("ScreenManager", msg)
#define SCREEN_WARN(msg) JOURNAL_WARN("ScreenManager", msg)
#define SCREEN_INFO(msg) JOURNAL_INFO("ScreenManager", msg)
#define SCREEN_DEBUG(msg) JOURNAL_DEBUG("ScreenManager", msg)

#define TRACKER_CRITICAL(msg) JOURNAL_CRITICAL("TrackerRouter", msg)
#define TRACKER_ERROR(msg) JOURNAL_ERROR("TrackerRouter", msg)
#define TRACKER_WARN(msg) JOURNAL_WARN("TrackerRouter", msg)
#define TRACKER_INFO(msg) JOURNAL_INFO("TrackerRouter", msg)
#define TRACKER_DEBUG(msg) JOURNAL_DEBUG("TrackerRouter", msg)

#define LAYOUT_CRITICAL(msg) JOURNAL_CRITICAL("ScreenLayout", msg)
#define LAYOUT_ERROR(msg) JOURNAL_ERROR("ScreenLayout", msg)
#define LAYOUT_WARN(msg) JOURNAL_WARN("ScreenLayout", msg)
#define LAYOUT_INFO(msg) JOURNAL_INFO("ScreenLayout", msg)
#define LAYOUT_DEBUG(msg) JOURNAL_DEBUG("ScreenLayout", msg)

#define SETTINGS_CRITICAL(msg) JOURNAL_CRITICAL("SettingsManager", msg)
#define SETTINGS_ERROR(msg) JOURNAL_ERROR("SettingsManager", msg)
#define SETTINGS_WARNING(msg) JOURNAL_WARN("SettingsManager", msg)
#define SETTINGS_INFO(msg) JOURNAL_INFO("SettingsManager", msg)
#define SETTINGS_DEBUG(msg) JOURNAL_DEBUG("SettingsManager", msg)

// Benchmark mode convenience macros
#define JOURNAL_ENABLE_BENCHMARK_MODE()                                        \
  JournalEngine::Logger::SetBenchmarkMode(true)
#define JOURNAL_DISABLE_BENCHMARK_MODE()                                       \
  JournalEngine::Logger::SetBenchmarkMode(false)

} // namespace JournalEngine

#endif // LOGGER_HPP
