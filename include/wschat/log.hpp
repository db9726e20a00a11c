/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Logging utilities for wschat (loghelper-compatible interface).
 * Provides WSCHAT_LOG_DEBUG, WSCHAT_LOG_INFO, WSCHAT_LOG_WARN and
 * WSCHAT_LOG_ERROR macros.
 */

#ifndef WSCHAT_LOG_HPP_
#define WSCHAT_LOG_HPP_

#include <atomic>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>

namespace wschat {

// Every handler thread logs, so lines are written under one mutex.
class Logger {
 public:
  enum class Level { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

  static void log(Level level, const std::string& msg) {
    if (level < min_level()) {
      return;
    }
    static const char* const kPrefix[] = {"[DEBUG]", "[INFO]", "[WARN]", "[ERROR]"};
    std::lock_guard<std::mutex> lock(mutex());
    std::cerr << "[wschat] " << kPrefix[static_cast<int>(level)] << " " << msg << std::endl;
  }

  static void set_level(Level level) { level_storage().store(level, std::memory_order_relaxed); }

  static Level min_level() { return level_storage().load(std::memory_order_relaxed); }

  // Accepts "debug", "info", "warn" or "error"; anything else leaves the level unchanged.
  static bool set_level(std::string_view name) {
    if (name == "debug") {
      set_level(Level::kDebug);
    } else if (name == "info") {
      set_level(Level::kInfo);
    } else if (name == "warn") {
      set_level(Level::kWarn);
    } else if (name == "error") {
      set_level(Level::kError);
    } else {
      return false;
    }
    return true;
  }

 private:
  static std::mutex& mutex() {
    static std::mutex m;
    return m;
  }

  static std::atomic<Level>& level_storage() {
    static std::atomic<Level> level{Level::kInfo};
    return level;
  }
};

#define WSCHAT_LOG_DEBUG(msg) ::wschat::Logger::log(::wschat::Logger::Level::kDebug, msg)
#define WSCHAT_LOG_INFO(msg) ::wschat::Logger::log(::wschat::Logger::Level::kInfo, msg)
#define WSCHAT_LOG_WARN(msg) ::wschat::Logger::log(::wschat::Logger::Level::kWarn, msg)
#define WSCHAT_LOG_ERROR(msg) ::wschat::Logger::log(::wschat::Logger::Level::kError, msg)

}  // namespace wschat

#endif  // WSCHAT_LOG_HPP_
