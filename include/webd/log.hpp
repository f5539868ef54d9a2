/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Logging utilities for webd.
 * Provides WEBD_LOG_DEBUG, WEBD_LOG_INFO, WEBD_LOG_WARN, WEBD_LOG_ERROR macros.
 */

#ifndef WEBD_LOG_HPP_
#define WEBD_LOG_HPP_

#include <iostream>
#include <string>

namespace webd {

class Logger {
 public:
  enum class Level { kDebug, kInfo, kWarn, kError };

  static void set_level(Level level) { threshold() = level; }
  static Level level() { return threshold(); }

  static bool enabled(Level level) { return static_cast<int>(level) >= static_cast<int>(threshold()); }

  static void log(Level level, const std::string& msg) {
    if (!enabled(level))
      return;
    const char* prefix[] = {"[DEBUG]", "[INFO]", "[WARN]", "[ERROR]"};
    std::cerr << prefix[static_cast<int>(level)] << " " << msg << std::endl;
  }

 private:
  static Level& threshold() {
    static Level level = Level::kInfo;
    return level;
  }
};

#define WEBD_LOG_DEBUG(msg) ::webd::Logger::log(::webd::Logger::Level::kDebug, msg)
#define WEBD_LOG_INFO(msg) ::webd::Logger::log(::webd::Logger::Level::kInfo, msg)
#define WEBD_LOG_WARN(msg) ::webd::Logger::log(::webd::Logger::Level::kWarn, msg)
#define WEBD_LOG_ERROR(msg) ::webd::Logger::log(::webd::Logger::Level::kError, msg)

}  // namespace webd

#endif  // WEBD_LOG_HPP_
