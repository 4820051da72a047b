/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

/**
 * @file Logger.hpp
 * @brief Per-system logging macros for the navigation library
 *
 * Debug builds (DEBUG defined) print every level to stdout as
 *   Wayfinder - [System] LEVEL: message
 * Release builds keep CRITICAL and ERROR only and append them to
 * <SDL pref path>/logs/wayfinder_<timestamp>.log. WARN, INFO and DEBUG
 * compile to nothing, so their message expressions are never evaluated.
 *
 * Messages are built by the caller, usually with std::format.
 */

#include <cstdint>
#include <string> // IWYU pragma: keep - std::string overload used by the macros

namespace Wayfinder {

enum class LogLevel : uint8_t {
  CRITICAL = 0,
  ERROR_LEVEL = 1, // ERROR collides with a Windows macro
  WARNING = 2,
  INFO = 3,
  DEBUG_LEVEL = 4
};

class Logger {
public:
  static void Log(LogLevel level, const char *system, const std::string &message) {
    Log(level, system, message.c_str());
  }

  // Thread-safe; lines from concurrent callers are never interleaved
  static void Log(LogLevel level, const char *system, const char *message);

  static const char *LevelName(LogLevel level);
};

} // namespace Wayfinder

#define WAYFINDER_CRITICAL(system, msg)                                        \
  Wayfinder::Logger::Log(Wayfinder::LogLevel::CRITICAL, system, msg)
#define WAYFINDER_ERROR(system, msg)                                           \
  Wayfinder::Logger::Log(Wayfinder::LogLevel::ERROR_LEVEL, system, msg)

#ifdef DEBUG
#define WAYFINDER_WARN(system, msg)                                            \
  Wayfinder::Logger::Log(Wayfinder::LogLevel::WARNING, system, msg)
#define WAYFINDER_INFO(system, msg)                                            \
  Wayfinder::Logger::Log(Wayfinder::LogLevel::INFO, system, msg)
#define WAYFINDER_DEBUG(system, msg)                                           \
  Wayfinder::Logger::Log(Wayfinder::LogLevel::DEBUG_LEVEL, system, msg)
#else
#define WAYFINDER_WARN(system, msg) ((void)0)
#define WAYFINDER_INFO(system, msg) ((void)0)
#define WAYFINDER_DEBUG(system, msg) ((void)0)
#endif

// Navigation service lifecycle
#define NAVIGATION_CRITICAL(msg) WAYFINDER_CRITICAL("NavigationManager", msg)
#define NAVIGATION_ERROR(msg) WAYFINDER_ERROR("NavigationManager", msg)
#define NAVIGATION_WARN(msg) WAYFINDER_WARN("NavigationManager", msg)
#define NAVIGATION_INFO(msg) WAYFINDER_INFO("NavigationManager", msg)
#define NAVIGATION_DEBUG(msg) WAYFINDER_DEBUG("NavigationManager", msg)

// Surface sampling and grid construction
#define GRIDBUILD_ERROR(msg) WAYFINDER_ERROR("GridBuilder", msg)
#define GRIDBUILD_WARN(msg) WAYFINDER_WARN("GridBuilder", msg)
#define GRIDBUILD_INFO(msg) WAYFINDER_INFO("GridBuilder", msg)
#define GRIDBUILD_DEBUG(msg) WAYFINDER_DEBUG("GridBuilder", msg)

#define PATHFIND_ERROR(msg) WAYFINDER_ERROR("Pathfinding", msg)
#define PATHFIND_WARN(msg) WAYFINDER_WARN("Pathfinding", msg)
#define PATHFIND_INFO(msg) WAYFINDER_INFO("Pathfinding", msg)
#define PATHFIND_DEBUG(msg) WAYFINDER_DEBUG("Pathfinding", msg)

#define NAVLINK_WARN(msg) WAYFINDER_WARN("LinkRegistrar", msg)
#define NAVLINK_INFO(msg) WAYFINDER_INFO("LinkRegistrar", msg)
#define NAVLINK_DEBUG(msg) WAYFINDER_DEBUG("LinkRegistrar", msg)

#define COMPONENT_ERROR(msg) WAYFINDER_ERROR("NavComponentRegistry", msg)
#define COMPONENT_WARN(msg) WAYFINDER_WARN("NavComponentRegistry", msg)
#define COMPONENT_DEBUG(msg) WAYFINDER_DEBUG("NavComponentRegistry", msg)

#define SETTINGS_ERROR(msg) WAYFINDER_ERROR("NavigationConfig", msg)
#define SETTINGS_WARNING(msg) WAYFINDER_WARN("NavigationConfig", msg)
#define SETTINGS_INFO(msg) WAYFINDER_INFO("NavigationConfig", msg)

#define DEMO_CRITICAL(msg) WAYFINDER_CRITICAL("Demo", msg)
#define DEMO_INFO(msg) WAYFINDER_INFO("Demo", msg)

#endif // LOGGER_HPP
