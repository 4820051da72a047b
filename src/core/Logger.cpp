/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/Logger.hpp"

#include <mutex>

#ifdef DEBUG
#include <cstdio>
#else
#include <SDL3/SDL.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>
#endif

namespace Wayfinder {

namespace {

std::mutex& logMutex() {
  static std::mutex mutex;
  return mutex;
}

#ifdef DEBUG

void writeLine(LogLevel level, const char *system, const char *message) {
  std::printf("Wayfinder - [%s] %s: %s\n", system, Logger::LevelName(level), message);
  std::fflush(stdout);
}

#else

namespace fs = std::filesystem;

constexpr size_t kLogFilesKept = 5;
constexpr const char *kLogPrefix = "wayfinder_";

std::tm toLocalTime(std::chrono::system_clock::time_point when) {
  const std::time_t t = std::chrono::system_clock::to_time_t(when);
  std::tm out{};
#ifdef _WIN32
  localtime_s(&out, &t);
#else
  localtime_r(&t, &out);
#endif
  return out;
}

// Deletes the oldest wayfinder_*.log files so that `keep` remain once a new one is opened
void pruneLogs(const fs::path &dir, size_t keep) {
  std::error_code ec;
  std::vector<fs::directory_entry> logs;
  for (const auto &entry : fs::directory_iterator(dir, ec)) {
    const std::string name = entry.path().filename().string();
    if (entry.path().extension() == ".log" && name.starts_with(kLogPrefix)) {
      logs.push_back(entry);
    }
  }
  if (logs.size() < keep) return;

  std::sort(logs.begin(), logs.end(), [](const auto &a, const auto &b) {
    return a.last_write_time() < b.last_write_time();
  });
  for (size_t i = 0; i + keep <= logs.size(); ++i) {
    fs::remove(logs[i].path(), ec);
  }
}

// Opened on the first CRITICAL/ERROR message; stays closed if the pref path is unusable
std::ofstream openLogFile() {
  std::ofstream file;

  // WAYFINDER_APP_NAME comes from CMake's PROJECT_NAME
  char *prefPath = SDL_GetPrefPath("Wayfinder", WAYFINDER_APP_NAME);
  if (!prefPath) return file;
  const fs::path dir = fs::path(prefPath) / "logs";
  SDL_free(prefPath);

  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) return file;
  pruneLogs(dir, kLogFilesKept);

  const std::tm started = toLocalTime(std::chrono::system_clock::now());
  std::ostringstream name;
  name << kLogPrefix << std::put_time(&started, "%Y%m%d_%H%M%S") << ".log";

  file.open(dir / name.str(), std::ios::out | std::ios::app);
  if (file) {
    file << "=== " << WAYFINDER_APP_NAME << " navigation log, started "
         << std::put_time(&started, "%Y-%m-%d %H:%M:%S") << " ===\n";
  }
  return file;
}

void writeLine(LogLevel level, const char *system, const char *message) {
  static std::ofstream file = openLogFile();
  if (!file.is_open()) return;

  const auto now = std::chrono::system_clock::now();
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()).count() % 1000;
  const std::tm local = toLocalTime(now);

  file << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0')
       << std::setw(3) << ms << " [" << Logger::LevelName(level) << "] ["
       << system << "] " << message << '\n';
  // CRITICAL and ERROR only, flushed per line
  file.flush();
}

#endif

} // namespace

const char *Logger::LevelName(LogLevel level) {
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

void Logger::Log(LogLevel level, const char *system, const char *message) {
  std::lock_guard<std::mutex> lock(logMutex());
  writeLine(level, system, message);
}

} // namespace Wayfinder
