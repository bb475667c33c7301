/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <atomic>  // IWYU pragma: keep - std::atomic<bool> benchmark mode flag
#include <cstdint> // IWYU pragma: keep - uint8_t level type
#include <cstdio>  // IWYU pragma: keep - printf() and fflush()
#include <mutex>   // IWYU pragma: keep - serialized console output
#include <string>  // IWYU pragma: keep - std::string messages in macros

namespace Bulwark {
enum class LogLevel : uint8_t {
  CRITICAL = 0,    // Always logs (console in debug, file in release)
  ERROR_LEVEL = 1, // Console in debug, file in release
  WARNING = 2,     // Debug only
  INFO = 3,        // Debug only
  DEBUG_LEVEL = 4  // Debug only
};

#ifdef DEBUG
// Debug builds log every level to the console
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
    printf("Bulwark - [%s] %s: %s\n", system, getLevelString(level), message);
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

#define BULWARK_CRITICAL(system, msg)                                          \
  Bulwark::Logger::Log(Bulwark::LogLevel::CRITICAL, system, msg)
#define BULWARK_ERROR(system, msg)                                             \
  Bulwark::Logger::Log(Bulwark::LogLevel::ERROR_LEVEL, system, msg)
#define BULWARK_WARN(system, msg)                                              \
  Bulwark::Logger::Log(Bulwark::LogLevel::WARNING, system, msg)
#define BULWARK_INFO(system, msg)                                              \
  Bulwark::Logger::Log(Bulwark::LogLevel::INFO, system, msg)
#define BULWARK_DEBUG(system, msg)                                             \
  Bulwark::Logger::Log(Bulwark::LogLevel::DEBUG_LEVEL, system, msg)

#else
// Release builds keep CRITICAL/ERROR only, written to a log file (Logger.cpp)
class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;

public:
  static std::mutex s_logMutex;

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

#define BULWARK_CRITICAL(system, msg)                                          \
  Bulwark::Logger::Log("CRITICAL", system, msg)

#define BULWARK_ERROR(system, msg) Bulwark::Logger::Log("ERROR", system, msg)

#define BULWARK_WARN(system, msg) ((void)0)  // Zero overhead
#define BULWARK_INFO(system, msg) ((void)0)  // Zero overhead
#define BULWARK_DEBUG(system, msg) ((void)0) // Zero overhead
#endif

inline std::atomic<bool> Logger::s_benchmarkMode{false};
inline std::mutex Logger::s_logMutex{};

// Core Systems
#define GAMELOOP_CRITICAL(msg) BULWARK_CRITICAL("GameLoop", msg)
#define GAMELOOP_ERROR(msg) BULWARK_ERROR("GameLoop", msg)
#define GAMELOOP_WARN(msg) BULWARK_WARN("GameLoop", msg)
#define GAMELOOP_INFO(msg) BULWARK_INFO("GameLoop", msg)
#define GAMELOOP_DEBUG(msg) BULWARK_DEBUG("GameLoop", msg)

#define SIM_CRITICAL(msg) BULWARK_CRITICAL("Simulation", msg)
#define SIM_ERROR(msg) BULWARK_ERROR("Simulation", msg)
#define SIM_WARN(msg) BULWARK_WARN("Simulation", msg)
#define SIM_INFO(msg) BULWARK_INFO("Simulation", msg)
#define SIM_DEBUG(msg) BULWARK_DEBUG("Simulation", msg)

#define SESSION_CRITICAL(msg) BULWARK_CRITICAL("GameSession", msg)
#define SESSION_ERROR(msg) BULWARK_ERROR("GameSession", msg)
#define SESSION_WARN(msg) BULWARK_WARN("GameSession", msg)
#define SESSION_INFO(msg) BULWARK_INFO("GameSession", msg)
#define SESSION_DEBUG(msg) BULWARK_DEBUG("GameSession", msg)

// Manager Systems
#define ENEMY_CRITICAL(msg) BULWARK_CRITICAL("EnemyManager", msg)
#define ENEMY_ERROR(msg) BULWARK_ERROR("EnemyManager", msg)
#define ENEMY_WARN(msg) BULWARK_WARN("EnemyManager", msg)
#define ENEMY_INFO(msg) BULWARK_INFO("EnemyManager", msg)
#define ENEMY_DEBUG(msg) BULWARK_DEBUG("EnemyManager", msg)

#define TOWER_CRITICAL(msg) BULWARK_CRITICAL("TowerManager", msg)
#define TOWER_ERROR(msg) BULWARK_ERROR("TowerManager", msg)
#define TOWER_WARN(msg) BULWARK_WARN("TowerManager", msg)
#define TOWER_INFO(msg) BULWARK_INFO("TowerManager", msg)
#define TOWER_DEBUG(msg) BULWARK_DEBUG("TowerManager", msg)

#define PROJECTILE_CRITICAL(msg) BULWARK_CRITICAL("ProjectileManager", msg)
#define PROJECTILE_ERROR(msg) BULWARK_ERROR("ProjectileManager", msg)
#define PROJECTILE_WARN(msg) BULWARK_WARN("ProjectileManager", msg)
#define PROJECTILE_INFO(msg) BULWARK_INFO("ProjectileManager", msg)
#define PROJECTILE_DEBUG(msg) BULWARK_DEBUG("ProjectileManager", msg)

#define WAVE_CRITICAL(msg) BULWARK_CRITICAL("WaveDirector", msg)
#define WAVE_ERROR(msg) BULWARK_ERROR("WaveDirector", msg)
#define WAVE_WARN(msg) BULWARK_WARN("WaveDirector", msg)
#define WAVE_INFO(msg) BULWARK_INFO("WaveDirector", msg)
#define WAVE_DEBUG(msg) BULWARK_DEBUG("WaveDirector", msg)

#define ECONOMY_CRITICAL(msg) BULWARK_CRITICAL("EconomyManager", msg)
#define ECONOMY_ERROR(msg) BULWARK_ERROR("EconomyManager", msg)
#define ECONOMY_WARN(msg) BULWARK_WARN("EconomyManager", msg)
#define ECONOMY_INFO(msg) BULWARK_INFO("EconomyManager", msg)
#define ECONOMY_DEBUG(msg) BULWARK_DEBUG("EconomyManager", msg)

#define CONFIG_CRITICAL(msg) BULWARK_CRITICAL("EntityConfigRegistry", msg)
#define CONFIG_ERROR(msg) BULWARK_ERROR("EntityConfigRegistry", msg)
#define CONFIG_WARN(msg) BULWARK_WARN("EntityConfigRegistry", msg)
#define CONFIG_INFO(msg) BULWARK_INFO("EntityConfigRegistry", msg)
#define CONFIG_DEBUG(msg) BULWARK_DEBUG("EntityConfigRegistry", msg)

#define SETTINGS_CRITICAL(msg) BULWARK_CRITICAL("SettingsManager", msg)
#define SETTINGS_ERROR(msg) BULWARK_ERROR("SettingsManager", msg)
#define SETTINGS_WARN(msg) BULWARK_WARN("SettingsManager", msg)
#define SETTINGS_INFO(msg) BULWARK_INFO("SettingsManager", msg)
#define SETTINGS_DEBUG(msg) BULWARK_DEBUG("SettingsManager", msg)

// World
#define MAP_CRITICAL(msg) BULWARK_CRITICAL("LevelMap", msg)
#define MAP_ERROR(msg) BULWARK_ERROR("LevelMap", msg)
#define MAP_WARN(msg) BULWARK_WARN("LevelMap", msg)
#define MAP_INFO(msg) BULWARK_INFO("LevelMap", msg)
#define MAP_DEBUG(msg) BULWARK_DEBUG("LevelMap", msg)

#define BULWARK_ENABLE_BENCHMARK_MODE() Bulwark::Logger::SetBenchmarkMode(true)
#define BULWARK_DISABLE_BENCHMARK_MODE()                                       \
  Bulwark::Logger::SetBenchmarkMode(false)

} // namespace Bulwark

#endif // LOGGER_HPP
