/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <atomic> // IWYU pragma: keep - benchmark mode flag
#include <cstdint> // IWYU pragma: keep - uint8_t
#include <cstdio> // IWYU pragma: keep - printf() and fflush()
#include <mutex> // IWYU pragma: keep - serialized console output
#include <string> // IWYU pragma: keep - std::string messages in macros

namespace Ragfall {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs
  ERROR_LEVEL = 1,  // Always logs (file in release)
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only
};

#ifdef DEBUG
// Console logging in debug builds
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
    printf("Ragfall Engine - [%s] %s: %s\n", system, getLevelString(level),
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

#define RAGFALL_CRITICAL(system, msg)                                          \
  Ragfall::Logger::Log(Ragfall::LogLevel::CRITICAL, system, msg)
#define RAGFALL_ERROR(system, msg)                                             \
  Ragfall::Logger::Log(Ragfall::LogLevel::ERROR_LEVEL, system, msg)
#define RAGFALL_WARN(system, msg)                                              \
  Ragfall::Logger::Log(Ragfall::LogLevel::WARNING, system, msg)
#define RAGFALL_INFO(system, msg)                                              \
  Ragfall::Logger::Log(Ragfall::LogLevel::INFO, system, msg)
#define RAGFALL_DEBUG(system, msg)                                             \
  Ragfall::Logger::Log(Ragfall::LogLevel::DEBUG_LEVEL, system, msg)

#else
// Release builds keep CRITICAL and ERROR only, written to a log file
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

  // Defined in Logger.cpp
  static void Log(const char *level, const char *system,
                  const std::string &message);
  static void Log(const char *level, const char *system, const char *message);
};

#define RAGFALL_CRITICAL(system, msg)                                          \
  Ragfall::Logger::Log("CRITICAL", system, msg)

#define RAGFALL_ERROR(system, msg) Ragfall::Logger::Log("ERROR", system, msg)

#define RAGFALL_WARN(system, msg) ((void)0)
#define RAGFALL_INFO(system, msg) ((void)0)
#define RAGFALL_DEBUG(system, msg) ((void)0)
#endif

inline std::atomic<bool> Logger::s_benchmarkMode{false};
inline std::mutex Logger::s_logMutex{};

// Core Systems
#define SCHEDULER_CRITICAL(msg) RAGFALL_CRITICAL("TaskScheduler", msg)
#define SCHEDULER_ERROR(msg) RAGFALL_ERROR("TaskScheduler", msg)
#define SCHEDULER_WARN(msg) RAGFALL_WARN("TaskScheduler", msg)
#define SCHEDULER_INFO(msg) RAGFALL_INFO("TaskScheduler", msg)
#define SCHEDULER_DEBUG(msg) RAGFALL_DEBUG("TaskScheduler", msg)

#define TIMESTEP_CRITICAL(msg) RAGFALL_CRITICAL("TimestepManager", msg)
#define TIMESTEP_ERROR(msg) RAGFALL_ERROR("TimestepManager", msg)
#define TIMESTEP_WARN(msg) RAGFALL_WARN("TimestepManager", msg)
#define TIMESTEP_INFO(msg) RAGFALL_INFO("TimestepManager", msg)
#define TIMESTEP_DEBUG(msg) RAGFALL_DEBUG("TimestepManager", msg)

#define DEMO_CRITICAL(msg) RAGFALL_CRITICAL("Demo", msg)
#define DEMO_ERROR(msg) RAGFALL_ERROR("Demo", msg)
#define DEMO_WARN(msg) RAGFALL_WARN("Demo", msg)
#define DEMO_INFO(msg) RAGFALL_INFO("Demo", msg)
#define DEMO_DEBUG(msg) RAGFALL_DEBUG("Demo", msg)

// Entities
#define ACTOR_CRITICAL(msg) RAGFALL_CRITICAL("Actor", msg)
#define ACTOR_ERROR(msg) RAGFALL_ERROR("Actor", msg)
#define ACTOR_WARN(msg) RAGFALL_WARN("Actor", msg)
#define ACTOR_INFO(msg) RAGFALL_INFO("Actor", msg)
#define ACTOR_DEBUG(msg) RAGFALL_DEBUG("Actor", msg)

// Physics and collision
#define PHYSICS_CRITICAL(msg) RAGFALL_CRITICAL("PhysicsWorld", msg)
#define PHYSICS_ERROR(msg) RAGFALL_ERROR("PhysicsWorld", msg)
#define PHYSICS_WARN(msg) RAGFALL_WARN("PhysicsWorld", msg)
#define PHYSICS_INFO(msg) RAGFALL_INFO("PhysicsWorld", msg)
#define PHYSICS_DEBUG(msg) RAGFALL_DEBUG("PhysicsWorld", msg)

#define SUPPRESSION_CRITICAL(msg)                                              \
  RAGFALL_CRITICAL("CollisionSuppressionManager", msg)
#define SUPPRESSION_ERROR(msg) RAGFALL_ERROR("CollisionSuppressionManager", msg)
#define SUPPRESSION_WARN(msg) RAGFALL_WARN("CollisionSuppressionManager", msg)
#define SUPPRESSION_INFO(msg) RAGFALL_INFO("CollisionSuppressionManager", msg)
#define SUPPRESSION_DEBUG(msg) RAGFALL_DEBUG("CollisionSuppressionManager", msg)

// Entity Systems
#define RAGDOLL_CRITICAL(msg) RAGFALL_CRITICAL("RagdollHandoff", msg)
#define RAGDOLL_ERROR(msg) RAGFALL_ERROR("RagdollHandoff", msg)
#define RAGDOLL_WARN(msg) RAGFALL_WARN("RagdollHandoff", msg)
#define RAGDOLL_INFO(msg) RAGFALL_INFO("RagdollHandoff", msg)
#define RAGDOLL_DEBUG(msg) RAGFALL_DEBUG("RagdollHandoff", msg)

#define MORTALITY_CRITICAL(msg) RAGFALL_CRITICAL("Mortality", msg)
#define MORTALITY_ERROR(msg) RAGFALL_ERROR("Mortality", msg)
#define MORTALITY_WARN(msg) RAGFALL_WARN("Mortality", msg)
#define MORTALITY_INFO(msg) RAGFALL_INFO("Mortality", msg)
#define MORTALITY_DEBUG(msg) RAGFALL_DEBUG("Mortality", msg)

// Camera
#define CAMERA_FOCUS_CRITICAL(msg) RAGFALL_CRITICAL("CameraFocus", msg)
#define CAMERA_FOCUS_ERROR(msg) RAGFALL_ERROR("CameraFocus", msg)
#define CAMERA_FOCUS_WARN(msg) RAGFALL_WARN("CameraFocus", msg)
#define CAMERA_FOCUS_INFO(msg) RAGFALL_INFO("CameraFocus", msg)
#define CAMERA_FOCUS_DEBUG(msg) RAGFALL_DEBUG("CameraFocus", msg)

#define SETTINGS_CRITICAL(msg) RAGFALL_CRITICAL("SettingsManager", msg)
#define SETTINGS_ERROR(msg) RAGFALL_ERROR("SettingsManager", msg)
#define SETTINGS_WARNING(msg) RAGFALL_WARN("SettingsManager", msg)
#define SETTINGS_INFO(msg) RAGFALL_INFO("SettingsManager", msg)
#define SETTINGS_DEBUG(msg) RAGFALL_DEBUG("SettingsManager", msg)

// Benchmark mode convenience macros
#define RAGFALL_ENABLE_BENCHMARK_MODE() Ragfall::Logger::SetBenchmarkMode(true)
#define RAGFALL_DISABLE_BENCHMARK_MODE()                                       \
  Ragfall::Logger::SetBenchmarkMode(false)

} // namespace Ragfall

#endif // LOGGER_HPP
