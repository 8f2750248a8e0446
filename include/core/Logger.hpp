/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

// Required includes for logging system:
// - string: Used in macro expansions for std::string() conversions
// - cstdio: Required for printf() and fflush() functions
// - cstdint: Required for uint8_t type
// - mutex: Required for thread-safe logging
// - atomic: Required for std::atomic<bool> benchmark mode flag
#include <atomic> // IWYU pragma: keep
#include <cstdint> // IWYU pragma: keep
#include <cstdio> // IWYU pragma: keep
#include <mutex> // IWYU pragma: keep
#include <string> // IWYU pragma: keep

namespace Kickoff {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs (file in release)
  ERROR_LEVEL = 1,  // Always logs (file in release)
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only
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
    printf("Kickoff Simulation - [%s] %s: %s\n", system, getLevelString(level),
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

#define KICKOFF_CRITICAL(system, msg)                                          \
  Kickoff::Logger::Log(Kickoff::LogLevel::CRITICAL, system, msg)
#define KICKOFF_ERROR(system, msg)                                             \
  Kickoff::Logger::Log(Kickoff::LogLevel::ERROR_LEVEL, system, msg)
#define KICKOFF_WARN(system, msg)                                              \
  Kickoff::Logger::Log(Kickoff::LogLevel::WARNING, system, msg)
#define KICKOFF_INFO(system, msg)                                              \
  Kickoff::Logger::Log(Kickoff::LogLevel::INFO, system, msg)
#define KICKOFF_DEBUG(system, msg)                                             \
  Kickoff::Logger::Log(Kickoff::LogLevel::DEBUG_LEVEL, system, msg)

#else
// Release builds keep CRITICAL and ERROR only, written to a rotating log file
// (see Logger.cpp)
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

  static void Log(const char *level, const char *system,
                  const std::string &message);
  static void Log(const char *level, const char *system, const char *message);
};

#define KICKOFF_CRITICAL(system, msg)                                          \
  Kickoff::Logger::Log("CRITICAL", system, msg)

#define KICKOFF_ERROR(system, msg) Kickoff::Logger::Log("ERROR", system, msg)

#define KICKOFF_WARN(system, msg) ((void)0)  // Zero overhead
#define KICKOFF_INFO(system, msg) ((void)0)  // Zero overhead
#define KICKOFF_DEBUG(system, msg) ((void)0) // Zero overhead
#endif

inline std::atomic<bool> Logger::s_benchmarkMode{false};
inline std::mutex Logger::s_logMutex{};

// Convenience macros for each simulation system

// Core Systems
#define SIM_CRITICAL(msg) KICKOFF_CRITICAL("Simulation", msg)
#define SIM_ERROR(msg) KICKOFF_ERROR("Simulation", msg)
#define SIM_WARN(msg) KICKOFF_WARN("Simulation", msg)
#define SIM_INFO(msg) KICKOFF_INFO("Simulation", msg)
#define SIM_DEBUG(msg) KICKOFF_DEBUG("Simulation", msg)

#define SETTINGS_CRITICAL(msg) KICKOFF_CRITICAL("SettingsManager", msg)
#define SETTINGS_ERROR(msg) KICKOFF_ERROR("SettingsManager", msg)
#define SETTINGS_WARNING(msg) KICKOFF_WARN("SettingsManager", msg)
#define SETTINGS_INFO(msg) KICKOFF_INFO("SettingsManager", msg)
#define SETTINGS_DEBUG(msg) KICKOFF_DEBUG("SettingsManager", msg)

#define MESSAGE_CRITICAL(msg) KICKOFF_CRITICAL("MessageDispatcher", msg)
#define MESSAGE_ERROR(msg) KICKOFF_ERROR("MessageDispatcher", msg)
#define MESSAGE_WARN(msg) KICKOFF_WARN("MessageDispatcher", msg)
#define MESSAGE_INFO(msg) KICKOFF_INFO("MessageDispatcher", msg)
#define MESSAGE_DEBUG(msg) KICKOFF_DEBUG("MessageDispatcher", msg)

#define FSM_CRITICAL(msg) KICKOFF_CRITICAL("StateMachine", msg)
#define FSM_ERROR(msg) KICKOFF_ERROR("StateMachine", msg)
#define FSM_WARN(msg) KICKOFF_WARN("StateMachine", msg)
#define FSM_INFO(msg) KICKOFF_INFO("StateMachine", msg)
#define FSM_DEBUG(msg) KICKOFF_DEBUG("StateMachine", msg)

// Steering and navigation
#define STEERING_CRITICAL(msg) KICKOFF_CRITICAL("SteeringBehaviors", msg)
#define STEERING_ERROR(msg) KICKOFF_ERROR("SteeringBehaviors", msg)
#define STEERING_WARN(msg) KICKOFF_WARN("SteeringBehaviors", msg)
#define STEERING_INFO(msg) KICKOFF_INFO("SteeringBehaviors", msg)
#define STEERING_DEBUG(msg) KICKOFF_DEBUG("SteeringBehaviors", msg)

#define PATH_CRITICAL(msg) KICKOFF_CRITICAL("Path", msg)
#define PATH_ERROR(msg) KICKOFF_ERROR("Path", msg)
#define PATH_WARN(msg) KICKOFF_WARN("Path", msg)
#define PATH_INFO(msg) KICKOFF_INFO("Path", msg)
#define PATH_DEBUG(msg) KICKOFF_DEBUG("Path", msg)

#define WORLD_CRITICAL(msg) KICKOFF_CRITICAL("AgentWorld", msg)
#define WORLD_ERROR(msg) KICKOFF_ERROR("AgentWorld", msg)
#define WORLD_WARN(msg) KICKOFF_WARN("AgentWorld", msg)
#define WORLD_INFO(msg) KICKOFF_INFO("AgentWorld", msg)
#define WORLD_DEBUG(msg) KICKOFF_DEBUG("AgentWorld", msg)

// Match entities
#define PITCH_CRITICAL(msg) KICKOFF_CRITICAL("Pitch", msg)
#define PITCH_ERROR(msg) KICKOFF_ERROR("Pitch", msg)
#define PITCH_WARN(msg) KICKOFF_WARN("Pitch", msg)
#define PITCH_INFO(msg) KICKOFF_INFO("Pitch", msg)
#define PITCH_DEBUG(msg) KICKOFF_DEBUG("Pitch", msg)

#define TEAM_CRITICAL(msg) KICKOFF_CRITICAL("Team", msg)
#define TEAM_ERROR(msg) KICKOFF_ERROR("Team", msg)
#define TEAM_WARN(msg) KICKOFF_WARN("Team", msg)
#define TEAM_INFO(msg) KICKOFF_INFO("Team", msg)
#define TEAM_DEBUG(msg) KICKOFF_DEBUG("Team", msg)

#define PLAYER_CRITICAL(msg) KICKOFF_CRITICAL("FieldPlayer", msg)
#define PLAYER_ERROR(msg) KICKOFF_ERROR("FieldPlayer", msg)
#define PLAYER_WARN(msg) KICKOFF_WARN("FieldPlayer", msg)
#define PLAYER_INFO(msg) KICKOFF_INFO("FieldPlayer", msg)
#define PLAYER_DEBUG(msg) KICKOFF_DEBUG("FieldPlayer", msg)

#define KEEPER_CRITICAL(msg) KICKOFF_CRITICAL("GoalKeeper", msg)
#define KEEPER_ERROR(msg) KICKOFF_ERROR("GoalKeeper", msg)
#define KEEPER_WARN(msg) KICKOFF_WARN("GoalKeeper", msg)
#define KEEPER_INFO(msg) KICKOFF_INFO("GoalKeeper", msg)
#define KEEPER_DEBUG(msg) KICKOFF_DEBUG("GoalKeeper", msg)

#define BALL_CRITICAL(msg) KICKOFF_CRITICAL("Ball", msg)
#define BALL_ERROR(msg) KICKOFF_ERROR("Ball", msg)
#define BALL_WARN(msg) KICKOFF_WARN("Ball", msg)
#define BALL_INFO(msg) KICKOFF_INFO("Ball", msg)
#define BALL_DEBUG(msg) KICKOFF_DEBUG("Ball", msg)

#define SUPPORT_CRITICAL(msg) KICKOFF_CRITICAL("SupportSpotCalculator", msg)
#define SUPPORT_ERROR(msg) KICKOFF_ERROR("SupportSpotCalculator", msg)
#define SUPPORT_WARN(msg) KICKOFF_WARN("SupportSpotCalculator", msg)
#define SUPPORT_INFO(msg) KICKOFF_INFO("SupportSpotCalculator", msg)
#define SUPPORT_DEBUG(msg) KICKOFF_DEBUG("SupportSpotCalculator", msg)

#define VIEWER_CRITICAL(msg) KICKOFF_CRITICAL("Viewer", msg)
#define VIEWER_ERROR(msg) KICKOFF_ERROR("Viewer", msg)
#define VIEWER_WARN(msg) KICKOFF_WARN("Viewer", msg)
#define VIEWER_INFO(msg) KICKOFF_INFO("Viewer", msg)
#define VIEWER_DEBUG(msg) KICKOFF_DEBUG("Viewer", msg)

// Benchmark mode convenience macros
#define KICKOFF_ENABLE_BENCHMARK_MODE() Kickoff::Logger::SetBenchmarkMode(true)
#define KICKOFF_DISABLE_BENCHMARK_MODE()                                       \
  Kickoff::Logger::SetBenchmarkMode(false)

} // namespace Kickoff

#endif // LOGGER_HPP
