/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/Logger.hpp"
#include "core/SoccerConfig.hpp"
#include "managers/SettingsManager.hpp"
#include "world/Pitch.hpp"
#include <chrono>
#include <exception>
#include <format>
#include <string>

#ifndef KICKOFF_APP_NAME
#define KICKOFF_APP_NAME "Kickoff"
#endif

// Defaults when res/settings.json does not say otherwise
const int DEFAULT_TICKS{18000};           // Five minutes at 60 ticks per second
const float DEFAULT_TICK_LENGTH{1.0f / 60.0f};
const int DEFAULT_SEED{5489};

int main([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
  SIM_INFO(std::format("Initializing {}", KICKOFF_APP_NAME));

  auto& settingsManager = Kickoff::SettingsManager::Instance();
  if (!settingsManager.loadFromFile("res/settings.json")) {
    SIM_WARN("Failed to load settings.json - using defaults");
  } else {
    SIM_INFO("Settings loaded from res/settings.json");
  }

  const int ticks = settingsManager.get<int>("simulation", "ticks", DEFAULT_TICKS);
  const float tickLength = settingsManager.get<float>("simulation", "tick_length", DEFAULT_TICK_LENGTH);
  const int seed = settingsManager.get<int>("simulation", "seed", DEFAULT_SEED);

  if (ticks <= 0 || tickLength <= 0.0f) {
    SIM_CRITICAL(std::format("Invalid simulation settings: {} ticks of {}s", ticks, tickLength));
    return -1;
  }

  try {
    const Kickoff::SoccerConfig config = Kickoff::SoccerConfig::fromSettings(settingsManager);
    Kickoff::Pitch pitch(config, static_cast<unsigned int>(seed));

    pitch.setScoreListener([&pitch](int blueGoals, int redGoals) {
      SIM_INFO(std::format("Goal after {} ticks - Blue {} : {} Red", pitch.getTickCount(),
                           blueGoals, redGoals));
    });

    SIM_INFO(std::format("Running {} ticks of {}s (seed {})", ticks, tickLength, seed));
    const auto start = std::chrono::steady_clock::now();

    for (int tick = 0; tick < ticks; ++tick) {
      pitch.update(tickLength);
    }

    const auto elapsed = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start);
    SIM_INFO(std::format("Simulated {:.1f}s of play in {:.1f}ms", pitch.getClock().getElapsedSeconds(),
                         elapsed.count()));
    SIM_INFO(std::format("Final score - Blue {} : {} Red", pitch.getBlueScore(), pitch.getRedScore()));
  } catch (const std::exception& e) {
    SIM_CRITICAL(std::format("Simulation aborted: {}", e.what()));
    return -1;
  }

  SIM_INFO(std::format("{} shutting down", KICKOFF_APP_NAME));
  return 0;
}
