/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/Logger.hpp"
#include "core/SoccerConfig.hpp"
#include "entities/Ball.hpp"
#include "entities/PlayerBase.hpp"
#include "entities/Team.hpp"
#include "managers/SettingsManager.hpp"
#include "utils/Geometry.hpp"
#include "world/Goal.hpp"
#include "world/Pitch.hpp"
#include <SDL3/SDL.h>
#include <algorithm>
#include <array>
#include <cmath>
#include <exception>
#include <format>

#ifndef KICKOFF_APP_NAME
#define KICKOFF_APP_NAME "Kickoff"
#endif

#define PITCH_GREEN 34, 110, 52, 255
#define LINE_WHITE 235, 235, 235, 255
#define REGION_GRAY 60, 130, 72, 255
#define BALL_BLACK 20, 20, 20, 255
#define BLUE_KIT 40, 80, 220, 255
#define RED_KIT 210, 40, 40, 255

const int WINDOW_WIDTH{1280};
const int WINDOW_HEIGHT{768};
const float WINDOW_MARGIN{40.0f};
const float TICK_LENGTH{1.0f / 60.0f};
const Uint64 FRAME_MS{16};

namespace {

// Maps pitch coordinates (y up, origin at the center spot) to window pixels
struct PitchView {
  float scale{1.0f};
  float left{0.0f};
  float top{0.0f};

  SDL_FPoint toScreen(const Vector2D& p) const {
    return SDL_FPoint{WINDOW_MARGIN + (p.getX() - left) * scale,
                      WINDOW_MARGIN + (top - p.getY()) * scale};
  }
};

PitchView makeView(const Kickoff::Region& area, int windowWidth, int windowHeight) {
  PitchView view;
  const float scaleX = (static_cast<float>(windowWidth) - 2.0f * WINDOW_MARGIN) / area.getWidth();
  const float scaleY = (static_cast<float>(windowHeight) - 2.0f * WINDOW_MARGIN) / area.getHeight();
  view.scale = std::min(scaleX, scaleY);
  view.left = area.getLeft();
  view.top = area.getTop();
  return view;
}

void drawCircle(SDL_Renderer* renderer, const PitchView& view, const Vector2D& center,
                float radius) {
  constexpr int SEGMENTS = 16;
  std::array<SDL_FPoint, SEGMENTS + 1> points{};
  for (int i = 0; i <= SEGMENTS; ++i) {
    const float angle = 2.0f * Kickoff::Geometry::PI * static_cast<float>(i) / SEGMENTS;
    points[i] = view.toScreen(center + Vector2D(std::cos(angle), std::sin(angle)) * radius);
  }
  SDL_RenderLines(renderer, points.data(), static_cast<int>(points.size()));
}

void drawRegion(SDL_Renderer* renderer, const PitchView& view, const Kickoff::Region& region) {
  const SDL_FPoint topLeft = view.toScreen(Vector2D(region.getLeft(), region.getTop()));
  const SDL_FRect rect{topLeft.x, topLeft.y, region.getWidth() * view.scale,
                       region.getHeight() * view.scale};
  SDL_RenderRect(renderer, &rect);
}

void drawGoal(SDL_Renderer* renderer, const PitchView& view, const Kickoff::Goal& goal) {
  const SDL_FPoint low = view.toScreen(goal.getLeftPost());
  const SDL_FPoint high = view.toScreen(goal.getRightPost());
  const float depth = goal.getSize().getX() * view.scale * -goal.getFacing().getX();
  SDL_RenderLine(renderer, low.x, low.y, low.x + depth, low.y);
  SDL_RenderLine(renderer, high.x, high.y, high.x + depth, high.y);
  SDL_RenderLine(renderer, low.x + depth, low.y, high.x + depth, high.y);
}

void drawTeam(SDL_Renderer* renderer, const PitchView& view, const Team& team) {
  if (team.getColor() == TeamColor::Blue) {
    SDL_SetRenderDrawColor(renderer, BLUE_KIT);
  } else {
    SDL_SetRenderDrawColor(renderer, RED_KIT);
  }

  for (const auto& player : team.getPlayers()) {
    drawCircle(renderer, view, player->getPosition(), player->getBoundingRadius());

    // Heading tick
    const SDL_FPoint from = view.toScreen(player->getPosition());
    const SDL_FPoint to =
        view.toScreen(player->getPosition() + player->getHeading() * (player->getBoundingRadius() * 2.0f));
    SDL_RenderLine(renderer, from.x, from.y, to.x, to.y);
  }
}

void render(SDL_Renderer* renderer, const PitchView& view, const Kickoff::Pitch& pitch) {
  SDL_SetRenderDrawColor(renderer, PITCH_GREEN);
  SDL_RenderClear(renderer);

  SDL_SetRenderDrawColor(renderer, REGION_GRAY);
  for (const Kickoff::Region& region : pitch.getRegions()) {
    drawRegion(renderer, view, region);
  }

  SDL_SetRenderDrawColor(renderer, LINE_WHITE);
  drawRegion(renderer, view, pitch.getPlayingArea());
  const SDL_FPoint top = view.toScreen(Vector2D(pitch.getPlayingArea().getCenter().getX(),
                                                pitch.getPlayingArea().getTop()));
  const SDL_FPoint bottom = view.toScreen(Vector2D(pitch.getPlayingArea().getCenter().getX(),
                                                   pitch.getPlayingArea().getBottom()));
  SDL_RenderLine(renderer, top.x, top.y, bottom.x, bottom.y);
  drawCircle(renderer, view, pitch.getPlayingArea().getCenter(),
             pitch.getPlayingArea().getHeight() * 0.125f);
  drawGoal(renderer, view, pitch.getRedGoal());
  drawGoal(renderer, view, pitch.getBlueGoal());

  drawTeam(renderer, view, pitch.getBlueTeam());
  drawTeam(renderer, view, pitch.getRedTeam());

  SDL_SetRenderDrawColor(renderer, BALL_BLACK);
  drawCircle(renderer, view, pitch.getBall().getPosition(), pitch.getBall().getBoundingRadius());

  SDL_RenderPresent(renderer);
}

}  // namespace

int main([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
  VIEWER_INFO(std::format("Initializing {} viewer", KICKOFF_APP_NAME));

  auto& settingsManager = Kickoff::SettingsManager::Instance();
  if (!settingsManager.loadFromFile("res/settings.json")) {
    VIEWER_WARN("Failed to load settings.json - using defaults");
  }

  const int windowWidth = settingsManager.get<int>("viewer", "resolution_width", WINDOW_WIDTH);
  const int windowHeight = settingsManager.get<int>("viewer", "resolution_height", WINDOW_HEIGHT);
  const int ticksPerFrame = std::max(1, settingsManager.get<int>("viewer", "ticks_per_frame", 1));
  const float tickLength = settingsManager.get<float>("simulation", "tick_length", TICK_LENGTH);
  const int seed = settingsManager.get<int>("simulation", "seed", 5489);

  if (!SDL_Init(SDL_INIT_VIDEO)) {
    VIEWER_CRITICAL(std::format("SDL video init failed: {}", SDL_GetError()));
    return -1;
  }

  SDL_Window* window = SDL_CreateWindow(KICKOFF_APP_NAME, windowWidth, windowHeight, 0);
  if (!window) {
    VIEWER_CRITICAL(std::format("Window creation failed: {}", SDL_GetError()));
    SDL_Quit();
    return -1;
  }

  SDL_Renderer* renderer = SDL_CreateRenderer(window, NULL);
  if (!renderer) {
    VIEWER_CRITICAL(std::format("Renderer creation failed: {}", SDL_GetError()));
    SDL_DestroyWindow(window);
    SDL_Quit();
    return -1;
  }

  int exitCode = 0;
  try {
    Kickoff::Pitch pitch(Kickoff::SoccerConfig::fromSettings(settingsManager),
                         static_cast<unsigned int>(seed));
    pitch.setScoreListener([](int blueGoals, int redGoals) {
      VIEWER_INFO(std::format("Blue {} : {} Red", blueGoals, redGoals));
    });

    const PitchView view = makeView(pitch.getPlayingArea(), windowWidth, windowHeight);

    VIEWER_INFO("Starting main loop - space pauses, escape quits");
    bool running = true;
    while (running) {
      const Uint64 frameStart = SDL_GetTicks();

      SDL_Event event;
      while (SDL_PollEvent(&event)) {
        switch (event.type) {
          case SDL_EVENT_QUIT:
            running = false;
            break;

          case SDL_EVENT_KEY_DOWN:
            if (event.key.key == SDLK_SPACE) {
              pitch.togglePause();
            } else if (event.key.key == SDLK_ESCAPE) {
              running = false;
            }
            break;

          default:
            break;
        }
      }

      for (int i = 0; i < ticksPerFrame; ++i) {
        pitch.update(tickLength);
      }
      render(renderer, view, pitch);

      const Uint64 frameTime = SDL_GetTicks() - frameStart;
      if (frameTime < FRAME_MS) {
        SDL_Delay(static_cast<Uint32>(FRAME_MS - frameTime));
      }
    }

    VIEWER_INFO(std::format("Final score - Blue {} : {} Red", pitch.getBlueScore(),
                            pitch.getRedScore()));
  } catch (const std::exception& e) {
    VIEWER_CRITICAL(std::format("Viewer aborted: {}", e.what()));
    exitCode = -1;
  }

  SDL_DestroyRenderer(renderer);
  SDL_DestroyWindow(window);
  SDL_Quit();
  return exitCode;
}
