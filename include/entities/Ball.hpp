/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef BALL_HPP
#define BALL_HPP

#include "core/SoccerConfig.hpp"
#include "entities/MovingEntity.hpp"
#include <functional>
#include <random>

namespace Kickoff {
class SteeringWorld;
}

/**
 * @brief The match ball.
 *
 * Moves in per-tick units: a kick sets the velocity outright, friction then
 * takes a fixed amount of speed off every tick until the ball stops. The
 * ball bounces off the walls of the world it lives in.
 */
class Ball : public MovingEntity {
 public:
  Ball(const Kickoff::SteeringWorld& world, std::mt19937& rng,
       const Kickoff::BallConfig& config = Kickoff::BallConfig{});

  void update(float deltaTime) override;

  // velocity = normalize(direction) * force / mass
  void kick(const Vector2D& direction, float force);
  void trap() { m_velocity = Vector2D(0, 0); }
  void placeAtPosition(const Vector2D& position = Vector2D(0, 0));

  /**
   * @brief Ticks a kick of the given force needs to travel from one point
   * to another.
   * @return -1 if friction stops the ball before it gets there.
   */
  float timeToCoverDistance(const Vector2D& from, const Vector2D& to, float force) const;

  // Where the ball will be after the given number of ticks
  Vector2D futurePosition(float time) const;

  /**
   * @brief Kick target rotated about the ball by a random error.
   *
   * The error is uniform within +-(pi - pi * kickingAccuracy) radians.
   */
  Vector2D addNoiseToKick(const Vector2D& target);

  const Vector2D& getPreviousPosition() const { return m_previousPosition; }
  float getFriction() const { return m_config.friction; }
  const Kickoff::BallConfig& getConfig() const { return m_config; }

 private:
  void testCollisionWithWalls();

  // Non-owning, the world owns the ball
  const Kickoff::SteeringWorld& m_world;
  std::reference_wrapper<std::mt19937> m_rng;
  Kickoff::BallConfig m_config;
  Vector2D m_previousPosition{0, 0};
};

#endif  // BALL_HPP
