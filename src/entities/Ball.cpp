/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/Ball.hpp"
#include "core/Logger.hpp"
#include "utils/Geometry.hpp"
#include "world/SteeringWorld.hpp"
#include <cmath>
#include <format>
#include <limits>

namespace {

MovingEntity::Params ballParams(const Kickoff::BallConfig& config) {
  MovingEntity::Params params;
  params.boundingRadius = config.radius;
  params.mass = config.mass;
  // Kicks set the velocity directly, nothing caps it afterwards
  params.maxSpeed = std::numeric_limits<float>::max();
  params.maxForce = std::numeric_limits<float>::max();
  params.maxTurnRate = Kickoff::Geometry::PI;
  return params;
}

}  // namespace

Ball::Ball(const Kickoff::SteeringWorld& world, std::mt19937& rng,
           const Kickoff::BallConfig& config)
    : MovingEntity(ballParams(config)), m_world(world), m_rng(rng), m_config(config) {
  if (m_config.friction >= 0.0f) {
    BALL_WARN(std::format("Friction must be negative, got {}; using -0.005", m_config.friction));
    m_config.friction = -0.005f;
  }
  setName("Ball");
}

void Ball::update(float /*deltaTime*/) {
  m_previousPosition = m_position;

  testCollisionWithWalls();

  const float friction = m_config.friction;
  if (m_velocity.lengthSquared() > friction * friction) {
    m_velocity += m_velocity.normalized() * friction;
    m_position += m_velocity;

    if (m_velocity.lengthSquared() > Vector2D::kEpsilon) {
      setHeading(m_velocity);
    }
  } else {
    m_velocity = Vector2D(0, 0);
  }
}

void Ball::kick(const Vector2D& direction, float force) {
  m_velocity = direction.normalized() * (force / m_mass);
}

void Ball::placeAtPosition(const Vector2D& position) {
  m_position = position;
  m_previousPosition = position;
  m_velocity = Vector2D(0, 0);
}

float Ball::timeToCoverDistance(const Vector2D& from, const Vector2D& to, float force) const {
  // Speed right after the kick
  const float speed = force / m_mass;
  const float distance = Vector2D::distance(from, to);

  // v^2 = u^2 + 2as
  const float term = speed * speed + 2.0f * distance * m_config.friction;
  if (term <= 0.0f) {
    return -1.0f;
  }

  // t = (v - u) / a
  return (std::sqrt(term) - speed) / m_config.friction;
}

Vector2D Ball::futurePosition(float time) const {
  // s = ut + 1/2at^2 along the direction of travel
  const Vector2D ut = m_velocity * time;
  const float halfATSquared = 0.5f * m_config.friction * time * time;
  return m_position + ut + m_velocity.normalized() * halfATSquared;
}

Vector2D Ball::addNoiseToKick(const Vector2D& target) {
  const float maxError = Kickoff::Geometry::PI - Kickoff::Geometry::PI * m_config.kickingAccuracy;
  std::uniform_real_distribution<float> unit(-1.0f, 1.0f);
  const float displacement = maxError * unit(m_rng.get());

  const Vector2D toTarget = (target - m_position).rotated(displacement);
  return m_position + toTarget;
}

void Ball::testCollisionWithWalls() {
  if (m_velocity.isZero()) {
    return;
  }

  // Probe as far as the ball travels this tick plus its radius
  const Vector2D direction = m_velocity.normalized();
  const Vector2D probeEnd = m_position + direction * (m_boundingRadius + getSpeed());

  float closest = std::numeric_limits<float>::max();
  const Kickoff::Wall2D* closestWall = nullptr;

  for (const Kickoff::Wall2D& wall : m_world.getWalls()) {
    float distance = 0.0f;
    Vector2D hit;
    if (Kickoff::Geometry::lineIntersection2D(m_position, probeEnd, wall.from, wall.to, distance,
                                              hit) &&
        distance < closest) {
      closest = distance;
      closestWall = &wall;
    }
  }

  if (closestWall != nullptr) {
    m_velocity.reflect(closestWall->normal);
  }
}
