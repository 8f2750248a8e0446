/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/MovingEntity.hpp"
#include <algorithm>
#include <cmath>

namespace {
constexpr float ALIGNED_ANGLE = 1e-5f;
}

MovingEntity::MovingEntity(const Params& params)
    : m_velocity(params.velocity), m_mass(params.mass), m_maxSpeed(params.maxSpeed),
      m_maxForce(params.maxForce), m_maxTurnRate(params.maxTurnRate) {
  m_position = params.position;
  m_boundingRadius = params.boundingRadius;
  setHeading(params.heading);
}

MovingEntity::MovingEntity(EntityID id, const Params& params)
    : Entity(id), m_velocity(params.velocity), m_mass(params.mass),
      m_maxSpeed(params.maxSpeed), m_maxForce(params.maxForce),
      m_maxTurnRate(params.maxTurnRate) {
  m_position = params.position;
  m_boundingRadius = params.boundingRadius;
  setHeading(params.heading);
}

void MovingEntity::setHeading(const Vector2D& heading) {
  if (heading.isZero()) {
    return;
  }
  m_heading = heading.normalized();
  m_side = m_heading.perp();
}

bool MovingEntity::rotateHeadingToFacePosition(const Vector2D& target) {
  const Vector2D toTarget = (target - m_position).normalized();
  if (toTarget.isZero()) {
    return true;
  }

  const float dot = std::clamp(m_heading.dot(toTarget), -1.0f, 1.0f);
  float angle = std::acos(dot);
  if (angle < ALIGNED_ANGLE) {
    return true;
  }

  const float turn = std::min(angle, m_maxTurnRate) *
                     static_cast<float>(m_heading.sign(toTarget));
  setHeading(m_heading.rotated(turn));
  m_velocity = m_velocity.rotated(turn);
  return false;
}

void MovingEntity::integrate(const Vector2D& force) {
  m_velocity += force / m_mass;
  m_velocity.truncate(m_maxSpeed);
  m_position += m_velocity;

  if (m_velocity.lengthSquared() > Vector2D::kEpsilon) {
    setHeading(m_velocity);
  }
}
