/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef MOVING_ENTITY_HPP
#define MOVING_ENTITY_HPP

#include "entities/Entity.hpp"

/**
 * @brief Entity with point-mass physics.
 *
 * Heading is a unit vector, side is always heading.perp(). Velocity is kept
 * at or below maxSpeed by integrate().
 */
class MovingEntity : public Entity {
 public:
  struct Params {
    Vector2D position{0, 0};
    Vector2D velocity{0, 0};
    Vector2D heading{1, 0};
    float boundingRadius{1.0f};
    float mass{1.0f};
    float maxSpeed{1.0f};
    float maxForce{1.0f};
    float maxTurnRate{1.0f};
  };

  explicit MovingEntity(const Params& params);
  MovingEntity(EntityID id, const Params& params);

  const Vector2D& getVelocity() const { return m_velocity; }
  void setVelocity(const Vector2D& velocity) { m_velocity = velocity; }

  const Vector2D& getHeading() const { return m_heading; }
  // Ignores zero vectors
  void setHeading(const Vector2D& heading);
  const Vector2D& getSide() const { return m_side; }

  float getSpeed() const { return m_velocity.length(); }
  float getSpeedSq() const { return m_velocity.lengthSquared(); }
  bool isSpeedMaxedOut() const { return getSpeedSq() >= m_maxSpeed * m_maxSpeed; }

  float getMass() const { return m_mass; }
  float getMaxSpeed() const { return m_maxSpeed; }
  void setMaxSpeed(float speed) { m_maxSpeed = speed; }
  float getMaxForce() const { return m_maxForce; }
  void setMaxForce(float force) { m_maxForce = force; }
  float getMaxTurnRate() const { return m_maxTurnRate; }
  void setMaxTurnRate(float rate) { m_maxTurnRate = rate; }

  /**
   * @brief Turn toward a point by at most maxTurnRate.
   * @return true once the heading already faces the point.
   */
  bool rotateHeadingToFacePosition(const Vector2D& target);

 protected:
  /**
   * @brief One tick of per-tick physics.
   *
   * velocity += force / mass, clamped to maxSpeed, then position +=
   * velocity. The heading follows the velocity when it is non-zero.
   */
  void integrate(const Vector2D& force);

  Vector2D m_velocity;
  Vector2D m_heading{1, 0};
  Vector2D m_side{0, 1};
  float m_mass;
  float m_maxSpeed;
  float m_maxForce;
  float m_maxTurnRate;
};

#endif  // MOVING_ENTITY_HPP
