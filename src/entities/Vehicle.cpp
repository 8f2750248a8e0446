/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/Vehicle.hpp"

Vehicle::Vehicle(const Kickoff::SteeringWorld& world, std::mt19937& rng, const Params& params,
                 const Kickoff::SteeringConfig& steeringConfig)
    : MovingEntity(params), m_steering(*this, world, rng, steeringConfig),
      m_smoothedHeading(m_heading) {}

void Vehicle::update(float deltaTime) {
  const Vector2D force = m_steering.calculate(deltaTime);

  m_velocity += (force / m_mass) * deltaTime;
  m_velocity.truncate(m_maxSpeed);
  m_position += m_velocity * deltaTime;

  if (m_velocity.lengthSquared() > Vector2D::kEpsilon) {
    setHeading(m_velocity);
  }

  if (m_smoothingOn) {
    m_smoothedHeading = m_headingSmoother.update(m_heading);
  }
}
