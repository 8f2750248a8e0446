/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef VEHICLE_HPP
#define VEHICLE_HPP

#include "ai/SteeringBehaviors.hpp"
#include "core/Smoother.hpp"
#include "entities/MovingEntity.hpp"
#include <random>

namespace Kickoff {
class SteeringWorld;
}

/**
 * @brief Free-roaming steered agent integrated with real time.
 *
 * Unlike the match players, whose speeds are per tick, a Vehicle scales
 * acceleration and displacement by deltaTime. Heading smoothing averages
 * the last ten headings for display without affecting the physics.
 */
class Vehicle : public MovingEntity {
 public:
  Vehicle(const Kickoff::SteeringWorld& world, std::mt19937& rng, const Params& params,
          const Kickoff::SteeringConfig& steeringConfig = Kickoff::SteeringConfig{});

  void update(float deltaTime) override;

  Kickoff::SteeringBehaviors& getSteering() { return m_steering; }
  const Kickoff::SteeringBehaviors& getSteering() const { return m_steering; }

  void smoothingOn() { m_smoothingOn = true; }
  void smoothingOff() { m_smoothingOn = false; }
  bool isSmoothingOn() const { return m_smoothingOn; }

  // Averaged heading while smoothing is on, the raw heading otherwise
  const Vector2D& getSmoothedHeading() const {
    return m_smoothingOn ? m_smoothedHeading : m_heading;
  }

 private:
  Kickoff::SteeringBehaviors m_steering;
  Kickoff::Smoother<Vector2D> m_headingSmoother{10};
  Vector2D m_smoothedHeading;
  bool m_smoothingOn{false};
};

#endif  // VEHICLE_HPP
