/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef PLAYER_BASE_HPP
#define PLAYER_BASE_HPP

#include "ai/SteeringBehaviors.hpp"
#include "core/SoccerConfig.hpp"
#include "entities/MovingEntity.hpp"
#include <cstdint>
#include <functional>

class Ball;
class Team;

namespace Kickoff {
class Pitch;
class Region;
}

/**
 * @brief State and tactical queries shared by field players and keepers.
 *
 * A player belongs to exactly one Team for its whole life and steers with
 * its own SteeringBehaviors, whose first target agent is the ball. Physics
 * run in per-tick units, see MovingEntity::integrate().
 */
class PlayerBase : public MovingEntity {
 public:
  enum class Role : uint8_t { GoalKeeper, Attacker, Defender };

  PlayerBase(Team& team, int homeRegionId, Role role);

  // Picks the best supporting attacker and tells it to move into position
  void findSupport();

  void trackBall();
  void trackTarget();

  float getDistanceToOppGoal() const;
  float getDistanceToHomeGoal() const;

  // An opponent is in front of the player and inside its comfort zone
  bool isThreatened() const;
  bool isPositionInFrontOfPlayer(const Vector2D& position) const;
  bool isBallWithinKeeperRange() const;
  bool isBallWithinKickingRange() const;
  bool isBallWithinReceivingRange() const;
  bool isInHomeRegion() const;
  bool isAheadOfAttacker() const;
  bool isAtTarget() const;
  bool isClosestTeamMemberToBall() const;
  bool isClosestPlayerOnPitchToBall() const;
  bool isControllingPlayer() const;
  // Within a third of the pitch length of the opponents' goal
  bool isInHotRegion() const;

  Role getRole() const { return m_role; }
  static const char* toString(Role role);

  int getHomeRegionId() const { return m_homeRegionId; }
  void setHomeRegionId(int id) { m_homeRegionId = id; }
  void setDefaultHomeRegion() { m_homeRegionId = m_defaultRegionId; }
  const Kickoff::Region& getHomeRegion() const;

  float getDistanceSqToBall() const { return m_distanceSqToBall; }
  void setDistanceSqToBall(float distanceSq) { m_distanceSqToBall = distanceSq; }

  Kickoff::SteeringBehaviors& getSteering() { return m_steering; }
  const Kickoff::SteeringBehaviors& getSteering() const { return m_steering; }

  Team& getTeam() const { return m_team.get(); }
  Kickoff::Pitch& getPitch() const;
  Ball& getBall() const;
  const Kickoff::PlayerConfig& getConfig() const;

 protected:
  // Non-owning, the team owns its players
  std::reference_wrapper<Team> m_team;
  Kickoff::SteeringBehaviors m_steering;

 private:
  Role m_role;
  int m_homeRegionId;
  int m_defaultRegionId;
  float m_distanceSqToBall;
};

#endif  // PLAYER_BASE_HPP
