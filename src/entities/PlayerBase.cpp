/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/PlayerBase.hpp"
#include "entities/Ball.hpp"
#include "entities/Team.hpp"
#include "world/Goal.hpp"
#include "world/Pitch.hpp"
#include <cmath>
#include <limits>

namespace {

MovingEntity::Params playerParams(Team& team, int homeRegionId) {
  const Kickoff::PlayerConfig& config = team.getPitch().getConfig().player;

  MovingEntity::Params params;
  params.position = team.getPitch().getRegionById(homeRegionId).getCenter();
  params.heading = team.getColor() == TeamColor::Blue ? Vector2D(1, 0) : Vector2D(-1, 0);
  params.boundingRadius = config.radius;
  params.mass = config.mass;
  params.maxSpeed = config.maxSpeedWithoutBall;
  params.maxForce = config.maxForce;
  params.maxTurnRate = config.maxTurnRate;
  return params;
}

}  // namespace

PlayerBase::PlayerBase(Team& team, int homeRegionId, Role role)
    : MovingEntity(playerParams(team, homeRegionId)), m_team(team),
      m_steering(*this, team.getPitch(), team.getPitch().getRandomEngine(),
                 team.getPitch().getConfig().steering),
      m_role(role), m_homeRegionId(homeRegionId), m_defaultRegionId(homeRegionId),
      m_distanceSqToBall(std::numeric_limits<float>::max()) {
  m_steering.setTargetAgent1(&team.getPitch().getBall());
  m_steering.setTarget(m_position);
}

const char* PlayerBase::toString(Role role) {
  switch (role) {
    case Role::GoalKeeper:
      return "GoalKeeper";
    case Role::Attacker:
      return "Attacker";
    case Role::Defender:
      return "Defender";
  }
  return "Unknown";
}

void PlayerBase::findSupport() {
  Team& team = getTeam();
  Kickoff::MessageDispatcher& dispatcher = getPitch().getDispatcher();

  if (team.getSupportingPlayer() == nullptr) {
    PlayerBase* supporter = team.calculateBestSupportingAttacker();
    if (supporter == nullptr) {
      return;
    }
    team.setSupportingPlayer(supporter);
    dispatcher.sendMessage(getID(), supporter->getID(), Kickoff::MessageType::SUPPORT_ATTACKER);
    return;
  }

  PlayerBase* bestSupporter = team.calculateBestSupportingAttacker();
  if (bestSupporter != nullptr && bestSupporter != team.getSupportingPlayer()) {
    // Send the current supporter home before handing the job over
    dispatcher.sendMessage(getID(), team.getSupportingPlayer()->getID(),
                           Kickoff::MessageType::GO_HOME);
    team.setSupportingPlayer(bestSupporter);
    dispatcher.sendMessage(getID(), bestSupporter->getID(),
                           Kickoff::MessageType::SUPPORT_ATTACKER);
  }
}

void PlayerBase::trackBall() {
  rotateHeadingToFacePosition(getBall().getPosition());
}

void PlayerBase::trackTarget() {
  setHeading(m_steering.getTarget() - m_position);
}

float PlayerBase::getDistanceToOppGoal() const {
  return std::abs(m_position.getX() - getTeam().getOpponentsGoal().getCenter().getX());
}

float PlayerBase::getDistanceToHomeGoal() const {
  return std::abs(m_position.getX() - getTeam().getHomeGoal().getCenter().getX());
}

bool PlayerBase::isThreatened() const {
  const float comfortZoneSq = getConfig().comfortZone * getConfig().comfortZone;
  for (const auto& opponent : getTeam().getOpponents().getPlayers()) {
    if (isPositionInFrontOfPlayer(opponent->getPosition()) &&
        Vector2D::distanceSquared(m_position, opponent->getPosition()) < comfortZoneSq) {
      return true;
    }
  }
  return false;
}

bool PlayerBase::isPositionInFrontOfPlayer(const Vector2D& position) const {
  return (position - m_position).dot(m_heading) > 0.0f;
}

bool PlayerBase::isBallWithinKeeperRange() const {
  const float range = getConfig().keeperInTargetRange;
  return Vector2D::distanceSquared(m_position, getBall().getPosition()) < range * range;
}

bool PlayerBase::isBallWithinKickingRange() const {
  const float range = getConfig().kickingDistance;
  return Vector2D::distanceSquared(m_position, getBall().getPosition()) < range * range;
}

bool PlayerBase::isBallWithinReceivingRange() const {
  const float range = getConfig().receivingRange;
  return Vector2D::distanceSquared(m_position, getBall().getPosition()) < range * range;
}

bool PlayerBase::isInHomeRegion() const {
  // Field players have to reach the inner half of their region
  return getHomeRegion().isInside(m_position, m_role != Role::GoalKeeper);
}

bool PlayerBase::isAheadOfAttacker() const {
  const PlayerBase* controller = getTeam().getControllingPlayer();
  if (controller == nullptr) {
    return false;
  }
  const float attackerToGoal = std::abs(controller->getPosition().getX() -
                                        getTeam().getOpponentsGoal().getCenter().getX());
  return getDistanceToOppGoal() < attackerToGoal;
}

bool PlayerBase::isAtTarget() const {
  const float range = getConfig().inTargetRange;
  return Vector2D::distanceSquared(m_position, m_steering.getTarget()) < range * range;
}

bool PlayerBase::isClosestTeamMemberToBall() const {
  return this == getTeam().getPlayerClosestToBall();
}

bool PlayerBase::isClosestPlayerOnPitchToBall() const {
  return isClosestTeamMemberToBall() &&
         m_distanceSqToBall < getTeam().getOpponents().getDistSqToBallOfClosestPlayer();
}

bool PlayerBase::isControllingPlayer() const {
  return this == getTeam().getControllingPlayer();
}

bool PlayerBase::isInHotRegion() const {
  return getDistanceToOppGoal() < getPitch().getPlayingArea().getLength() / 3.0f;
}

const Kickoff::Region& PlayerBase::getHomeRegion() const {
  return getPitch().getRegionById(m_homeRegionId);
}

Kickoff::Pitch& PlayerBase::getPitch() const {
  return getTeam().getPitch();
}

Ball& PlayerBase::getBall() const {
  return getPitch().getBall();
}

const Kickoff::PlayerConfig& PlayerBase::getConfig() const {
  return getPitch().getConfig().player;
}
