/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/GoalKeeper.hpp"
#include "entities/Ball.hpp"
#include "entities/Team.hpp"
#include "core/Logger.hpp"
#include "entities/FieldPlayer.hpp"
#include "entities/keeperStates/KeeperGlobalState.hpp"
#include "entities/keeperStates/TendGoalState.hpp"
#include "world/Goal.hpp"
#include "world/Pitch.hpp"
#include <format>
#include <limits>

GoalKeeper::GoalKeeper(Team& team, int homeRegionId, StateMachineType::StateType& startState)
    : PlayerBase(team, homeRegionId, Role::GoalKeeper), m_stateMachine(*this) {
  m_stateMachine.setCurrentState(&startState);
  m_stateMachine.setPreviousState(&startState);
  m_stateMachine.setGlobalState(&Kickoff::KeeperGlobalState::Instance());
  startState.enter(*this);
}

void GoalKeeper::update(float deltaTime) {
  m_stateMachine.update();
  integrate(m_steering.calculate(deltaTime));
}

bool GoalKeeper::handleMessage(const Kickoff::Telegram& telegram) {
  return m_stateMachine.handleMessage(telegram);
}

bool GoalKeeper::isBallWithinRangeForIntercept() const {
  const float range = getConfig().keeperInterceptRange;
  return Vector2D::distanceSquared(getTeam().getHomeGoal().getCenter(),
                                   getBall().getPosition()) <= range * range;
}

bool GoalKeeper::isTooFarFromGoalMouth() const {
  const float range = getConfig().keeperMaxDistanceFromGoal;
  return Vector2D::distanceSquared(m_position, getRearInterposeTarget()) > range * range;
}

Vector2D GoalKeeper::getRearInterposeTarget() const {
  const Kickoff::Goal& homeGoal = getTeam().getHomeGoal();
  const Kickoff::Region& field = getPitch().getPlayingArea();
  const float scale = homeGoal.getWidth() / field.getHeight();
  const float ballOffset = getBall().getPosition().getY() - field.getCenter().getY();
  return Vector2D(homeGoal.getCenter().getX(), homeGoal.getCenter().getY() + ballOffset * scale);
}

void GoalKeeper::throwBallTo(PlayerBase& receiver, const Vector2D& target, float force) {
  Ball& ball = getBall();
  ball.kick(target - ball.getPosition(), force);

  Kickoff::Pitch& pitch = getPitch();
  pitch.setGoalKeeperInBallPossession(false);
  KEEPER_DEBUG(std::format("Keeper {} throws to {}", getID(), receiver.getID()));

  pitch.getDispatcher().sendMessage(getID(), receiver.getID(), Kickoff::MessageType::RECEIVE_BALL,
                                    target);
  m_stateMachine.changeState(Kickoff::TendGoalState::Instance());
}

float GoalKeeper::getThrowingForce(const Vector2D& target) const {
  const Kickoff::PlayerConfig& config = getConfig();
  const Ball& ball = getBall();
  if (ball.timeToCoverDistance(ball.getPosition(), target, config.passingForce) >= 0.0f) {
    return config.passingForce;
  }
  return config.shootingForce;
}

PlayerBase* GoalKeeper::findNearestFieldPlayer() const {
  PlayerBase* nearest = nullptr;
  float closestSoFar = std::numeric_limits<float>::max();
  for (FieldPlayer* player : getTeam().getFieldPlayers()) {
    const float distanceSq = Vector2D::distanceSquared(m_position, player->getPosition());
    if (distanceSq < closestSoFar) {
      closestSoFar = distanceSq;
      nearest = player;
    }
  }
  return nearest;
}
