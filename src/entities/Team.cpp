/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/Team.hpp"
#include "core/Logger.hpp"
#include "entities/Ball.hpp"
#include "entities/FieldPlayer.hpp"
#include "entities/GoalKeeper.hpp"
#include "entities/fieldPlayerStates/ReturnToHomeRegionState.hpp"
#include "entities/fieldPlayerStates/WaitState.hpp"
#include "entities/keeperStates/TendGoalState.hpp"
#include "entities/teamStates/AttackingState.hpp"
#include "entities/teamStates/DefendingState.hpp"
#include "utils/Geometry.hpp"
#include "world/Goal.hpp"
#include "world/Pitch.hpp"
#include <array>
#include <cmath>
#include <format>
#include <random>
#include <stdexcept>

namespace {

// Keeper, attacker, attacker, defender, defender
constexpr std::array<int, 5> BLUE_HOME_REGIONS{1, 6, 8, 3, 5};
constexpr std::array<int, 5> RED_HOME_REGIONS{16, 9, 11, 12, 14};

constexpr std::array<int, 5> BLUE_ATTACKING_REGIONS{1, 12, 14, 6, 4};
constexpr std::array<int, 5> RED_ATTACKING_REGIONS{16, 3, 5, 9, 13};
constexpr std::array<int, 5> BLUE_DEFENDING_REGIONS{1, 6, 8, 3, 5};
constexpr std::array<int, 5> RED_DEFENDING_REGIONS{16, 9, 11, 12, 14};

// Part of the receiver's running range used for the tangent pass targets
constexpr float INTERCEPT_RANGE_SCALE = 0.3f;

}  // namespace

const char* toString(TeamColor color) {
  switch (color) {
    case TeamColor::Blue:
      return "Blue";
    case TeamColor::Red:
      return "Red";
  }
  return "Unknown";
}

Team::Team(Kickoff::Pitch& pitch, Kickoff::Goal& homeGoal, Kickoff::Goal& opponentsGoal,
           TeamColor color)
    : m_pitch(pitch), m_homeGoal(homeGoal), m_opponentsGoal(opponentsGoal), m_color(color),
      m_stateMachine(*this) {
  setName(std::format("{} team", toString(color)));

  // Start out defending without running the state's enter()
  m_stateMachine.setCurrentState(&Kickoff::DefendingState::Instance());
  m_stateMachine.setPreviousState(&Kickoff::DefendingState::Instance());

  createPlayers();

  // Red attacks toward -x, so its spots lie on the left half
  m_supportSpotCalculator = std::make_unique<Kickoff::SupportSpotCalculator>(
      *this, color == TeamColor::Red, pitch.getConfig().supportSpot, pitch.getClock(),
      pitch.getRandomEngine());

  TEAM_INFO(std::format("{} created with {} players", getName(), m_players.size()));
}

Team::~Team() {
  Kickoff::MessageDispatcher& dispatcher = getPitch().getDispatcher();
  for (const auto& player : m_players) {
    dispatcher.removeEntity(player->getID());
  }
  dispatcher.removeEntity(getID());
}

void Team::createPlayers() {
  const std::array<int, 5>& regions =
      m_color == TeamColor::Blue ? BLUE_HOME_REGIONS : RED_HOME_REGIONS;

  auto keeper = std::make_unique<GoalKeeper>(*this, regions[0],
                                             Kickoff::TendGoalState::Instance());
  m_goalKeeper = keeper.get();
  m_players.push_back(std::move(keeper));

  for (size_t i = 1; i < regions.size(); ++i) {
    const PlayerBase::Role role = i < 3 ? PlayerBase::Role::Attacker : PlayerBase::Role::Defender;
    auto player =
        std::make_unique<FieldPlayer>(*this, regions[i], role, Kickoff::WaitState::Instance());
    m_fieldPlayers.push_back(player.get());
    m_players.push_back(std::move(player));
  }

  Kickoff::MessageDispatcher& dispatcher = getPitch().getDispatcher();
  for (auto& player : m_players) {
    player->setName(std::format("{} {} {}", toString(m_color), PlayerBase::toString(player->getRole()),
                                player->getID()));
    dispatcher.registerEntity(*player);
  }
  dispatcher.registerEntity(*this);
}

Team& Team::getOpponents() const {
  if (m_opponents == nullptr) {
    TEAM_ERROR(std::format("{} has no opponents", getName()));
    throw std::logic_error("Team - opponents have not been set");
  }
  return *m_opponents;
}

void Team::update(float deltaTime) {
  calculateClosestPlayerToBall();

  // Switches between attack and defense, or waits for the kick-off
  m_stateMachine.update();

  for (auto& player : m_players) {
    player->update(deltaTime);
  }
}

void Team::setControllingPlayer(PlayerBase* player) {
  m_controllingPlayer = player;
  getOpponents().lostControl();
}

void Team::calculateClosestPlayerToBall() {
  const Vector2D& ballPosition = getPitch().getBall().getPosition();
  float closestSoFar = std::numeric_limits<float>::max();

  for (auto& player : m_players) {
    const float distanceSq = Vector2D::distanceSquared(player->getPosition(), ballPosition);
    player->setDistanceSqToBall(distanceSq);

    if (distanceSq < closestSoFar) {
      closestSoFar = distanceSq;
      m_playerClosestToBall = player.get();
    }
  }

  m_distSqToBallOfClosestPlayer = closestSoFar;
}

void Team::updateTargetsOfWaitingPlayers() {
  for (FieldPlayer* player : m_fieldPlayers) {
    const auto* state = player->getStateMachine().getCurrentState();
    if (state == &Kickoff::WaitState::Instance() ||
        state == &Kickoff::ReturnToHomeRegionState::Instance()) {
      player->getSteering().setTarget(player->getHomeRegion().getCenter());
    }
  }
}

PlayerBase* Team::calculateBestSupportingAttacker() {
  const Vector2D& supportSpot = getSupportSpot();
  float closestSoFar = std::numeric_limits<float>::max();
  PlayerBase* bestPlayer = nullptr;

  for (FieldPlayer* player : m_fieldPlayers) {
    if (player->getRole() != PlayerBase::Role::Attacker || player == m_controllingPlayer) {
      continue;
    }

    const float distanceSq = Vector2D::distanceSquared(player->getPosition(), supportSpot);
    if (distanceSq < closestSoFar) {
      closestSoFar = distanceSq;
      bestPlayer = player;
    }
  }

  return bestPlayer;
}

void Team::calculateBestSupportingPosition() {
  m_supportSpotCalculator->calculateBestSupportingPosition();
}

const Vector2D& Team::getSupportSpot() {
  return m_supportSpotCalculator->getBestSupportingSpot();
}

void Team::requestPass(PlayerBase& requester) {
  if (m_controllingPlayer == nullptr || m_controllingPlayer == &requester) {
    return;
  }

  // Only a fraction of the requests are made
  std::uniform_real_distribution<float> chance(0.0f, 1.0f);
  if (chance(getPitch().getRandomEngine()) > getPitch().getConfig().player.chanceOfRequestingPass) {
    return;
  }

  if (isPassSafeFromAllOpponents(m_controllingPlayer->getPosition(), requester.getPosition(),
                                 &requester, getPitch().getConfig().player.passingForce)) {
    TEAM_DEBUG(std::format("Player {} asks {} for the ball", requester.getID(),
                           m_controllingPlayer->getID()));
    getPitch().getDispatcher().sendMessage(requester.getID(), m_controllingPlayer->getID(),
                                           Kickoff::MessageType::PASS_TO_ME, requester.getID());
  }
}

void Team::returnAllFieldPlayersToHome(bool withGoalKeeper) {
  Kickoff::MessageDispatcher& dispatcher = getPitch().getDispatcher();
  for (auto& player : m_players) {
    if (withGoalKeeper || player->getRole() != PlayerBase::Role::GoalKeeper) {
      dispatcher.sendMessage(getID(), player->getID(), Kickoff::MessageType::GO_HOME);
    }
  }
}

void Team::setupTeamPositions() {
  const std::array<int, 5>* regions = nullptr;
  if (m_stateMachine.isInState(Kickoff::AttackingState::Instance())) {
    regions = m_color == TeamColor::Blue ? &BLUE_ATTACKING_REGIONS : &RED_ATTACKING_REGIONS;
  } else if (m_stateMachine.isInState(Kickoff::DefendingState::Instance())) {
    regions = m_color == TeamColor::Blue ? &BLUE_DEFENDING_REGIONS : &RED_DEFENDING_REGIONS;
  } else {
    TEAM_ERROR(std::format("{} has no positions for state {}", getName(),
                           m_stateMachine.getNameOfCurrentState()));
    throw std::logic_error("Team - no position data for the current state");
  }

  for (size_t i = 0; i < m_players.size(); ++i) {
    m_players[i]->setHomeRegionId((*regions)[i]);
  }
}

bool Team::isAllPlayersAtHome() const {
  for (const auto& player : m_players) {
    if (!player->isInHomeRegion()) {
      return false;
    }
  }
  return true;
}

bool Team::isShootPossible(const Vector2D& ballPosition, float kickingPower,
                           Vector2D& shotTarget) const {
  const Kickoff::Goal& goal = getOpponentsGoal();
  const Ball& ball = getPitch().getBall();
  const float ballRadius = ball.getBoundingRadius();

  // Integer positions between the posts, clear of the ball radius
  const int minY = static_cast<int>(std::ceil(goal.getLeftPost().getY() + ballRadius));
  const int maxY = static_cast<int>(std::floor(goal.getRightPost().getY() - ballRadius));
  if (minY > maxY) {
    return false;
  }
  std::uniform_int_distribution<int> randomY(minY, maxY);

  const int attempts = getPitch().getConfig().player.shotAttempts;
  for (int i = 0; i < attempts; ++i) {
    shotTarget = Vector2D(goal.getCenter().getX(),
                          static_cast<float>(randomY(getPitch().getRandomEngine())));

    // Strong enough to get over the line, and nobody can cut it off
    const float time = ball.timeToCoverDistance(ballPosition, shotTarget, kickingPower);
    if (time >= 0.0f && isPassSafeFromAllOpponents(ballPosition, shotTarget, nullptr, kickingPower)) {
      return true;
    }
  }

  return false;
}

bool Team::isPassPossible(const PlayerBase& passer, PlayerBase*& receiver, Vector2D& passTarget,
                          float passPower, float minPassingDistance) const {
  receiver = nullptr;
  const float minDistanceSq = minPassingDistance * minPassingDistance;
  const float goalX = getOpponentsGoal().getCenter().getX();
  float closestToGoalSoFar = std::numeric_limits<float>::max();
  Vector2D target;

  for (const auto& player : m_players) {
    if (player.get() == &passer ||
        Vector2D::distanceSquared(passer.getPosition(), player->getPosition()) <= minDistanceSq) {
      continue;
    }

    if (isPassToReceiverPossible(*player, target, passPower)) {
      const float distanceToGoal = std::abs(target.getX() - goalX);
      if (distanceToGoal < closestToGoalSoFar) {
        closestToGoalSoFar = distanceToGoal;
        receiver = player.get();
        passTarget = target;
      }
    }
  }

  return receiver != nullptr;
}

bool Team::isPassToReceiverPossible(const PlayerBase& receiver, Vector2D& passTarget,
                                    float passPower) const {
  const Kickoff::Pitch& pitch = getPitch();
  const Ball& ball = pitch.getBall();

  // Time for the ball to reach a receiver standing still
  const float time = ball.timeToCoverDistance(ball.getPosition(), receiver.getPosition(), passPower);
  if (time < 0.0f) {
    return false;
  }

  const float interceptRange = time * receiver.getMaxSpeed() * INTERCEPT_RANGE_SCALE;

  std::vector<Vector2D> passes;
  passes.reserve(3);
  Vector2D tangent1;
  Vector2D tangent2;
  const bool hasTangents = Kickoff::Geometry::getTangentPoints(
      receiver.getPosition(), interceptRange, ball.getPosition(), tangent1, tangent2);
  if (hasTangents) {
    passes.push_back(tangent1);
  }
  passes.push_back(receiver.getPosition());
  if (hasTangents) {
    passes.push_back(tangent2);
  }

  const float goalX = getOpponentsGoal().getCenter().getX();
  float closestSoFar = std::numeric_limits<float>::max();
  bool result = false;

  for (const Vector2D& pass : passes) {
    const float distance = std::abs(pass.getX() - goalX);
    if (distance < closestSoFar && pitch.getPlayingArea().isInside(pass) &&
        isPassSafeFromAllOpponents(ball.getPosition(), pass, &receiver, passPower)) {
      closestSoFar = distance;
      passTarget = pass;
      result = true;
    }
  }

  return result;
}

bool Team::isPassSafeFromAllOpponents(const Vector2D& from, const Vector2D& target,
                                      const PlayerBase* receiver, float passingForce) const {
  for (const auto& opponent : getOpponents().getPlayers()) {
    if (!isPassSafeFromOpponent(from, target, receiver, *opponent, passingForce)) {
      return false;
    }
  }
  return true;
}

bool Team::isPassSafeFromOpponent(const Vector2D& from, const Vector2D& target,
                                  const PlayerBase* receiver, const PlayerBase& opponent,
                                  float passingForce) const {
  Vector2D heading = (target - from).normalized();
  if (heading.isZero()) {
    heading = Vector2D(1, 0);
  }

  const Vector2D localOpponent =
      Kickoff::Geometry::pointToLocalSpace(opponent.getPosition(), heading, heading.perp(), from);

  // Behind the kicker. The ball outruns any player.
  if (localOpponent.getX() < 0.0f) {
    return true;
  }

  // Opponent further away than the target: only a race to the target matters
  if (Vector2D::distanceSquared(from, target) <
      Vector2D::distanceSquared(from, opponent.getPosition())) {
    if (receiver == nullptr) {
      return true;
    }
    return Vector2D::distanceSquared(target, opponent.getPosition()) >
           Vector2D::distanceSquared(target, receiver->getPosition());
  }

  // Time for the ball to get level with the opponent, and how far they run meanwhile
  const Ball& ball = getPitch().getBall();
  const float time =
      ball.timeToCoverDistance(Vector2D(0, 0), Vector2D(localOpponent.getX(), 0), passingForce);
  const float reach = opponent.getMaxSpeed() * time + ball.getBoundingRadius() +
                      opponent.getBoundingRadius();

  return std::abs(localOpponent.getY()) >= reach;
}

bool Team::isOpponentWithinRadius(const Vector2D& position, float radius) const {
  const float radiusSq = radius * radius;
  for (const auto& opponent : getOpponents().getPlayers()) {
    if (Vector2D::distanceSquared(opponent->getPosition(), position) < radiusSq) {
      return true;
    }
  }
  return false;
}

PlayerBase& Team::getPlayer(size_t index) const {
  if (index >= m_players.size()) {
    TEAM_ERROR(std::format("Player index {} out of range for {}", index, getName()));
    throw std::out_of_range("Team - player index out of range");
  }
  return *m_players[index];
}

PlayerBase* Team::getPlayerById(EntityID id) const {
  for (const auto& player : m_players) {
    if (player->getID() == id) {
      return player.get();
    }
  }
  return nullptr;
}
