/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef TEAM_HPP
#define TEAM_HPP

#include "ai/SupportSpotCalculator.hpp"
#include "entities/Entity.hpp"
#include "entities/PlayerBase.hpp"
#include "fsm/StateMachine.hpp"
#include <cstdint>
#include <functional>
#include <limits>
#include <memory>
#include <vector>

class FieldPlayer;
class GoalKeeper;

namespace Kickoff {
class Goal;
class Pitch;
}

enum class TeamColor : uint8_t { Blue, Red };

const char* toString(TeamColor color);

/**
 * @brief Five players, their shared tactics and the team state machine.
 *
 * Players are created in a fixed order: keeper, two attackers, two
 * defenders. Blue defends the goal on the left and attacks toward +x, red
 * the opposite.
 *
 * The key player pointers (controlling, supporting, receiving, closest to
 * the ball) are non-owning and only ever point at this team's players.
 * They are cleared by the states that set them and re-derived every tick.
 */
class Team : public Entity {
 public:
  using StateMachineType = Kickoff::StateMachine<Team>;

  Team(Kickoff::Pitch& pitch, Kickoff::Goal& homeGoal, Kickoff::Goal& opponentsGoal,
       TeamColor color);
  ~Team() override;

  void setOpponents(Team& opponents) { m_opponents = &opponents; }
  // Throws std::logic_error before setOpponents() was called
  Team& getOpponents() const;

  void update(float deltaTime) override;

  // Key players
  PlayerBase* getControllingPlayer() const { return m_controllingPlayer; }
  // Also takes control away from the opponents
  void setControllingPlayer(PlayerBase* player);
  PlayerBase* getSupportingPlayer() const { return m_supportingPlayer; }
  void setSupportingPlayer(PlayerBase* player) { m_supportingPlayer = player; }
  PlayerBase* getReceivingPlayer() const { return m_receivingPlayer; }
  void setReceivingPlayer(PlayerBase* player) { m_receivingPlayer = player; }
  PlayerBase* getPlayerClosestToBall() const { return m_playerClosestToBall; }
  void setPlayerClosestToBall(PlayerBase* player) { m_playerClosestToBall = player; }
  float getDistSqToBallOfClosestPlayer() const { return m_distSqToBallOfClosestPlayer; }

  void lostControl() { m_controllingPlayer = nullptr; }
  bool isInControl() const { return m_controllingPlayer != nullptr; }

  // Tactics

  // Sets the home region center as target of every waiting or homebound field player
  void updateTargetsOfWaitingPlayers();
  PlayerBase* calculateBestSupportingAttacker();
  void calculateBestSupportingPosition();
  const Vector2D& getSupportSpot();

  // Asks the controlling player for the ball when a pass to the requester is safe
  void requestPass(PlayerBase& requester);
  void returnAllFieldPlayersToHome(bool withGoalKeeper = false);

  /**
   * @brief Moves every player's home region to the layout of the current
   * team state.
   *
   * Throws std::logic_error unless the team is Attacking or Defending.
   */
  void setupTeamPositions();
  bool isAllPlayersAtHome() const;

  /**
   * @brief Tries a few random targets between the opponents' posts.
   * @param shotTarget Set to the last target tried, valid or not
   * @return true if one of them is reachable and safe from all opponents
   */
  bool isShootPossible(const Vector2D& ballPosition, float kickingPower,
                       Vector2D& shotTarget) const;

  /**
   * @brief Finds the safe pass that gets the ball closest to the opponents'
   * goal.
   * @param receiver Set to the chosen teammate, nullptr when none
   * @param passTarget Set to the point to kick at
   */
  bool isPassPossible(const PlayerBase& passer, PlayerBase*& receiver, Vector2D& passTarget,
                      float passPower, float minPassingDistance) const;

  bool isPassSafeFromAllOpponents(const Vector2D& from, const Vector2D& target,
                                  const PlayerBase* receiver, float passingForce) const;
  bool isOpponentWithinRadius(const Vector2D& position, float radius) const;

  // Players
  const std::vector<std::unique_ptr<PlayerBase>>& getPlayers() const { return m_players; }
  size_t getPlayerCount() const { return m_players.size(); }
  // Throws std::out_of_range
  PlayerBase& getPlayer(size_t index) const;
  PlayerBase* getPlayerById(EntityID id) const;
  GoalKeeper& getGoalKeeper() const { return *m_goalKeeper; }
  const std::vector<FieldPlayer*>& getFieldPlayers() const { return m_fieldPlayers; }

  StateMachineType& getStateMachine() { return m_stateMachine; }
  const StateMachineType& getStateMachine() const { return m_stateMachine; }

  Kickoff::Pitch& getPitch() const { return m_pitch.get(); }
  Kickoff::Goal& getHomeGoal() const { return m_homeGoal.get(); }
  Kickoff::Goal& getOpponentsGoal() const { return m_opponentsGoal.get(); }
  TeamColor getColor() const { return m_color; }

 private:
  void createPlayers();
  void calculateClosestPlayerToBall();
  bool isPassSafeFromOpponent(const Vector2D& from, const Vector2D& target,
                              const PlayerBase* receiver, const PlayerBase& opponent,
                              float passingForce) const;
  bool isPassToReceiverPossible(const PlayerBase& receiver, Vector2D& passTarget,
                                float passPower) const;

  // Non-owning, the pitch owns goals and teams
  std::reference_wrapper<Kickoff::Pitch> m_pitch;
  std::reference_wrapper<Kickoff::Goal> m_homeGoal;
  std::reference_wrapper<Kickoff::Goal> m_opponentsGoal;
  Team* m_opponents{nullptr};
  TeamColor m_color;

  StateMachineType m_stateMachine;
  std::vector<std::unique_ptr<PlayerBase>> m_players;
  GoalKeeper* m_goalKeeper{nullptr};
  std::vector<FieldPlayer*> m_fieldPlayers;
  std::unique_ptr<Kickoff::SupportSpotCalculator> m_supportSpotCalculator;

  PlayerBase* m_controllingPlayer{nullptr};
  PlayerBase* m_supportingPlayer{nullptr};
  PlayerBase* m_receivingPlayer{nullptr};
  PlayerBase* m_playerClosestToBall{nullptr};
  float m_distSqToBallOfClosestPlayer{std::numeric_limits<float>::max()};
};

#endif  // TEAM_HPP
