/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef GOAL_KEEPER_HPP
#define GOAL_KEEPER_HPP

#include "entities/PlayerBase.hpp"
#include "fsm/StateMachine.hpp"

/**
 * @brief The player that guards the home goal.
 */
class GoalKeeper : public PlayerBase {
 public:
  using StateMachineType = Kickoff::StateMachine<GoalKeeper>;

  // Enters startState right away
  GoalKeeper(Team& team, int homeRegionId, StateMachineType::StateType& startState);

  void update(float deltaTime) override;
  bool handleMessage(const Kickoff::Telegram& telegram) override;

  // Ball is inside the intercept range of the home goal center
  bool isBallWithinRangeForIntercept() const;
  bool isTooFarFromGoalMouth() const;

  /**
   * @brief Point on the goal line the keeper guards.
   *
   * Follows the ball's lateral position, scaled from the pitch height down
   * to the goal width.
   */
  Vector2D getRearInterposeTarget() const;

  /**
   * @brief Kicks the held ball toward target and tells receiver to collect it.
   *
   * Releases the keeper's possession and goes back to tending the goal.
   */
  void throwBallTo(PlayerBase& receiver, const Vector2D& target, float force);

  // Passing force when it reaches target, the full shooting force otherwise
  float getThrowingForce(const Vector2D& target) const;

  // Nearest field player, nullptr for a team without any
  PlayerBase* findNearestFieldPlayer() const;

  // Ticks spent holding the ball without a safe pass
  int getFailedPassAttempts() const { return m_failedPassAttempts; }
  void resetFailedPassAttempts() { m_failedPassAttempts = 0; }
  int recordFailedPassAttempt() { return ++m_failedPassAttempts; }

  StateMachineType& getStateMachine() { return m_stateMachine; }
  const StateMachineType& getStateMachine() const { return m_stateMachine; }

 private:
  StateMachineType m_stateMachine;
  int m_failedPassAttempts{0};
};

#endif  // GOAL_KEEPER_HPP
