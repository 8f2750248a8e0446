/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef FIELD_PLAYER_HPP
#define FIELD_PLAYER_HPP

#include "core/Regulator.hpp"
#include "entities/PlayerBase.hpp"
#include "fsm/StateMachine.hpp"

/**
 * @brief Attacker or defender driven by the field player states.
 */
class FieldPlayer : public PlayerBase {
 public:
  using StateMachineType = Kickoff::StateMachine<FieldPlayer>;

  // Enters startState right away
  FieldPlayer(Team& team, int homeRegionId, Role role, StateMachineType::StateType& startState);

  void update(float deltaTime) override;
  bool handleMessage(const Kickoff::Telegram& telegram) override;

  // Rate limits kicks to kickFrequency per second of game time
  bool isReadyForNextKick() { return m_kickLimiter.isReady(); }

  StateMachineType& getStateMachine() { return m_stateMachine; }
  const StateMachineType& getStateMachine() const { return m_stateMachine; }

 private:
  StateMachineType m_stateMachine;
  Kickoff::Regulator m_kickLimiter;
};

#endif  // FIELD_PLAYER_HPP
