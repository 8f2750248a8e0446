/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/FieldPlayer.hpp"
#include "entities/Team.hpp"
#include "entities/fieldPlayerStates/FieldPlayerGlobalState.hpp"
#include "world/Pitch.hpp"

FieldPlayer::FieldPlayer(Team& team, int homeRegionId, Role role,
                         StateMachineType::StateType& startState)
    : PlayerBase(team, homeRegionId, role), m_stateMachine(*this),
      m_kickLimiter(team.getPitch().getClock(), team.getPitch().getRandomEngine(),
                    team.getPitch().getConfig().player.kickFrequency) {
  m_stateMachine.setCurrentState(&startState);
  m_stateMachine.setPreviousState(&startState);
  m_stateMachine.setGlobalState(&Kickoff::FieldPlayerGlobalState::Instance());
  startState.enter(*this);
}

void FieldPlayer::update(float deltaTime) {
  m_stateMachine.update();

  const Vector2D force = m_steering.calculate(deltaTime);

  // No steering means the player is meant to stop
  if (force.lengthSquared() == 0.0f) {
    m_velocity *= getConfig().brakingRate;
  }

  integrate(force);
}

bool FieldPlayer::handleMessage(const Kickoff::Telegram& telegram) {
  return m_stateMachine.handleMessage(telegram);
}
