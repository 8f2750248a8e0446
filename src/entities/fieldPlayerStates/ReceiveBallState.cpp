/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/fieldPlayerStates/ReceiveBallState.hpp"
#include "entities/Ball.hpp"
#include "entities/FieldPlayer.hpp"
#include "entities/Team.hpp"
#include "entities/fieldPlayerStates/ChaseBallState.hpp"
#include "world/Pitch.hpp"
#include <random>

namespace Kickoff {

void ReceiveBallState::enter(FieldPlayer& player) {
    Team& team = player.getTeam();
    team.setReceivingPlayer(&player);
    team.setControllingPlayer(&player);

    const PlayerConfig& config = player.getConfig();
    std::uniform_real_distribution<float> chance(0.0f, 1.0f);
    const bool preferArrive = player.isInHotRegion() ||
                              chance(player.getPitch().getRandomEngine()) <
                                  config.chanceOfUsingArriveToReceive;

    if (preferArrive && !team.isOpponentWithinRadius(player.getPosition(), config.passThreatRadius)) {
        player.getSteering().arriveOn();
    } else {
        player.getSteering().pursuitOn();
    }
}

void ReceiveBallState::execute(FieldPlayer& player) {
    if (player.isBallWithinReceivingRange() || !player.getTeam().isInControl()) {
        player.getStateMachine().changeState(ChaseBallState::Instance());
        return;
    }

    SteeringBehaviors& steering = player.getSteering();
    if (steering.isOn(BehaviorKind::Pursuit)) {
        steering.setTarget(player.getBall().getPosition());
    }

    if (player.isAtTarget()) {
        steering.arriveOff();
        steering.pursuitOff();
        player.trackBall();
        player.setVelocity(Vector2D(0, 0));
    }
}

void ReceiveBallState::exit(FieldPlayer& player) {
    player.getSteering().arriveOff();
    player.getSteering().pursuitOff();
    player.getTeam().setReceivingPlayer(nullptr);
}

} // namespace Kickoff
