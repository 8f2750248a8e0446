/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/fieldPlayerStates/SupportAttackerState.hpp"
#include "core/Logger.hpp"
#include "entities/FieldPlayer.hpp"
#include "entities/Team.hpp"
#include "entities/fieldPlayerStates/ReturnToHomeRegionState.hpp"
#include <format>

namespace Kickoff {

void SupportAttackerState::enter(FieldPlayer& player) {
    player.getSteering().arriveOn();
    player.getSteering().setTarget(player.getTeam().getSupportSpot());
    PLAYER_DEBUG(std::format("Player {} supports the attack", player.getID()));
}

void SupportAttackerState::execute(FieldPlayer& player) {
    Team& team = player.getTeam();
    SteeringBehaviors& steering = player.getSteering();

    if (!team.isInControl()) {
        player.getStateMachine().changeState(ReturnToHomeRegionState::Instance());
        return;
    }

    // The best spot moves as the play develops
    const Vector2D& supportSpot = team.getSupportSpot();
    if (supportSpot != steering.getTarget()) {
        steering.setTarget(supportSpot);
        steering.arriveOn();
    }

    Vector2D shotTarget;
    if (team.isShootPossible(player.getPosition(), player.getConfig().shootingForce, shotTarget)) {
        team.requestPass(player);
    }

    if (player.isAtTarget()) {
        steering.arriveOff();
        player.trackBall();
        player.setVelocity(Vector2D(0, 0));

        if (!player.isThreatened()) {
            team.requestPass(player);
        }
    }
}

void SupportAttackerState::exit(FieldPlayer& player) {
    player.getTeam().setSupportingPlayer(nullptr);
    player.getSteering().arriveOff();
}

} // namespace Kickoff
