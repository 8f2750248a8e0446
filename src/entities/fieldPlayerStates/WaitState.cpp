/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/fieldPlayerStates/WaitState.hpp"
#include "entities/FieldPlayer.hpp"
#include "entities/Team.hpp"
#include "entities/fieldPlayerStates/ChaseBallState.hpp"
#include "world/Pitch.hpp"

namespace Kickoff {

void WaitState::enter(FieldPlayer& player) {
    // During a kick-off the player waits at the center of its region
    if (!player.getPitch().isGameOn()) {
        player.getSteering().setTarget(player.getHomeRegion().getCenter());
    }
}

void WaitState::execute(FieldPlayer& player) {
    SteeringBehaviors& steering = player.getSteering();

    // Pushed off the spot, walk back
    if (!player.isAtTarget()) {
        steering.arriveOn();
    } else {
        steering.arriveOff();
        player.setVelocity(Vector2D(0, 0));
        player.trackBall();
    }

    Team& team = player.getTeam();
    if (team.isInControl() && !player.isControllingPlayer() && player.isAheadOfAttacker()) {
        team.requestPass(player);
        return;
    }

    const Pitch& pitch = player.getPitch();
    if (pitch.isGameOn() && player.isClosestTeamMemberToBall() &&
        team.getReceivingPlayer() == nullptr && !pitch.isGoalKeeperInBallPossession()) {
        player.getStateMachine().changeState(ChaseBallState::Instance());
    }
}

} // namespace Kickoff
