/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/fieldPlayerStates/ReturnToHomeRegionState.hpp"
#include "entities/FieldPlayer.hpp"
#include "entities/Team.hpp"
#include "entities/fieldPlayerStates/ChaseBallState.hpp"
#include "entities/fieldPlayerStates/WaitState.hpp"
#include "world/Pitch.hpp"

namespace Kickoff {

void ReturnToHomeRegionState::enter(FieldPlayer& player) {
    player.getSteering().arriveOn();

    const Region& home = player.getHomeRegion();
    if (!home.isInside(player.getSteering().getTarget(), true)) {
        player.getSteering().setTarget(home.getCenter());
    }
}

void ReturnToHomeRegionState::execute(FieldPlayer& player) {
    const Pitch& pitch = player.getPitch();

    if (pitch.isGameOn() && player.isClosestTeamMemberToBall() &&
        player.getTeam().getReceivingPlayer() == nullptr &&
        !pitch.isGoalKeeperInBallPossession()) {
        player.getStateMachine().changeState(ChaseBallState::Instance());
        return;
    }

    if (pitch.isGameOn() && player.isInHomeRegion()) {
        // Stop wherever the player entered the region
        player.getSteering().setTarget(player.getPosition());
        player.getStateMachine().changeState(WaitState::Instance());
    } else if (!pitch.isGameOn() && player.isAtTarget()) {
        player.getStateMachine().changeState(WaitState::Instance());
    }
}

void ReturnToHomeRegionState::exit(FieldPlayer& player) {
    player.getSteering().arriveOff();
}

} // namespace Kickoff
