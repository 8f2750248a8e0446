/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/fieldPlayerStates/ChaseBallState.hpp"
#include "entities/Ball.hpp"
#include "entities/FieldPlayer.hpp"
#include "entities/fieldPlayerStates/KickBallState.hpp"
#include "entities/fieldPlayerStates/ReturnToHomeRegionState.hpp"

namespace Kickoff {

void ChaseBallState::enter(FieldPlayer& player) {
    player.getSteering().seekOn();
}

void ChaseBallState::execute(FieldPlayer& player) {
    if (player.isBallWithinKickingRange()) {
        player.getStateMachine().changeState(KickBallState::Instance());
        return;
    }

    if (player.isClosestTeamMemberToBall()) {
        player.getSteering().setTarget(player.getBall().getPosition());
        return;
    }

    player.getStateMachine().changeState(ReturnToHomeRegionState::Instance());
}

void ChaseBallState::exit(FieldPlayer& player) {
    player.getSteering().seekOff();
}

} // namespace Kickoff
