/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/teamStates/PrepareForKickOffState.hpp"
#include "entities/Team.hpp"
#include "entities/teamStates/DefendingState.hpp"
#include "world/Pitch.hpp"

namespace Kickoff {

void PrepareForKickOffState::enter(Team& team) {
    team.setControllingPlayer(nullptr);
    team.setSupportingPlayer(nullptr);
    team.setReceivingPlayer(nullptr);
    team.setPlayerClosestToBall(nullptr);

    team.returnAllFieldPlayersToHome(true);
}

void PrepareForKickOffState::execute(Team& team) {
    // Kick off once both sides are lined up
    if (team.isAllPlayersAtHome() && team.getOpponents().isAllPlayersAtHome()) {
        team.getStateMachine().changeState(DefendingState::Instance());
    }
}

void PrepareForKickOffState::exit(Team& team) {
    team.getPitch().setGameOn(true);
}

} // namespace Kickoff
