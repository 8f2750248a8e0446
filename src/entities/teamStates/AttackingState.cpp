/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/teamStates/AttackingState.hpp"
#include "core/Logger.hpp"
#include "entities/Team.hpp"
#include "entities/teamStates/DefendingState.hpp"
#include <format>

namespace Kickoff {

void AttackingState::enter(Team& team) {
    TEAM_DEBUG(std::format("{} team attacking", toString(team.getColor())));
    team.setupTeamPositions();
    team.updateTargetsOfWaitingPlayers();
}

void AttackingState::execute(Team& team) {
    if (!team.isInControl()) {
        team.getStateMachine().changeState(DefendingState::Instance());
        return;
    }

    team.calculateBestSupportingPosition();
}

void AttackingState::exit(Team& team) {
    team.setSupportingPlayer(nullptr);
}

} // namespace Kickoff
