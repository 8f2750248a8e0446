/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/teamStates/DefendingState.hpp"
#include "core/Logger.hpp"
#include "entities/Team.hpp"
#include "entities/teamStates/AttackingState.hpp"
#include <format>

namespace Kickoff {

void DefendingState::enter(Team& team) {
    TEAM_DEBUG(std::format("{} team defending", toString(team.getColor())));
    team.setupTeamPositions();
    team.updateTargetsOfWaitingPlayers();
}

void DefendingState::execute(Team& team) {
    if (team.isInControl()) {
        team.getStateMachine().changeState(AttackingState::Instance());
    }
}

} // namespace Kickoff
