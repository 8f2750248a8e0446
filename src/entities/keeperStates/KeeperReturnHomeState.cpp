/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/keeperStates/KeeperReturnHomeState.hpp"
#include "entities/GoalKeeper.hpp"
#include "entities/Team.hpp"
#include "entities/keeperStates/TendGoalState.hpp"
#include "world/Region.hpp"

namespace Kickoff {

void KeeperReturnHomeState::enter(GoalKeeper& keeper) {
    keeper.getSteering().arriveOn();
}

void KeeperReturnHomeState::execute(GoalKeeper& keeper) {
    keeper.getSteering().setTarget(keeper.getHomeRegion().getCenter());

    // Back home, or the other team has the ball
    if (keeper.isInHomeRegion() || !keeper.getTeam().isInControl()) {
        keeper.getStateMachine().changeState(TendGoalState::Instance());
    }
}

void KeeperReturnHomeState::exit(GoalKeeper& keeper) {
    keeper.getSteering().arriveOff();
}

} // namespace Kickoff
