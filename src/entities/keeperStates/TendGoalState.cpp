/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/keeperStates/TendGoalState.hpp"
#include "entities/Ball.hpp"
#include "entities/GoalKeeper.hpp"
#include "entities/Team.hpp"
#include "entities/keeperStates/InterceptBallState.hpp"
#include "entities/keeperStates/KeeperReturnHomeState.hpp"
#include "entities/keeperStates/PutBallBackInPlayState.hpp"
#include "world/Pitch.hpp"

namespace Kickoff {

void TendGoalState::enter(GoalKeeper& keeper) {
    // Stay between the ball and a point at the back of the goal
    keeper.getSteering().interposeOn(keeper.getConfig().keeperTendingDistance);
    keeper.getSteering().setTarget(keeper.getRearInterposeTarget());
}

void TendGoalState::execute(GoalKeeper& keeper) {
    keeper.getSteering().setTarget(keeper.getRearInterposeTarget());

    if (keeper.isBallWithinKeeperRange()) {
        keeper.getBall().trap();
        keeper.getPitch().setGoalKeeperInBallPossession(true);
        keeper.getStateMachine().changeState(PutBallBackInPlayState::Instance());
        return;
    }

    Team& team = keeper.getTeam();
    if (keeper.isTooFarFromGoalMouth() && team.isInControl()) {
        keeper.getStateMachine().changeState(KeeperReturnHomeState::Instance());
        return;
    }

    if (keeper.isBallWithinRangeForIntercept() && !team.isInControl()) {
        keeper.getStateMachine().changeState(InterceptBallState::Instance());
    }
}

void TendGoalState::exit(GoalKeeper& keeper) {
    keeper.getSteering().interposeOff();
}

} // namespace Kickoff
