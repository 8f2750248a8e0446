/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/keeperStates/InterceptBallState.hpp"
#include "core/Logger.hpp"
#include "entities/Ball.hpp"
#include "entities/GoalKeeper.hpp"
#include "entities/keeperStates/KeeperReturnHomeState.hpp"
#include "entities/keeperStates/PutBallBackInPlayState.hpp"
#include "world/Pitch.hpp"
#include <format>

namespace Kickoff {

void InterceptBallState::enter(GoalKeeper& keeper) {
    keeper.getSteering().pursuitOn();
    KEEPER_DEBUG(std::format("Keeper {} goes for the ball", keeper.getID()));
}

void InterceptBallState::execute(GoalKeeper& keeper) {
    // Give up the chase only when someone else is nearer the ball
    if (keeper.isTooFarFromGoalMouth() && !keeper.isClosestPlayerOnPitchToBall()) {
        keeper.getStateMachine().changeState(KeeperReturnHomeState::Instance());
        return;
    }

    if (keeper.isBallWithinKeeperRange()) {
        keeper.getBall().trap();
        keeper.getPitch().setGoalKeeperInBallPossession(true);
        keeper.getStateMachine().changeState(PutBallBackInPlayState::Instance());
    }
}

void InterceptBallState::exit(GoalKeeper& keeper) {
    keeper.getSteering().pursuitOff();
}

} // namespace Kickoff
