/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/keeperStates/PutBallBackInPlayState.hpp"
#include "core/Logger.hpp"
#include "entities/GoalKeeper.hpp"
#include "entities/Team.hpp"
#include <format>

namespace Kickoff {

void PutBallBackInPlayState::enter(GoalKeeper& keeper) {
    Team& team = keeper.getTeam();
    team.setControllingPlayer(&keeper);
    keeper.resetFailedPassAttempts();

    // Everyone clears out before the throw
    team.getOpponents().returnAllFieldPlayersToHome();
    team.returnAllFieldPlayersToHome();
}

void PutBallBackInPlayState::execute(GoalKeeper& keeper) {
    const PlayerConfig& config = keeper.getConfig();
    PlayerBase* receiver = nullptr;
    Vector2D ballTarget;

    if (keeper.getTeam().isPassPossible(keeper, receiver, ballTarget, config.passingForce,
                                        config.keeperMinPassDistance)) {
        keeper.throwBallTo(*receiver, ballTarget, config.passingForce);
        return;
    }

    keeper.setVelocity(Vector2D(0, 0));
    if (keeper.recordFailedPassAttempt() < config.keeperMaxPassAttempts) {
        return;
    }

    // Nobody in passing range for too long
    PlayerBase* nearest = keeper.findNearestFieldPlayer();
    if (nearest == nullptr) {
        return;
    }
    KEEPER_INFO(std::format("Keeper {} clears the ball to {} after {} attempts", keeper.getID(),
                            nearest->getID(), keeper.getFailedPassAttempts()));
    keeper.throwBallTo(*nearest, nearest->getPosition(),
                       keeper.getThrowingForce(nearest->getPosition()));
}

} // namespace Kickoff
