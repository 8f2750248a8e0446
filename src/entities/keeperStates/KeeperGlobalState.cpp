/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/keeperStates/KeeperGlobalState.hpp"
#include "entities/GoalKeeper.hpp"
#include "entities/Team.hpp"
#include "entities/keeperStates/InterceptBallState.hpp"
#include "entities/keeperStates/KeeperReturnHomeState.hpp"
#include "entities/keeperStates/PutBallBackInPlayState.hpp"

namespace Kickoff {

void KeeperGlobalState::execute(GoalKeeper& /*keeper*/) {}

bool KeeperGlobalState::onMessage(GoalKeeper& keeper, const Telegram& telegram) {
    switch (telegram.getType()) {
    case MessageType::GO_HOME:
        keeper.setDefaultHomeRegion();
        keeper.getStateMachine().changeState(KeeperReturnHomeState::Instance());
        return true;

    case MessageType::RECEIVE_BALL:
        keeper.getStateMachine().changeState(InterceptBallState::Instance());
        return true;

    case MessageType::PASS_TO_ME: {
        // Only a keeper holding the ball can hand it out
        if (!keeper.getStateMachine().isInState(PutBallBackInPlayState::Instance())) {
            return false;
        }
        const EntityID* requesterId = telegram.getEntityId();
        PlayerBase* requester =
            requesterId != nullptr ? keeper.getTeam().getPlayerById(*requesterId) : nullptr;
        if (requester == nullptr || requester == &keeper) {
            return false;
        }
        keeper.throwBallTo(*requester, requester->getPosition(),
                           keeper.getThrowingForce(requester->getPosition()));
        return true;
    }

    default:
        return false;
    }
}

} // namespace Kickoff
