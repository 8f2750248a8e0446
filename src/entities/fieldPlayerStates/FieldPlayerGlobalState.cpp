/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/fieldPlayerStates/FieldPlayerGlobalState.hpp"
#include "core/Logger.hpp"
#include "entities/Ball.hpp"
#include "entities/FieldPlayer.hpp"
#include "entities/Team.hpp"
#include "entities/fieldPlayerStates/ReceiveBallState.hpp"
#include "entities/fieldPlayerStates/ReturnToHomeRegionState.hpp"
#include "entities/fieldPlayerStates/SupportAttackerState.hpp"
#include "entities/fieldPlayerStates/WaitState.hpp"
#include "world/Pitch.hpp"
#include <format>

namespace Kickoff {

void FieldPlayerGlobalState::execute(FieldPlayer& player) {
    const PlayerConfig& config = player.getConfig();
    if (player.isBallWithinReceivingRange() && player.isControllingPlayer()) {
        player.setMaxSpeed(config.maxSpeedWithBall);
    } else {
        player.setMaxSpeed(config.maxSpeedWithoutBall);
    }
}

bool FieldPlayerGlobalState::onMessage(FieldPlayer& player, const Telegram& telegram) {
    switch (telegram.getType()) {
    case MessageType::RECEIVE_BALL:
        if (const Vector2D* target = telegram.getPosition()) {
            player.getSteering().setTarget(*target);
        }
        player.getStateMachine().changeState(ReceiveBallState::Instance());
        return true;

    case MessageType::SUPPORT_ATTACKER:
        if (player.getStateMachine().isInState(SupportAttackerState::Instance())) {
            return true;
        }
        player.getSteering().setTarget(player.getTeam().getSupportSpot());
        player.getStateMachine().changeState(SupportAttackerState::Instance());
        return true;

    case MessageType::GO_HOME:
        player.setDefaultHomeRegion();
        player.getStateMachine().changeState(ReturnToHomeRegionState::Instance());
        return true;

    case MessageType::PASS_TO_ME: {
        const EntityID* requesterId = telegram.getEntityId();
        PlayerBase* requester =
            requesterId != nullptr ? player.getTeam().getPlayerById(*requesterId) : nullptr;
        if (requester == nullptr) {
            PLAYER_WARN(std::format("Player {} got a pass request from an unknown sender",
                                    player.getID()));
            return false;
        }

        // Already passing, or the ball is out of reach
        if (player.getTeam().getReceivingPlayer() != nullptr || !player.isBallWithinKickingRange()) {
            return true;
        }

        Ball& ball = player.getBall();
        ball.kick(requester->getPosition() - ball.getPosition(), player.getConfig().passingForce);
        PLAYER_DEBUG(std::format("Player {} passes to {} on request", player.getID(),
                                 requester->getID()));

        player.getPitch().getDispatcher().sendMessage(player.getID(), requester->getID(),
                                                      MessageType::RECEIVE_BALL,
                                                      requester->getPosition());
        player.getStateMachine().changeState(WaitState::Instance());
        player.findSupport();
        return true;
    }
    }

    return false;
}

} // namespace Kickoff
