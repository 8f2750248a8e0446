/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/fieldPlayerStates/KickBallState.hpp"
#include "core/Logger.hpp"
#include "entities/Ball.hpp"
#include "entities/FieldPlayer.hpp"
#include "entities/Team.hpp"
#include "entities/fieldPlayerStates/ChaseBallState.hpp"
#include "entities/fieldPlayerStates/DribbleState.hpp"
#include "entities/fieldPlayerStates/WaitState.hpp"
#include "world/Pitch.hpp"
#include <format>
#include <random>

namespace Kickoff {

void KickBallState::enter(FieldPlayer& player) {
    player.getTeam().setControllingPlayer(&player);

    // Only so many kicks per second
    if (!player.isReadyForNextKick()) {
        player.getStateMachine().changeState(ChaseBallState::Instance());
    }
}

void KickBallState::execute(FieldPlayer& player) {
    Team& team = player.getTeam();
    Pitch& pitch = player.getPitch();
    Ball& ball = player.getBall();
    const PlayerConfig& config = player.getConfig();

    const Vector2D toBall = (ball.getPosition() - player.getPosition()).normalized();
    const float dot = toBall.dot(player.getHeading());

    // Keeper has it, someone is already receiving, or the ball is behind
    if (pitch.isGoalKeeperInBallPossession() || dot < 0.0f || team.getReceivingPlayer() != nullptr) {
        player.getStateMachine().changeState(ChaseBallState::Instance());
        return;
    }

    Vector2D ballTarget;

    // Shot. Kicks lose power the less the player faces the ball.
    float power = config.shootingForce * dot;
    std::uniform_real_distribution<float> chance(0.0f, 1.0f);
    if (team.isShootPossible(ball.getPosition(), power, ballTarget) ||
        chance(pitch.getRandomEngine()) < config.chanceOfPotShot) {
        ballTarget = ball.addNoiseToKick(ballTarget);
        ball.kick(ballTarget - ball.getPosition(), power);
        PLAYER_DEBUG(std::format("Player {} shoots at ({}, {})", player.getID(), ballTarget.getX(),
                                 ballTarget.getY()));

        player.getStateMachine().changeState(WaitState::Instance());
        player.findSupport();
        return;
    }

    // Pass
    power = config.passingForce * dot;
    PlayerBase* receiver = nullptr;
    if (player.isThreatened() &&
        team.isPassPossible(player, receiver, ballTarget, power, config.minPassDistance)) {
        ballTarget = ball.addNoiseToKick(ballTarget);
        ball.kick(ballTarget - ball.getPosition(), power);
        PLAYER_DEBUG(std::format("Player {} passes to {}", player.getID(), receiver->getID()));

        pitch.getDispatcher().sendMessage(player.getID(), receiver->getID(),
                                          MessageType::RECEIVE_BALL, ballTarget);
        player.getStateMachine().changeState(WaitState::Instance());
        player.findSupport();
        return;
    }

    player.findSupport();
    player.getStateMachine().changeState(DribbleState::Instance());
}

} // namespace Kickoff
