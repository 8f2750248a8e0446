/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/fieldPlayerStates/DribbleState.hpp"
#include "entities/Ball.hpp"
#include "entities/FieldPlayer.hpp"
#include "entities/Team.hpp"
#include "entities/fieldPlayerStates/ChaseBallState.hpp"
#include "utils/Geometry.hpp"
#include "world/Goal.hpp"

namespace Kickoff {

void DribbleState::enter(FieldPlayer& player) {
    player.getTeam().setControllingPlayer(&player);
}

void DribbleState::execute(FieldPlayer& player) {
    const Vector2D& attackDirection = player.getTeam().getHomeGoal().getFacing();
    const Vector2D& heading = player.getHeading();
    const PlayerConfig& config = player.getConfig();

    if (heading.dot(attackDirection) < 0.0f) {
        // Facing our own goal: turn a quarter of pi toward the attack with a small kick
        const float turn = Geometry::PI * 0.25f * static_cast<float>(heading.sign(attackDirection));
        player.getBall().kick(heading.rotated(turn), config.dribbleAndTurnForce);
    } else {
        player.getBall().kick(attackDirection, config.dribbleForce);
    }

    // Run after the ball
    player.getStateMachine().changeState(ChaseBallState::Instance());
}

} // namespace Kickoff
