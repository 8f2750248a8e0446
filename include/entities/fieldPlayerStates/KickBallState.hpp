/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef KICK_BALL_STATE_HPP
#define KICK_BALL_STATE_HPP

#include "fsm/State.hpp"

class FieldPlayer;

namespace Kickoff {

/**
 * @brief Shoot if a shot is on, otherwise pass when threatened, otherwise
 * dribble.
 */
class KickBallState : public State<FieldPlayer> {
public:
    static KickBallState& Instance() {
        static KickBallState instance;
        return instance;
    }

    void enter(FieldPlayer& player) override;
    void execute(FieldPlayer& player) override;

    const char* getName() const override { return "KickBall"; }

private:
    KickBallState() = default;
};

} // namespace Kickoff

#endif // KICK_BALL_STATE_HPP
