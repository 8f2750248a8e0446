/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef INTERCEPT_BALL_STATE_HPP
#define INTERCEPT_BALL_STATE_HPP

#include "fsm/State.hpp"

class GoalKeeper;

namespace Kickoff {

// Pursue the ball until it is trapped or the keeper strays too far
class InterceptBallState : public State<GoalKeeper> {
public:
    static InterceptBallState& Instance() {
        static InterceptBallState instance;
        return instance;
    }

    void enter(GoalKeeper& keeper) override;
    void execute(GoalKeeper& keeper) override;
    void exit(GoalKeeper& keeper) override;

    const char* getName() const override { return "InterceptBall"; }

private:
    InterceptBallState() = default;
};

} // namespace Kickoff

#endif // INTERCEPT_BALL_STATE_HPP
