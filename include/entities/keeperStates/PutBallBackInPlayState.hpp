/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef PUT_BALL_BACK_IN_PLAY_STATE_HPP
#define PUT_BALL_BACK_IN_PLAY_STATE_HPP

#include "fsm/State.hpp"

class GoalKeeper;

namespace Kickoff {

/**
 * @brief Hold the ball until a safe pass to a teammate appears.
 *
 * After keeperMaxPassAttempts ticks without one the ball is cleared to the
 * nearest field player instead.
 */
class PutBallBackInPlayState : public State<GoalKeeper> {
public:
    static PutBallBackInPlayState& Instance() {
        static PutBallBackInPlayState instance;
        return instance;
    }

    void enter(GoalKeeper& keeper) override;
    void execute(GoalKeeper& keeper) override;

    const char* getName() const override { return "PutBallBackInPlay"; }

private:
    PutBallBackInPlayState() = default;
};

} // namespace Kickoff

#endif // PUT_BALL_BACK_IN_PLAY_STATE_HPP
