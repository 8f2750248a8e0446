/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef RECEIVE_BALL_STATE_HPP
#define RECEIVE_BALL_STATE_HPP

#include "fsm/State.hpp"

class FieldPlayer;

namespace Kickoff {

/**
 * @brief Wait for or run onto a pass.
 *
 * Arrives at the pass target when no opponent is near and either the
 * player is in the hot region or a coin flip says so; pursues the ball
 * otherwise.
 */
class ReceiveBallState : public State<FieldPlayer> {
public:
    static ReceiveBallState& Instance() {
        static ReceiveBallState instance;
        return instance;
    }

    void enter(FieldPlayer& player) override;
    void execute(FieldPlayer& player) override;
    void exit(FieldPlayer& player) override;

    const char* getName() const override { return "ReceiveBall"; }

private:
    ReceiveBallState() = default;
};

} // namespace Kickoff

#endif // RECEIVE_BALL_STATE_HPP
