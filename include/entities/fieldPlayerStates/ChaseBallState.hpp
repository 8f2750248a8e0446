/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef CHASE_BALL_STATE_HPP
#define CHASE_BALL_STATE_HPP

#include "fsm/State.hpp"

class FieldPlayer;

namespace Kickoff {

// Seek the ball while this player is the closest of its team
class ChaseBallState : public State<FieldPlayer> {
public:
    static ChaseBallState& Instance() {
        static ChaseBallState instance;
        return instance;
    }

    void enter(FieldPlayer& player) override;
    void execute(FieldPlayer& player) override;
    void exit(FieldPlayer& player) override;

    const char* getName() const override { return "ChaseBall"; }

private:
    ChaseBallState() = default;
};

} // namespace Kickoff

#endif // CHASE_BALL_STATE_HPP
