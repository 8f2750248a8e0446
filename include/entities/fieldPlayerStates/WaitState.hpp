/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef WAIT_STATE_HPP
#define WAIT_STATE_HPP

#include "fsm/State.hpp"

class FieldPlayer;

namespace Kickoff {

/**
 * @brief Hold position at the steering target, facing the ball.
 */
class WaitState : public State<FieldPlayer> {
public:
    static WaitState& Instance() {
        static WaitState instance;
        return instance;
    }

    void enter(FieldPlayer& player) override;
    void execute(FieldPlayer& player) override;

    const char* getName() const override { return "Wait"; }

private:
    WaitState() = default;
};

} // namespace Kickoff

#endif // WAIT_STATE_HPP
