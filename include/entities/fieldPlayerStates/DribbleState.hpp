/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef DRIBBLE_STATE_HPP
#define DRIBBLE_STATE_HPP

#include "fsm/State.hpp"

class FieldPlayer;

namespace Kickoff {

// Nudges the ball toward the opponents' goal, turning first if facing away
class DribbleState : public State<FieldPlayer> {
public:
    static DribbleState& Instance() {
        static DribbleState instance;
        return instance;
    }

    void enter(FieldPlayer& player) override;
    void execute(FieldPlayer& player) override;

    const char* getName() const override { return "Dribble"; }

private:
    DribbleState() = default;
};

} // namespace Kickoff

#endif // DRIBBLE_STATE_HPP
