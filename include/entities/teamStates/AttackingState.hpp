/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef ATTACKING_STATE_HPP
#define ATTACKING_STATE_HPP

#include "fsm/State.hpp"

class Team;

namespace Kickoff {

// Team has the ball: attacking layout and a support spot refreshed every tick
class AttackingState : public State<Team> {
public:
    static AttackingState& Instance() {
        static AttackingState instance;
        return instance;
    }

    void enter(Team& team) override;
    void execute(Team& team) override;
    void exit(Team& team) override;

    const char* getName() const override { return "Attacking"; }

private:
    AttackingState() = default;
};

} // namespace Kickoff

#endif // ATTACKING_STATE_HPP
