/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef DEFENDING_STATE_HPP
#define DEFENDING_STATE_HPP

#include "fsm/State.hpp"

class Team;

namespace Kickoff {

class DefendingState : public State<Team> {
public:
    static DefendingState& Instance() {
        static DefendingState instance;
        return instance;
    }

    void enter(Team& team) override;
    void execute(Team& team) override;

    const char* getName() const override { return "Defending"; }

private:
    DefendingState() = default;
};

} // namespace Kickoff

#endif // DEFENDING_STATE_HPP
