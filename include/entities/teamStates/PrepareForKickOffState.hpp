/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef PREPARE_FOR_KICK_OFF_STATE_HPP
#define PREPARE_FOR_KICK_OFF_STATE_HPP

#include "fsm/State.hpp"

class Team;

namespace Kickoff {

/**
 * @brief Everybody goes home, play restarts once both teams are there.
 */
class PrepareForKickOffState : public State<Team> {
public:
    static PrepareForKickOffState& Instance() {
        static PrepareForKickOffState instance;
        return instance;
    }

    void enter(Team& team) override;
    void execute(Team& team) override;
    void exit(Team& team) override;

    const char* getName() const override { return "PrepareForKickOff"; }

private:
    PrepareForKickOffState() = default;
};

} // namespace Kickoff

#endif // PREPARE_FOR_KICK_OFF_STATE_HPP
