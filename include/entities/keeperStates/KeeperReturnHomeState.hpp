/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef KEEPER_RETURN_HOME_STATE_HPP
#define KEEPER_RETURN_HOME_STATE_HPP

#include "fsm/State.hpp"

class GoalKeeper;

namespace Kickoff {

class KeeperReturnHomeState : public State<GoalKeeper> {
public:
    static KeeperReturnHomeState& Instance() {
        static KeeperReturnHomeState instance;
        return instance;
    }

    void enter(GoalKeeper& keeper) override;
    void execute(GoalKeeper& keeper) override;
    void exit(GoalKeeper& keeper) override;

    const char* getName() const override { return "KeeperReturnHome"; }

private:
    KeeperReturnHomeState() = default;
};

} // namespace Kickoff

#endif // KEEPER_RETURN_HOME_STATE_HPP
