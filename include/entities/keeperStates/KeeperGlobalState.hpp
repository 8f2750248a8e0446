/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef KEEPER_GLOBAL_STATE_HPP
#define KEEPER_GLOBAL_STATE_HPP

#include "fsm/State.hpp"

class GoalKeeper;

namespace Kickoff {

// Handles the telegrams a keeper understands
class KeeperGlobalState : public State<GoalKeeper> {
public:
    static KeeperGlobalState& Instance() {
        static KeeperGlobalState instance;
        return instance;
    }

    void execute(GoalKeeper& keeper) override;
    bool onMessage(GoalKeeper& keeper, const Telegram& telegram) override;

    const char* getName() const override { return "KeeperGlobal"; }

private:
    KeeperGlobalState() = default;
};

} // namespace Kickoff

#endif // KEEPER_GLOBAL_STATE_HPP
