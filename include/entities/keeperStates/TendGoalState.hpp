/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef TEND_GOAL_STATE_HPP
#define TEND_GOAL_STATE_HPP

#include "fsm/State.hpp"

class GoalKeeper;

namespace Kickoff {

/**
 * @brief Stay between the ball and the goal mouth.
 *
 * The keeper interposes at the tending distance in front of the rear
 * target and traps the ball once it comes within reach.
 */
class TendGoalState : public State<GoalKeeper> {
public:
    static TendGoalState& Instance() {
        static TendGoalState instance;
        return instance;
    }

    void enter(GoalKeeper& keeper) override;
    void execute(GoalKeeper& keeper) override;
    void exit(GoalKeeper& keeper) override;

    const char* getName() const override { return "TendGoal"; }

private:
    TendGoalState() = default;
};

} // namespace Kickoff

#endif // TEND_GOAL_STATE_HPP
