/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SUPPORT_ATTACKER_STATE_HPP
#define SUPPORT_ATTACKER_STATE_HPP

#include "fsm/State.hpp"

class FieldPlayer;

namespace Kickoff {

/**
 * @brief Run to the best support spot and ask for the ball from there.
 */
class SupportAttackerState : public State<FieldPlayer> {
public:
    static SupportAttackerState& Instance() {
        static SupportAttackerState instance;
        return instance;
    }

    void enter(FieldPlayer& player) override;
    void execute(FieldPlayer& player) override;
    void exit(FieldPlayer& player) override;

    const char* getName() const override { return "SupportAttacker"; }

private:
    SupportAttackerState() = default;
};

} // namespace Kickoff

#endif // SUPPORT_ATTACKER_STATE_HPP
