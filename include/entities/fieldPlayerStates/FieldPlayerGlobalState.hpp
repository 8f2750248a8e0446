/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef FIELD_PLAYER_GLOBAL_STATE_HPP
#define FIELD_PLAYER_GLOBAL_STATE_HPP

#include "fsm/State.hpp"

class FieldPlayer;

namespace Kickoff {

/**
 * @brief Runs every tick ahead of the field player's current state.
 *
 * Slows the player down while it has the ball at its feet and answers
 * every telegram a field player understands.
 */
class FieldPlayerGlobalState : public State<FieldPlayer> {
public:
    static FieldPlayerGlobalState& Instance() {
        static FieldPlayerGlobalState instance;
        return instance;
    }

    void execute(FieldPlayer& player) override;
    bool onMessage(FieldPlayer& player, const Telegram& telegram) override;

    const char* getName() const override { return "FieldPlayerGlobal"; }

private:
    FieldPlayerGlobalState() = default;
};

} // namespace Kickoff

#endif // FIELD_PLAYER_GLOBAL_STATE_HPP
