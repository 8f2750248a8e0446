/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef STATE_HPP
#define STATE_HPP

#include "events/Telegram.hpp"

namespace Kickoff {

/**
 * @brief One behavior of an entity's state machine.
 *
 * States hold no per-entity data: each concrete state is a process-wide
 * singleton reached through its static Instance(), and every bit of
 * context it needs arrives through the owner parameter.
 */
template<typename OwnerType>
class State {
public:
    virtual ~State() = default;

    virtual void enter(OwnerType& /*owner*/) {}
    virtual void execute(OwnerType& owner) = 0;
    virtual void exit(OwnerType& /*owner*/) {}

    // Return true to consume the telegram
    virtual bool onMessage(OwnerType& /*owner*/, const Telegram& /*telegram*/) { return false; }

    virtual const char* getName() const = 0;

protected:
    State() = default;
    State(const State&) = delete;
    State& operator=(const State&) = delete;
};

} // namespace Kickoff

#endif // STATE_HPP
