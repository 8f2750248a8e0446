/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef STATE_MACHINE_HPP
#define STATE_MACHINE_HPP

#include "core/Logger.hpp"
#include "fsm/State.hpp"
#include <format>
#include <stdexcept>

namespace Kickoff {

/**
 * @brief Current, previous and global state of one owner.
 *
 * The machine never owns its states; they are shared singletons. The
 * global state runs before the current state on every update and gets the
 * first chance at every telegram.
 */
template<typename OwnerType>
class StateMachine {
public:
    using StateType = State<OwnerType>;

    explicit StateMachine(OwnerType& owner) : m_owner(owner) {}

    StateMachine(const StateMachine&) = delete;
    StateMachine& operator=(const StateMachine&) = delete;

    // Initial setup only, no enter/exit is called
    void setCurrentState(StateType* state) { m_currentState = state; }
    void setPreviousState(StateType* state) { m_previousState = state; }
    void setGlobalState(StateType* state) { m_globalState = state; }

    void update() {
        if (m_globalState) {
            m_globalState->execute(m_owner);
        }
        if (m_currentState) {
            m_currentState->execute(m_owner);
        }
    }

    bool handleMessage(const Telegram& telegram) {
        if (m_globalState && m_globalState->onMessage(m_owner, telegram)) {
            return true;
        }
        return m_currentState && m_currentState->onMessage(m_owner, telegram);
    }

    /**
     * @brief exit() the current state, then enter() the new one.
     *
     * The state being left becomes the previous state. Throws
     * std::logic_error when there is no current state to leave.
     */
    void changeState(StateType& newState) {
        if (!m_currentState) {
            FSM_ERROR(std::format("changeState to {} with no current state", newState.getName()));
            throw std::logic_error("StateMachine - changeState called with no current state");
        }

        m_previousState = m_currentState;
        m_currentState->exit(m_owner);
        m_currentState = &newState;
        m_currentState->enter(m_owner);
    }

    void revertToPreviousState() {
        if (!m_previousState) {
            FSM_ERROR("revertToPreviousState with no previous state");
            throw std::logic_error("StateMachine - no previous state to revert to");
        }
        changeState(*m_previousState);
    }

    bool isInState(const StateType& state) const { return m_currentState == &state; }

    StateType* getCurrentState() const { return m_currentState; }
    StateType* getPreviousState() const { return m_previousState; }
    StateType* getGlobalState() const { return m_globalState; }

    const char* getNameOfCurrentState() const {
        return m_currentState ? m_currentState->getName() : "";
    }

private:
    OwnerType& m_owner;

    // Non-owning, states are singletons
    StateType* m_currentState{nullptr};
    StateType* m_previousState{nullptr};
    StateType* m_globalState{nullptr};
};

} // namespace Kickoff

#endif // STATE_MACHINE_HPP
