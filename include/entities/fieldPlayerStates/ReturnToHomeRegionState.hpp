/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef RETURN_TO_HOME_REGION_STATE_HPP
#define RETURN_TO_HOME_REGION_STATE_HPP

#include "fsm/State.hpp"

class FieldPlayer;

namespace Kickoff {

class ReturnToHomeRegionState : public State<FieldPlayer> {
public:
    static ReturnToHomeRegionState& Instance() {
        static ReturnToHomeRegionState instance;
        return instance;
    }

    void enter(FieldPlayer& player) override;
    void execute(FieldPlayer& player) override;
    void exit(FieldPlayer& player) override;

    const char* getName() const override { return "ReturnToHomeRegion"; }

private:
    ReturnToHomeRegionState() = default;
};

} // namespace Kickoff

#endif // RETURN_TO_HOME_REGION_STATE_HPP
