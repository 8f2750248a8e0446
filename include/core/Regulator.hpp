/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef REGULATOR_HPP
#define REGULATOR_HPP

#include "core/GameClock.hpp"
#include <functional>
#include <random>

namespace Kickoff {

/**
 * @brief Limits how often a piece of code may run
 *
 * A positive rate allows that many runs per second of game time, each
 * deadline jittered by up to 10ms so many regulators created together do
 * not all fire on the same tick. A rate of zero is always ready, a negative
 * rate never is.
 */
class Regulator {
public:
    Regulator(const GameClock& clock, std::mt19937& rng, float updatesPerSecond);

    bool isReady();

    double getUpdatePeriodMs() const { return m_updatePeriodMs; }

private:
    // Non-owning references, both outlive every regulator on the pitch
    std::reference_wrapper<const GameClock> m_clock;
    std::reference_wrapper<std::mt19937> m_rng;
    double m_updatePeriodMs{0.0};
    double m_nextUpdateMs{0.0};
};

} // namespace Kickoff

#endif // REGULATOR_HPP
