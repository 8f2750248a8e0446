/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/Regulator.hpp"

namespace Kickoff {

namespace {
constexpr double UPDATE_JITTER_MS = 10.0;
}

Regulator::Regulator(const GameClock& clock, std::mt19937& rng, float updatesPerSecond)
    : m_clock(clock), m_rng(rng) {
    if (updatesPerSecond > 0.0f) {
        m_updatePeriodMs = 1000.0 / updatesPerSecond;
    } else if (updatesPerSecond < 0.0f) {
        m_updatePeriodMs = -1.0;
    }
    m_nextUpdateMs = m_clock.get().getElapsedMs();
}

bool Regulator::isReady() {
    if (m_updatePeriodMs == 0.0) {
        return true;
    }
    if (m_updatePeriodMs < 0.0) {
        return false;
    }

    const double now = m_clock.get().getElapsedMs();
    if (now >= m_nextUpdateMs) {
        std::uniform_real_distribution<double> jitter(-UPDATE_JITTER_MS, UPDATE_JITTER_MS);
        m_nextUpdateMs = now + m_updatePeriodMs + jitter(m_rng.get());
        return true;
    }
    return false;
}

} // namespace Kickoff
