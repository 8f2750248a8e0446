/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef GAME_CLOCK_HPP
#define GAME_CLOCK_HPP

namespace Kickoff {

/**
 * @brief Simulated match time, advanced only by the host tick
 *
 * Rate limiters read this instead of the wall clock so a headless run
 * produces the same decisions whatever the machine speed.
 */
class GameClock {
public:
    void advance(float deltaSeconds) {
        if (deltaSeconds > 0.0f) {
            m_elapsedMs += static_cast<double>(deltaSeconds) * 1000.0;
        }
    }

    double getElapsedMs() const { return m_elapsedMs; }
    double getElapsedSeconds() const { return m_elapsedMs / 1000.0; }
    void reset() { m_elapsedMs = 0.0; }

private:
    double m_elapsedMs{0.0};
};

} // namespace Kickoff

#endif // GAME_CLOCK_HPP
