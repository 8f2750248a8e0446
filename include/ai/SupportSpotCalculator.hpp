/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SUPPORT_SPOT_CALCULATOR_HPP
#define SUPPORT_SPOT_CALCULATOR_HPP

#include "core/Regulator.hpp"
#include "core/SoccerConfig.hpp"
#include "utils/Vector2D.hpp"
#include <functional>
#include <vector>

class Team;

namespace Kickoff {

/**
 * @brief Scores a fixed grid of positions in the attacking half
 *
 * Each spot earns points for being reachable by a safe pass, for allowing a
 * shot at goal and for being near the optimal distance from the ball
 * carrier. Rescoring is rate limited; between runs the previous best spot
 * is returned.
 */
class SupportSpotCalculator {
public:
    struct SupportSpot {
        Vector2D position;
        float score{0.0f};
    };

    /**
     * @param isLeftSide true when the team attacks toward -x
     */
    SupportSpotCalculator(Team& team, bool isLeftSide, const SupportSpotConfig& config,
                          const GameClock& clock, std::mt19937& rng);

    const Vector2D& calculateBestSupportingPosition();

    // Scores the grid first if no best spot has been chosen yet
    const Vector2D& getBestSupportingSpot();

    const std::vector<SupportSpot>& getSpots() const { return m_spots; }
    bool hasBestSpot() const { return m_bestSpot != nullptr; }
    bool isLeftSide() const { return m_isLeftSide; }

private:
    void createSpots();

    // Non-owning, the team owns this calculator
    std::reference_wrapper<Team> m_team;
    bool m_isLeftSide;
    SupportSpotConfig m_config;
    Regulator m_regulator;
    std::vector<SupportSpot> m_spots;
    const SupportSpot* m_bestSpot{nullptr};
};

} // namespace Kickoff

#endif // SUPPORT_SPOT_CALCULATOR_HPP
