/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "ai/SupportSpotCalculator.hpp"
#include "core/Logger.hpp"
#include "entities/Team.hpp"
#include "world/Pitch.hpp"
#include <cmath>
#include <format>
#include <stdexcept>

namespace Kickoff {

SupportSpotCalculator::SupportSpotCalculator(Team& team, bool isLeftSide,
                                             const SupportSpotConfig& config,
                                             const GameClock& clock, std::mt19937& rng)
    : m_team(team), m_isLeftSide(isLeftSide), m_config(config),
      m_regulator(clock, rng, config.updatesPerSecond) {
    createSpots();
    if (m_spots.empty()) {
        SUPPORT_ERROR(std::format("Spot grid {} x {} leaves no spots in the attacking half",
                                  m_config.spotsX, m_config.spotsY));
        throw std::invalid_argument("SupportSpotCalculator - empty spot grid");
    }
}

void SupportSpotCalculator::createSpots() {
    const Region& field = m_team.get().getPitch().getPlayingArea();

    const float spotRegionWidth = field.getWidth() * m_config.regionWidthFraction;
    const float spotRegionHeight = field.getHeight() * m_config.regionHeightFraction;
    const float sliceX = spotRegionWidth / static_cast<float>(m_config.spotsX);
    const float sliceY = spotRegionHeight / static_cast<float>(m_config.spotsY);

    const float top = field.getTop() - (field.getHeight() - spotRegionHeight) * 0.5f - sliceY * 0.5f;
    const float right = field.getRight() - (field.getWidth() - spotRegionWidth) * 0.5f - sliceX * 0.5f;
    const float left = field.getLeft() + (field.getWidth() - spotRegionWidth) * 0.5f + sliceX * 0.5f;

    // Only the columns in the attacking half, short of the center line
    const float columns = static_cast<float>(m_config.spotsX) * 0.5f - 1.0f;
    for (int x = 0; static_cast<float>(x) < columns; ++x) {
        for (int y = 0; y < m_config.spotsY; ++y) {
            const float px = m_isLeftSide ? left + static_cast<float>(x) * sliceX
                                          : right - static_cast<float>(x) * sliceX;
            m_spots.push_back({Vector2D(px, top - static_cast<float>(y) * sliceY), 0.0f});
        }
    }

    SUPPORT_DEBUG(std::format("{} support spots for the {} team", m_spots.size(),
                              toString(m_team.get().getColor())));
}

const Vector2D& SupportSpotCalculator::calculateBestSupportingPosition() {
    if (!m_regulator.isReady() && m_bestSpot != nullptr) {
        return m_bestSpot->position;
    }

    Team& team = m_team.get();
    const PlayerConfig& playerConfig = team.getPitch().getConfig().player;
    const PlayerBase* controller = team.getControllingPlayer();

    m_bestSpot = nullptr;
    float bestScoreSoFar = 0.0f;
    Vector2D shotTarget;

    for (SupportSpot& spot : m_spots) {
        spot.score = 0.0f;

        if (controller != nullptr &&
            team.isPassSafeFromAllOpponents(controller->getPosition(), spot.position, nullptr,
                                            playerConfig.passingForce)) {
            spot.score += m_config.canPassScore;
        }

        if (team.isShootPossible(spot.position, playerConfig.shootingForce, shotTarget)) {
            spot.score += m_config.canScoreScore;
        }

        if (controller != nullptr && team.getSupportingPlayer() != nullptr) {
            const float distance = Vector2D::distance(controller->getPosition(), spot.position);
            const float offset = std::abs(m_config.optimalDistance - distance);
            if (offset < m_config.optimalDistance) {
                spot.score += m_config.distanceFromControllerScore *
                              (m_config.optimalDistance - offset) / m_config.optimalDistance;
            }
        }

        if (spot.score > bestScoreSoFar) {
            bestScoreSoFar = spot.score;
            m_bestSpot = &spot;
        }
    }

    // Nothing scored, settle for the first spot rather than having no target
    if (m_bestSpot == nullptr) {
        m_bestSpot = &m_spots.front();
    }

    return m_bestSpot->position;
}

const Vector2D& SupportSpotCalculator::getBestSupportingSpot() {
    if (m_bestSpot == nullptr) {
        return calculateBestSupportingPosition();
    }
    return m_bestSpot->position;
}

} // namespace Kickoff
