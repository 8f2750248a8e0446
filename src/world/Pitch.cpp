/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "world/Pitch.hpp"
#include "core/Logger.hpp"
#include "entities/Ball.hpp"
#include "entities/Team.hpp"
#include "entities/teamStates/PrepareForKickOffState.hpp"
#include "world/Goal.hpp"
#include <format>
#include <stdexcept>

namespace Kickoff {

Pitch::Pitch(const SoccerConfig& config, unsigned int seed)
    : m_config(config), m_rng(seed),
      m_playingArea(config.pitch.width * -0.5f, config.pitch.height * 0.5f,
                    config.pitch.width * 0.5f, config.pitch.height * -0.5f) {
    createRegions();
    createGame();
    createWalls();

    m_gameOn = true;
    PITCH_INFO(std::format("Pitch {}x{} ready with {} regions (seed {})", m_playingArea.getWidth(),
                           m_playingArea.getHeight(), m_regions.size(), seed));
}

Pitch::~Pitch() = default;

void Pitch::createRegions() {
    const int columns = m_config.pitch.regionColumns;
    const int rows = m_config.pitch.regionRows;
    if (columns <= 0 || rows <= 0) {
        PITCH_ERROR(std::format("Invalid region grid {} x {}", columns, rows));
        throw std::invalid_argument("Pitch - region grid needs at least one column and row");
    }

    const float width = m_playingArea.getWidth() / static_cast<float>(columns);
    const float height = m_playingArea.getHeight() / static_cast<float>(rows);

    m_regions.reserve(static_cast<size_t>(columns * rows));
    int id = 0;
    for (int col = 0; col < columns; ++col) {
        for (int row = 0; row < rows; ++row) {
            const float left = m_playingArea.getLeft() + static_cast<float>(col) * width;
            const float bottom = m_playingArea.getBottom() + static_cast<float>(row) * height;
            m_regions.emplace_back(left, bottom + height, left + width, bottom, id);
            ++id;
        }
    }
}

void Pitch::createGame() {
    m_ball = std::make_unique<Ball>(*this, m_rng, m_config.ball);

    const Vector2D goalSize(m_config.pitch.goalDepth, m_config.pitch.goalWidth);
    const float halfDepth = m_config.pitch.goalDepth * 0.5f;

    m_redGoal = std::make_unique<Goal>(Vector2D(m_playingArea.getRight() + halfDepth, 0.0f),
                                       goalSize, Vector2D(-1.0f, 0.0f));
    m_blueGoal = std::make_unique<Goal>(Vector2D(m_playingArea.getLeft() - halfDepth, 0.0f),
                                        goalSize, Vector2D(1.0f, 0.0f));

    m_blueTeam = std::make_unique<Team>(*this, *m_blueGoal, *m_redGoal, TeamColor::Blue);
    m_redTeam = std::make_unique<Team>(*this, *m_redGoal, *m_blueGoal, TeamColor::Red);
    m_blueTeam->setOpponents(*m_redTeam);
    m_redTeam->setOpponents(*m_blueTeam);
}

void Pitch::createWalls() {
    const float left = m_playingArea.getLeft();
    const float right = m_playingArea.getRight();
    const float top = m_playingArea.getTop();
    const float bottom = m_playingArea.getBottom();

    // Side lines
    m_walls.emplace_back(Vector2D(left, bottom), Vector2D(right, bottom), Vector2D(0.0f, 1.0f));
    m_walls.emplace_back(Vector2D(left, top), Vector2D(right, top), Vector2D(0.0f, -1.0f));

    // Goal lines, open between the posts
    const Vector2D& blueLow = m_blueGoal->getLeftPost();
    const Vector2D& blueHigh = m_blueGoal->getRightPost();
    m_walls.emplace_back(Vector2D(blueHigh.getX(), blueHigh.getY()),
                         Vector2D(blueHigh.getX(), top), Vector2D(1.0f, 0.0f));
    m_walls.emplace_back(Vector2D(blueLow.getX(), bottom),
                         Vector2D(blueLow.getX(), blueLow.getY()), Vector2D(1.0f, 0.0f));

    const Vector2D& redLow = m_redGoal->getLeftPost();
    const Vector2D& redHigh = m_redGoal->getRightPost();
    m_walls.emplace_back(Vector2D(redHigh.getX(), redHigh.getY()),
                         Vector2D(redHigh.getX(), top), Vector2D(-1.0f, 0.0f));
    m_walls.emplace_back(Vector2D(redLow.getX(), bottom),
                         Vector2D(redLow.getX(), redLow.getY()), Vector2D(-1.0f, 0.0f));
}

void Pitch::update(float deltaTime) {
    if (m_paused) {
        return;
    }

    ++m_tickCount;
    m_clock.advance(deltaTime);

    m_ball->update(deltaTime);
    m_redTeam->update(deltaTime);
    m_blueTeam->update(deltaTime);

    if (m_redGoal->isScored(*m_ball) || m_blueGoal->isScored(*m_ball)) {
        m_gameOn = false;
        m_ball->placeAtPosition(m_playingArea.getCenter());

        m_redTeam->getStateMachine().changeState(PrepareForKickOffState::Instance());
        m_blueTeam->getStateMachine().changeState(PrepareForKickOffState::Instance());

        PITCH_INFO(std::format("Goal at tick {}: Blue {} - {} Red", m_tickCount, getBlueScore(),
                               getRedScore()));
        if (m_scoreListener) {
            m_scoreListener(getBlueScore(), getRedScore());
        }
    }
}

const Region& Pitch::getRegionById(int id) const {
    if (id < 0 || static_cast<size_t>(id) >= m_regions.size()) {
        PITCH_ERROR(std::format("Region id {} out of range ({} regions)", id, m_regions.size()));
        throw std::out_of_range("Pitch - region id out of range");
    }
    return m_regions[static_cast<size_t>(id)];
}

void Pitch::togglePause() {
    m_paused = !m_paused;
    PITCH_INFO(m_paused ? "Paused" : "Resumed");
}

int Pitch::getBlueScore() const {
    // Blue scores into the red goal
    return m_redGoal->getNumberGoalsScored();
}

int Pitch::getRedScore() const {
    return m_blueGoal->getNumberGoalsScored();
}

void Pitch::collectAgents(std::vector<const MovingEntity*>& out) const {
    for (const Team* team : {m_blueTeam.get(), m_redTeam.get()}) {
        for (const auto& player : team->getPlayers()) {
            out.push_back(player.get());
        }
    }
}

} // namespace Kickoff
