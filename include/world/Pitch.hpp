/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef PITCH_HPP
#define PITCH_HPP

#include "core/GameClock.hpp"
#include "core/SoccerConfig.hpp"
#include "managers/MessageDispatcher.hpp"
#include "world/Region.hpp"
#include "world/SteeringWorld.hpp"
#include "world/Wall2D.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <random>
#include <vector>

class Ball;
class Team;

namespace Kickoff {

class Goal;

/**
 * @brief The match: field, ball, goals, both teams and the walls
 *
 * The playing area is centered on the origin. Blue defends the goal at the
 * left edge, red the one at the right edge. Regions form a grid of
 * columns by rows with id = column * rows + row, row 0 at the bottom.
 *
 * Everything the match needs at run time hangs off the pitch: the message
 * dispatcher, the game clock and the random engine. Nothing here is a
 * process-wide singleton, so several pitches can exist side by side.
 */
class Pitch : public SteeringWorld {
public:
    // Goals per team after every goal: blue, red
    using ScoreListener = std::function<void(int blueGoals, int redGoals)>;

    explicit Pitch(const SoccerConfig& config = SoccerConfig{},
                   unsigned int seed = std::mt19937::default_seed);
    ~Pitch() override;

    Pitch(const Pitch&) = delete;
    Pitch& operator=(const Pitch&) = delete;

    /**
     * @brief One simulation tick
     *
     * Advances the clock, moves the ball, then updates red and blue in that
     * order. A goal stops play, returns the ball to the center spot and
     * sends both teams into kick-off preparation. Does nothing while paused.
     */
    void update(float deltaTime);

    Ball& getBall() { return *m_ball; }
    const Ball& getBall() const { return *m_ball; }
    Team& getRedTeam() { return *m_redTeam; }
    const Team& getRedTeam() const { return *m_redTeam; }
    Team& getBlueTeam() { return *m_blueTeam; }
    const Team& getBlueTeam() const { return *m_blueTeam; }
    Goal& getRedGoal() { return *m_redGoal; }
    const Goal& getRedGoal() const { return *m_redGoal; }
    Goal& getBlueGoal() { return *m_blueGoal; }
    const Goal& getBlueGoal() const { return *m_blueGoal; }

    const Region& getPlayingArea() const { return m_playingArea; }
    // Throws std::out_of_range
    const Region& getRegionById(int id) const;
    size_t getRegionCount() const { return m_regions.size(); }
    const std::vector<Region>& getRegions() const { return m_regions; }

    bool isGoalKeeperInBallPossession() const { return m_goalKeeperHasBall; }
    void setGoalKeeperInBallPossession(bool hasBall) { m_goalKeeperHasBall = hasBall; }
    bool isGameOn() const { return m_gameOn; }
    void setGameOn(bool gameOn) { m_gameOn = gameOn; }
    bool isPaused() const { return m_paused; }
    void togglePause();

    // Goals scored by each team
    int getBlueScore() const;
    int getRedScore() const;
    void setScoreListener(ScoreListener listener) { m_scoreListener = std::move(listener); }

    uint64_t getTickCount() const { return m_tickCount; }

    MessageDispatcher& getDispatcher() { return m_dispatcher; }
    const GameClock& getClock() const { return m_clock; }
    std::mt19937& getRandomEngine() { return m_rng; }
    const SoccerConfig& getConfig() const { return m_config; }

    const std::vector<Wall2D>& getWalls() const override { return m_walls; }
    const std::vector<Obstacle>& getObstacles() const override { return m_obstacles; }
    void collectAgents(std::vector<const MovingEntity*>& out) const override;

private:
    void createRegions();
    void createGame();
    void createWalls();

    SoccerConfig m_config;
    std::mt19937 m_rng;
    GameClock m_clock;
    // Declared before the teams, which unregister from it on destruction
    MessageDispatcher m_dispatcher;

    Region m_playingArea;
    std::vector<Region> m_regions;
    std::vector<Wall2D> m_walls;
    std::vector<Obstacle> m_obstacles;

    std::unique_ptr<Ball> m_ball;
    std::unique_ptr<Goal> m_redGoal;
    std::unique_ptr<Goal> m_blueGoal;
    std::unique_ptr<Team> m_blueTeam;
    std::unique_ptr<Team> m_redTeam;

    ScoreListener m_scoreListener;
    uint64_t m_tickCount{0};
    bool m_goalKeeperHasBall{false};
    bool m_gameOn{false};
    bool m_paused{false};
};

} // namespace Kickoff

#endif // PITCH_HPP
