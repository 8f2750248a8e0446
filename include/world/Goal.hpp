/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef GOAL_HPP
#define GOAL_HPP

#include "utils/Vector2D.hpp"

class Ball;

namespace Kickoff {

/**
 * @brief One goal mouth on the goal line of the pitch
 *
 * Posts are placed on the goal line, the side of the goal box facing the
 * field. The counter tracks goals scored into this goal, i.e. by the
 * opposing team.
 */
class Goal {
public:
    /**
     * @param position Center of the goal box
     * @param size Depth along x and mouth width along y
     * @param facing Unit vector pointing from the goal into the field
     */
    Goal(const Vector2D& position, const Vector2D& size, const Vector2D& facing);

    /**
     * @brief Detects the ball crossing the goal line this tick
     *
     * Compares the ball's previous and current x against the goal line and
     * bumps the counter when it crossed into the goal.
     */
    bool isScored(const Ball& ball);

    const Vector2D& getPosition() const { return m_position; }
    const Vector2D& getSize() const { return m_size; }
    const Vector2D& getFacing() const { return m_facing; }
    const Vector2D& getLeftPost() const { return m_leftPost; }
    const Vector2D& getRightPost() const { return m_rightPost; }
    const Vector2D& getCenter() const { return m_center; }
    float getWidth() const { return m_size.getY(); }

    int getNumberGoalsScored() const { return m_goalsScored; }
    void resetGoalsScored() { m_goalsScored = 0; }

private:
    Vector2D m_position;
    Vector2D m_size;
    Vector2D m_facing;
    Vector2D m_leftPost;
    Vector2D m_rightPost;
    Vector2D m_center;
    int m_goalsScored{0};
};

} // namespace Kickoff

#endif // GOAL_HPP
