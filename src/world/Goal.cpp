/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "world/Goal.hpp"
#include "entities/Ball.hpp"

namespace Kickoff {

Goal::Goal(const Vector2D& position, const Vector2D& size, const Vector2D& facing)
    : m_position(position), m_size(size), m_facing(facing.normalized()) {
    const Vector2D halfSize = m_size * 0.5f;

    // The goal line is the face of the box toward the field
    const float lineX = m_facing.getX() > 0.0f ? m_position.getX() + halfSize.getX()
                                               : m_position.getX() - halfSize.getX();

    m_leftPost = Vector2D(lineX, m_position.getY() - halfSize.getY());
    m_rightPost = Vector2D(lineX, m_position.getY() + halfSize.getY());
    m_center = (m_leftPost + m_rightPost) * 0.5f;
}

bool Goal::isScored(const Ball& ball) {
    const float x = ball.getPosition().getX();
    const float previousX = ball.getPreviousPosition().getX();
    const float lineX = m_center.getX();

    bool scored = false;
    if (m_facing.getX() > 0.0f) {
        scored = x < lineX && previousX > lineX;
    } else {
        scored = x > lineX && previousX < lineX;
    }

    if (scored) {
        // Where the ball's path crosses the goal line must lie between the posts
        const float t = (lineX - previousX) / (x - previousX);
        const float crossingY = ball.getPreviousPosition().getY() +
                                (ball.getPosition().getY() - ball.getPreviousPosition().getY()) * t;
        scored = crossingY > m_leftPost.getY() && crossingY < m_rightPost.getY();
    }

    if (scored) {
        ++m_goalsScored;
    }
    return scored;
}

} // namespace Kickoff
