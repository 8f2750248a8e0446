/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef REGION_HPP
#define REGION_HPP

#include "utils/Vector2D.hpp"
#include <algorithm>
#include <cmath>
#include <random>

namespace Kickoff {

/**
 * @brief Immutable axis-aligned rectangle of the pitch
 *
 * y grows toward the top edge, so top > bottom.
 */
class Region {
public:
    static constexpr int NO_ID = -1;

    Region() = default;
    Region(float left, float top, float right, float bottom, int id = NO_ID)
        : m_top(top), m_right(right), m_left(left), m_bottom(bottom),
          m_width(std::abs(right - left)), m_height(std::abs(top - bottom)),
          m_center((left + right) * 0.5f, (top + bottom) * 0.5f), m_id(id) {}

    /**
     * @brief Strict containment; points on an edge are outside
     * @param halfSize Shrink the rectangle by a quarter of each dimension on
     *        every side before testing
     */
    bool isInside(const Vector2D& position, bool halfSize = false) const {
        float marginX = 0.0f;
        float marginY = 0.0f;
        if (halfSize) {
            marginX = m_width * 0.25f;
            marginY = m_height * 0.25f;
        }
        return position.getX() > m_left + marginX && position.getX() < m_right - marginX &&
               position.getY() > m_bottom + marginY && position.getY() < m_top - marginY;
    }

    Vector2D getRandomPosition(std::mt19937& rng) const {
        std::uniform_real_distribution<float> x(m_left, m_right);
        std::uniform_real_distribution<float> y(m_bottom, m_top);
        const float px = x(rng);
        return Vector2D(px, y(rng));
    }

    float getTop() const { return m_top; }
    float getRight() const { return m_right; }
    float getLeft() const { return m_left; }
    float getBottom() const { return m_bottom; }
    float getWidth() const { return m_width; }
    float getHeight() const { return m_height; }
    float getLength() const { return std::max(m_width, m_height); }
    float getBreadth() const { return std::min(m_width, m_height); }
    const Vector2D& getCenter() const { return m_center; }
    int getId() const { return m_id; }

private:
    float m_top{0.0f};
    float m_right{0.0f};
    float m_left{0.0f};
    float m_bottom{0.0f};
    float m_width{0.0f};
    float m_height{0.0f};
    Vector2D m_center;
    int m_id{NO_ID};
};

} // namespace Kickoff

#endif // REGION_HPP
