/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef GEOMETRY_HPP
#define GEOMETRY_HPP

#include "utils/Vector2D.hpp"
#include <cmath>
#include <optional>

namespace Kickoff::Geometry {

constexpr float PI = 3.14159265358979323846f;

/**
 * @brief Transforms a world point into an agent's local frame
 *
 * The local frame has +x along the agent heading and +y along its side
 * vector, origin at the agent position.
 */
inline Vector2D pointToLocalSpace(const Vector2D& point, const Vector2D& heading,
                                  const Vector2D& side, const Vector2D& position) {
    const Vector2D toPoint = point - position;
    return Vector2D(toPoint.dot(heading), toPoint.dot(side));
}

inline Vector2D vectorToWorldSpace(const Vector2D& local, const Vector2D& heading,
                                   const Vector2D& side) {
    return heading * local.getX() + side * local.getY();
}

inline Vector2D pointToWorldSpace(const Vector2D& local, const Vector2D& heading,
                                  const Vector2D& side, const Vector2D& position) {
    return position + vectorToWorldSpace(local, heading, side);
}

/**
 * @brief Intersection of segments AB and CD
 * @param distance Set to the distance from A to the hit point
 * @param point Set to the hit point
 * @return true if the segments cross
 */
inline bool lineIntersection2D(const Vector2D& a, const Vector2D& b,
                               const Vector2D& c, const Vector2D& d,
                               float& distance, Vector2D& point) {
    const float rTop = (a.getY() - c.getY()) * (d.getX() - c.getX()) -
                       (a.getX() - c.getX()) * (d.getY() - c.getY());
    const float sTop = (a.getY() - c.getY()) * (b.getX() - a.getX()) -
                       (a.getX() - c.getX()) * (b.getY() - a.getY());
    const float bot = (b.getX() - a.getX()) * (d.getY() - c.getY()) -
                      (b.getY() - a.getY()) * (d.getX() - c.getX());

    if (bot == 0.0f) {
        // parallel
        return false;
    }

    const float r = rTop / bot;
    const float s = sTop / bot;
    if (r > 0.0f && r < 1.0f && s > 0.0f && s < 1.0f) {
        distance = Vector2D::distance(a, b) * r;
        point = a + (b - a) * r;
        return true;
    }
    distance = 0.0f;
    return false;
}

/**
 * @brief Distance along a unit ray to the nearest point of a circle
 *
 * Returns the first non-negative hit, so an origin inside the circle yields
 * the exit point. Empty when the ray misses.
 */
inline std::optional<float> rayCircleIntersection(const Vector2D& origin,
                                                  const Vector2D& direction,
                                                  const Vector2D& center,
                                                  float radius) {
    const Vector2D toCenter = center - origin;
    const float along = toCenter.dot(direction);
    const float perpSq = toCenter.lengthSquared() - along * along;
    const float rSq = radius * radius;
    if (perpSq > rSq) {
        return std::nullopt;
    }

    const float half = std::sqrt(rSq - perpSq);
    float t = along - half;
    if (t <= 0.0f) {
        t = along + half;
    }
    if (t < 0.0f) {
        return std::nullopt;
    }
    return t;
}

/**
 * @brief Tangent points on circle (center, radius) as seen from point
 * @return false if point lies on or inside the circle
 */
inline bool getTangentPoints(const Vector2D& center, float radius,
                             const Vector2D& point, Vector2D& t1, Vector2D& t2) {
    const Vector2D d = point - center;
    const float distSq = d.lengthSquared();
    const float rSq = radius * radius;
    if (distSq <= rSq) {
        return false;
    }

    const float root = std::sqrt(distSq - rSq);
    t1 = center + Vector2D(radius * (radius * d.getX() - d.getY() * root) / distSq,
                           radius * (radius * d.getY() + d.getX() * root) / distSq);
    t2 = center + Vector2D(radius * (radius * d.getX() + d.getY() * root) / distSq,
                           radius * (radius * d.getY() - d.getX() * root) / distSq);
    return true;
}

} // namespace Kickoff::Geometry

#endif // GEOMETRY_HPP
