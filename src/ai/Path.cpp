/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "ai/Path.hpp"
#include "core/Logger.hpp"
#include "utils/Geometry.hpp"
#include "world/Region.hpp"
#include <stdexcept>

namespace Kickoff {

Path& Path::addWaypoint(const Vector2D& waypoint) {
    m_waypoints.push_back(waypoint);
    return *this;
}

Path& Path::clear() {
    m_waypoints.clear();
    m_index = 0;
    return *this;
}

Path& Path::setNextWaypoint() {
    if (m_waypoints.empty()) {
        PATH_ERROR("setNextWaypoint on a path without waypoints");
        throw std::out_of_range("Path - no waypoints assigned");
    }

    if (++m_index == m_waypoints.size()) {
        m_index = m_loop ? 0 : m_waypoints.size() - 1;
    }
    return *this;
}

const Vector2D& Path::getCurrentWaypoint() const {
    if (m_waypoints.empty()) {
        PATH_ERROR("getCurrentWaypoint on a path without waypoints");
        throw std::out_of_range("Path - no waypoints assigned");
    }
    return m_waypoints[m_index];
}

bool Path::isFinished() const {
    if (m_loop) {
        return false;
    }
    return m_waypoints.empty() || m_index == m_waypoints.size() - 1;
}

Path& Path::createRandomPath(int numberOfWaypoints, const Region& bounds, std::mt19937& rng) {
    clear();
    if (numberOfWaypoints <= 0) {
        return *this;
    }

    const float halfWidth = bounds.getWidth() * 0.5f;
    const float halfHeight = bounds.getHeight() * 0.5f;
    std::uniform_real_distribution<float> radialX(halfWidth * 0.2f, halfWidth);
    std::uniform_real_distribution<float> radialY(halfHeight * 0.2f, halfHeight);
    const float spacing = 2.0f * Geometry::PI / static_cast<float>(numberOfWaypoints);

    for (int i = 0; i < numberOfWaypoints; ++i) {
        const float x = radialX(rng);
        const Vector2D radial(x, radialY(rng));
        addWaypoint(bounds.getCenter() + radial.rotated(spacing * static_cast<float>(i)));
    }
    return *this;
}

} // namespace Kickoff
