/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef PATH_HPP
#define PATH_HPP

#include "utils/Vector2D.hpp"
#include <random>
#include <vector>

namespace Kickoff {

class Region;

/**
 * @brief Ordered waypoint list for the follow-path steering behavior
 *
 * A looping path wraps from the last waypoint back to the first and is
 * never finished. A non-looping path stays on its last waypoint.
 */
class Path {
public:
    explicit Path(bool loop = false) : m_loop(loop) {}

    Path& addWaypoint(const Vector2D& waypoint);
    Path& clear();

    // Throws std::out_of_range on an empty path
    Path& setNextWaypoint();
    const Vector2D& getCurrentWaypoint() const;

    bool isFinished() const;

    /**
     * @brief Replaces the waypoints with a loop of random points around the
     *        region center, spread evenly by angle
     */
    Path& createRandomPath(int numberOfWaypoints, const Region& bounds, std::mt19937& rng);

    bool isLooped() const { return m_loop; }
    void setLoop(bool loop) { m_loop = loop; }
    size_t getCurrentIndex() const { return m_index; }
    const std::vector<Vector2D>& getWaypoints() const { return m_waypoints; }
    bool empty() const { return m_waypoints.empty(); }

private:
    std::vector<Vector2D> m_waypoints;
    size_t m_index{0};
    bool m_loop;
};

} // namespace Kickoff

#endif // PATH_HPP
