/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef STEERING_WORLD_HPP
#define STEERING_WORLD_HPP

#include "world/Wall2D.hpp"
#include <vector>

class MovingEntity;

namespace Kickoff {

/**
 * @brief What steering needs to know about the space an agent moves in
 *
 * Implemented by the Pitch for matches and by AgentWorld for free-roaming
 * vehicles.
 */
class SteeringWorld {
public:
    virtual ~SteeringWorld() = default;

    virtual const std::vector<Wall2D>& getWalls() const = 0;
    virtual const std::vector<Obstacle>& getObstacles() const = 0;

    // Appends every agent that can be a flocking neighbor
    virtual void collectAgents(std::vector<const MovingEntity*>& out) const = 0;
};

} // namespace Kickoff

#endif // STEERING_WORLD_HPP
