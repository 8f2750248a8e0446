/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef AGENT_WORLD_HPP
#define AGENT_WORLD_HPP

#include "entities/Vehicle.hpp"
#include "world/SteeringWorld.hpp"
#include <memory>
#include <random>
#include <vector>

namespace Kickoff {

class Region;

/**
 * @brief Walls, obstacles and vehicles outside of a match
 *
 * Owns its vehicles. update() steps every vehicle once, in creation order.
 */
class AgentWorld : public SteeringWorld {
public:
    explicit AgentWorld(unsigned int seed = std::mt19937::default_seed) : m_rng(seed) {}

    AgentWorld(const AgentWorld&) = delete;
    AgentWorld& operator=(const AgentWorld&) = delete;

    void addWall(const Wall2D& wall) { m_walls.push_back(wall); }
    // Four walls around the region with normals facing inward
    void enclose(const Region& bounds);
    void addObstacle(const Obstacle& obstacle) { m_obstacles.push_back(obstacle); }

    Vehicle& createVehicle(const MovingEntity::Params& params,
                           const SteeringConfig& steeringConfig = SteeringConfig{});
    bool removeVehicle(EntityID id);
    void clear();

    void update(float deltaTime);

    const std::vector<Wall2D>& getWalls() const override { return m_walls; }
    const std::vector<Obstacle>& getObstacles() const override { return m_obstacles; }
    void collectAgents(std::vector<const MovingEntity*>& out) const override;

    size_t getVehicleCount() const { return m_vehicles.size(); }
    Vehicle& getVehicle(size_t index);
    std::mt19937& getRandomEngine() { return m_rng; }

private:
    std::mt19937 m_rng;
    std::vector<Wall2D> m_walls;
    std::vector<Obstacle> m_obstacles;
    std::vector<std::unique_ptr<Vehicle>> m_vehicles;
};

} // namespace Kickoff

#endif // AGENT_WORLD_HPP
