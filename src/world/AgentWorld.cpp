/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "world/AgentWorld.hpp"
#include "core/Logger.hpp"
#include "world/Region.hpp"
#include <algorithm>
#include <format>
#include <stdexcept>

namespace Kickoff {

void AgentWorld::enclose(const Region& bounds) {
    const Vector2D topLeft(bounds.getLeft(), bounds.getTop());
    const Vector2D topRight(bounds.getRight(), bounds.getTop());
    const Vector2D bottomLeft(bounds.getLeft(), bounds.getBottom());
    const Vector2D bottomRight(bounds.getRight(), bounds.getBottom());

    m_walls.emplace_back(bottomLeft, bottomRight, Vector2D(0.0f, 1.0f));
    m_walls.emplace_back(topLeft, topRight, Vector2D(0.0f, -1.0f));
    m_walls.emplace_back(bottomLeft, topLeft, Vector2D(1.0f, 0.0f));
    m_walls.emplace_back(bottomRight, topRight, Vector2D(-1.0f, 0.0f));
}

Vehicle& AgentWorld::createVehicle(const MovingEntity::Params& params,
                                   const SteeringConfig& steeringConfig) {
    m_vehicles.push_back(std::make_unique<Vehicle>(*this, m_rng, params, steeringConfig));
    WORLD_DEBUG(std::format("Vehicle {} created", m_vehicles.back()->getID()));
    return *m_vehicles.back();
}

bool AgentWorld::removeVehicle(EntityID id) {
    auto it = std::find_if(m_vehicles.begin(), m_vehicles.end(),
                           [id](const std::unique_ptr<Vehicle>& v) { return v->getID() == id; });
    if (it == m_vehicles.end()) {
        return false;
    }

    // Nobody may keep steering toward a vehicle that no longer exists
    const Vehicle* removed = it->get();
    for (auto& vehicle : m_vehicles) {
        SteeringBehaviors& steering = vehicle->getSteering();
        if (steering.getTargetAgent1() == removed) {
            steering.setTargetAgent1(nullptr);
        }
        if (steering.getTargetAgent2() == removed) {
            steering.setTargetAgent2(nullptr);
        }
    }
    m_vehicles.erase(it);
    return true;
}

void AgentWorld::clear() {
    m_vehicles.clear();
    m_walls.clear();
    m_obstacles.clear();
}

void AgentWorld::update(float deltaTime) {
    for (auto& vehicle : m_vehicles) {
        vehicle->update(deltaTime);
    }
}

void AgentWorld::collectAgents(std::vector<const MovingEntity*>& out) const {
    for (const auto& vehicle : m_vehicles) {
        out.push_back(vehicle.get());
    }
}

Vehicle& AgentWorld::getVehicle(size_t index) {
    if (index >= m_vehicles.size()) {
        WORLD_ERROR(std::format("Vehicle index {} out of range ({} vehicles)", index,
                                m_vehicles.size()));
        throw std::out_of_range("AgentWorld - vehicle index out of range");
    }
    return *m_vehicles[index];
}

} // namespace Kickoff
