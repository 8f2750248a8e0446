/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "ai/SteeringBehaviors.hpp"
#include "core/Logger.hpp"
#include "entities/MovingEntity.hpp"
#include "utils/Geometry.hpp"
#include "world/SteeringWorld.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <format>
#include <limits>
#include <stdexcept>

namespace Kickoff {

namespace {

// Zero when the denominator is not positive so a resting agent predicts in place
float lookAheadTime(float distance, float combinedSpeed) {
    return combinedSpeed > 0.0f ? distance / combinedSpeed : 0.0f;
}

} // namespace

const char* toString(BehaviorKind kind) {
    switch (kind) {
    case BehaviorKind::WallAvoidance:
        return "WallAvoidance";
    case BehaviorKind::ObstacleAvoidance:
        return "ObstacleAvoidance";
    case BehaviorKind::Evade:
        return "Evade";
    case BehaviorKind::Separation:
        return "Separation";
    case BehaviorKind::Alignment:
        return "Alignment";
    case BehaviorKind::Cohesion:
        return "Cohesion";
    case BehaviorKind::Flee:
        return "Flee";
    case BehaviorKind::Seek:
        return "Seek";
    case BehaviorKind::Arrive:
        return "Arrive";
    case BehaviorKind::Wander:
        return "Wander";
    case BehaviorKind::Pursuit:
        return "Pursuit";
    case BehaviorKind::OffsetPursuit:
        return "OffsetPursuit";
    case BehaviorKind::Interpose:
        return "Interpose";
    case BehaviorKind::Hide:
        return "Hide";
    case BehaviorKind::FollowPath:
        return "FollowPath";
    case BehaviorKind::COUNT:
        break;
    }
    return "Unknown";
}

SteeringBehaviors::SteeringBehaviors(MovingEntity& agent, const SteeringWorld& world,
                                     std::mt19937& rng, const SteeringConfig& config)
    : m_agent(agent), m_world(world), m_rng(rng), m_config(config),
      m_arriveDeceleration(config.decelerationTweaker) {
    m_weights[index(BehaviorKind::WallAvoidance)] = config.wallAvoidanceWeight;
    m_weights[index(BehaviorKind::ObstacleAvoidance)] = config.obstacleAvoidanceWeight;
    m_weights[index(BehaviorKind::Evade)] = config.evadeWeight;
    m_weights[index(BehaviorKind::Separation)] = config.separationWeight;
    m_weights[index(BehaviorKind::Alignment)] = config.alignmentWeight;
    m_weights[index(BehaviorKind::Cohesion)] = config.cohesionWeight;
    m_weights[index(BehaviorKind::Flee)] = config.fleeWeight;
    m_weights[index(BehaviorKind::Seek)] = config.seekWeight;
    m_weights[index(BehaviorKind::Arrive)] = config.arriveWeight;
    m_weights[index(BehaviorKind::Wander)] = config.wanderWeight;
    m_weights[index(BehaviorKind::Pursuit)] = config.pursuitWeight;
    m_weights[index(BehaviorKind::OffsetPursuit)] = config.offsetPursuitWeight;
    m_weights[index(BehaviorKind::Interpose)] = config.interposeWeight;
    m_weights[index(BehaviorKind::Hide)] = config.hideWeight;
    m_weights[index(BehaviorKind::FollowPath)] = config.followPathWeight;

    // Random start point on the wander circle
    std::uniform_real_distribution<float> angle(0.0f, 2.0f * Geometry::PI);
    const float theta = angle(m_rng.get());
    m_wanderTarget = Vector2D(m_config.wanderRadius * std::cos(theta),
                              m_config.wanderRadius * std::sin(theta));
}

Vector2D SteeringBehaviors::calculate(float deltaTime) {
    m_steeringForce = Vector2D();

    if (isOn(BehaviorKind::Separation) || isOn(BehaviorKind::Alignment) ||
        isOn(BehaviorKind::Cohesion)) {
        findNeighbors();
    }

    for (size_t i = 0; i < KIND_COUNT; ++i) {
        if (!m_active.test(i)) {
            continue;
        }
        const BehaviorKind kind = static_cast<BehaviorKind>(i);
        const Vector2D force = computeForce(kind, deltaTime) * m_weights[i];
        if (!accumulateForce(force)) {
            break;
        }
    }

    return m_steeringForce;
}

bool SteeringBehaviors::accumulateForce(const Vector2D& forceToAdd) {
    const float remaining = m_agent.getMaxForce() - m_steeringForce.length();
    if (remaining <= 0.0f) {
        return false;
    }

    const float magnitude = forceToAdd.length();
    if (magnitude >= remaining) {
        // This force uses up the rest of the budget
        m_steeringForce += forceToAdd.normalized() * remaining;
        return false;
    }

    m_steeringForce += forceToAdd;
    return true;
}

Vector2D SteeringBehaviors::computeForce(BehaviorKind kind, float deltaTime) {
    switch (kind) {
    case BehaviorKind::WallAvoidance:
        return wallAvoidance();
    case BehaviorKind::ObstacleAvoidance:
        return obstacleAvoidance();
    case BehaviorKind::Evade:
        return evade(requireTargetAgent(kind));
    case BehaviorKind::Separation:
        return separation();
    case BehaviorKind::Alignment:
        return alignment();
    case BehaviorKind::Cohesion:
        return cohesion();
    case BehaviorKind::Flee:
        return flee(m_target);
    case BehaviorKind::Seek:
        return seek(m_target);
    case BehaviorKind::Arrive:
        return arrive(m_target, m_arriveDeceleration);
    case BehaviorKind::Wander:
        return wander(deltaTime);
    case BehaviorKind::Pursuit:
        return pursuit(requireTargetAgent(kind));
    case BehaviorKind::OffsetPursuit:
        return offsetPursuit(requireTargetAgent(kind), m_offset);
    case BehaviorKind::Interpose: {
        const MovingEntity& first = requireTargetAgent(kind);
        if (m_targetAgent2 != nullptr) {
            return interpose(first, *m_targetAgent2);
        }
        return interpose(first, m_target, m_interposeDistance);
    }
    case BehaviorKind::Hide:
        return hide(requireTargetAgent(kind));
    case BehaviorKind::FollowPath:
        return followPath();
    case BehaviorKind::COUNT:
        break;
    }
    return Vector2D();
}

const MovingEntity& SteeringBehaviors::requireTargetAgent(BehaviorKind kind) const {
    if (m_targetAgent1 == nullptr) {
        STEERING_ERROR(std::format("{} is on but no target agent is assigned (agent {})",
                                   toString(kind), m_agent.getID()));
        throw std::invalid_argument(
            std::format("SteeringBehaviors - {} target not assigned", toString(kind)));
    }
    return *m_targetAgent1;
}

void SteeringBehaviors::findNeighbors() {
    m_neighbors.clear();
    m_candidates.clear();
    m_world.collectAgents(m_candidates);

    const float viewSq = m_config.viewDistance * m_config.viewDistance;
    for (const MovingEntity* other : m_candidates) {
        if (other != &m_agent &&
            Vector2D::distanceSquared(other->getPosition(), m_agent.getPosition()) < viewSq) {
            m_neighbors.push_back(other);
        }
    }
}

Vector2D SteeringBehaviors::seek(const Vector2D& target) const {
    const Vector2D desired = (target - m_agent.getPosition()).normalized() * m_agent.getMaxSpeed();
    return desired - m_agent.getVelocity();
}

Vector2D SteeringBehaviors::flee(const Vector2D& target) const {
    const float panicSq = m_config.panicDistance * m_config.panicDistance;
    if (Vector2D::distanceSquared(m_agent.getPosition(), target) >= panicSq) {
        return Vector2D();
    }
    const Vector2D desired = (m_agent.getPosition() - target).normalized() * m_agent.getMaxSpeed();
    return desired - m_agent.getVelocity();
}

Vector2D SteeringBehaviors::arrive(const Vector2D& target, float deceleration) const {
    const Vector2D toTarget = target - m_agent.getPosition();
    const float distance = toTarget.length();
    if (distance <= 0.0f) {
        return Vector2D();
    }

    const float speed = std::min(distance / deceleration, m_agent.getMaxSpeed());
    const Vector2D desired = toTarget * (speed / distance);
    return desired - m_agent.getVelocity();
}

Vector2D SteeringBehaviors::pursuit(const MovingEntity& evader) const {
    const Vector2D toEvader = evader.getPosition() - m_agent.getPosition();
    const bool evaderAhead = toEvader.dot(m_agent.getHeading()) > 0.0f;
    const bool facing = m_agent.getHeading().dot(evader.getHeading()) < 0.95f;
    if (evaderAhead && facing) {
        return seek(evader.getPosition());
    }

    const float lookAhead =
        lookAheadTime(toEvader.length(), m_agent.getMaxSpeed() + evader.getSpeed());
    return seek(evader.getPosition() + evader.getVelocity() * lookAhead);
}

Vector2D SteeringBehaviors::offsetPursuit(const MovingEntity& leader, const Vector2D& offset) const {
    const Vector2D worldOffset = Geometry::pointToWorldSpace(offset, leader.getHeading(),
                                                             leader.getSide(), leader.getPosition());
    const Vector2D toOffset = worldOffset - m_agent.getPosition();
    const float lookAhead =
        lookAheadTime(toOffset.length(), m_agent.getMaxSpeed() + leader.getSpeed());
    return arrive(worldOffset + leader.getVelocity() * lookAhead,
                  decelerationFactor(Deceleration::VeryFast));
}

Vector2D SteeringBehaviors::evade(const MovingEntity& pursuer) const {
    const Vector2D toPursuer = pursuer.getPosition() - m_agent.getPosition();
    if (toPursuer.lengthSquared() > m_config.panicDistance * m_config.panicDistance) {
        return Vector2D();
    }

    const float lookAhead =
        lookAheadTime(toPursuer.length(), m_agent.getMaxSpeed() + pursuer.getSpeed());
    return flee(pursuer.getPosition() + pursuer.getVelocity() * lookAhead);
}

Vector2D SteeringBehaviors::interpose(const MovingEntity& agentA, const MovingEntity& agentB) const {
    const Vector2D midPoint = (agentA.getPosition() + agentB.getPosition()) * 0.5f;
    const float time = lookAheadTime(Vector2D::distance(m_agent.getPosition(), midPoint),
                                     m_agent.getMaxSpeed());

    const Vector2D futureA = agentA.getPosition() + agentA.getVelocity() * time;
    const Vector2D futureB = agentB.getPosition() + agentB.getVelocity() * time;
    return arrive((futureA + futureB) * 0.5f, decelerationFactor(Deceleration::VeryFast));
}

Vector2D SteeringBehaviors::interpose(const MovingEntity& agent, const Vector2D& point,
                                      float distance) const {
    const Vector2D toAgent = (agent.getPosition() - point).normalized();
    return arrive(point + toAgent * distance, decelerationFactor(Deceleration::VeryFast));
}

Vector2D SteeringBehaviors::hidingPosition(const Vector2D& obstacleCenter, float obstacleRadius,
                                           const Vector2D& hunterPosition) const {
    const float distanceAway = obstacleRadius + m_config.hideDistanceFromBoundary;
    return obstacleCenter + (obstacleCenter - hunterPosition).normalized() * distanceAway;
}

Vector2D SteeringBehaviors::hide(const MovingEntity& hunter) const {
    float closestSq = std::numeric_limits<float>::max();
    Vector2D bestSpot;
    bool found = false;

    for (const Obstacle& obstacle : m_world.getObstacles()) {
        const Vector2D spot = hidingPosition(obstacle.center, obstacle.radius, hunter.getPosition());
        const float distSq = Vector2D::distanceSquared(spot, m_agent.getPosition());
        if (distSq < closestSq) {
            closestSq = distSq;
            bestSpot = spot;
            found = true;
        }
    }

    if (!found) {
        return evade(hunter);
    }
    return arrive(bestSpot, decelerationFactor(Deceleration::VeryFast));
}

Vector2D SteeringBehaviors::wander(float deltaTime) {
    const float jitter = m_config.wanderJitterPerSec * deltaTime;
    std::uniform_real_distribution<float> unit(-1.0f, 1.0f);
    const float jx = unit(m_rng.get());
    const float jy = unit(m_rng.get());

    m_wanderTarget += Vector2D(jx * jitter, jy * jitter);
    m_wanderTarget = m_wanderTarget.normalized() * m_config.wanderRadius;

    const Vector2D local = m_wanderTarget + Vector2D(m_config.wanderDistance, 0.0f);
    const Vector2D world = Geometry::pointToWorldSpace(local, m_agent.getHeading(),
                                                       m_agent.getSide(), m_agent.getPosition());
    return world - m_agent.getPosition();
}

Vector2D SteeringBehaviors::obstacleAvoidance() const {
    const float boxLength = m_config.minDetectionBoxLength + m_agent.getSpeed() +
                            m_agent.getMaxSpeed() + m_agent.getBoundingRadius();

    const Obstacle* closest = nullptr;
    float closestDistance = std::numeric_limits<float>::max();
    Vector2D closestLocal;

    for (const Obstacle& obstacle : m_world.getObstacles()) {
        const Vector2D local = Geometry::pointToLocalSpace(obstacle.center, m_agent.getHeading(),
                                                           m_agent.getSide(), m_agent.getPosition());
        // Only obstacles ahead and within the detection box
        if (local.getX() <= 0.0f || local.getX() >= boxLength) {
            continue;
        }

        const float expandedRadius = obstacle.radius + m_agent.getBoundingRadius();
        if (std::abs(local.getY()) >= expandedRadius) {
            continue;
        }

        const auto hit = Geometry::rayCircleIntersection(Vector2D(), Vector2D(1.0f, 0.0f),
                                                         local, expandedRadius);
        if (hit && *hit < closestDistance) {
            closestDistance = *hit;
            closest = &obstacle;
            closestLocal = local;
        }
    }

    if (closest == nullptr) {
        return Vector2D();
    }

    // The closer the obstacle the stronger the push
    const float multiplier = 1.0f + (boxLength - closestLocal.getX()) / boxLength;
    const Vector2D localForce(
        (closest->radius - closestLocal.getX()) * m_config.obstacleBrakingWeight,
        (closest->radius - closestLocal.getY()) * multiplier);
    return Geometry::vectorToWorldSpace(localForce, m_agent.getHeading(), m_agent.getSide());
}

Vector2D SteeringBehaviors::wallAvoidance() const {
    const Vector2D& origin = m_agent.getPosition();
    const Vector2D& heading = m_agent.getHeading();
    const float length = m_config.wallFeelerLength;

    // Straight ahead, then 45 degrees either side at half length
    const std::array<Vector2D, 3> feelers = {
        origin + heading * length,
        origin + heading.rotated(Geometry::PI * 0.25f) * (length * 0.5f),
        origin + heading.rotated(-Geometry::PI * 0.25f) * (length * 0.5f),
    };

    float closestDistance = std::numeric_limits<float>::max();
    const Wall2D* closestWall = nullptr;
    Vector2D closestPoint;
    Vector2D closestFeeler;

    for (const Vector2D& feeler : feelers) {
        for (const Wall2D& wall : m_world.getWalls()) {
            float distance = 0.0f;
            Vector2D point;
            if (Geometry::lineIntersection2D(origin, feeler, wall.from, wall.to, distance, point) &&
                distance < closestDistance) {
                closestDistance = distance;
                closestWall = &wall;
                closestPoint = point;
                closestFeeler = feeler;
            }
        }
    }

    if (closestWall == nullptr) {
        return Vector2D();
    }
    // Push along the wall normal by how far the feeler overshoots
    return closestWall->normal * (closestFeeler - closestPoint).length();
}

Vector2D SteeringBehaviors::followPath() {
    if (m_path.empty()) {
        return Vector2D();
    }

    const float seekDistSq = m_config.waypointSeekDistance * m_config.waypointSeekDistance;
    if (Vector2D::distanceSquared(m_path.getCurrentWaypoint(), m_agent.getPosition()) < seekDistSq) {
        m_path.setNextWaypoint();
    }

    if (!m_path.isFinished()) {
        return seek(m_path.getCurrentWaypoint());
    }
    return arrive(m_path.getCurrentWaypoint(), decelerationFactor(Deceleration::Middle));
}

Vector2D SteeringBehaviors::separation() const {
    Vector2D force;
    for (const MovingEntity* neighbor : m_neighbors) {
        if (neighbor == m_targetAgent1) {
            continue;
        }
        const Vector2D toAgent = m_agent.getPosition() - neighbor->getPosition();
        float length = toAgent.length();
        if (length == 0.0f) {
            length = 0.0001f;
        }
        // Inversely proportional to the distance
        force += toAgent.normalized() / length;
    }
    return force;
}

Vector2D SteeringBehaviors::alignment() const {
    Vector2D averageHeading;
    int count = 0;
    for (const MovingEntity* neighbor : m_neighbors) {
        if (neighbor == m_targetAgent1) {
            continue;
        }
        averageHeading += neighbor->getHeading();
        ++count;
    }

    if (count == 0) {
        return Vector2D();
    }
    return averageHeading / static_cast<float>(count) - m_agent.getHeading();
}

Vector2D SteeringBehaviors::cohesion() const {
    Vector2D centerOfMass;
    int count = 0;
    for (const MovingEntity* neighbor : m_neighbors) {
        if (neighbor == m_targetAgent1) {
            continue;
        }
        centerOfMass += neighbor->getPosition();
        ++count;
    }

    if (count == 0) {
        return Vector2D();
    }
    // Normalized, cohesion is otherwise far larger than the other group forces
    return seek(centerOfMass / static_cast<float>(count)).normalized();
}

} // namespace Kickoff
