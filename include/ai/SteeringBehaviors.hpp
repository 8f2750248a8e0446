/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef STEERING_BEHAVIORS_HPP
#define STEERING_BEHAVIORS_HPP

#include "ai/Path.hpp"
#include "core/SoccerConfig.hpp"
#include "utils/Vector2D.hpp"
#include <array>
#include <bitset>
#include <cstdint>
#include <functional>
#include <random>
#include <vector>

class MovingEntity;

namespace Kickoff {

class SteeringWorld;

/**
 * Every behavior the steering engine can run. Listed in evaluation
 * priority order, highest first.
 */
enum class BehaviorKind : uint8_t {
    WallAvoidance,
    ObstacleAvoidance,
    Evade,
    Separation,
    Alignment,
    Cohesion,
    Flee,
    Seek,
    Arrive,
    Wander,
    Pursuit,
    OffsetPursuit,
    Interpose,
    Hide,
    FollowPath,
    COUNT
};

// How hard arrive brakes; the value divides the remaining distance
enum class Deceleration : uint8_t {
    VeryFast,
    Fast,
    Middle,
    Slow,
    VerySlow
};

constexpr float decelerationFactor(Deceleration deceleration) {
    switch (deceleration) {
    case Deceleration::VeryFast:
        return 1.5f;
    case Deceleration::Fast:
        return 3.0f;
    case Deceleration::Middle:
        return 4.0f;
    case Deceleration::Slow:
        return 5.0f;
    case Deceleration::VerySlow:
        return 6.0f;
    }
    return 4.0f;
}

const char* toString(BehaviorKind kind);

/**
 * @brief Per-agent steering force generator
 *
 * Active behaviors are evaluated in BehaviorKind order. Each weighted force
 * is added while the agent still has force budget left (maxForce minus the
 * length of the running sum); the force that exhausts the budget is
 * truncated to fit and everything of lower priority is skipped that tick.
 *
 * Evade, pursuit, offset pursuit, interpose and hide need targetAgent1.
 * Turning one of them on without it makes calculate() throw
 * std::invalid_argument.
 */
class SteeringBehaviors {
public:
    SteeringBehaviors(MovingEntity& agent, const SteeringWorld& world, std::mt19937& rng,
                      const SteeringConfig& config = SteeringConfig{});

    SteeringBehaviors(const SteeringBehaviors&) = delete;
    SteeringBehaviors& operator=(const SteeringBehaviors&) = delete;

    Vector2D calculate(float deltaTime);
    const Vector2D& getSteeringForce() const { return m_steeringForce; }

    void on(BehaviorKind kind) { m_active.set(index(kind)); }
    void off(BehaviorKind kind) { m_active.reset(index(kind)); }
    bool isOn(BehaviorKind kind) const { return m_active.test(index(kind)); }
    bool isAnyOn() const { return m_active.any(); }
    void allOff() { m_active.reset(); }

    void seekOn() { on(BehaviorKind::Seek); }
    void seekOff() { off(BehaviorKind::Seek); }
    void fleeOn() { on(BehaviorKind::Flee); }
    void fleeOff() { off(BehaviorKind::Flee); }
    void arriveOn() { on(BehaviorKind::Arrive); }
    void arriveOff() { off(BehaviorKind::Arrive); }
    void wanderOn() { on(BehaviorKind::Wander); }
    void wanderOff() { off(BehaviorKind::Wander); }
    void pursuitOn() { on(BehaviorKind::Pursuit); }
    void pursuitOff() { off(BehaviorKind::Pursuit); }
    void offsetPursuitOn(const Vector2D& offset) {
        m_offset = offset;
        on(BehaviorKind::OffsetPursuit);
    }
    void offsetPursuitOff() { off(BehaviorKind::OffsetPursuit); }
    void evadeOn() { on(BehaviorKind::Evade); }
    void evadeOff() { off(BehaviorKind::Evade); }
    // distance > 0 keeps the agent that far from the target point toward targetAgent1
    void interposeOn(float distance = 0.0f) {
        m_interposeDistance = distance;
        on(BehaviorKind::Interpose);
    }
    void interposeOff() { off(BehaviorKind::Interpose); }
    void hideOn() { on(BehaviorKind::Hide); }
    void hideOff() { off(BehaviorKind::Hide); }
    void followPathOn() { on(BehaviorKind::FollowPath); }
    void followPathOff() { off(BehaviorKind::FollowPath); }
    void separationOn() { on(BehaviorKind::Separation); }
    void separationOff() { off(BehaviorKind::Separation); }
    void alignmentOn() { on(BehaviorKind::Alignment); }
    void alignmentOff() { off(BehaviorKind::Alignment); }
    void cohesionOn() { on(BehaviorKind::Cohesion); }
    void cohesionOff() { off(BehaviorKind::Cohesion); }
    void obstacleAvoidanceOn() { on(BehaviorKind::ObstacleAvoidance); }
    void obstacleAvoidanceOff() { off(BehaviorKind::ObstacleAvoidance); }
    void wallAvoidanceOn() { on(BehaviorKind::WallAvoidance); }
    void wallAvoidanceOff() { off(BehaviorKind::WallAvoidance); }
    void flockingOn() {
        cohesionOn();
        separationOn();
        alignmentOn();
        wanderOn();
    }
    void flockingOff() {
        cohesionOff();
        separationOff();
        alignmentOff();
        wanderOff();
    }

    const Vector2D& getTarget() const { return m_target; }
    void setTarget(const Vector2D& target) { m_target = target; }

    // Non-owning, the agents must outlive this steering instance or be reset
    const MovingEntity* getTargetAgent1() const { return m_targetAgent1; }
    void setTargetAgent1(const MovingEntity* agent) { m_targetAgent1 = agent; }
    const MovingEntity* getTargetAgent2() const { return m_targetAgent2; }
    void setTargetAgent2(const MovingEntity* agent) { m_targetAgent2 = agent; }

    const Vector2D& getOffset() const { return m_offset; }
    Path& getPath() { return m_path; }
    const Path& getPath() const { return m_path; }

    float getWeight(BehaviorKind kind) const { return m_weights[index(kind)]; }
    void setWeight(BehaviorKind kind, float weight) { m_weights[index(kind)] = weight; }

    float getArriveDeceleration() const { return m_arriveDeceleration; }
    void setArriveDeceleration(float deceleration) { m_arriveDeceleration = deceleration; }
    float getPanicDistance() const { return m_config.panicDistance; }
    float getViewDistance() const { return m_config.viewDistance; }
    float getInterposeDistance() const { return m_interposeDistance; }

    const std::vector<const MovingEntity*>& getNeighbors() const { return m_neighbors; }
    // Wander target on the wander circle, agent local space
    const Vector2D& getWanderTarget() const { return m_wanderTarget; }

    // Individual behaviors, public so states and tests can use them directly
    Vector2D seek(const Vector2D& target) const;
    Vector2D flee(const Vector2D& target) const;
    Vector2D arrive(const Vector2D& target, float deceleration) const;
    Vector2D pursuit(const MovingEntity& evader) const;
    Vector2D offsetPursuit(const MovingEntity& leader, const Vector2D& offset) const;
    Vector2D evade(const MovingEntity& pursuer) const;
    Vector2D interpose(const MovingEntity& agentA, const MovingEntity& agentB) const;
    Vector2D interpose(const MovingEntity& agent, const Vector2D& point, float distance) const;
    Vector2D hide(const MovingEntity& hunter) const;
    Vector2D wander(float deltaTime);
    Vector2D obstacleAvoidance() const;
    Vector2D wallAvoidance() const;
    Vector2D followPath();
    Vector2D separation() const;
    Vector2D alignment() const;
    Vector2D cohesion() const;

private:
    static constexpr size_t KIND_COUNT = static_cast<size_t>(BehaviorKind::COUNT);
    static constexpr size_t index(BehaviorKind kind) { return static_cast<size_t>(kind); }

    bool accumulateForce(const Vector2D& forceToAdd);
    Vector2D computeForce(BehaviorKind kind, float deltaTime);
    const MovingEntity& requireTargetAgent(BehaviorKind kind) const;
    void findNeighbors();
    Vector2D hidingPosition(const Vector2D& obstacleCenter, float obstacleRadius,
                            const Vector2D& hunterPosition) const;

    // Non-owning references, the owner holds this object by value
    MovingEntity& m_agent;
    const SteeringWorld& m_world;
    std::reference_wrapper<std::mt19937> m_rng;
    SteeringConfig m_config;

    std::bitset<KIND_COUNT> m_active;
    std::array<float, KIND_COUNT> m_weights{};

    Vector2D m_steeringForce;
    Vector2D m_target;
    const MovingEntity* m_targetAgent1{nullptr};
    const MovingEntity* m_targetAgent2{nullptr};
    Vector2D m_offset;
    float m_interposeDistance{0.0f};
    float m_arriveDeceleration;
    Vector2D m_wanderTarget;
    Path m_path;
    std::vector<const MovingEntity*> m_neighbors;
    std::vector<const MovingEntity*> m_candidates;
};

} // namespace Kickoff

#endif // STEERING_BEHAVIORS_HPP
