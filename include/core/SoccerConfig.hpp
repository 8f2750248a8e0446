/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SOCCER_CONFIG_HPP
#define SOCCER_CONFIG_HPP

namespace Kickoff
{

class SettingsManager;

/**
 * Configuration for the Ball
 *
 * Speeds are in pitch units per tick, so friction is a per-tick decrement.
 */
struct BallConfig
{
    float friction = -0.005f;                     // Speed change per tick, must be negative
    float kickingAccuracy = 0.99f;                // 1.0 means no noise is added to kicks
    float radius = 1.0f;
    float mass = 1.0f;
};

/**
 * Configuration shared by field players and keepers
 *
 * All ranges are plain distances; comparisons square them.
 */
struct PlayerConfig
{
    // Keeper
    float keeperInTargetRange = 2.0f;             // Ball this close can be trapped by the keeper
    float keeperInterceptRange = 15.0f;           // Ball this close to the goal center triggers an intercept
    float keeperTendingDistance = 4.0f;           // Distance kept in front of the goal mouth
    float keeperMinPassDistance = 5.0f;           // Closest teammate the keeper will throw to
    float keeperMaxDistanceFromGoal = 15.0f;      // Further than this and the keeper heads back
    int keeperMaxPassAttempts = 60;               // Ticks without a safe pass before the keeper clears the ball

    // Ranges
    float receivingRange = 2.0f;
    float inTargetRange = 2.0f;
    float kickingDistance = 1.5f;
    float comfortZone = 10.0f;                    // Opponents inside this (and in front) are a threat
    float passThreatRadius = 15.0f;               // Receivers with opponents this close pursue the ball

    // Decisions
    float kickFrequency = 8.0f;                   // Kicks allowed per second
    int shotAttempts = 5;                         // Random shot targets tried per shot check
    float chanceOfUsingArriveToReceive = 0.5f;
    float chanceOfPotShot = 0.005f;               // Chance of shooting with no clear shot
    float chanceOfRequestingPass = 0.1f;          // Fraction of pass requests actually sent
    float minPassDistance = 15.0f;

    // Physics
    float mass = 1.0f;
    float radius = 1.0f;
    float maxSpeedWithBall = 0.085f;
    float maxSpeedWithoutBall = 0.11f;
    float maxForce = 1.0f;
    float maxTurnRate = 0.1f;                     // Radians per tick
    float brakingRate = 0.8f;                     // Velocity scale applied when no force acts

    // Kick strengths
    float dribbleForce = 0.18f;
    float dribbleAndTurnForce = 0.12f;
    float shootingForce = 0.8f;
    float passingForce = 0.5f;
};

/**
 * Configuration for SteeringBehaviors
 */
struct SteeringConfig
{
    // Weights
    float separationWeight = 1.0f;
    float alignmentWeight = 1.0f;
    float cohesionWeight = 4.0f;
    float seekWeight = 1.0f;
    float fleeWeight = 1.0f;
    float arriveWeight = 1.0f;
    float wanderWeight = 1.0f;
    float pursuitWeight = 1.0f;
    float offsetPursuitWeight = 1.0f;
    float evadeWeight = 1.0f;
    float interposeWeight = 1.0f;
    float hideWeight = 1.0f;
    float followPathWeight = 1.0f;
    float obstacleAvoidanceWeight = 10.0f;
    float wallAvoidanceWeight = 10.0f;

    // Parameters
    float decelerationTweaker = 1.0f;
    float panicDistance = 50.0f;
    float hideDistanceFromBoundary = 10.0f;       // Clearance kept behind an obstacle when hiding
    float waypointSeekDistance = 5.0f;
    float wallFeelerLength = 20.0f;
    float viewDistance = 200.0f;
    float minDetectionBoxLength = 0.0f;           // Added to speed + maxSpeed for obstacle avoidance
    float obstacleBrakingWeight = 0.2f;
    float wanderRadius = 5.0f;
    float wanderDistance = 10.0f;
    float wanderJitterPerSec = 80.0f;
};

/**
 * Configuration for SupportSpotCalculator
 */
struct SupportSpotConfig
{
    int spotsX = 13;                              // Columns across the whole pitch, half are used
    int spotsY = 6;
    float regionWidthFraction = 0.9f;             // Part of the pitch the grid covers
    float regionHeightFraction = 0.8f;
    float canPassScore = 2.0f;
    float canScoreScore = 1.0f;
    float distanceFromControllerScore = 2.0f;
    float optimalDistance = 20.0f;
    float updatesPerSecond = 1.0f;
};

/**
 * Configuration for the Pitch
 */
struct PitchConfig
{
    float width = 100.0f;
    float height = 60.0f;
    int regionColumns = 6;
    int regionRows = 3;
    float goalDepth = 2.0f;
    float goalWidth = 10.0f;
};

/**
 * Aggregate passed into the Pitch and everything it builds
 */
struct SoccerConfig
{
    BallConfig ball;
    PlayerConfig player;
    SteeringConfig steering;
    SupportSpotConfig supportSpot;
    PitchConfig pitch;

    /**
     * Defaults overlaid with every value present under the "ball", "player",
     * "steering", "support_spot" and "pitch" categories
     */
    static SoccerConfig fromSettings(const SettingsManager& settings);
};

} // namespace Kickoff

#endif // SOCCER_CONFIG_HPP
