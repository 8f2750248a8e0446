/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/SoccerConfig.hpp"
#include "core/Logger.hpp"
#include "managers/SettingsManager.hpp"
#include <format>

namespace Kickoff {

namespace {

template<typename T>
void overlay(const SettingsManager& settings, const char* category, const char* key, T& field) {
    field = settings.get<T>(category, key, field);
}

// Masses, radii and speeds end up as divisors or clamps
template<typename T>
void requirePositive(const char* category, const char* key, T& field, T fallback) {
    if (field <= T{0}) {
        SETTINGS_WARNING(std::format("{}.{} must be positive, got {}; using {}", category, key,
                                     field, fallback));
        field = fallback;
    }
}

} // namespace

SoccerConfig SoccerConfig::fromSettings(const SettingsManager& settings) {
    SoccerConfig config;

    BallConfig& ball = config.ball;
    overlay(settings, "ball", "friction", ball.friction);
    overlay(settings, "ball", "kicking_accuracy", ball.kickingAccuracy);
    overlay(settings, "ball", "radius", ball.radius);
    overlay(settings, "ball", "mass", ball.mass);
    if (ball.friction >= 0.0f) {
        SETTINGS_WARNING(std::format("ball.friction must be negative, got {}; using -0.005",
                                     ball.friction));
        ball.friction = BallConfig{}.friction;
    }
    requirePositive("ball", "radius", ball.radius, BallConfig{}.radius);
    requirePositive("ball", "mass", ball.mass, BallConfig{}.mass);

    PlayerConfig& p = config.player;
    overlay(settings, "player", "keeper_in_target_range", p.keeperInTargetRange);
    overlay(settings, "player", "keeper_intercept_range", p.keeperInterceptRange);
    overlay(settings, "player", "keeper_tending_distance", p.keeperTendingDistance);
    overlay(settings, "player", "keeper_min_pass_distance", p.keeperMinPassDistance);
    overlay(settings, "player", "keeper_max_distance_from_goal", p.keeperMaxDistanceFromGoal);
    overlay(settings, "player", "keeper_max_pass_attempts", p.keeperMaxPassAttempts);
    overlay(settings, "player", "receiving_range", p.receivingRange);
    overlay(settings, "player", "in_target_range", p.inTargetRange);
    overlay(settings, "player", "kicking_distance", p.kickingDistance);
    overlay(settings, "player", "comfort_zone", p.comfortZone);
    overlay(settings, "player", "pass_threat_radius", p.passThreatRadius);
    overlay(settings, "player", "kick_frequency", p.kickFrequency);
    overlay(settings, "player", "shot_attempts", p.shotAttempts);
    overlay(settings, "player", "chance_of_using_arrive_to_receive", p.chanceOfUsingArriveToReceive);
    overlay(settings, "player", "chance_of_pot_shot", p.chanceOfPotShot);
    overlay(settings, "player", "chance_of_requesting_pass", p.chanceOfRequestingPass);
    overlay(settings, "player", "min_pass_distance", p.minPassDistance);
    overlay(settings, "player", "mass", p.mass);
    overlay(settings, "player", "radius", p.radius);
    overlay(settings, "player", "max_speed_with_ball", p.maxSpeedWithBall);
    overlay(settings, "player", "max_speed_without_ball", p.maxSpeedWithoutBall);
    overlay(settings, "player", "max_force", p.maxForce);
    overlay(settings, "player", "max_turn_rate", p.maxTurnRate);
    overlay(settings, "player", "braking_rate", p.brakingRate);
    overlay(settings, "player", "dribble_force", p.dribbleForce);
    overlay(settings, "player", "dribble_and_turn_force", p.dribbleAndTurnForce);
    overlay(settings, "player", "shooting_force", p.shootingForce);
    overlay(settings, "player", "passing_force", p.passingForce);

    const PlayerConfig defaults;
    requirePositive("player", "mass", p.mass, defaults.mass);
    requirePositive("player", "radius", p.radius, defaults.radius);
    requirePositive("player", "max_speed_with_ball", p.maxSpeedWithBall, defaults.maxSpeedWithBall);
    requirePositive("player", "max_speed_without_ball", p.maxSpeedWithoutBall,
                    defaults.maxSpeedWithoutBall);
    requirePositive("player", "max_force", p.maxForce, defaults.maxForce);
    requirePositive("player", "keeper_max_pass_attempts", p.keeperMaxPassAttempts,
                    defaults.keeperMaxPassAttempts);

    SteeringConfig& s = config.steering;
    overlay(settings, "steering", "separation_weight", s.separationWeight);
    overlay(settings, "steering", "alignment_weight", s.alignmentWeight);
    overlay(settings, "steering", "cohesion_weight", s.cohesionWeight);
    overlay(settings, "steering", "seek_weight", s.seekWeight);
    overlay(settings, "steering", "flee_weight", s.fleeWeight);
    overlay(settings, "steering", "arrive_weight", s.arriveWeight);
    overlay(settings, "steering", "wander_weight", s.wanderWeight);
    overlay(settings, "steering", "pursuit_weight", s.pursuitWeight);
    overlay(settings, "steering", "offset_pursuit_weight", s.offsetPursuitWeight);
    overlay(settings, "steering", "evade_weight", s.evadeWeight);
    overlay(settings, "steering", "interpose_weight", s.interposeWeight);
    overlay(settings, "steering", "hide_weight", s.hideWeight);
    overlay(settings, "steering", "follow_path_weight", s.followPathWeight);
    overlay(settings, "steering", "obstacle_avoidance_weight", s.obstacleAvoidanceWeight);
    overlay(settings, "steering", "wall_avoidance_weight", s.wallAvoidanceWeight);
    overlay(settings, "steering", "deceleration_tweaker", s.decelerationTweaker);
    overlay(settings, "steering", "panic_distance", s.panicDistance);
    overlay(settings, "steering", "hide_distance_from_boundary", s.hideDistanceFromBoundary);
    overlay(settings, "steering", "waypoint_seek_distance", s.waypointSeekDistance);
    overlay(settings, "steering", "wall_feeler_length", s.wallFeelerLength);
    overlay(settings, "steering", "view_distance", s.viewDistance);
    overlay(settings, "steering", "min_detection_box_length", s.minDetectionBoxLength);
    overlay(settings, "steering", "obstacle_braking_weight", s.obstacleBrakingWeight);
    overlay(settings, "steering", "wander_radius", s.wanderRadius);
    overlay(settings, "steering", "wander_distance", s.wanderDistance);
    overlay(settings, "steering", "wander_jitter_per_sec", s.wanderJitterPerSec);

    SupportSpotConfig& spot = config.supportSpot;
    overlay(settings, "support_spot", "spots_x", spot.spotsX);
    overlay(settings, "support_spot", "spots_y", spot.spotsY);
    overlay(settings, "support_spot", "region_width_fraction", spot.regionWidthFraction);
    overlay(settings, "support_spot", "region_height_fraction", spot.regionHeightFraction);
    overlay(settings, "support_spot", "can_pass_score", spot.canPassScore);
    overlay(settings, "support_spot", "can_score_score", spot.canScoreScore);
    overlay(settings, "support_spot", "distance_from_controller_score", spot.distanceFromControllerScore);
    overlay(settings, "support_spot", "optimal_distance", spot.optimalDistance);
    overlay(settings, "support_spot", "updates_per_second", spot.updatesPerSecond);

    PitchConfig& pitch = config.pitch;
    overlay(settings, "pitch", "width", pitch.width);
    overlay(settings, "pitch", "height", pitch.height);
    overlay(settings, "pitch", "region_columns", pitch.regionColumns);
    overlay(settings, "pitch", "region_rows", pitch.regionRows);
    overlay(settings, "pitch", "goal_depth", pitch.goalDepth);
    overlay(settings, "pitch", "goal_width", pitch.goalWidth);

    return config;
}

} // namespace Kickoff
