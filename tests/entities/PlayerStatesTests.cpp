/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE PlayerStatesTests
#include <boost/test/unit_test.hpp>

#include "core/Logger.hpp"
#include "entities/Ball.hpp"
#include "entities/FieldPlayer.hpp"
#include "entities/GoalKeeper.hpp"
#include "entities/Team.hpp"
#include "entities/fieldPlayerStates/ChaseBallState.hpp"
#include "entities/fieldPlayerStates/DribbleState.hpp"
#include "entities/fieldPlayerStates/KickBallState.hpp"
#include "entities/fieldPlayerStates/ReceiveBallState.hpp"
#include "entities/fieldPlayerStates/ReturnToHomeRegionState.hpp"
#include "entities/fieldPlayerStates/SupportAttackerState.hpp"
#include "entities/fieldPlayerStates/WaitState.hpp"
#include "entities/keeperStates/InterceptBallState.hpp"
#include "entities/keeperStates/PutBallBackInPlayState.hpp"
#include "entities/keeperStates/TendGoalState.hpp"
#include "entities/teamStates/AttackingState.hpp"
#include "utils/Geometry.hpp"
#include "world/Goal.hpp"
#include "world/Pitch.hpp"
#include <cmath>
#include <initializer_list>

using namespace Kickoff;

namespace {
constexpr float TICK = 1.0f / 60.0f;
constexpr unsigned int SEED = 4242;

// Noise-free kicks, no pot shots, and every pass request sent
SoccerConfig makeConfig() {
    SoccerConfig config;
    config.ball.kickingAccuracy = 1.0f;
    config.player.chanceOfPotShot = 0.0f;
    config.player.chanceOfRequestingPass = 1.0f;
    config.player.chanceOfUsingArriveToReceive = 1.0f;
    return config;
}

void moveTeamTo(Team& team, const Vector2D& position) {
    for (const auto& player : team.getPlayers()) {
        player->setPosition(position);
    }
}

// Blue attacker just outside the red box with the ball at its feet and the red side far behind
FieldPlayer& lineUpShot(Pitch& pitch) {
    moveTeamTo(pitch.getRedTeam(), Vector2D(-40.0f, 25.0f));
    FieldPlayer& attacker = *pitch.getBlueTeam().getFieldPlayers()[0];
    attacker.setPosition(Vector2D(38.0f, 0.0f));
    attacker.setHeading(Vector2D(1.0f, 0.0f));
    pitch.getBall().placeAtPosition(Vector2D(39.0f, 0.0f));
    return attacker;
}

// Blue keeper on its line with a stationary ball in its hands
void giveBallToKeeper(Pitch& pitch) {
    GoalKeeper& keeper = pitch.getBlueTeam().getGoalKeeper();
    keeper.setPosition(Vector2D(-47.0f, 0.0f));
    pitch.getBall().placeAtPosition(Vector2D(-46.0f, 0.0f));
    pitch.setGoalKeeperInBallPossession(true);
    keeper.getStateMachine().changeState(PutBallBackInPlayState::Instance());
}
}

struct PlayerStatesFixture {
    Pitch pitch{makeConfig(), SEED};
    Team& blue{pitch.getBlueTeam()};
    Team& red{pitch.getRedTeam()};
    Ball& ball{pitch.getBall()};

    PlayerStatesFixture() { KICKOFF_ENABLE_BENCHMARK_MODE(); }
    ~PlayerStatesFixture() { KICKOFF_DISABLE_BENCHMARK_MODE(); }

    FieldPlayer& fieldPlayer(size_t index) { return *blue.getFieldPlayers()[index]; }

    static bool isMovingToward(const Vector2D& velocity, const Vector2D& from, const Vector2D& to) {
        return velocity.normalized().dot((to - from).normalized()) > 0.999f;
    }
};

BOOST_FIXTURE_TEST_SUITE(KickBallTests, PlayerStatesFixture)

BOOST_AUTO_TEST_CASE(TestShootsAtOpenGoal) {
    FieldPlayer& attacker = lineUpShot(pitch);
    attacker.getStateMachine().changeState(KickBallState::Instance());
    BOOST_REQUIRE(attacker.getStateMachine().isInState(KickBallState::Instance()));
    BOOST_CHECK(blue.getControllingPlayer() == &attacker);

    attacker.getStateMachine().update();

    BOOST_CHECK(attacker.getStateMachine().isInState(WaitState::Instance()));
    BOOST_CHECK_CLOSE(ball.getSpeed(), pitch.getConfig().player.shootingForce, 0.01f);

    // Heads for the red goal line between the posts
    const Vector2D& velocity = ball.getVelocity();
    BOOST_REQUIRE_GT(velocity.getX(), 0.0f);
    const Goal& goal = pitch.getRedGoal();
    const float crossingY = velocity.getY() / velocity.getX() * (goal.getCenter().getX() - 39.0f);
    BOOST_CHECK_GT(crossingY, goal.getLeftPost().getY());
    BOOST_CHECK_LT(crossingY, goal.getRightPost().getY());

    // The other attacker is sent up in support
    BOOST_CHECK(blue.getSupportingPlayer() == &fieldPlayer(1));
    BOOST_CHECK(fieldPlayer(1).getStateMachine().isInState(SupportAttackerState::Instance()));
}

BOOST_AUTO_TEST_CASE(TestShotNoise) {
    SoccerConfig sloppyConfig = makeConfig();
    sloppyConfig.ball.kickingAccuracy = 0.9f;
    Pitch sloppy(sloppyConfig, SEED);

    // Same seed, same shot target, only the accuracy differs
    for (Pitch* match : {&pitch, &sloppy}) {
        FieldPlayer& attacker = lineUpShot(*match);
        attacker.getStateMachine().changeState(KickBallState::Instance());
        attacker.getStateMachine().update();
    }

    const Vector2D& accurate = ball.getVelocity();
    const Vector2D& noisy = sloppy.getBall().getVelocity();
    BOOST_CHECK_CLOSE(noisy.length(), accurate.length(), 0.01f);

    const float angle = std::atan2(accurate.cross(noisy), accurate.dot(noisy));
    BOOST_CHECK_GT(std::abs(angle), 0.0f);
    BOOST_CHECK_LE(std::abs(angle), Geometry::PI * 0.1f + 0.0001f);
}

BOOST_AUTO_TEST_CASE(TestKickRateLimited) {
    FieldPlayer& attacker = lineUpShot(pitch);
    attacker.getStateMachine().changeState(KickBallState::Instance());
    BOOST_REQUIRE(attacker.getStateMachine().isInState(KickBallState::Instance()));

    // A second kick in the same instant is refused
    attacker.getStateMachine().changeState(WaitState::Instance());
    attacker.getStateMachine().changeState(KickBallState::Instance());
    BOOST_CHECK(attacker.getStateMachine().isInState(ChaseBallState::Instance()));
    BOOST_CHECK(ball.getVelocity().isZero());

    // Half a second of match time later the player may kick again
    ball.placeAtPosition(Vector2D(0.0f, -29.0f));
    pitch.update(0.5f);
    lineUpShot(pitch);
    attacker.getStateMachine().changeState(KickBallState::Instance());
    BOOST_CHECK(attacker.getStateMachine().isInState(KickBallState::Instance()));
}

BOOST_AUTO_TEST_CASE(TestBallBehindPlayerIsChased) {
    FieldPlayer& attacker = lineUpShot(pitch);
    attacker.getStateMachine().changeState(KickBallState::Instance());
    attacker.setHeading(Vector2D(-1.0f, 0.0f));

    attacker.getStateMachine().update();
    BOOST_CHECK(attacker.getStateMachine().isInState(ChaseBallState::Instance()));
    BOOST_CHECK(ball.getVelocity().isZero());
}

BOOST_AUTO_TEST_CASE(TestThreatenedPlayerPasses) {
    moveTeamTo(red, Vector2D(45.0f, 25.0f));
    red.getPlayer(3).setPosition(Vector2D(-22.0f, 3.0f));

    FieldPlayer& passer = fieldPlayer(0);
    passer.setPosition(Vector2D(-30.0f, 0.0f));
    passer.setHeading(Vector2D(1.0f, 0.0f));
    ball.placeAtPosition(Vector2D(-29.0f, 0.0f));

    // Only the defender is both far enough and within reach
    fieldPlayer(1).setPosition(Vector2D(-30.0f, 6.0f));
    fieldPlayer(2).setPosition(Vector2D(-30.0f, -20.0f));
    fieldPlayer(3).setPosition(Vector2D(-45.0f, 28.0f));
    blue.getGoalKeeper().setPosition(Vector2D(-49.0f, -28.0f));

    BOOST_REQUIRE(passer.isThreatened());
    passer.getStateMachine().changeState(KickBallState::Instance());
    passer.getStateMachine().update();

    FieldPlayer& receiver = fieldPlayer(2);
    BOOST_CHECK(receiver.getStateMachine().isInState(ReceiveBallState::Instance()));
    BOOST_CHECK(blue.getReceivingPlayer() == &receiver);
    BOOST_CHECK(blue.getControllingPlayer() == &receiver);
    BOOST_CHECK(passer.getStateMachine().isInState(WaitState::Instance()) ||
                passer.getStateMachine().isInState(SupportAttackerState::Instance()));

    // The telegram carried the pass target the ball was kicked at
    BOOST_CHECK_CLOSE(ball.getSpeed(), pitch.getConfig().player.passingForce, 0.01f);
    BOOST_CHECK(isMovingToward(ball.getVelocity(), Vector2D(-29.0f, 0.0f),
                               receiver.getSteering().getTarget()));
}

BOOST_AUTO_TEST_CASE(TestUnthreatenedPlayerDribbles) {
    moveTeamTo(red, Vector2D(45.0f, 25.0f));
    FieldPlayer& player = fieldPlayer(0);
    player.setPosition(Vector2D(-30.0f, 0.0f));
    player.setHeading(Vector2D(1.0f, 0.0f));
    ball.placeAtPosition(Vector2D(-29.0f, 0.0f));

    player.getStateMachine().changeState(KickBallState::Instance());
    player.getStateMachine().update();
    BOOST_REQUIRE(player.getStateMachine().isInState(DribbleState::Instance()));
    BOOST_CHECK(blue.getControllingPlayer() == &player);
    BOOST_CHECK(ball.getVelocity().isZero());

    player.getStateMachine().update();
    BOOST_CHECK(player.getStateMachine().isInState(ChaseBallState::Instance()));
    BOOST_CHECK_CLOSE(ball.getVelocity().getX(), pitch.getConfig().player.dribbleForce, 0.01f);
    BOOST_CHECK_SMALL(ball.getVelocity().getY(), 0.0001f);
}

BOOST_AUTO_TEST_CASE(TestDribbleTurnsPlayerFacingOwnGoal) {
    moveTeamTo(red, Vector2D(45.0f, 25.0f));
    FieldPlayer& player = fieldPlayer(0);
    player.setPosition(Vector2D(-30.0f, 0.0f));
    player.setHeading(Vector2D(-1.0f, 0.0f));
    ball.placeAtPosition(Vector2D(-31.0f, 0.0f));

    player.getStateMachine().changeState(KickBallState::Instance());
    player.getStateMachine().update();
    BOOST_REQUIRE(player.getStateMachine().isInState(DribbleState::Instance()));
    player.getStateMachine().update();

    // A small kick a quarter of pi off the heading
    BOOST_CHECK_CLOSE(ball.getSpeed(), pitch.getConfig().player.dribbleAndTurnForce, 0.01f);
    BOOST_CHECK_CLOSE(ball.getVelocity().normalized().dot(Vector2D(-1.0f, 0.0f)),
                      std::cos(Geometry::PI * 0.25f), 0.01f);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(FieldPlayerMessageTests, PlayerStatesFixture)

BOOST_AUTO_TEST_CASE(TestPassOnRequest) {
    moveTeamTo(red, Vector2D(45.0f, 25.0f));
    FieldPlayer& passer = fieldPlayer(0);
    FieldPlayer& requester = fieldPlayer(2);
    passer.setPosition(Vector2D(0.0f, 0.0f));
    requester.setPosition(Vector2D(-10.0f, 10.0f));
    ball.placeAtPosition(Vector2D(1.0f, 0.0f));

    BOOST_CHECK(pitch.getDispatcher().sendMessage(requester.getID(), passer.getID(),
                                                  MessageType::PASS_TO_ME, requester.getID()));

    BOOST_CHECK_CLOSE(ball.getSpeed(), pitch.getConfig().player.passingForce, 0.01f);
    BOOST_CHECK(isMovingToward(ball.getVelocity(), Vector2D(1.0f, 0.0f), requester.getPosition()));

    // The requester was told where the ball is going
    BOOST_CHECK(requester.getStateMachine().isInState(ReceiveBallState::Instance()));
    BOOST_CHECK(requester.getSteering().getTarget() == requester.getPosition());
    BOOST_CHECK(blue.getControllingPlayer() == &requester);
    BOOST_CHECK(!passer.getStateMachine().isInState(ReceiveBallState::Instance()));
}

BOOST_AUTO_TEST_CASE(TestPassRequestOutOfReachIgnored) {
    FieldPlayer& passer = fieldPlayer(0);
    FieldPlayer& requester = fieldPlayer(2);
    passer.setPosition(Vector2D(0.0f, 0.0f));
    ball.placeAtPosition(Vector2D(10.0f, 0.0f));

    BOOST_CHECK(pitch.getDispatcher().sendMessage(requester.getID(), passer.getID(),
                                                  MessageType::PASS_TO_ME, requester.getID()));
    BOOST_CHECK(ball.getVelocity().isZero());
    BOOST_CHECK(!requester.getStateMachine().isInState(ReceiveBallState::Instance()));
}

BOOST_AUTO_TEST_CASE(TestPassRequestWhileAnotherReceives) {
    FieldPlayer& passer = fieldPlayer(0);
    passer.setPosition(Vector2D(0.0f, 0.0f));
    ball.placeAtPosition(Vector2D(1.0f, 0.0f));
    blue.setReceivingPlayer(&fieldPlayer(3));

    BOOST_CHECK(pitch.getDispatcher().sendMessage(fieldPlayer(2).getID(), passer.getID(),
                                                  MessageType::PASS_TO_ME, fieldPlayer(2).getID()));
    BOOST_CHECK(ball.getVelocity().isZero());
}

BOOST_AUTO_TEST_CASE(TestPassRequestFromStrangerRejected) {
    FieldPlayer& passer = fieldPlayer(0);
    passer.setPosition(Vector2D(0.0f, 0.0f));
    ball.placeAtPosition(Vector2D(1.0f, 0.0f));

    BOOST_CHECK(!pitch.getDispatcher().sendMessage(fieldPlayer(2).getID(), passer.getID(),
                                                   MessageType::PASS_TO_ME, red.getPlayer(1).getID()));
    BOOST_CHECK(ball.getVelocity().isZero());
}

BOOST_AUTO_TEST_CASE(TestGoHomeRestoresDefaultRegion) {
    FieldPlayer& player = fieldPlayer(0);
    player.setHomeRegionId(12);

    BOOST_CHECK(pitch.getDispatcher().sendMessage(blue.getID(), player.getID(), MessageType::GO_HOME));
    BOOST_CHECK(player.getStateMachine().isInState(ReturnToHomeRegionState::Instance()));
    BOOST_CHECK_EQUAL(player.getHomeRegionId(), 6);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(ReceiveBallTests, PlayerStatesFixture)

BOOST_AUTO_TEST_CASE(TestUnmarkedReceiverArrives) {
    moveTeamTo(red, Vector2D(40.0f, 25.0f));
    FieldPlayer& receiver = fieldPlayer(2);
    receiver.setPosition(Vector2D(-20.0f, 0.0f));

    BOOST_CHECK(pitch.getDispatcher().sendMessage(fieldPlayer(3).getID(), receiver.getID(),
                                                  MessageType::RECEIVE_BALL, Vector2D(-20.0f, 5.0f)));

    BOOST_REQUIRE(receiver.getStateMachine().isInState(ReceiveBallState::Instance()));
    BOOST_CHECK(receiver.getSteering().isOn(BehaviorKind::Arrive));
    BOOST_CHECK(!receiver.getSteering().isOn(BehaviorKind::Pursuit));
    BOOST_CHECK(receiver.getSteering().getTarget() == Vector2D(-20.0f, 5.0f));
    BOOST_CHECK(blue.getReceivingPlayer() == &receiver);
    BOOST_CHECK(blue.getControllingPlayer() == &receiver);
}

BOOST_AUTO_TEST_CASE(TestMarkedReceiverPursues) {
    moveTeamTo(red, Vector2D(40.0f, 25.0f));
    red.getPlayer(1).setPosition(Vector2D(-20.0f, 10.0f));
    FieldPlayer& receiver = fieldPlayer(2);
    receiver.setPosition(Vector2D(-20.0f, 0.0f));
    ball.placeAtPosition(Vector2D(-5.0f, 3.0f));

    pitch.getDispatcher().sendMessage(fieldPlayer(3).getID(), receiver.getID(),
                                      MessageType::RECEIVE_BALL, Vector2D(-20.0f, 5.0f));
    BOOST_REQUIRE(receiver.getStateMachine().isInState(ReceiveBallState::Instance()));
    BOOST_CHECK(receiver.getSteering().isOn(BehaviorKind::Pursuit));
    BOOST_CHECK(!receiver.getSteering().isOn(BehaviorKind::Arrive));

    // Pursuit chases the ball itself rather than the pass target
    receiver.getStateMachine().update();
    BOOST_CHECK(receiver.getSteering().getTarget() == ball.getPosition());
}

BOOST_AUTO_TEST_CASE(TestHotRegionAlwaysArrives) {
    SoccerConfig config = makeConfig();
    config.player.chanceOfUsingArriveToReceive = 0.0f;
    Pitch local(config, SEED);
    moveTeamTo(local.getRedTeam(), Vector2D(-45.0f, -25.0f));

    Team& team = local.getBlueTeam();
    FieldPlayer& deep = *team.getFieldPlayers()[2];
    FieldPlayer& forward = *team.getFieldPlayers()[0];
    deep.setPosition(Vector2D(-20.0f, 0.0f));
    forward.setPosition(Vector2D(30.0f, 0.0f));
    BOOST_REQUIRE(!deep.isInHotRegion());
    BOOST_REQUIRE(forward.isInHotRegion());

    local.getDispatcher().sendMessage(team.getID(), deep.getID(), MessageType::RECEIVE_BALL,
                                      Vector2D(-20.0f, 5.0f));
    BOOST_CHECK(deep.getSteering().isOn(BehaviorKind::Pursuit));

    local.getDispatcher().sendMessage(team.getID(), forward.getID(), MessageType::RECEIVE_BALL,
                                      Vector2D(30.0f, 5.0f));
    BOOST_CHECK(forward.getSteering().isOn(BehaviorKind::Arrive));
    BOOST_CHECK(!forward.getSteering().isOn(BehaviorKind::Pursuit));
}

BOOST_AUTO_TEST_CASE(TestReceiverTakesBallInRange) {
    moveTeamTo(red, Vector2D(40.0f, 25.0f));
    FieldPlayer& receiver = fieldPlayer(2);
    receiver.setPosition(Vector2D(-20.0f, 0.0f));
    pitch.getDispatcher().sendMessage(fieldPlayer(3).getID(), receiver.getID(),
                                      MessageType::RECEIVE_BALL, Vector2D(-20.0f, 5.0f));
    BOOST_REQUIRE(receiver.getStateMachine().isInState(ReceiveBallState::Instance()));

    ball.placeAtPosition(Vector2D(-19.0f, 0.0f));
    receiver.getStateMachine().update();
    BOOST_CHECK(receiver.getStateMachine().isInState(ChaseBallState::Instance()));
    BOOST_CHECK(blue.getReceivingPlayer() == nullptr);
    BOOST_CHECK(!receiver.getSteering().isOn(BehaviorKind::Arrive));
}

BOOST_AUTO_TEST_CASE(TestReceiverGivesUpWhenControlLost) {
    FieldPlayer& receiver = fieldPlayer(2);
    pitch.getDispatcher().sendMessage(fieldPlayer(3).getID(), receiver.getID(),
                                      MessageType::RECEIVE_BALL, Vector2D(-20.0f, 5.0f));
    red.setControllingPlayer(&red.getPlayer(1));

    receiver.getStateMachine().update();
    BOOST_CHECK(receiver.getStateMachine().isInState(ChaseBallState::Instance()));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(SupportAttackerTests, PlayerStatesFixture)

BOOST_AUTO_TEST_CASE(TestSupporterAtSpotAsksForTheBall) {
    moveTeamTo(red, Vector2D(-45.0f, -25.0f));
    FieldPlayer& attacker = fieldPlayer(0);
    FieldPlayer& supporter = fieldPlayer(1);
    blue.setControllingPlayer(&attacker);

    const Vector2D spot = blue.getSupportSpot();
    supporter.getStateMachine().changeState(SupportAttackerState::Instance());
    supporter.setPosition(spot);
    attacker.setPosition(spot - Vector2D(12.0f, 0.0f));
    ball.placeAtPosition(spot - Vector2D(11.0f, 0.0f));

    supporter.getStateMachine().update();

    // The attacker answered the request with a pass
    BOOST_CHECK(supporter.getStateMachine().isInState(ReceiveBallState::Instance()));
    BOOST_CHECK(blue.getControllingPlayer() == &supporter);
    BOOST_CHECK_CLOSE(ball.getSpeed(), pitch.getConfig().player.passingForce, 0.01f);
    BOOST_CHECK(isMovingToward(ball.getVelocity(), spot - Vector2D(11.0f, 0.0f), spot));

    // And took over the supporting role
    BOOST_CHECK(attacker.getStateMachine().isInState(SupportAttackerState::Instance()));
    BOOST_CHECK(blue.getSupportingPlayer() == &attacker);
}

BOOST_AUTO_TEST_CASE(TestNoRequestWithoutSafePass) {
    FieldPlayer& attacker = fieldPlayer(0);
    FieldPlayer& supporter = fieldPlayer(1);
    blue.setControllingPlayer(&attacker);

    const Vector2D spot = blue.getSupportSpot();
    supporter.getStateMachine().changeState(SupportAttackerState::Instance());
    supporter.setPosition(spot);
    attacker.setPosition(spot - Vector2D(12.0f, 0.0f));
    ball.placeAtPosition(spot - Vector2D(11.0f, 0.0f));

    // Red crowds the passing lane
    moveTeamTo(red, spot - Vector2D(6.0f, 0.0f));

    supporter.getStateMachine().update();
    BOOST_CHECK(supporter.getStateMachine().isInState(SupportAttackerState::Instance()));
    BOOST_CHECK(ball.getVelocity().isZero());
}

BOOST_AUTO_TEST_CASE(TestSupporterFallsBackWhenControlLost) {
    FieldPlayer& supporter = fieldPlayer(1);
    blue.setSupportingPlayer(&supporter);
    supporter.getStateMachine().changeState(SupportAttackerState::Instance());

    supporter.getStateMachine().update();
    BOOST_CHECK(supporter.getStateMachine().isInState(ReturnToHomeRegionState::Instance()));
    BOOST_CHECK(blue.getSupportingPlayer() == nullptr);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(GoalKeeperStateTests, PlayerStatesFixture)

BOOST_AUTO_TEST_CASE(TestKeeperTrapsBallInRange) {
    GoalKeeper& keeper = blue.getGoalKeeper();
    BOOST_REQUIRE(keeper.getStateMachine().isInState(TendGoalState::Instance()));
    keeper.setPosition(Vector2D(-47.0f, 0.0f));
    ball.placeAtPosition(Vector2D(-46.0f, 0.0f));
    ball.kick(Vector2D(-1.0f, 0.0f), 0.3f);

    keeper.getStateMachine().update();

    BOOST_CHECK(keeper.getStateMachine().isInState(PutBallBackInPlayState::Instance()));
    BOOST_CHECK(ball.getVelocity().isZero());
    BOOST_CHECK(pitch.isGoalKeeperInBallPossession());
    BOOST_CHECK(blue.getControllingPlayer() == &keeper);
    BOOST_CHECK(!red.isInControl());

    // Everybody clears out for the throw
    BOOST_CHECK(fieldPlayer(0).getStateMachine().isInState(ReturnToHomeRegionState::Instance()));
    BOOST_CHECK(red.getFieldPlayers().front()->getStateMachine().isInState(
        ReturnToHomeRegionState::Instance()));
}

BOOST_AUTO_TEST_CASE(TestKeeperInterceptsCloseBall) {
    GoalKeeper& keeper = blue.getGoalKeeper();
    keeper.setPosition(Vector2D(-47.0f, 0.0f));

    // Outside intercept range nothing changes
    ball.placeAtPosition(Vector2D(-30.0f, 0.0f));
    keeper.getStateMachine().update();
    BOOST_CHECK(keeper.getStateMachine().isInState(TendGoalState::Instance()));

    // Close to goal, but the ball is ours
    ball.placeAtPosition(Vector2D(-40.0f, 5.0f));
    blue.setControllingPlayer(&fieldPlayer(2));
    keeper.getStateMachine().update();
    BOOST_CHECK(keeper.getStateMachine().isInState(TendGoalState::Instance()));

    blue.lostControl();
    keeper.getStateMachine().update();
    BOOST_CHECK(keeper.getStateMachine().isInState(InterceptBallState::Instance()));
}

BOOST_AUTO_TEST_CASE(TestKeeperThrowsToFreeTeammate) {
    moveTeamTo(red, Vector2D(45.0f, 25.0f));
    giveBallToKeeper(pitch);
    GoalKeeper& keeper = blue.getGoalKeeper();
    BOOST_REQUIRE(blue.getControllingPlayer() == &keeper);

    fieldPlayer(0).setPosition(Vector2D(-30.0f, 10.0f));
    fieldPlayer(1).setPosition(Vector2D(-30.0f, -10.0f));
    fieldPlayer(2).setPosition(Vector2D(-35.0f, 15.0f));
    fieldPlayer(3).setPosition(Vector2D(-35.0f, -15.0f));

    keeper.getStateMachine().update();

    BOOST_CHECK(keeper.getStateMachine().isInState(TendGoalState::Instance()));
    BOOST_CHECK(!pitch.isGoalKeeperInBallPossession());
    BOOST_CHECK_CLOSE(ball.getSpeed(), pitch.getConfig().player.passingForce, 0.01f);

    PlayerBase* receiver = blue.getReceivingPlayer();
    BOOST_REQUIRE(receiver != nullptr);
    BOOST_CHECK(receiver != &keeper);
    BOOST_CHECK(isMovingToward(ball.getVelocity(), Vector2D(-46.0f, 0.0f),
                               receiver->getSteering().getTarget()));
}

BOOST_AUTO_TEST_CASE(TestKeeperClearsBallAfterFailedAttempts) {
    moveTeamTo(red, Vector2D(45.0f, 25.0f));
    giveBallToKeeper(pitch);
    GoalKeeper& keeper = blue.getGoalKeeper();

    // Every teammate beyond the reach of a pass
    fieldPlayer(0).setPosition(Vector2D(10.0f, 0.0f));
    fieldPlayer(1).setPosition(Vector2D(10.0f, 20.0f));
    fieldPlayer(2).setPosition(Vector2D(10.0f, -20.0f));
    fieldPlayer(3).setPosition(Vector2D(20.0f, 0.0f));

    const int attempts = pitch.getConfig().player.keeperMaxPassAttempts;
    for (int i = 1; i < attempts; ++i) {
        keeper.getStateMachine().update();
    }
    BOOST_CHECK(keeper.getStateMachine().isInState(PutBallBackInPlayState::Instance()));
    BOOST_CHECK_EQUAL(keeper.getFailedPassAttempts(), attempts - 1);
    BOOST_CHECK(ball.getVelocity().isZero());
    BOOST_CHECK(keeper.getVelocity().isZero());

    keeper.getStateMachine().update();

    // Cleared toward the nearest teammate with enough force to get there
    BOOST_CHECK(keeper.getStateMachine().isInState(TendGoalState::Instance()));
    BOOST_CHECK(!pitch.isGoalKeeperInBallPossession());
    BOOST_CHECK_CLOSE(ball.getSpeed(), pitch.getConfig().player.shootingForce, 0.01f);
    BOOST_CHECK(isMovingToward(ball.getVelocity(), Vector2D(-46.0f, 0.0f), Vector2D(10.0f, 0.0f)));
    BOOST_CHECK(fieldPlayer(0).getStateMachine().isInState(ReceiveBallState::Instance()));
    BOOST_CHECK(blue.getControllingPlayer() == &fieldPlayer(0));
}

BOOST_AUTO_TEST_CASE(TestKeeperAnswersPassRequest) {
    moveTeamTo(red, Vector2D(45.0f, 25.0f));
    giveBallToKeeper(pitch);
    GoalKeeper& keeper = blue.getGoalKeeper();
    FieldPlayer& requester = fieldPlayer(0);
    requester.setPosition(Vector2D(10.0f, 0.0f));

    BOOST_CHECK(pitch.getDispatcher().sendMessage(requester.getID(), keeper.getID(),
                                                  MessageType::PASS_TO_ME, requester.getID()));

    BOOST_CHECK(keeper.getStateMachine().isInState(TendGoalState::Instance()));
    BOOST_CHECK(!pitch.isGoalKeeperInBallPossession());
    BOOST_CHECK(isMovingToward(ball.getVelocity(), Vector2D(-46.0f, 0.0f), requester.getPosition()));
    BOOST_CHECK(requester.getStateMachine().isInState(ReceiveBallState::Instance()));
}

BOOST_AUTO_TEST_CASE(TestKeeperWithoutBallIgnoresPassRequest) {
    GoalKeeper& keeper = blue.getGoalKeeper();
    BOOST_CHECK(!pitch.getDispatcher().sendMessage(fieldPlayer(0).getID(), keeper.getID(),
                                                   MessageType::PASS_TO_ME, fieldPlayer(0).getID()));
    BOOST_CHECK(keeper.getStateMachine().isInState(TendGoalState::Instance()));
    BOOST_CHECK(ball.getVelocity().isZero());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(MatchScenarioTests, PlayerStatesFixture)

BOOST_AUTO_TEST_CASE(TestCenterKick) {
    FieldPlayer& attacker = fieldPlayer(0);
    attacker.setPosition(Vector2D(-3.0f, 0.0f));
    attacker.setHeading(Vector2D(1.0f, 0.0f));
    BOOST_REQUIRE(pitch.isGameOn());
    BOOST_REQUIRE(ball.getPosition().isZero());

    int ticks = 0;
    for (; ticks < 600 && ball.getVelocity().isZero(); ++ticks) {
        pitch.update(TICK);
    }
    BOOST_REQUIRE_LT(ticks, 600);

    // The red keeper covers every shot, so the attacker carries the ball forward
    BOOST_CHECK(blue.getControllingPlayer() == &attacker);
    BOOST_CHECK(!red.isInControl());
    BOOST_CHECK_CLOSE(ball.getVelocity().getX(), pitch.getConfig().player.dribbleForce, 0.01f);
    BOOST_CHECK(attacker.getStateMachine().isInState(ChaseBallState::Instance()));

    pitch.update(TICK);
    BOOST_CHECK(blue.getStateMachine().isInState(AttackingState::Instance()));
}

BOOST_AUTO_TEST_CASE(TestKeeperNeverStallsWithBall) {
    SoccerConfig config = makeConfig();
    config.player.chanceOfRequestingPass = 0.0f;
    Pitch match(config, SEED);

    // Everyone at home, nobody within a pass of the keeper
    GoalKeeper& keeper = match.getBlueTeam().getGoalKeeper();
    keeper.setPosition(Vector2D(-47.0f, 0.0f));
    match.getBall().placeAtPosition(Vector2D(-46.0f, 0.0f));

    match.update(TICK);
    BOOST_REQUIRE(match.isGoalKeeperInBallPossession());

    const int attempts = config.player.keeperMaxPassAttempts;
    int ticks = 0;
    for (; ticks <= attempts + 1 && match.isGoalKeeperInBallPossession(); ++ticks) {
        match.update(TICK);
    }

    BOOST_CHECK(!match.isGoalKeeperInBallPossession());
    BOOST_CHECK_LE(ticks, attempts);
    BOOST_CHECK(!match.getBall().getVelocity().isZero());
    BOOST_CHECK(keeper.getStateMachine().isInState(TendGoalState::Instance()));
}

BOOST_AUTO_TEST_SUITE_END()
