/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE PathTests
#include <boost/test/unit_test.hpp>

#include "ai/Path.hpp"
#include "core/Logger.hpp"
#include "world/Region.hpp"
#include <random>
#include <stdexcept>

using namespace Kickoff;

struct QuietLogFixture {
    QuietLogFixture() { KICKOFF_ENABLE_BENCHMARK_MODE(); }
    ~QuietLogFixture() { KICKOFF_DISABLE_BENCHMARK_MODE(); }
};

BOOST_GLOBAL_FIXTURE(QuietLogFixture);

BOOST_AUTO_TEST_SUITE(PathTestSuite)

BOOST_AUTO_TEST_CASE(TestOpenPathStopsAtEnd) {
    Path path;
    path.addWaypoint(Vector2D(0, 0)).addWaypoint(Vector2D(10, 0)).addWaypoint(Vector2D(10, 10));

    BOOST_CHECK(!path.isFinished());
    path.setNextWaypoint();
    BOOST_CHECK_CLOSE(path.getCurrentWaypoint().getX(), 10.0f, 0.001f);
    path.setNextWaypoint();
    BOOST_CHECK(path.isFinished());

    // Stays on the last waypoint
    path.setNextWaypoint();
    BOOST_CHECK_EQUAL(path.getCurrentIndex(), 2u);
    BOOST_CHECK_CLOSE(path.getCurrentWaypoint().getY(), 10.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestLoopedPathWraps) {
    Path path(true);
    BOOST_CHECK(path.isLooped());
    path.addWaypoint(Vector2D(1, 0)).addWaypoint(Vector2D(2, 0));

    path.setNextWaypoint();
    path.setNextWaypoint();
    BOOST_CHECK_EQUAL(path.getCurrentIndex(), 0u);
    BOOST_CHECK(!path.isFinished());

    // Open the loop, the last waypoint becomes the end
    path.setLoop(false);
    path.setNextWaypoint();
    BOOST_CHECK(path.isFinished());
}

BOOST_AUTO_TEST_CASE(TestEmptyPathThrows) {
    Path path;
    BOOST_CHECK_THROW(path.setNextWaypoint(), std::out_of_range);
    BOOST_CHECK_THROW(path.getCurrentWaypoint(), std::out_of_range);
}

BOOST_AUTO_TEST_CASE(TestClearResetsIndex) {
    Path path;
    path.addWaypoint(Vector2D(0, 0)).addWaypoint(Vector2D(5, 5));
    path.setNextWaypoint();

    path.clear();
    BOOST_CHECK(path.empty());
    BOOST_CHECK_EQUAL(path.getCurrentIndex(), 0u);
}

BOOST_AUTO_TEST_CASE(TestRandomPathInsideBounds) {
    Region bounds(-50.0f, 50.0f, 50.0f, -50.0f);
    std::mt19937 rng(7);
    Path path(true);
    path.createRandomPath(8, bounds, rng);

    BOOST_CHECK_EQUAL(path.getWaypoints().size(), 8u);
    for (const Vector2D& waypoint : path.getWaypoints()) {
        BOOST_CHECK(waypoint.length() <= 50.0f * 1.4143f);
        BOOST_CHECK(waypoint.length() > 0.0f);
    }
}

BOOST_AUTO_TEST_SUITE_END()
