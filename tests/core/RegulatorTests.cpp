/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE RegulatorTests
#include <boost/test/unit_test.hpp>

#include "core/GameClock.hpp"
#include "core/Regulator.hpp"
#include "core/Smoother.hpp"
#include "utils/Vector2D.hpp"
#include <random>

using namespace Kickoff;

// ============================================================================
// Test Fixture
// ============================================================================

struct ClockFixture {
    GameClock clock;
    std::mt19937 rng{1234};
};

BOOST_FIXTURE_TEST_SUITE(RegulatorTestSuite, ClockFixture)

BOOST_AUTO_TEST_CASE(TestFirstCallIsReady) {
    Regulator regulator(clock, rng, 1.0f);
    BOOST_CHECK(regulator.isReady());
    BOOST_CHECK(!regulator.isReady());
}

BOOST_AUTO_TEST_CASE(TestReadyAgainAfterPeriod) {
    Regulator regulator(clock, rng, 8.0f);   // 125ms period, +-10ms jitter
    BOOST_CHECK_CLOSE(regulator.getUpdatePeriodMs(), 125.0, 0.001);
    BOOST_CHECK(regulator.isReady());

    clock.advance(0.1f);                     // 100ms, before the earliest slot
    BOOST_CHECK(!regulator.isReady());

    clock.advance(0.04f);                    // 140ms, past the latest slot
    BOOST_CHECK(regulator.isReady());
}

BOOST_AUTO_TEST_CASE(TestZeroRateAlwaysReady) {
    Regulator regulator(clock, rng, 0.0f);
    for (int i = 0; i < 5; ++i) {
        BOOST_CHECK(regulator.isReady());
    }
}

BOOST_AUTO_TEST_CASE(TestNegativeRateNeverReady) {
    Regulator regulator(clock, rng, -1.0f);
    BOOST_CHECK(!regulator.isReady());
    clock.advance(10.0f);
    BOOST_CHECK(!regulator.isReady());
}

BOOST_AUTO_TEST_CASE(TestClockIgnoresNegativeTime) {
    clock.advance(1.5f);
    clock.advance(-1.0f);
    BOOST_CHECK_CLOSE(clock.getElapsedMs(), 1500.0, 0.001);
    clock.reset();
    BOOST_CHECK_EQUAL(clock.getElapsedMs(), 0.0);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(SmootherTestSuite)

BOOST_AUTO_TEST_CASE(TestAveragesOverWindow) {
    Smoother<float> smoother(4, 0.0f);

    // The window starts filled with zeros
    BOOST_CHECK_CLOSE(smoother.update(4.0f), 1.0f, 0.001f);
    smoother.update(4.0f);
    smoother.update(4.0f);
    BOOST_CHECK_CLOSE(smoother.update(4.0f), 4.0f, 0.001f);

    // Oldest sample drops out
    BOOST_CHECK_CLOSE(smoother.update(8.0f), 5.0f, 0.001f);
    BOOST_CHECK_CLOSE(smoother.getAverage(), 5.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestSmoothsVectors) {
    Smoother<Vector2D> smoother(2, Vector2D(0, 0));
    smoother.update(Vector2D(1.0f, 0.0f));
    const Vector2D average = smoother.update(Vector2D(0.0f, 1.0f));

    BOOST_CHECK_CLOSE(average.getX(), 0.5f, 0.001f);
    BOOST_CHECK_CLOSE(average.getY(), 0.5f, 0.001f);
    BOOST_CHECK_EQUAL(smoother.getSampleCount(), 2u);
}

BOOST_AUTO_TEST_SUITE_END()
