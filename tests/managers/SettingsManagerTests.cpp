/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE SettingsManagerTests
#include <boost/test/unit_test.hpp>
#include "core/Logger.hpp"
#include "core/SoccerConfig.hpp"
#include "managers/SettingsManager.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <thread>

using namespace Kickoff;

struct SettingsTestFixture {
    const std::string testFile = "tests/test_data/test_settings.json";

    SettingsTestFixture() {
        KICKOFF_ENABLE_BENCHMARK_MODE();
        std::filesystem::create_directories("tests/test_data");
        SettingsManager::Instance().clearAll();
    }

    ~SettingsTestFixture() {
        std::error_code ec;
        std::filesystem::remove(testFile, ec);
        KICKOFF_DISABLE_BENCHMARK_MODE();
    }

    void createTestFile(const std::string& content) {
        std::ofstream file(testFile);
        file << content;
    }
};

BOOST_FIXTURE_TEST_SUITE(SettingsManagerTestSuite, SettingsTestFixture)

BOOST_AUTO_TEST_CASE(TestGetSetValues) {
    auto& settings = SettingsManager::Instance();

    BOOST_CHECK(settings.set("player", "shot_attempts", 7));
    BOOST_CHECK_EQUAL(settings.get<int>("player", "shot_attempts", 0), 7);

    BOOST_CHECK(settings.set("ball", "friction", -0.01f));
    BOOST_CHECK_CLOSE(settings.get<float>("ball", "friction", 0.0f), -0.01f, 0.001f);

    BOOST_CHECK(settings.set("simulation", "paused", true));
    BOOST_CHECK_EQUAL(settings.get<bool>("simulation", "paused", false), true);

    BOOST_CHECK(settings.set("simulation", "label", std::string("friendly")));
    BOOST_CHECK_EQUAL(settings.get<std::string>("simulation", "label", ""), "friendly");

    // Missing keys fall back to the default
    BOOST_CHECK_EQUAL(settings.get<int>("player", "nonexistent", 42), 42);
    BOOST_CHECK_EQUAL(settings.get<std::string>("nonexistent", "key", "default"), "default");
}

BOOST_AUTO_TEST_CASE(TestHasAndRemove) {
    auto& settings = SettingsManager::Instance();

    settings.set("pitch", "width", 100);
    settings.set("pitch", "height", 60);

    BOOST_CHECK(settings.has("pitch", "width"));
    BOOST_CHECK(!settings.has("pitch", "nonexistent"));
    BOOST_CHECK(!settings.has("nonexistent", "width"));

    BOOST_CHECK(settings.remove("pitch", "width"));
    BOOST_CHECK(!settings.has("pitch", "width"));
    BOOST_CHECK(settings.has("pitch", "height"));
    BOOST_CHECK(!settings.remove("pitch", "width"));
}

BOOST_AUTO_TEST_CASE(TestClearCategory) {
    auto& settings = SettingsManager::Instance();

    settings.set("ball", "mass", 1.0f);
    settings.set("ball", "radius", 1.0f);
    settings.set("pitch", "width", 100);

    BOOST_CHECK(settings.clearCategory("ball"));
    BOOST_CHECK(!settings.has("ball", "mass"));
    BOOST_CHECK(!settings.has("ball", "radius"));
    BOOST_CHECK(settings.has("pitch", "width"));
    BOOST_CHECK(!settings.clearCategory("ball"));
}

BOOST_AUTO_TEST_CASE(TestCategoriesAndKeys) {
    auto& settings = SettingsManager::Instance();

    settings.set("steering", "seek_weight", 1.0f);
    settings.set("steering", "flee_weight", 2.0f);
    settings.set("support_spot", "spots_x", 13);

    auto categories = settings.getCategories();
    BOOST_CHECK_EQUAL(categories.size(), 2u);
    BOOST_CHECK(std::find(categories.begin(), categories.end(), "steering") != categories.end());

    auto keys = settings.getKeys("steering");
    BOOST_CHECK_EQUAL(keys.size(), 2u);
    BOOST_CHECK(settings.getKeys("nonexistent").empty());
}

BOOST_AUTO_TEST_CASE(TestLoadFromFile) {
    auto& settings = SettingsManager::Instance();

    createTestFile(R"({
  "simulation": {
    "ticks": 600,
    "tick_length": 0.02,
    "headless": true
  },
  "player": {
    "max_speed_without_ball": 0.2
  },
  "notes": "ignored"
})");

    BOOST_CHECK(settings.loadFromFile(testFile));

    BOOST_CHECK_EQUAL(settings.get<int>("simulation", "ticks", 0), 600);
    BOOST_CHECK_CLOSE(settings.get<float>("simulation", "tick_length", 0.0f), 0.02f, 0.001f);
    BOOST_CHECK_EQUAL(settings.get<bool>("simulation", "headless", false), true);
    BOOST_CHECK_CLOSE(settings.get<float>("player", "max_speed_without_ball", 0.0f), 0.2f, 0.001f);

    // A non-object category is skipped
    BOOST_CHECK(!settings.has("notes", "notes"));
}

BOOST_AUTO_TEST_CASE(TestSaveToFile) {
    auto& settings = SettingsManager::Instance();

    settings.set("pitch", "width", 120);
    settings.set("simulation", "headless", true);
    settings.set("ball", "kicking_accuracy", 0.95f);
    settings.set("simulation", "label", std::string("derby"));

    BOOST_CHECK(settings.saveToFile(testFile));
    BOOST_CHECK(std::filesystem::exists(testFile));

    settings.clearAll();
    BOOST_CHECK(!settings.has("pitch", "width"));
    BOOST_CHECK(settings.loadFromFile(testFile));

    BOOST_CHECK_EQUAL(settings.get<int>("pitch", "width", 0), 120);
    BOOST_CHECK_EQUAL(settings.get<bool>("simulation", "headless", false), true);
    BOOST_CHECK_CLOSE(settings.get<float>("ball", "kicking_accuracy", 0.0f), 0.95f, 0.001f);
    BOOST_CHECK_EQUAL(settings.get<std::string>("simulation", "label", ""), "derby");
}

BOOST_AUTO_TEST_CASE(TestChangeListener) {
    auto& settings = SettingsManager::Instance();

    int callbackCount = 0;
    std::string lastKey;

    auto callbackId = settings.registerChangeListener("player",
        [&](const std::string&, const std::string& key, const SettingsManager::SettingValue&) {
            callbackCount++;
            lastKey = key;
        });

    settings.set("player", "mass", 2.0f);
    settings.set("player", "radius", 1.5f);
    settings.set("ball", "mass", 0.5f);

    BOOST_CHECK_EQUAL(callbackCount, 2);
    BOOST_CHECK_EQUAL(lastKey, "radius");

    settings.unregisterChangeListener(callbackId);
    settings.set("player", "max_force", 3.0f);
    BOOST_CHECK_EQUAL(callbackCount, 2);
}

BOOST_AUTO_TEST_CASE(TestGlobalChangeListener) {
    auto& settings = SettingsManager::Instance();

    int callbackCount = 0;
    auto callbackId = settings.registerChangeListener("",
        [&](const std::string&, const std::string&, const SettingsManager::SettingValue&) {
            callbackCount++;
        });

    settings.set("ball", "mass", 1.0f);
    settings.set("pitch", "width", 80);
    settings.set("steering", "seek_weight", 2.0f);
    BOOST_CHECK_EQUAL(callbackCount, 3);

    settings.unregisterChangeListener(callbackId);
}

BOOST_AUTO_TEST_CASE(TestThreadSafety) {
    auto& settings = SettingsManager::Instance();

    const int numThreads = 8;
    const int operationsPerThread = 100;
    std::vector<std::thread> threads;

    for (int t = 0; t < numThreads; ++t) {
        threads.emplace_back([&settings, t]() {
            for (int i = 0; i < operationsPerThread; ++i) {
                const std::string category = "category" + std::to_string(t);
                const std::string key = "key" + std::to_string(i);
                settings.set(category, key, i * t);
                settings.get<int>(category, key, -1);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (int t = 0; t < numThreads; ++t) {
        const std::string category = "category" + std::to_string(t);
        BOOST_CHECK_EQUAL(settings.getKeys(category).size(), static_cast<size_t>(operationsPerThread));
        BOOST_CHECK_EQUAL(settings.get<int>(category, "key99", -1), 99 * t);
    }
}

BOOST_AUTO_TEST_CASE(TestInvalidFile) {
    auto& settings = SettingsManager::Instance();

    BOOST_CHECK(!settings.loadFromFile("nonexistent_file.json"));

    createTestFile("{ invalid json }");
    BOOST_CHECK(!settings.loadFromFile(testFile));

    createTestFile("[1, 2, 3]");
    BOOST_CHECK(!settings.loadFromFile(testFile));
}

BOOST_AUTO_TEST_CASE(TestTypeMismatch) {
    auto& settings = SettingsManager::Instance();

    settings.set("test", "value", 42);

    // Ints widen to float, every other mismatch gives the default
    BOOST_CHECK_CLOSE(settings.get<float>("test", "value", 99.9f), 42.0f, 0.001f);
    BOOST_CHECK_EQUAL(settings.get<bool>("test", "value", true), true);
    BOOST_CHECK_EQUAL(settings.get<std::string>("test", "value", "default"), "default");

    settings.set("test", "ratio", 0.5f);
    BOOST_CHECK_EQUAL(settings.get<int>("test", "ratio", -1), -1);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(SoccerConfigTestSuite, SettingsTestFixture)

BOOST_AUTO_TEST_CASE(TestDefaultsWithEmptySettings) {
    SoccerConfig config = SoccerConfig::fromSettings(SettingsManager::Instance());
    SoccerConfig defaults;

    BOOST_CHECK_CLOSE(config.ball.friction, defaults.ball.friction, 0.001f);
    BOOST_CHECK_CLOSE(config.player.maxSpeedWithBall, defaults.player.maxSpeedWithBall, 0.001f);
    BOOST_CHECK_EQUAL(config.supportSpot.spotsX, defaults.supportSpot.spotsX);
    BOOST_CHECK_CLOSE(config.pitch.width, defaults.pitch.width, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestOverlayFromFile) {
    auto& settings = SettingsManager::Instance();

    createTestFile(R"({
  "ball": { "mass": 2.5 },
  "player": { "shot_attempts": 9, "passing_force": 0.6 },
  "steering": { "wall_avoidance_weight": 5 },
  "support_spot": { "optimal_distance": 25 },
  "pitch": { "width": 120, "region_columns": 6 }
})");
    BOOST_REQUIRE(settings.loadFromFile(testFile));

    SoccerConfig config = SoccerConfig::fromSettings(settings);

    BOOST_CHECK_CLOSE(config.ball.mass, 2.5f, 0.001f);
    BOOST_CHECK_EQUAL(config.player.shotAttempts, 9);
    BOOST_CHECK_CLOSE(config.player.passingForce, 0.6f, 0.001f);
    // Whole numbers in the file still fill float fields
    BOOST_CHECK_CLOSE(config.steering.wallAvoidanceWeight, 5.0f, 0.001f);
    BOOST_CHECK_CLOSE(config.supportSpot.optimalDistance, 25.0f, 0.001f);
    BOOST_CHECK_CLOSE(config.pitch.width, 120.0f, 0.001f);
    BOOST_CHECK_EQUAL(config.pitch.regionColumns, 6);

    // Untouched values keep their defaults
    BOOST_CHECK_CLOSE(config.pitch.height, PitchConfig{}.height, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestNonNegativeFrictionIsRejected) {
    auto& settings = SettingsManager::Instance();
    settings.set("ball", "friction", 0.01f);

    SoccerConfig config = SoccerConfig::fromSettings(settings);
    BOOST_CHECK_CLOSE(config.ball.friction, BallConfig{}.friction, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestNonPositiveMassAndSpeedAreRejected) {
    auto& settings = SettingsManager::Instance();
    settings.set("ball", "mass", -1.0f);
    settings.set("player", "mass", 0.0f);
    settings.set("player", "max_speed_without_ball", -0.2f);
    settings.set("player", "max_speed_with_ball", 0.0f);
    settings.set("player", "keeper_max_pass_attempts", 0);
    settings.set("player", "max_force", 2.0f);

    SoccerConfig config = SoccerConfig::fromSettings(settings);
    const PlayerConfig defaults;
    BOOST_CHECK_CLOSE(config.ball.mass, BallConfig{}.mass, 0.001f);
    BOOST_CHECK_CLOSE(config.player.mass, defaults.mass, 0.001f);
    BOOST_CHECK_CLOSE(config.player.maxSpeedWithoutBall, defaults.maxSpeedWithoutBall, 0.001f);
    BOOST_CHECK_CLOSE(config.player.maxSpeedWithBall, defaults.maxSpeedWithBall, 0.001f);
    BOOST_CHECK_EQUAL(config.player.keeperMaxPassAttempts, defaults.keeperMaxPassAttempts);

    // Valid values next to the rejected ones still apply
    BOOST_CHECK_CLOSE(config.player.maxForce, 2.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestShippedSettingsFileLoads) {
    auto& settings = SettingsManager::Instance();
    BOOST_REQUIRE(settings.loadFromFile("res/settings.json"));

    BOOST_CHECK_EQUAL(settings.get<int>("simulation", "ticks", 0), 18000);
    SoccerConfig config = SoccerConfig::fromSettings(settings);
    BOOST_CHECK_LT(config.ball.friction, 0.0f);
    BOOST_CHECK_CLOSE(config.player.maxSpeedWithoutBall, 0.11f, 0.001f);
}

BOOST_AUTO_TEST_SUITE_END()
