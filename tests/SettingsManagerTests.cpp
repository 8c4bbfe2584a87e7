/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE SettingsManagerTests
#include <boost/test/unit_test.hpp>
#include "managers/SettingsManager.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>

using namespace JournalEngine;

// Test fixture for setup/cleanup
struct SettingsTestFixture {
    const std::string testFile = "tests/test_data/test_settings.json";

    SettingsTestFixture() {
        std::filesystem::create_directories("tests/test_data");
        SettingsManager::Instance().clearAll();
    }

    ~SettingsTestFixture() {
        std::error_code ec;
        std::filesystem::remove(testFile, ec);
    }

    void createTestFile(const std::string& content) {
        std::ofstream file(testFile);
        file << content;
    }
};

BOOST_FIXTURE_TEST_SUITE(SettingsManagerTestSuite, SettingsTestFixture)

BOOST_AUTO_TEST_CASE(TestGetSetInt) {
    auto& settings = SettingsManager::Instance();

    BOOST_CHECK(settings.set("pool", "prewarm_count", 32));
    BOOST_CHECK_EQUAL(settings.get<int>("pool", "prewarm_count", 0), 32);

    // Default when the key doesn't exist
    BOOST_CHECK_EQUAL(settings.get<int>("pool", "nonexistent", 42), 42);
}

BOOST_AUTO_TEST_CASE(TestGetSetFloat) {
    auto& settings = SettingsManager::Instance();

    BOOST_CHECK(settings.set("pool", "marker_lifetime", 2.5f));
    BOOST_CHECK_CLOSE(settings.get<float>("pool", "marker_lifetime", 0.0f), 2.5f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestFloatReadsWholeNumber) {
    auto& settings = SettingsManager::Instance();

    settings.set("pool", "marker_size", 18);
    BOOST_CHECK_CLOSE(settings.get<float>("pool", "marker_size", 0.0f), 18.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestGetSetBoolAndString) {
    auto& settings = SettingsManager::Instance();

    settings.set("window", "vsync", true);
    settings.set("window", "title", "Patient Journal");

    BOOST_CHECK(settings.get<bool>("window", "vsync", false));
    BOOST_CHECK_EQUAL(settings.get<std::string>("window", "title", ""), "Patient Journal");
}

BOOST_AUTO_TEST_CASE(TestTypeMismatchReturnsDefault) {
    auto& settings = SettingsManager::Instance();

    settings.set("window", "title", "Journal");
    BOOST_CHECK_EQUAL(settings.get<int>("window", "title", 7), 7);
    BOOST_CHECK_EQUAL(settings.get<bool>("window", "title", false), false);
}

BOOST_AUTO_TEST_CASE(TestHasAndRemove) {
    auto& settings = SettingsManager::Instance();

    settings.set("ui", "layout_file", "res/screens.json");
    BOOST_CHECK(settings.has("ui", "layout_file"));

    BOOST_CHECK(settings.remove("ui", "layout_file"));
    BOOST_CHECK(!settings.has("ui", "layout_file"));
    BOOST_CHECK(!settings.remove("ui", "layout_file"));
    BOOST_CHECK(settings.getKeys("ui").empty());
}

BOOST_AUTO_TEST_CASE(TestGetKeys) {
    auto& settings = SettingsManager::Instance();

    settings.set("window", "width", 1280);
    settings.set("window", "height", 720);

    auto keys = settings.getKeys("window");
    std::sort(keys.begin(), keys.end());
    BOOST_REQUIRE_EQUAL(keys.size(), 2u);
    BOOST_CHECK_EQUAL(keys[0], "height");
    BOOST_CHECK_EQUAL(keys[1], "width");
    BOOST_CHECK(settings.getKeys("missing").empty());
}

BOOST_AUTO_TEST_CASE(TestLoadFromFile) {
    createTestFile(R"({
        "window": {"width": 1920, "height": 1080, "title": "Journal"},
        "pool": {"marker_lifetime": 1.5, "prewarm_count": 8},
        "ui": {"debug_overlay": true, "nested": {"ignored": 1}},
        "notACategory": 5
    })");

    auto& settings = SettingsManager::Instance();
    BOOST_REQUIRE(settings.loadFromFile(testFile));

    BOOST_CHECK_EQUAL(settings.get<int>("window", "width", 0), 1920);
    BOOST_CHECK_EQUAL(settings.get<std::string>("window", "title", ""), "Journal");
    BOOST_CHECK_CLOSE(settings.get<float>("pool", "marker_lifetime", 0.0f), 1.5f, 0.001f);
    BOOST_CHECK_EQUAL(settings.get<int>("pool", "prewarm_count", 0), 8);
    BOOST_CHECK(settings.get<bool>("ui", "debug_overlay", false));
    BOOST_CHECK(!settings.has("ui", "nested"));
    BOOST_CHECK(settings.getKeys("notACategory").empty());
}

BOOST_AUTO_TEST_CASE(TestSaveAndReload) {
    auto& settings = SettingsManager::Instance();
    settings.set("window", "width", 800);
    settings.set("window", "title", "Saved");
    settings.set("pool", "marker_lifetime", 0.75f);
    settings.set("ui", "debug_overlay", false);

    BOOST_REQUIRE(settings.saveToFile(testFile));
    settings.clearAll();
    BOOST_CHECK(!settings.has("window", "width"));

    BOOST_REQUIRE(settings.loadFromFile(testFile));
    BOOST_CHECK_EQUAL(settings.get<int>("window", "width", 0), 800);
    BOOST_CHECK_EQUAL(settings.get<std::string>("window", "title", ""), "Saved");
    BOOST_CHECK_CLOSE(settings.get<float>("pool", "marker_lifetime", 0.0f), 0.75f, 0.001f);
    BOOST_CHECK_EQUAL(settings.get<bool>("ui", "debug_overlay", true), false);
}

BOOST_AUTO_TEST_CASE(TestInvalidFile) {
    auto& settings = SettingsManager::Instance();

    BOOST_CHECK(!settings.loadFromFile("tests/test_data/nonexistent.json"));

    createTestFile("{ \"window\": { \"width\": }");
    BOOST_CHECK(!settings.loadFromFile(testFile));

    createTestFile("[1, 2, 3]");
    BOOST_CHECK(!settings.loadFromFile(testFile));
}

BOOST_AUTO_TEST_CASE(TestConcurrentAccess) {
    auto& settings = SettingsManager::Instance();
    settings.set("pool", "counter", 0);

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&settings, t]() {
            for (int i = 0; i < 200; ++i) {
                settings.set("thread" + std::to_string(t), "value", i);
                (void)settings.get<int>("pool", "counter", -1);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (int t = 0; t < 4; ++t) {
        BOOST_CHECK_EQUAL(settings.get<int>("thread" + std::to_string(t), "value", -1), 199);
    }
}

BOOST_AUTO_TEST_SUITE_END()
