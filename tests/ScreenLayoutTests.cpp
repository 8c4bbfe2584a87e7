/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE ScreenLayoutTests
#include <boost/test/unit_test.hpp>
#include "journal/PatientJournalScreen.hpp"
#include "journal/ScreenLayout.hpp"
#include "utils/JsonReader.hpp"
#include <filesystem>
#include <fstream>
#include <string>

using namespace JournalEngine;

struct LayoutFixture {
    const ScreenRect bounds{0.0f, 0.0f, 800.0f, 600.0f};
    JsonReader reader;
    ScreenLayout layout;

    bool parse(const std::string& json) {
        BOOST_REQUIRE_MESSAGE(reader.parse(json), reader.getLastError());
        return parseScreenLayout(reader.getRoot(), bounds, layout);
    }
};

BOOST_FIXTURE_TEST_SUITE(ScreenLayoutTestSuite, LayoutFixture)

BOOST_AUTO_TEST_CASE(TestDefaultLayout) {
    layout = makeDefaultScreenLayout(bounds);

    BOOST_REQUIRE_EQUAL(layout.screens.size(), 7u);
    BOOST_CHECK_EQUAL(layout.screens[0]->getName(), "Splash");
    BOOST_CHECK_EQUAL(layout.screens[3]->getName(), "CSUSelect");
    BOOST_REQUIRE(layout.journal != nullptr);
    BOOST_CHECK(layout.screens[4].get() == layout.journal);
    BOOST_CHECK_EQUAL(layout.trackerRules.size(), 4u);
    BOOST_CHECK_EQUAL(layout.screens[2]->getBounds().width, 800.0f);
}

BOOST_AUTO_TEST_CASE(TestParseScreensAndRules) {
    const std::string json = R"({
        "screens": [
            {"name": "Start", "transition": "none"},
            {"name": "Pick", "transition": "slide", "duration": 0.5, "color": [10, 20, 30]},
            {"name": "Diary", "journal": true}
        ],
        "trackers": [
            {"screen": "Pick", "tracker": "csu", "first_choice_only": true},
            {"screen": 0, "tracker": "asthma"}
        ]
    })";

    BOOST_REQUIRE(parse(json));
    BOOST_REQUIRE_EQUAL(layout.screens.size(), 3u);
    BOOST_CHECK(layout.screens[0]->getTransition() == ScreenTransition::None);
    BOOST_CHECK(layout.screens[1]->getTransition() == ScreenTransition::Slide);
    BOOST_CHECK_CLOSE(layout.screens[1]->getTransitionDuration(), 0.5f, 0.001f);
    BOOST_CHECK(layout.screens[1]->getTint() == (Tint{10, 20, 30, 255}));
    BOOST_CHECK(layout.screens[2].get() == layout.journal);

    BOOST_REQUIRE_EQUAL(layout.trackerRules.size(), 2u);
    BOOST_CHECK_EQUAL(layout.trackerRules[0].screenIndex, 1u);
    BOOST_CHECK(layout.trackerRules[0].tracker == TrackerType::CSU);
    BOOST_CHECK(layout.trackerRules[0].firstChoiceOnly);
    BOOST_CHECK_EQUAL(layout.trackerRules[1].screenIndex, 0u);
    BOOST_CHECK(!layout.trackerRules[1].firstChoiceOnly);
}

BOOST_AUTO_TEST_CASE(TestMissingTrackersUsesDefaults) {
    BOOST_REQUIRE(parse(R"({"screens": [{"name": "Only"}]})"));
    BOOST_CHECK_EQUAL(layout.trackerRules.size(), 4u);
    BOOST_CHECK(layout.journal == nullptr);
    BOOST_CHECK(layout.screens[0]->getTransition() == ScreenTransition::Fade);
}

BOOST_AUTO_TEST_CASE(TestEmptyTrackersDisablesRouting) {
    BOOST_REQUIRE(parse(R"({"screens": [{"name": "Only"}], "trackers": []})"));
    BOOST_CHECK(layout.trackerRules.empty());
}

BOOST_AUTO_TEST_CASE(TestRejectsDuplicateNames) {
    BOOST_CHECK(!parse(R"({"screens": [{"name": "A"}, {"name": "A"}]})"));
    BOOST_CHECK(layout.screens.empty());
}

BOOST_AUTO_TEST_CASE(TestRejectsMissingName) {
    BOOST_CHECK(!parse(R"({"screens": [{"transition": "fade"}]})"));
}

BOOST_AUTO_TEST_CASE(TestRejectsTwoJournals) {
    BOOST_CHECK(!parse(R"({"screens": [{"name": "A", "journal": true},
                                       {"name": "B", "journal": true}]})"));
}

BOOST_AUTO_TEST_CASE(TestRejectsBadRule) {
    BOOST_CHECK(!parse(R"({"screens": [{"name": "A"}],
                           "trackers": [{"screen": "Missing", "tracker": "csu"}]})"));
    BOOST_CHECK(!parse(R"({"screens": [{"name": "A"}],
                           "trackers": [{"screen": 4, "tracker": "csu"}]})"));
    BOOST_CHECK(!parse(R"({"screens": [{"name": "A"}],
                           "trackers": [{"screen": 0, "tracker": "eczema"}]})"));
}

BOOST_AUTO_TEST_CASE(TestRejectsEmptyScreens) {
    BOOST_CHECK(!parse(R"({"screens": []})"));
    BOOST_CHECK(!parse(R"([1, 2, 3])"));
}

BOOST_AUTO_TEST_CASE(TestLoadFromFile) {
    const std::string path = "tests/test_data/test_screens.json";
    std::filesystem::create_directories("tests/test_data");
    {
        std::ofstream file(path);
        file << R"({"screens": [{"name": "Home"}, {"name": "Diary", "journal": true}]})";
    }

    BOOST_CHECK(loadScreenLayout(path, bounds, layout));
    BOOST_CHECK_EQUAL(layout.screens.size(), 2u);
    std::filesystem::remove(path);

    BOOST_CHECK(!loadScreenLayout("tests/test_data/does_not_exist.json", bounds, layout));
}

BOOST_AUTO_TEST_SUITE_END()
