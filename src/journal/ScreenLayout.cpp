/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "journal/ScreenLayout.hpp"
#include "core/Logger.hpp"
#include "journal/PatientJournalScreen.hpp"
#include "utils/JsonReader.hpp"
#include <algorithm>
#include <optional>
#include <unordered_set>

namespace JournalEngine {

namespace {

struct DefaultScreen {
    const char* name;
    ScreenTransition transition;
    Tint tint;
    bool journal;
};

constexpr float DEFAULT_DURATION = 0.25f;

uint8_t colorChannel(const JsonValue& value, uint8_t fallback) {
    auto number = value.tryAsInt();
    if (!number) {
        return fallback;
    }
    return static_cast<uint8_t>(std::clamp(*number, 0, 255));
}

Tint parseTint(const JsonValue& value) {
    Tint tint{};
    if (!value.isArray() || value.size() < 3) {
        return tint;
    }
    tint.r = colorChannel(value[0], tint.r);
    tint.g = colorChannel(value[1], tint.g);
    tint.b = colorChannel(value[2], tint.b);
    tint.a = colorChannel(value[3], tint.a);
    return tint;
}

std::optional<size_t> resolveScreenIndex(const JsonValue& value,
                                         const std::vector<std::unique_ptr<Screen>>& screens) {
    if (auto index = value.tryAsInt()) {
        if (*index >= 0 && static_cast<size_t>(*index) < screens.size()) {
            return static_cast<size_t>(*index);
        }
        return std::nullopt;
    }
    if (auto name = value.tryAsString()) {
        for (size_t i = 0; i < screens.size(); ++i) {
            if (screens[i]->getName() == *name) {
                return i;
            }
        }
    }
    return std::nullopt;
}

} // namespace

ScreenLayout makeDefaultScreenLayout(const ScreenRect& bounds) {
    static const DefaultScreen defaults[] = {
        {"Splash", ScreenTransition::None, {33, 33, 33, 255}, false},
        {"Home", ScreenTransition::Fade, {48, 63, 159, 255}, false},
        {"SymptomSelect", ScreenTransition::Slide, {0, 137, 123, 255}, false},
        {"CSUSelect", ScreenTransition::Slide, {194, 24, 91, 255}, false},
        {"ScreenCSUPatientJournal", ScreenTransition::Scale, {69, 90, 100, 255}, true},
        {"AsthmaSelect", ScreenTransition::Slide, {25, 118, 210, 255}, false},
        {"SymptomJournal", ScreenTransition::Fade, {56, 142, 60, 255}, false},
    };

    ScreenLayout layout;
    for (const auto& entry : defaults) {
        std::unique_ptr<Screen> screen;
        if (entry.journal) {
            auto journal = std::make_unique<PatientJournalScreen>(entry.name);
            layout.journal = journal.get();
            screen = std::move(journal);
        } else {
            screen = std::make_unique<Screen>(entry.name);
        }
        screen->setTransition(entry.transition, DEFAULT_DURATION);
        screen->setTint(entry.tint);
        screen->setBounds(bounds);
        layout.screens.push_back(std::move(screen));
    }
    layout.trackerRules = TrackerRouter::defaultRules();
    return layout;
}

bool parseScreenLayout(const JsonValue& root, const ScreenRect& bounds, ScreenLayout& out) {
    if (!root.isObject() || !root["screens"].isArray() || root["screens"].size() == 0) {
        LAYOUT_ERROR("Layout must be an object with a non-empty \"screens\" array");
        return false;
    }

    ScreenLayout layout;
    std::unordered_set<std::string> names;
    const JsonValue& screens = root["screens"];

    for (size_t i = 0; i < screens.size(); ++i) {
        const JsonValue& entry = screens[i];
        auto name = entry["name"].tryAsString();
        if (!name || name->empty()) {
            LAYOUT_ERROR("Screen " + std::to_string(i) + " has no name");
            return false;
        }
        if (!names.insert(*name).second) {
            LAYOUT_ERROR("Duplicate screen name: " + *name);
            return false;
        }

        std::unique_ptr<Screen> screen;
        if (entry["journal"].tryAsBool().value_or(false)) {
            if (layout.journal != nullptr) {
                LAYOUT_ERROR("More than one journal screen: " + *name);
                return false;
            }
            auto journal = std::make_unique<PatientJournalScreen>(*name);
            layout.journal = journal.get();
            screen = std::move(journal);
        } else {
            screen = std::make_unique<Screen>(*name);
        }

        const auto transition = transitionFromString(entry["transition"].tryAsString().value_or("fade"));
        const auto duration = static_cast<float>(entry["duration"].tryAsNumber().value_or(DEFAULT_DURATION));
        screen->setTransition(transition, duration);
        screen->setBounds(bounds);
        if (entry.hasKey("color")) {
            screen->setTint(parseTint(entry["color"]));
        }
        layout.screens.push_back(std::move(screen));
    }

    if (!root.hasKey("trackers")) {
        layout.trackerRules = TrackerRouter::defaultRules();
    } else {
        const JsonValue& trackers = root["trackers"];
        if (!trackers.isArray()) {
            LAYOUT_ERROR("\"trackers\" must be an array");
            return false;
        }

        for (size_t i = 0; i < trackers.size(); ++i) {
            const JsonValue& entry = trackers[i];
            auto index = resolveScreenIndex(entry["screen"], layout.screens);
            auto tracker = trackerTypeFromString(entry["tracker"].tryAsString().value_or(""));
            if (!index || !tracker) {
                LAYOUT_ERROR("Tracker rule " + std::to_string(i) + " has an unknown screen or tracker");
                return false;
            }
            layout.trackerRules.push_back(
                {*index, *tracker, entry["first_choice_only"].tryAsBool().value_or(false)});
        }
    }

    out = std::move(layout);
    LAYOUT_INFO("Parsed layout with " + std::to_string(out.screens.size()) + " screens and " +
                std::to_string(out.trackerRules.size()) + " tracker rules");
    return true;
}

bool loadScreenLayout(const std::string& path, const ScreenRect& bounds, ScreenLayout& out) {
    JsonReader reader;
    if (!reader.loadFromFile(path)) {
        LAYOUT_ERROR("Failed to load screen layout " + path + " - " + reader.getLastError());
        return false;
    }
    return parseScreenLayout(reader.getRoot(), bounds, out);
}

} // namespace JournalEngine
