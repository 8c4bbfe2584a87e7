/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SCREEN_LAYOUT_HPP
#define SCREEN_LAYOUT_HPP

#include "journal/TrackerRouter.hpp"
#include "ui/Screen.hpp"
#include <memory>
#include <string>
#include <vector>

namespace JournalEngine {

class JsonValue;
class PatientJournalScreen;

/**
 * @brief The application's screen collection plus its tracker routing
 *
 * Layout file format:
 *   {
 *     "screens": [
 *       { "name": "Home", "transition": "fade", "duration": 0.25,
 *         "color": [48, 63, 159], "journal": false }
 *     ],
 *     "trackers": [
 *       { "screen": 3, "tracker": "CSU", "first_choice_only": true },
 *       { "screen": "AsthmaSelect", "tracker": "Asthma" }
 *     ]
 *   }
 * A tracker rule's "screen" is an index or a screen name. Exactly one
 * screen may set "journal"; it becomes a PatientJournalScreen. Without a
 * "trackers" array the default routing table is used.
 */
struct ScreenLayout {
    std::vector<std::unique_ptr<Screen>> screens{};
    std::vector<TrackerRule> trackerRules{};
    PatientJournalScreen* journal{nullptr}; // owned by screens
};

// Built-in seven-screen journal layout with the default routing table
ScreenLayout makeDefaultScreenLayout(const ScreenRect& bounds);

/**
 * @brief Parses a layout document
 * @return false with out untouched if the document is invalid
 */
bool parseScreenLayout(const JsonValue& root, const ScreenRect& bounds, ScreenLayout& out);

bool loadScreenLayout(const std::string& path, const ScreenRect& bounds, ScreenLayout& out);

} // namespace JournalEngine

#endif // SCREEN_LAYOUT_HPP
