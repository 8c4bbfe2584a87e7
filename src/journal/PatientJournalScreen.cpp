/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "journal/PatientJournalScreen.hpp"
#include "core/Logger.hpp"
#include <SDL3/SDL.h>
#include <string>

namespace JournalEngine {

PatientJournalScreen::PatientJournalScreen(const std::string& screenName)
    : Screen(screenName) {
}

void PatientJournalScreen::setTrackerType(TrackerType type) {
    if (type == m_trackerType) {
        return;
    }
    TRACKER_INFO(std::string("Journal tracker: ") + trackerTypeToString(m_trackerType) +
                 " -> " + trackerTypeToString(type));
    m_trackerType = type;
    ++m_trackerChanges;
}

void PatientJournalScreen::renderContent(SDL_Renderer* renderer, const ScreenRect& bounds,
                                         uint8_t alpha) const {
    const std::string label = std::string("Tracker: ") + trackerTypeToString(m_trackerType);
    SDL_SetRenderDrawColor(renderer, 255, 235, 59, alpha);
    SDL_RenderDebugText(renderer, bounds.x + 16.0f, bounds.y + 40.0f, label.c_str());
}

} // namespace JournalEngine
