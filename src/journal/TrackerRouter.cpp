/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "journal/TrackerRouter.hpp"
#include "core/Logger.hpp"
#include "journal/PatientJournalScreen.hpp"
#include "managers/ScreenManager.hpp"
#include <string>

namespace JournalEngine {

TrackerRouter::TrackerRouter(PatientJournalScreen& journal, std::vector<TrackerRule> rules)
    : m_journal(journal), m_rules(std::move(rules)) {
}

TrackerRouter::~TrackerRouter() {
    detach();
}

std::vector<TrackerRule> TrackerRouter::defaultRules() {
    return {
        {3, TrackerType::CSU, true},
        {2, TrackerType::Symptom, true},
        {6, TrackerType::Symptom, false},
        {5, TrackerType::Asthma, false},
    };
}

std::optional<TrackerType> TrackerRouter::onNavigate(size_t screenIndex) {
    for (const auto& rule : m_rules) {
        if (rule.screenIndex != screenIndex) {
            continue;
        }
        if (rule.firstChoiceOnly && m_firstChoiceMade) {
            continue;
        }

        if (rule.firstChoiceOnly) {
            m_firstChoiceMade = true;
        }
        m_journal.setTrackerType(rule.tracker);
        TRACKER_DEBUG("Screen " + std::to_string(screenIndex) + " selected tracker " +
                      trackerTypeToString(rule.tracker));
        return rule.tracker;
    }
    return std::nullopt;
}

void TrackerRouter::attach(ScreenManager& screens) {
    detach();
    mp_screens = &screens;
    m_listenerId = screens.addNavigationListener(
        [this](size_t index, Screen& /* screen */) { onNavigate(index); });
}

void TrackerRouter::detach() {
    if (mp_screens != nullptr) {
        mp_screens->removeNavigationListener(m_listenerId);
        mp_screens = nullptr;
    }
}

} // namespace JournalEngine
