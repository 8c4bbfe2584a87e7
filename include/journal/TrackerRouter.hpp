/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef TRACKER_ROUTER_HPP
#define TRACKER_ROUTER_HPP

#include "journal/TrackerType.hpp"
#include <cstddef>
#include <optional>
#include <vector>

namespace JournalEngine {

class PatientJournalScreen;
class ScreenManager;

struct TrackerRule {
    size_t screenIndex{0};
    TrackerType tracker{TrackerType::None};
    // Only applies while the patient has not made their first tracker choice
    bool firstChoiceOnly{false};
};

/**
 * @brief Picks the journal's tracker from the screen the user navigates to
 *
 * Rules are tried in order and the first applicable one wins. A
 * first-choice rule is skipped once any first-choice rule has fired, so the
 * first condition picked on the onboarding screens sticks while the
 * dedicated tracker screens still switch freely.
 */
class TrackerRouter {
public:
    explicit TrackerRouter(PatientJournalScreen& journal,
                           std::vector<TrackerRule> rules = defaultRules());
    ~TrackerRouter();

    TrackerRouter(const TrackerRouter&) = delete;
    TrackerRouter& operator=(const TrackerRouter&) = delete;

    // 3 -> CSU (first choice), 2 -> Symptom (first choice), 6 -> Symptom, 5 -> Asthma
    static std::vector<TrackerRule> defaultRules();

    /**
     * @brief Applies the first rule matching the navigated screen index
     * @return The tracker that was applied, if any rule matched
     */
    std::optional<TrackerType> onNavigate(size_t screenIndex);

    // Subscribes to the manager's navigations; detaches from any previous manager
    void attach(ScreenManager& screens);
    void detach();

    bool hasFirstChoice() const { return m_firstChoiceMade; }
    void resetFirstChoice() { m_firstChoiceMade = false; }
    const std::vector<TrackerRule>& getRules() const { return m_rules; }

private:
    PatientJournalScreen& m_journal;
    std::vector<TrackerRule> m_rules;
    bool m_firstChoiceMade{false};
    ScreenManager* mp_screens{nullptr};
    size_t m_listenerId{0};
};

} // namespace JournalEngine

#endif // TRACKER_ROUTER_HPP
