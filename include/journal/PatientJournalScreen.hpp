/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef PATIENT_JOURNAL_SCREEN_HPP
#define PATIENT_JOURNAL_SCREEN_HPP

#include "journal/TrackerType.hpp"
#include "ui/Screen.hpp"
#include <cstddef>

namespace JournalEngine {

// Journal view whose content depends on the selected tracker
class PatientJournalScreen : public Screen {
public:
    explicit PatientJournalScreen(const std::string& screenName);
    ~PatientJournalScreen() override = default;

    void setTrackerType(TrackerType type);
    TrackerType getTrackerType() const { return m_trackerType; }

    // Number of setTrackerType() calls that changed the tracker
    size_t getTrackerChangeCount() const { return m_trackerChanges; }

protected:
    void renderContent(SDL_Renderer* renderer, const ScreenRect& bounds,
                       uint8_t alpha) const override;

private:
    TrackerType m_trackerType{TrackerType::None};
    size_t m_trackerChanges{0};
};

} // namespace JournalEngine

#endif // PATIENT_JOURNAL_SCREEN_HPP
