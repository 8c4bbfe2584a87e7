/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef TRACKER_TYPE_HPP
#define TRACKER_TYPE_HPP

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace JournalEngine {

// What the patient journal is currently recording
enum class TrackerType : uint8_t {
    None,
    CSU,     // chronic spontaneous urticaria
    Symptom,
    Asthma
};

inline const char* trackerTypeToString(TrackerType type) {
    switch (type) {
    case TrackerType::CSU:
        return "CSU";
    case TrackerType::Symptom:
        return "Symptom";
    case TrackerType::Asthma:
        return "Asthma";
    case TrackerType::None:
    default:
        return "None";
    }
}

inline std::optional<TrackerType> trackerTypeFromString(const std::string& name) {
    if (name == "CSU" || name == "csu") {
        return TrackerType::CSU;
    }
    if (name == "Symptom" || name == "symptom") {
        return TrackerType::Symptom;
    }
    if (name == "Asthma" || name == "asthma") {
        return TrackerType::Asthma;
    }
    if (name == "None" || name == "none") {
        return TrackerType::None;
    }
    return std::nullopt;
}

// For Boost.Test
inline std::ostream& operator<<(std::ostream& os, TrackerType type) {
    return os << trackerTypeToString(type);
}

} // namespace JournalEngine

#endif // TRACKER_TYPE_HPP
