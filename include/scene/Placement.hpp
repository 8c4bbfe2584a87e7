/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef PLACEMENT_HPP
#define PLACEMENT_HPP

#include "utils/Vector2D.hpp"

namespace JournalEngine {

// Where a scene object sits relative to its parent
struct Placement {
    Vector2D position{};
    float rotation{0.0f}; // degrees

    Placement() = default;
    Placement(const Vector2D& pos, float rot = 0.0f) : position(pos), rotation(rot) {}

    bool operator==(const Placement& other) const {
        return position == other.position && rotation == other.rotation;
    }
};

} // namespace JournalEngine

#endif // PLACEMENT_HPP
