/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef TINT_HPP
#define TINT_HPP

#include <cstdint>

namespace JournalEngine {

// RGBA colour kept free of SDL types so headers stay SDL-agnostic
struct Tint {
    uint8_t r{255};
    uint8_t g{255};
    uint8_t b{255};
    uint8_t a{255};

    bool operator==(const Tint& other) const {
        return r == other.r && g == other.g && b == other.b && a == other.a;
    }
};

} // namespace JournalEngine

#endif // TINT_HPP
