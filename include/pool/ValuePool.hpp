/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef VALUE_POOL_HPP
#define VALUE_POOL_HPP

#include <cstddef>
#include <type_traits>
#include <utility>
#include <vector>

namespace JournalEngine {

/**
 * @brief Last-in-first-out free list of plain values of one type
 *
 * One pool per value type; nothing is looked up at runtime. Unlike
 * ObjectPool there is no ownership tracking: put() accepts any value.
 *
 * Usage:
 *   ValuePool<std::vector<Vector2D>> scratch;
 *   auto points = scratch.get();   // empty vector on first use
 *   ...
 *   points.clear();
 *   scratch.put(std::move(points));
 */
template<typename T>
class ValuePool {
    static_assert(std::is_default_constructible_v<T>,
                  "ValuePool requires a default-constructible type");

public:
    ValuePool() = default;

    // Most recently put value, or a default-constructed T when empty
    T get() {
        if (m_values.empty()) {
            return T{};
        }
        T value = std::move(m_values.back());
        m_values.pop_back();
        return value;
    }

    void put(T value) {
        m_values.push_back(std::move(value));
    }

    size_t size() const { return m_values.size(); }
    bool empty() const { return m_values.empty(); }
    void reserve(size_t capacity) { m_values.reserve(capacity); }
    void clear() { m_values.clear(); }

private:
    std::vector<T> m_values{};
};

} // namespace JournalEngine

#endif // VALUE_POOL_HPP
