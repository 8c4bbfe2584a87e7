/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE ValuePoolTests
#include <boost/test/unit_test.hpp>
#include "pool/ValuePool.hpp"
#include "utils/Vector2D.hpp"
#include <string>
#include <vector>

using namespace JournalEngine;

BOOST_AUTO_TEST_SUITE(ValuePoolTestSuite)

BOOST_AUTO_TEST_CASE(TestGetOnEmptyPoolDefaultConstructs) {
    ValuePool<std::string> pool;
    BOOST_CHECK(pool.empty());
    BOOST_CHECK(pool.get().empty());
    BOOST_CHECK(pool.empty());
}

BOOST_AUTO_TEST_CASE(TestPutThenGetIsLastInFirstOut) {
    ValuePool<int> pool;
    pool.put(1);
    pool.put(2);
    pool.put(3);

    BOOST_CHECK_EQUAL(pool.size(), 3u);
    BOOST_CHECK_EQUAL(pool.get(), 3);
    BOOST_CHECK_EQUAL(pool.get(), 2);
    BOOST_CHECK_EQUAL(pool.get(), 1);
    BOOST_CHECK_EQUAL(pool.get(), 0);
}

BOOST_AUTO_TEST_CASE(TestReusedBufferKeepsCapacity) {
    ValuePool<std::vector<Vector2D>> scratch;

    auto points = scratch.get();
    points.reserve(64);
    points.emplace_back(1.0f, 2.0f);
    const auto capacity = points.capacity();
    points.clear();
    scratch.put(std::move(points));

    auto reused = scratch.get();
    BOOST_CHECK(reused.empty());
    BOOST_CHECK_GE(reused.capacity(), capacity);
}

BOOST_AUTO_TEST_CASE(TestPoolsOfDifferentTypesAreIndependent) {
    ValuePool<int> ints;
    ValuePool<float> floats;

    ints.put(7);
    BOOST_CHECK_EQUAL(ints.size(), 1u);
    BOOST_CHECK(floats.empty());
    BOOST_CHECK_EQUAL(floats.get(), 0.0f);
}

BOOST_AUTO_TEST_CASE(TestClear) {
    ValuePool<std::string> pool;
    pool.reserve(4);
    pool.put("a");
    pool.put("b");
    pool.clear();

    BOOST_CHECK(pool.empty());
    BOOST_CHECK_EQUAL(pool.get(), "");
}

BOOST_AUTO_TEST_SUITE_END()
