/* SPDX-FileCopyrightText: 2025 PhotoSphere Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/resource_cache.hpp"
#include <gtest/gtest.h>
#include <string>

using namespace pss::core;

TEST(ResourceCacheTest, MissThenHit) {
    ResourceCache<std::string, int> cache(4);
    EXPECT_EQ(cache.find("a"), nullptr);
    cache.insert("a", 1);

    auto* value = cache.find("a");
    ASSERT_NE(value, nullptr);
    EXPECT_EQ(*value, 1);
    EXPECT_EQ(cache.hits(), 1u);
    EXPECT_EQ(cache.misses(), 1u);
}

TEST(ResourceCacheTest, EvictsLeastRecentlyUsed) {
    ResourceCache<std::string, int> cache(3);
    cache.insert("a", 1);
    cache.insert("b", 2);
    cache.insert("c", 3);

    // Touch "a" so "b" becomes the oldest
    ASSERT_NE(cache.find("a"), nullptr);

    const auto evicted = cache.insert("d", 4);
    ASSERT_TRUE(evicted.has_value());
    EXPECT_EQ(*evicted, "b");
    EXPECT_EQ(cache.size(), 3u);
    EXPECT_TRUE(cache.contains("a"));
    EXPECT_FALSE(cache.contains("b"));
    EXPECT_TRUE(cache.contains("c"));
    EXPECT_TRUE(cache.contains("d"));

    EXPECT_EQ(*cache.insert("e", 5), "c");
}

TEST(ResourceCacheTest, ReplaceDoesNotEvict) {
    ResourceCache<std::string, int> cache(2);
    cache.insert("a", 1);
    cache.insert("b", 2);

    EXPECT_FALSE(cache.insert("a", 10).has_value());
    EXPECT_EQ(cache.size(), 2u);
    EXPECT_EQ(*cache.find("a"), 10);

    // Replacing refreshed "a", so "b" goes next
    EXPECT_EQ(*cache.insert("c", 3), "b");
}

TEST(ResourceCacheTest, EraseAndClear) {
    ResourceCache<int, std::string> cache(4);
    cache.insert(1, "one");
    cache.insert(2, "two");

    EXPECT_TRUE(cache.erase(1));
    EXPECT_FALSE(cache.erase(1));
    EXPECT_EQ(cache.size(), 1u);

    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_FALSE(cache.contains(2));
}

TEST(ResourceCacheTest, CapacityIsAtLeastOne) {
    ResourceCache<int, int> cache(0);
    EXPECT_EQ(cache.capacity(), 1u);
    cache.insert(1, 1);
    EXPECT_EQ(*cache.insert(2, 2), 1);
    EXPECT_TRUE(cache.contains(2));
}
