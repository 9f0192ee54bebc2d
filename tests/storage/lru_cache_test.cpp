// File: tests/storage/lru_cache_test.cpp
#include "storage/lru_cache.hpp"
#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>

namespace simgroup {
namespace {

// Weigh strings by their length so that tests can reason in bytes
size_t StringWeight(const int&, const std::string& value) {
    return value.size();
}

// ============================================================================
// Basic Operations Tests
// ============================================================================

TEST(LRUCacheTest, ConstructorSetsCapacity) {
    LRUCache<int, std::string> cache(1024);
    EXPECT_EQ(1024u, cache.CapacityBytes());
    EXPECT_EQ(0u, cache.Size());
    EXPECT_EQ(0u, cache.UsedBytes());
}

TEST(LRUCacheTest, ZeroCapacitySetToOne) {
    LRUCache<int, int> cache(0);
    EXPECT_EQ(1u, cache.CapacityBytes());
}

TEST(LRUCacheTest, PutAndGetSingleItem) {
    LRUCache<int, std::string> cache(100, StringWeight);

    EXPECT_TRUE(cache.Put(1, "one"));

    auto result = cache.Get(1);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ("one", *result);
    EXPECT_EQ(3u, cache.UsedBytes());
}

TEST(LRUCacheTest, GetNonExistentReturnsNullopt) {
    LRUCache<int, std::string> cache(100);
    EXPECT_FALSE(cache.Get(99).has_value());
}

TEST(LRUCacheTest, UpdateExistingKeyReweighs) {
    LRUCache<int, std::string> cache(100, StringWeight);

    cache.Put(1, "one");
    cache.Put(1, "ONE MORE");

    EXPECT_EQ("ONE MORE", *cache.Get(1));
    EXPECT_EQ(1u, cache.Size());
    EXPECT_EQ(8u, cache.UsedBytes());
}

TEST(LRUCacheTest, OversizeUpdateDropsOldValue) {
    LRUCache<int, std::string> cache(10, StringWeight);

    EXPECT_TRUE(cache.Put(1, "old"));
    EXPECT_TRUE(cache.Put(2, "kept"));
    EXPECT_FALSE(cache.Put(1, "a-value-longer-than-ten"));

    EXPECT_FALSE(cache.Get(1).has_value());
    EXPECT_EQ("kept", *cache.Get(2));
    EXPECT_EQ(1u, cache.Size());
    EXPECT_EQ(4u, cache.UsedBytes());
}

TEST(LRUCacheTest, RemoveExistingItem) {
    LRUCache<int, std::string> cache(100, StringWeight);

    cache.Put(1, "one");
    EXPECT_TRUE(cache.Remove(1));
    EXPECT_FALSE(cache.Remove(1));
    EXPECT_EQ(0u, cache.Size());
    EXPECT_EQ(0u, cache.UsedBytes());
}

// ============================================================================
// Byte Capacity and Eviction Tests
// ============================================================================

TEST(LRUCacheTest, EvictsLeastRecentlyUsedUntilItFits) {
    LRUCache<int, std::string> cache(10, StringWeight);

    cache.Put(1, "aaaa");   // 4 bytes
    cache.Put(2, "bbbb");   // 8 bytes
    cache.Get(1);           // 1 is now most recently used
    cache.Put(3, "cccc");   // 12 > 10: evict 2

    EXPECT_TRUE(cache.Contains(1));
    EXPECT_FALSE(cache.Contains(2));
    EXPECT_TRUE(cache.Contains(3));
    EXPECT_EQ(8u, cache.UsedBytes());
    EXPECT_EQ(1u, cache.Evictions());
}

TEST(LRUCacheTest, LargeEntryEvictsSeveral) {
    LRUCache<int, std::string> cache(10, StringWeight);

    cache.Put(1, "aaa");
    cache.Put(2, "bbb");
    cache.Put(3, "ccc");
    cache.Put(4, "dddddddd");  // 8 bytes: every 3-byte entry has to go

    EXPECT_TRUE(cache.Contains(4));
    EXPECT_LE(cache.UsedBytes(), 10u);
    EXPECT_FALSE(cache.Contains(1));
    EXPECT_FALSE(cache.Contains(2));
    EXPECT_EQ(3u, cache.Evictions());
}

TEST(LRUCacheTest, EntryLargerThanCapacityIsRejected) {
    LRUCache<int, std::string> cache(4, StringWeight);

    cache.Put(1, "ab");
    EXPECT_FALSE(cache.Put(2, "too large"));

    EXPECT_TRUE(cache.Contains(1));
    EXPECT_FALSE(cache.Contains(2));
    EXPECT_EQ(0u, cache.Evictions());
}

TEST(LRUCacheTest, DefaultWeightIsSizeofValue) {
    LRUCache<int, int> cache(3 * sizeof(int));

    cache.Put(1, 10);
    cache.Put(2, 20);
    cache.Put(3, 30);
    cache.Put(4, 40);

    EXPECT_EQ(3u, cache.Size());
    EXPECT_FALSE(cache.Contains(1));
}

// ============================================================================
// Statistics Tests
// ============================================================================

TEST(LRUCacheTest, HitRateTracksLookups) {
    LRUCache<int, std::string> cache(100, StringWeight);
    EXPECT_FLOAT_EQ(0.0f, cache.HitRate());

    cache.Put(1, "one");
    cache.Get(1);
    cache.Get(1);
    cache.Get(2);

    EXPECT_EQ(2u, cache.Hits());
    EXPECT_EQ(1u, cache.Misses());
    EXPECT_NEAR(2.0f / 3.0f, cache.HitRate(), 1e-6f);
}

TEST(LRUCacheTest, ClearResetsEverything) {
    LRUCache<int, std::string> cache(100, StringWeight);
    cache.Put(1, "one");
    cache.Get(1);

    cache.Clear();

    auto stats = cache.GetStats();
    EXPECT_EQ(0u, stats.entries);
    EXPECT_EQ(0u, stats.used_bytes);
    EXPECT_EQ(0u, stats.hits);
    EXPECT_FLOAT_EQ(0.0f, stats.utilization);
}

// ============================================================================
// Thread Safety Tests
// ============================================================================

TEST(LRUCacheTest, ConcurrentPutsStayWithinCapacity) {
    LRUCache<int, std::string> cache(64, StringWeight);

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&cache, t]() {
            for (int i = 0; i < 500; ++i) {
                cache.Put(t * 1000 + i, "value");
                cache.Get(t * 1000 + i / 2);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_LE(cache.UsedBytes(), 64u);
}

} // namespace
} // namespace simgroup
