#include <gtest/gtest.h>
#include "lru_cache.hpp"
#include <atomic>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

// ============================================================================
// Basic Functionality Tests
// ============================================================================

TEST(LRUCacheTest, Construction) {
    EXPECT_THROW((LRUCache<int, int>(0)), std::invalid_argument);

    LRUCache<int, int> cache(8);
    EXPECT_EQ(cache.capacity(), 8u);
    EXPECT_EQ(cache.size(), 0u);
}

TEST(LRUCacheTest, AddGetRemove) {
    LRUCache<std::string, std::string> cache(2);
    EXPECT_FALSE(cache.add("a", "1"));
    EXPECT_FALSE(cache.add("b", "2"));

    std::string value;
    ASSERT_TRUE(cache.get("a", value));
    EXPECT_EQ(value, "1");

    // "b" is now the oldest
    EXPECT_TRUE(cache.add("c", "3"));
    EXPECT_FALSE(cache.contains("b"));
    EXPECT_EQ(cache.keys(), (std::vector<std::string>{"a", "c"}));

    EXPECT_TRUE(cache.remove("a"));
    EXPECT_FALSE(cache.remove("a"));
    EXPECT_EQ(cache.size(), 1u);
}

TEST(LRUCacheTest, OldestAccessors) {
    LRUCache<int, int> cache(3);
    cache.add(1, 10);
    cache.add(2, 20);

    int key = 0, value = 0;
    ASSERT_TRUE(cache.getOldest(key, value));
    EXPECT_EQ(key, 1);
    ASSERT_TRUE(cache.removeOldest(key, value));
    EXPECT_EQ(key, 1);
    EXPECT_EQ(value, 10);
    EXPECT_EQ(cache.values(), (std::vector<int>{20}));
}

TEST(LRUCacheTest, ContainsOrAdd) {
    LRUCache<int, int> cache(2);
    cache.add(1, 10);
    cache.add(2, 20);

    bool evicted = true;
    EXPECT_TRUE(cache.containsOrAdd(1, 99, evicted));
    EXPECT_FALSE(evicted);

    // Existing entry was neither updated nor promoted
    int value = 0;
    ASSERT_TRUE(cache.peek(1, value));
    EXPECT_EQ(value, 10);

    EXPECT_FALSE(cache.containsOrAdd(3, 30, evicted));
    EXPECT_TRUE(evicted);
    EXPECT_FALSE(cache.contains(1));
}

TEST(LRUCacheTest, PeekOrAdd) {
    LRUCache<int, int> cache(2);
    cache.add(1, 10);

    int previous = 0;
    bool evicted = true;
    EXPECT_TRUE(cache.peekOrAdd(1, 99, previous, evicted));
    EXPECT_EQ(previous, 10);
    EXPECT_FALSE(evicted);

    EXPECT_FALSE(cache.peekOrAdd(2, 20, previous, evicted));
    EXPECT_FALSE(evicted);
    EXPECT_EQ(cache.size(), 2u);
}

TEST(LRUCacheTest, ResizeAndPurgeNotify) {
    int notifications = 0;
    LRUCache<int, int> cache(4, [&notifications](const int&, const int&) {
        ++notifications;
    });
    for (int i = 0; i < 4; ++i) {
        cache.add(i, i);
    }

    EXPECT_EQ(cache.resize(1), 3u);
    EXPECT_EQ(notifications, 3);
    EXPECT_EQ(cache.keys(), (std::vector<int>{3}));

    cache.purge();
    EXPECT_EQ(notifications, 4);
    EXPECT_EQ(cache.size(), 0u);
}

// ============================================================================
// Concurrency Tests
// ============================================================================

/**
 * @brief Concurrent adds and gets never break the capacity bound
 */
TEST(LRUCacheTest, ConcurrentAccess) {
    const size_t capacity = 64;
    LRUCache<int, int> cache(capacity);
    std::atomic<int> wrong_values{0};
    std::vector<std::thread> threads;

    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&cache, &wrong_values, t]() {
            for (int i = 0; i < 2000; ++i) {
                int key = (t * 2000 + i) % 200;
                cache.add(key, key * 3);
                int value = 0;
                if (cache.get(key, value) && value != key * 3) {
                    wrong_values.fetch_add(1, std::memory_order_relaxed);
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(wrong_values.load(), 0);
    EXPECT_EQ(cache.size(), capacity);
    EXPECT_EQ(cache.keys().size(), capacity);
}
