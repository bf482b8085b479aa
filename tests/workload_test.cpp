#include <gtest/gtest.h>
#include "lru_cache.hpp"
#include "two_queue_cache.hpp"
#include "workload.hpp"
#include <random>
#include <string>

TEST(WorkloadTest, ParseWorkloadType) {
    WorkloadType workload = PUT_ALL;
    ASSERT_TRUE(parseWorkloadType("SCAN", workload));
    EXPECT_EQ(workload, SCAN);
    ASSERT_TRUE(parseWorkloadType("GET_POPULAR", workload));
    EXPECT_EQ(workload, GET_POPULAR);
    EXPECT_STREQ(workloadName(workload), "GET_POPULAR");

    EXPECT_FALSE(parseWorkloadType("get_all", workload));
    EXPECT_EQ(workload, GET_POPULAR);
}

TEST(WorkloadTest, ReadThroughFillsOnMiss) {
    TwoQueueCache<std::string, std::string> cache(16);
    ClientStats stats;

    readThrough(cache, "k", stats);
    readThrough(cache, "k", stats);
    EXPECT_EQ(stats.misses, 1u);
    EXPECT_EQ(stats.hits, 1u);

    std::string value;
    ASSERT_TRUE(cache.peek("k", value));
    EXPECT_EQ(value, "value_of_k");
}

TEST(WorkloadTest, PopularKeysAlwaysHitWhenCached) {
    LRUCache<std::string, std::string> cache(64);
    for (int i = 1; i <= kPopularKeys; ++i) {
        cache.add(popularKey(i), "v");
    }

    std::mt19937 gen(42);
    ClientStats stats;
    for (uint64_t seq = 0; seq < 500; ++seq) {
        runOperation(cache, GET_POPULAR, 0, 1000, gen, seq, stats);
    }
    EXPECT_EQ(stats.operations, 500u);
    EXPECT_EQ(stats.hits, 500u);
    EXPECT_EQ(stats.misses, 0u);
}

/**
 * @brief Under a scan, 2Q keeps the popular set while a same-size LRU loses it
 */
TEST(WorkloadTest, ScanFavoursTwoQueue) {
    const size_t capacity = 20;
    TwoQueueCache<std::string, std::string> two_queue(capacity);
    LRUCache<std::string, std::string> lru(capacity);

    std::mt19937 gen_2q(7), gen_lru(7);
    ClientStats stats_2q, stats_lru;
    for (uint64_t seq = 0; seq < 20000; ++seq) {
        runOperation(two_queue, SCAN, 0, 1000, gen_2q, seq, stats_2q);
        runOperation(lru, SCAN, 0, 1000, gen_lru, seq, stats_lru);
    }

    EXPECT_EQ(stats_2q.hits + stats_2q.misses, 10000u);
    EXPECT_GT(stats_2q.hits, stats_lru.hits);
    for (int i = 1; i <= kPopularKeys; ++i) {
        EXPECT_TRUE(two_queue.contains(popularKey(i)));
    }
}

TEST(WorkloadTest, MixedKeepsCacheBounded) {
    TwoQueueCache<std::string, std::string> cache(50);
    std::mt19937 gen(3);
    ClientStats stats;
    for (uint64_t seq = 0; seq < 5000; ++seq) {
        runOperation(cache, MIXED, 1, 500, gen, seq, stats);
        ASSERT_LE(cache.size(), 50u);
    }
    EXPECT_EQ(stats.operations, 5000u);
}
