#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <iostream>
#include <random>
#include <string>
#include <thread>
#include <vector>

/**
 * @brief In-process, multi-threaded load generator for the caches.
 *
 * Several client threads share one cache and issue operations against it
 * according to a workload pattern:
 *  - PUT_ALL: All operations are adds (insert/update)
 *  - GET_ALL: All operations are reads over the whole key space, filling the
 *             cache on a miss
 *  - GET_POPULAR: Repeated reads on a small set of keys
 *  - MIXED: Random mix of get, add and remove
 *  - SCAN: Reads of the popular keys interleaved with a sweep of keys that
 *          are touched only once
 *
 * The cache type only needs get(key, value&), add(key, value),
 * remove(key) and size().
 */

enum WorkloadType {
    PUT_ALL,       // Only add operations
    GET_ALL,       // Only get operations (read-through on miss)
    GET_POPULAR,   // Frequent reads on small key subset
    MIXED,         // Combination of get, add and remove
    SCAN           // Popular reads polluted by one-time keys
};

// Number of keys in the popular set used by GET_POPULAR and SCAN.
constexpr int kPopularKeys = 10;

// Structure to hold per-thread (client) statistics
struct ClientStats {
    uint64_t operations = 0;       // Total number of operations issued
    uint64_t hits = 0;             // Reads answered by the cache
    uint64_t misses = 0;           // Reads that missed
    uint64_t total_latency_ns = 0; // Cumulative latency in nanoseconds
};

// Global atomic flag to indicate if the run should continue
extern std::atomic<bool> g_running;

/**
 * @brief Maps a workload name such as "GET_POPULAR" to its enum value.
 * @return false if the name is unknown.
 */
bool parseWorkloadType(const std::string& name, WorkloadType& workload);

const char* workloadName(WorkloadType workload);

std::string popularKey(int index);

/**
 * @brief Prints the aggregated statistics of a run.
 */
void printReport(const std::vector<ClientStats>& all_stats, double duration_sec, size_t final_entries);

/**
 * @brief Issues a read and fills the cache on a miss, like a read-through
 * layer in front of a slower store.
 */
template <typename CacheT>
void readThrough(CacheT& cache, const std::string& key, ClientStats& stats) {
    std::string value;
    if (cache.get(key, value)) {
        stats.hits++;
        return;
    }
    stats.misses++;
    cache.add(key, "value_of_" + key);
}

/**
 * @brief Performs a single operation of the given workload.
 *
 * @param sequence Per-thread counter used by SCAN to generate fresh keys.
 */
template <typename CacheT>
void runOperation(CacheT& cache, WorkloadType workload, int thread_id, int key_space_size,
                  std::mt19937& gen, uint64_t sequence, ClientStats& stats) {
    std::uniform_int_distribution<> key_dist(1, key_space_size);
    std::uniform_int_distribution<> popular_key_dist(1, kPopularKeys);
    std::uniform_int_distribution<> op_dist(0, 2); // 0=GET, 1=PUT, 2=DELETE

    switch (workload) {
        case PUT_ALL: {
            int key = key_dist(gen);
            cache.add("key_" + std::to_string(key),
                      "value_" + std::to_string(key) + "_" + std::to_string(thread_id));
            break;
        }

        case GET_ALL:
            readThrough(cache, "key_" + std::to_string(key_dist(gen)), stats);
            break;

        case GET_POPULAR:
            readThrough(cache, popularKey(popular_key_dist(gen)), stats);
            break;

        case MIXED: {
            int op = op_dist(gen);
            std::string key = "key_" + std::to_string(key_dist(gen));
            if (op == 0) {
                readThrough(cache, key, stats);
            } else if (op == 1) {
                cache.add(key, "value_" + key);
            } else {
                cache.remove(key);
            }
            break;
        }

        case SCAN:
            // Even operations hit the popular set, odd ones sweep new keys.
            if (sequence % 2 == 0) {
                readThrough(cache, popularKey(popular_key_dist(gen)), stats);
            } else {
                cache.add("scan_" + std::to_string(thread_id) + "_" + std::to_string(sequence),
                          "scan_value");
            }
            break;
    }
    stats.operations++;
}

/**
 * @brief Function executed by each client thread.
 *
 * Generates operations until the duration elapses or g_running is cleared.
 */
template <typename CacheT>
void clientThread(CacheT& cache, int thread_id, WorkloadType workload,
                  int duration_sec, int key_space_size, ClientStats& stats) {
    std::random_device rd;
    std::mt19937 gen(rd());

    auto end_time = std::chrono::steady_clock::now() + std::chrono::seconds(duration_sec);
    uint64_t sequence = 0;

    while (g_running && std::chrono::steady_clock::now() < end_time) {
        auto op_start = std::chrono::steady_clock::now();
        runOperation(cache, workload, thread_id, key_space_size, gen, sequence++, stats);
        auto op_end = std::chrono::steady_clock::now();
        stats.total_latency_ns +=
            std::chrono::duration_cast<std::chrono::nanoseconds>(op_end - op_start).count();
    }
}

/**
 * @brief Runs a complete load test against one shared cache and prints the report.
 */
template <typename CacheT>
void runBenchmark(CacheT& cache, WorkloadType workload, int num_threads,
                  int duration_sec, int key_space_size) {
    // Preload popular keys so they start out cached
    if (workload == GET_POPULAR || workload == SCAN) {
        std::cout << "Pre-populating popular keys..." << std::endl;
        for (int i = 1; i <= kPopularKeys; i++) {
            cache.add(popularKey(i), "popular_value_" + std::to_string(i));
        }
        std::cout << "Pre-population complete.\n" << std::endl;
    }

    std::vector<ClientStats> all_stats(num_threads);
    std::vector<std::thread> threads;

    std::cout << "Starting load test..." << std::endl;
    auto test_start = std::chrono::steady_clock::now();

    for (int i = 0; i < num_threads; i++) {
        threads.emplace_back(clientThread<CacheT>, std::ref(cache), i, workload,
                             duration_sec, key_space_size, std::ref(all_stats[i]));
    }

    for (auto& t : threads) {
        t.join();
    }

    auto test_end = std::chrono::steady_clock::now();
    double actual_duration = std::chrono::duration<double>(test_end - test_start).count();

    printReport(all_stats, actual_duration, cache.size());
}
