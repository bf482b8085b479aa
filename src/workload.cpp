#include "workload.hpp"

std::atomic<bool> g_running(true);

bool parseWorkloadType(const std::string& name, WorkloadType& workload) {
    if (name == "PUT_ALL") workload = PUT_ALL;
    else if (name == "GET_ALL") workload = GET_ALL;
    else if (name == "GET_POPULAR") workload = GET_POPULAR;
    else if (name == "MIXED") workload = MIXED;
    else if (name == "SCAN") workload = SCAN;
    else return false;
    return true;
}

const char* workloadName(WorkloadType workload) {
    switch (workload) {
        case PUT_ALL: return "PUT_ALL";
        case GET_ALL: return "GET_ALL";
        case GET_POPULAR: return "GET_POPULAR";
        case MIXED: return "MIXED";
        case SCAN: return "SCAN";
    }
    return "UNKNOWN";
}

std::string popularKey(int index) {
    return "popular_key_" + std::to_string(index);
}

void printReport(const std::vector<ClientStats>& all_stats, double duration_sec, size_t final_entries) {
    // Aggregate statistics from all threads
    uint64_t total_ops = 0, total_hits = 0, total_misses = 0, total_latency = 0;
    for (const auto& stats : all_stats) {
        total_ops += stats.operations;
        total_hits += stats.hits;
        total_misses += stats.misses;
        total_latency += stats.total_latency_ns;
    }
    uint64_t total_reads = total_hits + total_misses;

    std::cout << "\n=== Load Test Results ===" << std::endl;
    std::cout << "Actual Duration: " << duration_sec << " seconds" << std::endl;
    std::cout << "Total Operations: " << total_ops << std::endl;
    std::cout << "Cache Hits: " << total_hits << std::endl;
    std::cout << "Cache Misses: " << total_misses << std::endl;
    std::cout << "Hit Rate: " << (total_reads > 0 ? (double)total_hits / total_reads * 100.0 : 0) << "%" << std::endl;
    std::cout << "Entries Cached: " << final_entries << std::endl;
    std::cout << "\n--- Performance Metrics ---" << std::endl;
    std::cout << "Average Throughput: " << (duration_sec > 0 ? (double)total_ops / duration_sec : 0) << " ops/sec" << std::endl;
    std::cout << "Average Latency: " << (total_ops > 0 ? (double)total_latency / total_ops : 0) << " ns" << std::endl;
    std::cout << "=========================\n" << std::endl;
}
