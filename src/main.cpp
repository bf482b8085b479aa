#include <iostream>      // For standard input/output operations (std::cout, std::cerr)
#include <csignal>       // For handling system signals like SIGINT (Ctrl+C)
#include <exception>
#include <memory>
#include <string>
#include "cache_config.hpp"
#include "lru_cache.hpp"
#include "two_queue_cache.hpp"
#include "workload.hpp"

// ------------------------------------------------------------
// Signal handler: stops the client threads early
// ------------------------------------------------------------
void signalHandler(int) {
    g_running = false;
}

// ------------------------------------------------------------
// Prints command-line usage information.
// ------------------------------------------------------------
void printUsage(const char* prog_name) {
    std::cout << "Usage: " << prog_name << " <workload> <num_threads> <duration_sec> [key_space_size]" << std::endl;
    std::cout << "Workload types: PUT_ALL, GET_ALL, GET_POPULAR, MIXED, SCAN" << std::endl;
    std::cout << "Environment: CACHE_POLICY (2q|lru), CACHE_SIZE, CACHE_RECENT_RATIO, CACHE_GHOST_RATIO" << std::endl;
    std::cout << "Example: CACHE_POLICY=lru " << prog_name << " SCAN 4 10 10000" << std::endl;
}

int main(int argc, char* argv[]) {
    // Ensure minimum required arguments are provided
    if (argc < 4) {
        printUsage(argv[0]);
        return 1;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    std::string workload_str = argv[1];
    WorkloadType workload;
    if (!parseWorkloadType(workload_str, workload)) {
        std::cerr << "Invalid workload type: " << workload_str << std::endl;
        printUsage(argv[0]);
        return 1;
    }

    int num_threads = 0;
    int duration_sec = 0;
    int key_space_size = 10000;
    CacheConfig config;
    try {
        num_threads = std::stoi(argv[2]);
        duration_sec = std::stoi(argv[3]);
        if (argc > 4) key_space_size = std::stoi(argv[4]);
        config = loadConfigFromEnv();
    } catch (const std::exception& e) {
        std::cerr << "Invalid configuration: " << e.what() << std::endl;
        printUsage(argv[0]);
        return 1;
    }

    if (num_threads <= 0 || duration_sec <= 0 || key_space_size <= 0) {
        std::cerr << "Thread count, duration and key space size must be positive" << std::endl;
        return 1;
    }

    // ------------------------------
    // Display the loaded configuration
    // ------------------------------
    printConfig(config);
    std::cout << "=== Load Generator Configuration ===" << std::endl;
    std::cout << "Workload: " << workloadName(workload) << std::endl;
    std::cout << "Threads: " << num_threads << std::endl;
    std::cout << "Duration: " << duration_sec << " seconds" << std::endl;
    std::cout << "Key Space Size: " << key_space_size << std::endl;
    std::cout << "====================================\n" << std::endl;

    try {
        if (config.policy == "lru") {
            auto cache = std::make_unique<LRUCache<std::string, std::string>>(config.cache_size);
            runBenchmark(*cache, workload, num_threads, duration_sec, key_space_size);
        } else {
            auto cache = std::make_unique<TwoQueueCache<std::string, std::string>>(
                config.cache_size, config.recent_ratio, config.ghost_ratio);
            runBenchmark(*cache, workload, num_threads, duration_sec, key_space_size);
        }
    } catch (const std::exception& e) {
        std::cerr << "Failed to create cache: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
