#pragma once

#include <cstddef>
#include <string>

/**
 * @brief Runtime configuration for the cache benchmark.
 *
 * Every field can be overridden by an environment variable:
 *  - CACHE_POLICY        → "2q" or "lru"
 *  - CACHE_SIZE          → total number of entries
 *  - CACHE_RECENT_RATIO  → 2Q recent pool ratio
 *  - CACHE_GHOST_RATIO   → 2Q ghost pool ratio
 */
struct CacheConfig {
    std::string policy = "2q";
    size_t cache_size = 1000;
    double recent_ratio = 0.25;
    double ghost_ratio = 0.50;
};

/**
 * @brief Retrieves an environment variable by name.
 * @return The variable's value, or default_value if it is not set.
 */
std::string getEnv(const char* name, const std::string& default_value);

/**
 * @brief Builds a CacheConfig from the environment, falling back to defaults.
 *
 * @throws std::invalid_argument or std::out_of_range if a numeric variable
 *         cannot be parsed, std::invalid_argument if validateConfig() fails.
 */
CacheConfig loadConfigFromEnv();

/**
 * @brief Checks the policy name, the size and both ratios.
 * @throws std::invalid_argument describing the first invalid field.
 */
void validateConfig(const CacheConfig& config);

// Prints the configuration banner to std::cout.
void printConfig(const CacheConfig& config);
