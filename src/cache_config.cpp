#include "cache_config.hpp"
#include <cstdlib>   // For environment variable access
#include <iostream>
#include <stdexcept>

// ------------------------------------------------------------
// Helper function: Retrieves an environment variable by name.
// If not found, returns the provided default value.
// ------------------------------------------------------------
std::string getEnv(const char* name, const std::string& default_value) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : default_value;
}

namespace {

// std::stoul silently wraps negative input, so reject a leading '-' first.
// Trailing text ("12abc", "1e6") is rejected rather than ignored.
size_t parseSize(const std::string& text) {
    if (text.find('-') != std::string::npos) {
        throw std::invalid_argument("CACHE_SIZE must not be negative: " + text);
    }
    size_t pos = 0;
    unsigned long value = std::stoul(text, &pos);
    if (pos != text.size()) {
        throw std::invalid_argument("CACHE_SIZE is not an integer: " + text);
    }
    return value;
}

double parseRatio(const std::string& text, const char* name) {
    size_t pos = 0;
    double value = std::stod(text, &pos);
    if (pos != text.size()) {
        throw std::invalid_argument(std::string(name) + " is not a number: " + text);
    }
    return value;
}

void checkRatio(double ratio, const char* name) {
    if (!(ratio >= 0.0 && ratio <= 1.0)) {
        throw std::invalid_argument(std::string(name) + " must be within [0, 1]");
    }
}

} // namespace

CacheConfig loadConfigFromEnv() {
    CacheConfig config;

    // Read cache configuration (convert from string to size_t/double)
    config.policy = getEnv("CACHE_POLICY", config.policy);
    config.cache_size = parseSize(getEnv("CACHE_SIZE", std::to_string(config.cache_size)));
    config.recent_ratio = parseRatio(getEnv("CACHE_RECENT_RATIO", std::to_string(config.recent_ratio)),
                                     "CACHE_RECENT_RATIO");
    config.ghost_ratio = parseRatio(getEnv("CACHE_GHOST_RATIO", std::to_string(config.ghost_ratio)),
                                    "CACHE_GHOST_RATIO");

    validateConfig(config);
    return config;
}

void validateConfig(const CacheConfig& config) {
    if (config.policy != "2q" && config.policy != "lru") {
        throw std::invalid_argument("unknown CACHE_POLICY: " + config.policy);
    }
    if (config.cache_size == 0) {
        throw std::invalid_argument("CACHE_SIZE must be positive");
    }
    checkRatio(config.recent_ratio, "CACHE_RECENT_RATIO");
    checkRatio(config.ghost_ratio, "CACHE_GHOST_RATIO");
}

void printConfig(const CacheConfig& config) {
    std::cout << "=== Cache Configuration ===" << std::endl;
    std::cout << "Policy: " << config.policy << std::endl;
    std::cout << "Cache Size: " << config.cache_size << std::endl;
    if (config.policy == "2q") {
        std::cout << "Recent Ratio: " << config.recent_ratio << std::endl;
        std::cout << "Ghost Ratio: " << config.ghost_ratio << std::endl;
    }
    std::cout << "===========================\n" << std::endl;
}
