/*
 * engram C++11 - Memory Configuration
 * 
 * Typed settings for one deployment, read from the JSON config file
 * (with ENGRAM_* environment fallback) by load_memory_config().
 */
#ifndef ENGRAM_MEMORY_CONFIG_HPP
#define ENGRAM_MEMORY_CONFIG_HPP

#include "recall.hpp"
#include "consolidation.hpp"
#include <engram/core/config.hpp>
#include <string>

namespace engram {

struct EmbeddingConfig {
    std::string provider;       // "hashing" | "http"
    size_t dimension;
    std::string url;
    std::string model;
    std::string api_key;
    long timeout_ms;
    
    EmbeddingConfig() : provider("hashing"), dimension(256), timeout_ms(30000) {}
};

struct SearchConfig {
    double alpha;               // Weight of the similarity ranker
    int default_results;
    
    SearchConfig() : alpha(0.7), default_results(5) {}
};

struct RecallConfig {
    int max_branches;
    int max_depth;
    double temperature;
    RecallOptions options;
    
    RecallConfig() : max_branches(3), max_depth(3), temperature(0.7) {}
};

struct ConsolidationConfig {
    double window_hours;
    int64_t max_replay_events;
    double link_update_strength;
    ConsolidationOptions options;
    
    ConsolidationConfig() : window_hours(24), max_replay_events(200), link_update_strength(0.2) {}
};

struct WorkingSetConfig {
    size_t capacity;
    double half_life_hours;
    
    WorkingSetConfig() : capacity(20), half_life_hours(24) {}
};

struct MemoryConfig {
    std::string db_path;
    EmbeddingConfig embedding;
    SearchConfig search;
    RecallConfig recall;
    ConsolidationConfig consolidation;
    WorkingSetConfig working_set;
    std::string log_level;
    
    MemoryConfig() : db_path("~/.engram/memory.db"), log_level("info") {}
};

// Defaults for every missing key; throws ValidationError for values
// outside their domain
MemoryConfig load_memory_config(const Config& config);

} // namespace engram

#endif // ENGRAM_MEMORY_CONFIG_HPP
