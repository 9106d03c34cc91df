/*
 * engram C++11 - Memory Configuration Loader
 */
#include <engram/memory/config.hpp>
#include <engram/memory/errors.hpp>
#include <engram/core/utils.hpp>
#include <cmath>

namespace engram {

MemoryConfig load_memory_config(const Config& config) {
    MemoryConfig mc;
    
    mc.db_path = resolve_user_path(config.get_string("db_path", mc.db_path));
    mc.log_level = config.get_string("log_level", mc.log_level);
    
    // Embedding collaborator
    EmbeddingConfig& emb = mc.embedding;
    emb.provider = to_lower(config.get_string("embedding.provider", emb.provider));
    int64_t dim = config.get_int("embedding.dimension", static_cast<int64_t>(emb.dimension));
    if (dim < 1) {
        throw ValidationError("embedding.dimension must be positive");
    }
    emb.dimension = static_cast<size_t>(dim);
    emb.url = config.get_string("embedding.url", emb.url);
    emb.model = config.get_string("embedding.model", emb.model);
    emb.api_key = config.get_string("embedding.api_key", emb.api_key);
    emb.timeout_ms = static_cast<long>(config.get_int("embedding.timeout_ms", emb.timeout_ms));
    if (emb.provider != "hashing" && emb.provider != "http") {
        throw ValidationError("embedding.provider must be 'hashing' or 'http'");
    }
    if (emb.provider == "http" && emb.url.empty()) {
        throw ValidationError("embedding.url is required for the http provider");
    }
    
    // Hybrid search
    mc.search.alpha = clamp(config.get_double("search.alpha", mc.search.alpha), 0.0, 1.0);
    mc.search.default_results = static_cast<int>(
        config.get_int("search.default_results", mc.search.default_results));
    if (mc.search.default_results < 1) {
        throw ValidationError("search.default_results must be at least 1");
    }
    
    // Divergent recall
    RecallConfig& rc = mc.recall;
    rc.max_branches = static_cast<int>(config.get_int("recall.max_branches", rc.max_branches));
    rc.max_depth = static_cast<int>(config.get_int("recall.max_depth", rc.max_depth));
    rc.temperature = config.get_double("recall.temperature", rc.temperature);
    rc.options.depth_decay = config.get_double("recall.depth_decay", rc.options.depth_decay);
    rc.options.random_seed = static_cast<uint64_t>(config.get_int("recall.random_seed", 0));
    rc.options.diagnostics_update_access = config.get_bool("recall.diagnostics_update_access",
                                                           rc.options.diagnostics_update_access);
    if (rc.max_branches < 1 || rc.max_depth < 1) {
        throw ValidationError("recall.max_branches and recall.max_depth must be at least 1");
    }
    if (rc.temperature < 0.0) {
        throw ValidationError("recall.temperature must be >= 0");
    }
    if (rc.options.depth_decay <= 0.0 || rc.options.depth_decay > 1.0) {
        throw ValidationError("recall.depth_decay must be in (0, 1]");
    }
    
    // Association graph and consolidation
    ConsolidationConfig& cc = mc.consolidation;
    cc.options.cap = config.get_double("association.cap", cc.options.cap);
    cc.window_hours = config.get_double("consolidation.window_hours", cc.window_hours);
    cc.max_replay_events = config.get_int("consolidation.max_replay_events", cc.max_replay_events);
    cc.link_update_strength = config.get_double("consolidation.link_update_strength",
                                                cc.link_update_strength);
    cc.options.related_link_threshold = config.get_double("consolidation.related_link_threshold",
                                                          cc.options.related_link_threshold);
    cc.options.event_retention_hours = config.get_double("consolidation.event_retention_hours",
                                                         cc.options.event_retention_hours);
    if (cc.options.cap <= 0.0) {
        throw ValidationError("association.cap must be positive");
    }
    if (!(cc.window_hours >= 0.0) || !(cc.link_update_strength >= 0.0) ||
        cc.max_replay_events < 0) {
        throw ValidationError("consolidation settings must not be negative");
    }
    if (!(cc.options.event_retention_hours >= 0.0) || !(cc.options.related_link_threshold >= 0.0)) {
        throw ValidationError("consolidation settings must not be negative");
    }
    if (!std::isfinite(cc.window_hours) || !std::isfinite(cc.link_update_strength) ||
        !std::isfinite(cc.options.event_retention_hours)) {
        throw ValidationError("consolidation settings must be finite");
    }
    
    // Working set
    int64_t capacity = config.get_int("working_set.capacity",
                                      static_cast<int64_t>(mc.working_set.capacity));
    if (capacity < 1) {
        throw ValidationError("working_set.capacity must be at least 1");
    }
    mc.working_set.capacity = static_cast<size_t>(capacity);
    mc.working_set.half_life_hours = config.get_double("working_set.half_life_hours",
                                                       mc.working_set.half_life_hours);
    if (mc.working_set.half_life_hours <= 0.0) {
        throw ValidationError("working_set.half_life_hours must be positive");
    }
    
    return mc;
}

} // namespace engram
