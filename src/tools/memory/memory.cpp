/*
 * engram C++11 - Memory Tool Implementation
 */
#include <engram/tools/memory/memory.hpp>
#include <engram/memory/errors.hpp>
#include <engram/core/logger.hpp>
#include <engram/core/utils.hpp>
#include <climits>
#include <cmath>

namespace engram {

namespace {

struct ToolEntry {
    const char* name;
    const char* description;
};

const ToolEntry TOOLS[] = {
    {"remember", "Store a new memory (content, emotion, category, importance, tags, media, camera)"},
    {"get_memory", "Fetch one memory by id and count the access"},
    {"search_memories", "Hybrid semantic and bigram search with optional filters and scoring"},
    {"recall", "Memories relevant to a context, weighted by recency, emotion and importance"},
    {"recall_with_associations", "Recall plus the memories linked to each result"},
    {"recall_divergent", "Associative recall by spreading activation from a context"},
    {"get_association_diagnostics", "Run recall without side effects and report traversal counters"},
    {"consolidate_memories", "Replay recent co-activations into association strengths"},
    {"link_memories", "Create a typed causal link between two memories"},
    {"get_causal_chain", "Walk causal links forward or backward from a memory"},
    {"get_memory_chain", "Memories linked to a memory in either direction"},
    {"list_recent_memories", "Newest memories first, optionally filtered"},
    {"get_memory_stats", "Counts by category and emotion plus store totals"},
    {"search_important_memories", "Memories above an importance and access threshold"},
    {"delete_memory", "Delete a memory with its links, edges and events"},
    {"create_episode", "Group memories into an episode"},
    {"get_episode", "Fetch one episode by id"},
    {"get_episode_memories", "Members of an episode in chronological order"},
    {"search_episodes", "Bigram search over episode titles and summaries"},
    {"list_episodes", "Newest episodes first"},
    {"delete_episode", "Delete an episode and clear its members' references"},
    {"get_working_set", "Current working-set entries"},
    {"refresh_working_set", "Rebuild the working set from the store"},
    {"get_associations", "Association neighbors of a memory, or the strength of one pair"}
};

const size_t TOOL_COUNT = sizeof(TOOLS) / sizeof(TOOLS[0]);

Json string_map_to_json(const std::map<std::string, int64_t>& m) {
    Json out = Json::object();
    for (std::map<std::string, int64_t>::const_iterator it = m.begin(); it != m.end(); ++it) {
        out.set(it->first, it->second);
    }
    return out;
}

// Checked parameter getters: an absent or null key gives the default, a
// value of the wrong type is a ValidationError.
const Json* param(const Json& params, const std::string& key) {
    if (!params.has(key) || params[key].is_null()) return NULL;
    return &params[key];
}

double number_param(const Json& params, const std::string& key, double def) {
    const Json* v = param(params, key);
    if (!v) return def;
    if (!v->is_number() || !std::isfinite(v->as_number())) {
        throw ValidationError(key + " must be a finite number");
    }
    return v->as_number();
}

int64_t int64_param(const Json& params, const std::string& key, int64_t def) {
    // Integers above 2^53 are not exactly representable in a JSON number
    const double LIMIT = 9007199254740992.0;
    const Json* v = param(params, key);
    if (!v) return def;
    double d = number_param(params, key, 0.0);
    if (d != std::floor(d)) {
        throw ValidationError(key + " must be an integer");
    }
    if (d > LIMIT || d < -LIMIT) {
        throw ValidationError(key + " is out of range");
    }
    return static_cast<int64_t>(d);
}

int int_param(const Json& params, const std::string& key, int def) {
    int64_t n = int64_param(params, key, def);
    if (n > INT_MAX || n < INT_MIN) {
        throw ValidationError(key + " is out of range");
    }
    return static_cast<int>(n);
}

std::string string_param(const Json& params, const std::string& key, const std::string& def) {
    const Json* v = param(params, key);
    if (!v) return def;
    if (!v->is_string()) {
        throw ValidationError(key + " must be a string");
    }
    return v->as_string();
}

bool bool_param(const Json& params, const std::string& key, bool def) {
    const Json* v = param(params, key);
    if (!v) return def;
    if (!v->is_bool()) {
        throw ValidationError(key + " must be true or false");
    }
    return v->as_bool();
}

std::vector<std::string> string_list_param(const Json& params, const std::string& key) {
    std::vector<std::string> out;
    const Json* v = param(params, key);
    if (!v) return out;
    if (!v->is_array()) {
        throw ValidationError(key + " must be an array of strings");
    }
    for (size_t i = 0; i < v->size(); ++i) {
        if (!(*v)[i].is_string()) {
            throw ValidationError(key + " must be an array of strings");
        }
        out.push_back((*v)[i].as_string());
    }
    return out;
}

RecordFilter parse_filter(const Json& params) {
    RecordFilter filter;
    std::string category = string_param(params, "category", "");
    if (!category.empty()) {
        if (!parse_category(category, filter.category)) {
            throw ValidationError("Unknown category: " + category);
        }
        filter.has_category = true;
    }
    std::string emotion = string_param(params, "emotion", "");
    if (!emotion.empty()) {
        if (!parse_emotion(emotion, filter.emotion)) {
            throw ValidationError("Unknown emotion: " + emotion);
        }
        filter.has_emotion = true;
    }
    filter.created_after = int64_param(params, "created_after", 0);
    filter.created_before = int64_param(params, "created_before", 0);
    filter.min_importance = int_param(params, "min_importance", 0);
    return filter;
}

std::string require_string(const Json& params, const std::string& key) {
    std::string value = string_param(params, key, "");
    if (trim(value).empty()) {
        throw ValidationError(key + " is required");
    }
    return value;
}

} // anonymous namespace

Json record_to_json(const MemoryRecord& r) {
    Json item;
    item.set("id", r.id);
    item.set("content", r.content);
    item.set("emotion", emotion_to_string(r.emotion));
    item.set("category", category_to_string(r.category));
    item.set("importance", r.importance);
    item.set("created_at", r.created_at);
    item.set("created", format_timestamp_ms(r.created_at));
    item.set("last_accessed", r.last_accessed);
    item.set("access_count", r.access_count);
    item.set("tags", Json::string_array(r.tags));
    if (!r.media_path.empty()) {
        Json media;
        media.set("path", r.media_path);
        media.set("type", r.media_type);
        media.set("transcript", r.transcript);
        item.set("media", media);
    }
    if (r.has_camera) {
        Json camera;
        camera.set("pan", r.camera_pan);
        camera.set("tilt", r.camera_tilt);
        item.set("camera", camera);
    }
    if (!r.episode_id.empty()) {
        item.set("episode_id", r.episode_id);
    }
    return item;
}

Json episode_to_json(const Episode& e) {
    Json item;
    item.set("id", e.id);
    item.set("title", e.title);
    item.set("summary", e.summary);
    item.set("participants", Json::string_array(e.participants));
    item.set("memory_ids", Json::string_array(e.member_ids));
    item.set("emotion", emotion_to_string(e.emotion));
    item.set("importance", e.importance);
    item.set("start_time", e.start_time);
    item.set("end_time", e.end_time);
    item.set("created_at", e.created_at);
    return item;
}

Json recall_result_to_json(const RecallResult& r) {
    Json item;
    item.set("memory", record_to_json(r.record));
    item.set("activation", r.activation);
    item.set("origin_seed_id", r.origin_seed_id);
    item.set("hops", r.hops);
    item.set("prediction_error", r.prediction_error);
    item.set("novelty", r.novelty);
    return item;
}

Json scored_hit_to_json(const ScoredHit& h) {
    Json item;
    item.set("memory", record_to_json(h.hit.record));
    item.set("score", h.hit.score);
    item.set("similarity", h.hit.similarity);
    item.set("lexical", h.hit.lexical);
    item.set("time_decay", h.time_decay);
    item.set("emotion_boost", h.emotion_boost);
    item.set("importance_boost", h.importance_boost);
    item.set("final_score", h.final_score);
    return item;
}

Json chain_entry_to_json(const ChainEntry& e) {
    Json item;
    item.set("memory", record_to_json(e.record));
    item.set("depth", e.depth);
    if (!e.via_id.empty()) {
        item.set("via_id", e.via_id);
        item.set("link_type", e.link_type);
    }
    return item;
}

MemoryTool::MemoryTool() {}

MemoryTool::~MemoryTool() {
    shutdown();
}

bool MemoryTool::init(const Config& cfg) {
    MemoryConfig config;
    try {
        config = load_memory_config(cfg);
    } catch (const MemoryError& e) {
        last_error_ = e.what();
        LOG_ERROR("Invalid memory configuration: %s", e.what());
        return false;
    }
    return init(config, NULL);
}

bool MemoryTool::init(const MemoryConfig& config, Embedder* embedder) {
    shutdown();

    if (embedder) {
        manager_.reset(new MemoryManager(config, embedder));
    } else {
        manager_.reset(new MemoryManager(config));
    }

    if (!manager_->initialize()) {
        last_error_ = manager_->last_error();
        manager_.reset();
        return false;
    }

    last_error_.clear();
    return true;
}

void MemoryTool::shutdown() {
    if (manager_) {
        manager_->shutdown();
        manager_.reset();
    }
}

const std::string& MemoryTool::last_error() const {
    return last_error_;
}

MemoryManager* MemoryTool::memory_manager() {
    return manager_.get();
}

std::vector<std::string> MemoryTool::tool_names() {
    std::vector<std::string> names;
    for (size_t i = 0; i < TOOL_COUNT; ++i) {
        names.push_back(TOOLS[i].name);
    }
    return names;
}

std::string MemoryTool::describe(const std::string& function_name) {
    for (size_t i = 0; i < TOOL_COUNT; ++i) {
        if (function_name == TOOLS[i].name) return TOOLS[i].description;
    }
    return "";
}

Json MemoryTool::execute(const std::string& function_name, const Json& params) {
    try {
        return dispatch(function_name, params);
    } catch (const MemoryError& e) {
        LOG_WARN("%s failed (%s): %s", function_name.c_str(),
                 error_kind_to_string(e.kind()).c_str(), e.what());
        return make_error(error_kind_to_string(e.kind()), e.what());
    } catch (const std::exception& e) {
        LOG_WARN("%s failed: %s", function_name.c_str(), e.what());
        return make_error("InternalError", e.what());
    }
}

Json MemoryTool::dispatch(const std::string& function_name, const Json& params) {
    if (!manager_) {
        throw StoreError("Memory tool not initialized");
    }
    if (!params.is_null() && !params.is_object()) {
        throw ValidationError("Parameters must be a JSON object");
    }

    if (function_name == "remember") {
        return remember(params);
    } else if (function_name == "get_memory") {
        return get_memory(params);
    } else if (function_name == "search_memories") {
        return search_memories(params);
    } else if (function_name == "recall") {
        return recall(params);
    } else if (function_name == "recall_with_associations") {
        return recall_with_associations(params);
    } else if (function_name == "recall_divergent") {
        return recall_divergent(params);
    } else if (function_name == "get_association_diagnostics") {
        return get_association_diagnostics(params);
    } else if (function_name == "consolidate_memories") {
        return consolidate_memories(params);
    } else if (function_name == "link_memories") {
        return link_memories(params);
    } else if (function_name == "get_causal_chain") {
        return get_causal_chain(params);
    } else if (function_name == "get_memory_chain") {
        return get_memory_chain(params);
    } else if (function_name == "list_recent_memories") {
        return list_recent_memories(params);
    } else if (function_name == "get_memory_stats") {
        return get_memory_stats(params);
    } else if (function_name == "search_important_memories") {
        return search_important_memories(params);
    } else if (function_name == "delete_memory") {
        return delete_memory(params);
    } else if (function_name == "create_episode") {
        return create_episode(params);
    } else if (function_name == "get_episode") {
        return get_episode(params);
    } else if (function_name == "get_episode_memories") {
        return get_episode_memories(params);
    } else if (function_name == "search_episodes") {
        return search_episodes(params);
    } else if (function_name == "list_episodes") {
        return list_episodes(params);
    } else if (function_name == "delete_episode") {
        return delete_episode(params);
    } else if (function_name == "get_working_set") {
        return get_working_set(params);
    } else if (function_name == "refresh_working_set") {
        return refresh_working_set(params);
    } else if (function_name == "get_associations") {
        return get_associations(params);
    }

    throw ValidationError("Unknown function: " + function_name);
}

// ============ Records ============

Json MemoryTool::remember(const Json& params) {
    MemoryRecord draft;
    draft.content = require_string(params, "content");

    std::string emotion = string_param(params, "emotion", "neutral");
    if (!parse_emotion(emotion, draft.emotion)) {
        throw ValidationError("Unknown emotion: " + emotion);
    }
    std::string category = string_param(params, "category", "daily");
    if (!parse_category(category, draft.category)) {
        throw ValidationError("Unknown category: " + category);
    }
    draft.importance = int_param(params, "importance", 3);
    draft.tags = string_list_param(params, "tags");
    draft.created_at = int64_param(params, "created_at", 0);

    draft.media_path = string_param(params, "media_path", "");
    draft.media_type = string_param(params, "media_type", "");
    draft.transcript = string_param(params, "transcript", "");
    if (params.has("camera_pan") || params.has("camera_tilt")) {
        draft.has_camera = true;
        draft.camera_pan = number_param(params, "camera_pan", 0.0);
        draft.camera_tilt = number_param(params, "camera_tilt", 0.0);
    }

    bool auto_link = bool_param(params, "auto_link", false);
    double threshold = number_param(params, "link_threshold", DEFAULT_LINK_THRESHOLD);

    MemoryRecord stored = manager_->remember(draft, auto_link, threshold);

    Json response = make_success("Memory saved");
    response.set("memory", record_to_json(stored));
    return response;
}

Json MemoryTool::get_memory(const Json& params) {
    MemoryRecord record = manager_->get(require_string(params, "memory_id"));

    Json response;
    response.set("success", true);
    response.set("memory", record_to_json(record));
    return response;
}

Json MemoryTool::search_memories(const Json& params) {
    std::string query = require_string(params, "query");
    int n = int_param(params, "n_results", manager_->config().search.default_results);

    Json response;
    response.set("success", true);

    if (bool_param(params, "scoring", false)) {
        ScoringOptions options;
        options.use_time_decay = bool_param(params, "use_time_decay", options.use_time_decay);
        options.use_emotion_boost = bool_param(params, "use_emotion_boost",
                                               options.use_emotion_boost);
        options.decay_half_life_days = number_param(params, "decay_half_life_days",
                                                    options.decay_half_life_days);

        std::vector<ScoredHit> scored = manager_->search_scored(query, parse_filter(params), n,
                                                                options);
        Json items = Json::array();
        for (size_t i = 0; i < scored.size(); ++i) {
            items.push(scored_hit_to_json(scored[i]));
        }
        response.set("results", items);
        response.set("count", static_cast<int64_t>(scored.size()));
        return response;
    }

    std::vector<SearchHit> hits = manager_->search(query, parse_filter(params), n);

    Json items = Json::array();
    for (size_t i = 0; i < hits.size(); ++i) {
        Json item;
        item.set("memory", record_to_json(hits[i].record));
        item.set("score", hits[i].score);
        item.set("similarity", hits[i].similarity);
        item.set("lexical", hits[i].lexical);
        items.push(item);
    }

    response.set("results", items);
    response.set("count", static_cast<int64_t>(hits.size()));
    return response;
}

Json MemoryTool::list_recent_memories(const Json& params) {
    int limit = int_param(params, "limit", 10);
    std::vector<MemoryRecord> records = manager_->list_recent(limit, parse_filter(params));

    Json items = Json::array();
    for (size_t i = 0; i < records.size(); ++i) {
        items.push(record_to_json(records[i]));
    }

    Json response;
    response.set("success", true);
    response.set("memories", items);
    response.set("count", static_cast<int64_t>(records.size()));
    return response;
}

Json MemoryTool::search_important_memories(const Json& params) {
    std::vector<MemoryRecord> records = manager_->search_important(
        int_param(params, "min_importance", 4),
        int64_param(params, "min_access_count", 0),
        int_param(params, "limit", 10));

    Json items = Json::array();
    for (size_t i = 0; i < records.size(); ++i) {
        items.push(record_to_json(records[i]));
    }

    Json response;
    response.set("success", true);
    response.set("memories", items);
    response.set("count", static_cast<int64_t>(records.size()));
    return response;
}

Json MemoryTool::get_memory_stats(const Json&) {
    MemoryStats s = manager_->stats();

    Json stats;
    stats.set("total", s.total);
    stats.set("by_category", string_map_to_json(s.by_category));
    stats.set("by_emotion", string_map_to_json(s.by_emotion));
    if (s.total > 0) {
        stats.set("oldest", format_timestamp_ms(s.oldest));
        stats.set("newest", format_timestamp_ms(s.newest));
    }
    stats.set("links", s.link_count);
    stats.set("episodes", s.episode_count);
    stats.set("associations", s.association_count);
    stats.set("pending_coactivations", s.pending_events);

    Json response;
    response.set("success", true);
    response.set("stats", stats);
    return response;
}

Json MemoryTool::delete_memory(const Json& params) {
    std::string id = require_string(params, "memory_id");
    manager_->delete_memory(id);

    Json response = make_success("Memory deleted");
    response.set("memory_id", id);
    return response;
}

// ============ Links ============

Json MemoryTool::link_memories(const Json& params) {
    std::string source = require_string(params, "source_id");
    std::string target = require_string(params, "target_id");
    std::string type = string_param(params, "link_type", "related");

    manager_->link(source, target, type, string_param(params, "note", ""));

    Json response = make_success("Link created");
    response.set("source_id", source);
    response.set("target_id", target);
    response.set("link_type", type);
    return response;
}

Json MemoryTool::get_causal_chain(const Json& params) {
    std::string id = require_string(params, "memory_id");

    std::string dir = string_param(params, "direction", "backward");
    ChainDirection direction;
    if (dir == "forward") {
        direction = ChainDirection::FORWARD;
    } else if (dir == "backward") {
        direction = ChainDirection::BACKWARD;
    } else {
        throw ValidationError("direction must be \"forward\" or \"backward\"");
    }

    std::vector<ChainEntry> chain = manager_->causal_chain(id, direction,
                                                           int_param(params, "max_depth", 3));

    Json items = Json::array();
    for (size_t i = 0; i < chain.size(); ++i) {
        items.push(chain_entry_to_json(chain[i]));
    }

    Json response;
    response.set("success", true);
    response.set("direction", dir);
    response.set("chain", items);
    return response;
}

Json MemoryTool::get_memory_chain(const Json& params) {
    std::string id = require_string(params, "memory_id");
    std::vector<ChainEntry> chain = manager_->memory_chain(id, int_param(params, "depth", 2));

    Json items = Json::array();
    for (size_t i = 0; i < chain.size(); ++i) {
        items.push(chain_entry_to_json(chain[i]));
    }

    Json response;
    response.set("success", true);
    response.set("chain", items);
    response.set("count", static_cast<int64_t>(chain.size()));
    return response;
}

// ============ Association ============

RecallParams MemoryTool::recall_params(const Json& params) const {
    const RecallConfig& defaults = manager_->config().recall;

    RecallParams p;
    p.context = require_string(params, "context");
    p.n_results = int_param(params, "n_results", manager_->config().search.default_results);
    p.max_branches = int_param(params, "max_branches", defaults.max_branches);
    p.max_depth = int_param(params, "max_depth", defaults.max_depth);
    p.temperature = number_param(params, "temperature", defaults.temperature);
    return p;
}

Json MemoryTool::recall(const Json& params) {
    std::string context = require_string(params, "context");
    std::vector<ScoredHit> hits = manager_->recall(context, int_param(params, "n_results", 3));

    Json items = Json::array();
    for (size_t i = 0; i < hits.size(); ++i) {
        items.push(scored_hit_to_json(hits[i]));
    }

    Json response;
    response.set("success", true);
    response.set("results", items);
    response.set("count", static_cast<int64_t>(hits.size()));
    return response;
}

Json MemoryTool::recall_with_associations(const Json& params) {
    std::string context = require_string(params, "context");
    AssociatedRecall r = manager_->recall_with_associations(
        context, int_param(params, "n_results", 3), int_param(params, "chain_depth", 1));

    Json primary = Json::array();
    for (size_t i = 0; i < r.primary.size(); ++i) {
        primary.push(scored_hit_to_json(r.primary[i]));
    }
    Json associated = Json::array();
    for (size_t i = 0; i < r.associated.size(); ++i) {
        associated.push(chain_entry_to_json(r.associated[i]));
    }

    Json response;
    response.set("success", true);
    response.set("results", primary);
    response.set("associated", associated);
    response.set("count", static_cast<int64_t>(r.primary.size() + r.associated.size()));
    return response;
}

Json MemoryTool::recall_divergent(const Json& params) {
    std::vector<RecallResult> results = manager_->recall_divergent(recall_params(params));

    Json items = Json::array();
    for (size_t i = 0; i < results.size(); ++i) {
        items.push(recall_result_to_json(results[i]));
    }

    Json response;
    response.set("success", true);
    response.set("results", items);
    response.set("count", static_cast<int64_t>(results.size()));
    return response;
}

Json MemoryTool::get_association_diagnostics(const Json& params) {
    RecallDiagnostics d = manager_->association_diagnostics(recall_params(params));

    Json diag;
    diag.set("seed_count", static_cast<int64_t>(d.seed_count));
    // The budget saturates at the top of uint64_t
    diag.set("step_budget", static_cast<double>(d.step_budget));
    diag.set("traversal_steps", static_cast<double>(d.traversal_steps));
    diag.set("traversed_edges", static_cast<double>(d.traversed_edges));
    diag.set("visited_nodes", static_cast<int64_t>(d.visited_nodes));
    diag.set("expanded_nodes", static_cast<int64_t>(d.expanded_nodes));
    diag.set("depth_reached", d.depth_reached);
    diag.set("avg_branching", d.avg_branching);
    diag.set("avg_prediction_error", d.avg_prediction_error);
    diag.set("avg_novelty", d.avg_novelty);
    diag.set("seed_ids", Json::string_array(d.seed_ids));
    diag.set("visited_ids", Json::string_array(d.visited_ids));

    Json items = Json::array();
    for (size_t i = 0; i < d.results.size(); ++i) {
        items.push(recall_result_to_json(d.results[i]));
    }
    diag.set("results", items);

    Json response;
    response.set("success", true);
    response.set("diagnostics", diag);
    return response;
}

Json MemoryTool::consolidate_memories(const Json& params) {
    const ConsolidationConfig& defaults = manager_->config().consolidation;

    ConsolidationStats s = manager_->consolidate(
        number_param(params, "window_hours", defaults.window_hours),
        int64_param(params, "max_replay_events", defaults.max_replay_events),
        number_param(params, "link_update_strength", defaults.link_update_strength));

    Json stats;
    stats.set("events_replayed", s.events_replayed);
    stats.set("edges_updated", s.edges_updated);
    stats.set("edges_created", s.edges_created);
    stats.set("edges_capped", s.edges_capped);
    stats.set("skipped_missing", s.skipped_missing);
    stats.set("related_links_created", s.related_links_created);
    stats.set("events_pruned", s.events_pruned);

    Json response;
    response.set("success", true);
    response.set("stats", stats);
    return response;
}

Json MemoryTool::get_associations(const Json& params) {
    std::string id = require_string(params, "memory_id");

    Json response;
    response.set("success", true);
    response.set("memory_id", id);

    std::string other = string_param(params, "other_id", "");
    if (!other.empty()) {
        response.set("other_id", other);
        response.set("strength", manager_->association_strength(id, other));
        return response;
    }

    int top_k = int_param(params, "top_k", 10);
    if (top_k < 1) {
        throw ValidationError("top_k must be at least 1");
    }
    std::vector<Neighbor> neighbors = manager_->association_neighbors(id,
                                                                      static_cast<size_t>(top_k));
    Json items = Json::array();
    for (size_t i = 0; i < neighbors.size(); ++i) {
        Json item;
        item.set("id", neighbors[i].id);
        item.set("strength", neighbors[i].strength);
        items.push(item);
    }
    response.set("neighbors", items);
    return response;
}

// ============ Episodes ============

Json MemoryTool::create_episode(const Json& params) {
    std::vector<std::string> members = string_list_param(params, "memory_ids");
    Episode episode = manager_->create_episode(string_param(params, "title", ""), members,
                                               string_list_param(params, "participants"),
                                               string_param(params, "summary", ""));

    Json response = make_success("Episode created");
    response.set("episode", episode_to_json(episode));
    return response;
}

Json MemoryTool::get_episode(const Json& params) {
    Episode episode = manager_->get_episode(require_string(params, "episode_id"));

    Json response;
    response.set("success", true);
    response.set("episode", episode_to_json(episode));
    return response;
}

Json MemoryTool::get_episode_memories(const Json& params) {
    std::string id = require_string(params, "episode_id");
    std::vector<MemoryRecord> records = manager_->episode_memories(id);

    Json items = Json::array();
    for (size_t i = 0; i < records.size(); ++i) {
        items.push(record_to_json(records[i]));
    }

    Json response;
    response.set("success", true);
    response.set("episode_id", id);
    response.set("memories", items);
    response.set("count", static_cast<int64_t>(records.size()));
    return response;
}

Json MemoryTool::search_episodes(const Json& params) {
    std::vector<EpisodeHit> hits = manager_->search_episodes(require_string(params, "query"),
                                                             int_param(params, "n_results", 5));

    Json items = Json::array();
    for (size_t i = 0; i < hits.size(); ++i) {
        Json item;
        item.set("episode", episode_to_json(hits[i].episode));
        item.set("score", hits[i].score);
        items.push(item);
    }

    Json response;
    response.set("success", true);
    response.set("results", items);
    response.set("count", static_cast<int64_t>(hits.size()));
    return response;
}

Json MemoryTool::list_episodes(const Json& params) {
    std::vector<Episode> episodes = manager_->list_episodes(int_param(params, "limit", 10));

    Json items = Json::array();
    for (size_t i = 0; i < episodes.size(); ++i) {
        items.push(episode_to_json(episodes[i]));
    }

    Json response;
    response.set("success", true);
    response.set("episodes", items);
    response.set("count", static_cast<int64_t>(episodes.size()));
    return response;
}

Json MemoryTool::delete_episode(const Json& params) {
    std::string id = require_string(params, "episode_id");
    manager_->delete_episode(id);

    Json response = make_success("Episode deleted");
    response.set("episode_id", id);
    return response;
}

// ============ Working set ============

Json MemoryTool::get_working_set(const Json&) {
    std::vector<WorkingSetEntry> entries = manager_->working_set();

    Json items = Json::array();
    for (size_t i = 0; i < entries.size(); ++i) {
        Json item;
        item.set("id", entries[i].id);
        item.set("score", entries[i].score);
        item.set("last_activated", entries[i].last_activated);
        item.set("access_count", entries[i].access_count);
        items.push(item);
    }

    Json response;
    response.set("success", true);
    response.set("entries", items);
    response.set("count", static_cast<int64_t>(entries.size()));
    return response;
}

Json MemoryTool::refresh_working_set(const Json& params) {
    manager_->refresh_working_set();
    return get_working_set(params);
}

Json MemoryTool::make_error(const std::string& kind, const std::string& message) {
    Json response;
    response.set("success", false);
    response.set("error", message);
    response.set("error_kind", kind);
    return response;
}

Json MemoryTool::make_success(const std::string& message) {
    Json response;
    response.set("success", true);
    response.set("message", message);
    return response;
}

} // namespace engram
