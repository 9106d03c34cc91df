/*
 * engram C++11 - Memory Manager Implementation
 */
#include <engram/memory/manager.hpp>
#include <engram/memory/similarity.hpp>
#include <engram/memory/errors.hpp>
#include <engram/core/logger.hpp>
#include <engram/core/utils.hpp>
#include <algorithm>
#include <cmath>
#include <set>

namespace engram {

MemoryManager::MemoryManager(const MemoryConfig& config)
    : config_(config)
    , embedder_(nullptr)
    , initialized_(false)
{
}

MemoryManager::MemoryManager(const MemoryConfig& config, Embedder* embedder)
    : config_(config)
    , embedder_(embedder)
    , initialized_(false)
{
}

MemoryManager::~MemoryManager() {
    shutdown();
}

bool MemoryManager::initialize() {
    if (initialized_) return true;
    
    try {
        if (!embedder_) {
            const EmbeddingConfig& ec = config_.embedding;
            if (ec.provider == "http") {
                owned_embedder_.reset(new HttpEmbedder(ec.url, ec.model, ec.api_key,
                                                       ec.dimension, ec.timeout_ms));
            } else {
                owned_embedder_.reset(new HashingEmbedder(ec.dimension));
            }
            embedder_ = owned_embedder_.get();
        }
        if (embedder_->dimension() != config_.embedding.dimension) {
            set_error("Embedder '" + embedder_->name() + "' has dimension " +
                      std::to_string(embedder_->dimension()) + ", configured dimension is " +
                      std::to_string(config_.embedding.dimension));
            return false;
        }
        
        // Ensure parent directory exists
        std::string db_dir = dirname(config_.db_path);
        if (db_dir != "." && !path_exists(db_dir) && !mkdir_p(db_dir)) {
            set_error("Cannot create database directory: " + db_dir);
            return false;
        }
        
        db_.reset(new Database());
        db_->open(config_.db_path);
        
        store_.reset(new RecordStore(*db_, config_.embedding.dimension));
        store_->ensure_schema();
        
        events_.reset(new CoactivationLog(*db_));
        graph_.reset(new AssociationGraph(*db_));
        retriever_.reset(new HybridRetriever(*store_, *embedder_, *events_, config_.search.alpha));
        recall_.reset(new RecallEngine(*store_, *retriever_, *graph_, *events_,
                                       config_.recall.options));
        consolidation_.reset(new ConsolidationEngine(*store_, *graph_, *events_,
                                                     config_.consolidation.options));
        working_set_.reset(new WorkingSetCache(*store_, config_.working_set.capacity,
                                               config_.working_set.half_life_hours));
        episodes_.reset(new EpisodeManager(*store_));
    } catch (const MemoryError& e) {
        set_error(e.what());
        shutdown();
        return false;
    }
    
    initialized_ = true;
    LOG_INFO("Memory manager initialized (embedder %s, dimension %zu)",
             embedder_->name().c_str(), config_.embedding.dimension);
    return true;
}

void MemoryManager::shutdown() {
    episodes_.reset();
    working_set_.reset();
    consolidation_.reset();
    recall_.reset();
    retriever_.reset();
    graph_.reset();
    events_.reset();
    store_.reset();
    if (db_) {
        db_->close();
        db_.reset();
    }
    initialized_ = false;
}

bool MemoryManager::is_initialized() const {
    return initialized_;
}

void MemoryManager::require_initialized() const {
    if (!initialized_) {
        throw StoreError("Memory manager not initialized");
    }
}

// ============ Records ============

MemoryRecord MemoryManager::remember(const MemoryRecord& draft, bool auto_link,
                                     double link_threshold) {
    require_initialized();
    if (trim(draft.content).empty()) {
        throw ValidationError("Memory content must not be empty");
    }
    if (auto_link && !(link_threshold >= -1.0 && link_threshold <= 1.0)) {
        throw ValidationError("link_threshold must be within [-1, 1]");
    }
    
    MemoryRecord record = draft;
    if (record.embedding.empty()) {
        record.embedding = retriever_->embed(record.content);
    }
    
    std::vector<MemoryRecord> existing;
    if (auto_link) {
        existing = store_->list_recent(-1);
    }
    
    std::string id;
    size_t links = 0;
    {
        Transaction tx(*db_);
        id = store_->create(record);
        
        if (auto_link) {
            std::vector<RankedRecord> ranked = SimilarityRanker::rank(record.embedding, existing);
            for (size_t i = 0; i < ranked.size() && links < MAX_AUTO_LINKS; ++i) {
                if (ranked[i].score < link_threshold) break;
                store_->create_link(id, ranked[i].record.id, "similar", "auto-linked by similarity");
                ++links;
            }
        }
        tx.commit();
    }
    
    MemoryRecord stored = store_->get(id);
    retriever_->on_record_added(stored);
    if (links > 0) {
        LOG_DEBUG("Auto-linked memory %s to %zu similar memories", id.c_str(), links);
    }
    return stored;
}

MemoryRecord MemoryManager::get(const std::string& id) {
    require_initialized();
    store_->update_access(id);
    return store_->get(id);
}

std::vector<SearchHit> MemoryManager::search(const std::string& query, const RecordFilter& filter,
                                             int n_results) {
    require_initialized();
    return retriever_->search(query, filter, n_results);
}

std::vector<ScoredHit> MemoryManager::search_scored(const std::string& query,
                                                    const RecordFilter& filter, int n_results,
                                                    const ScoringOptions& options) {
    require_initialized();
    return retriever_->search_scored(query, filter, n_results, options);
}

std::vector<ScoredHit> MemoryManager::recall(const std::string& context, int n_results) {
    return search_scored(context, RecordFilter(), n_results, ScoringOptions());
}

AssociatedRecall MemoryManager::recall_with_associations(const std::string& context,
                                                         int n_results, int chain_depth) {
    n_results = std::max(1, std::min(10, n_results));
    chain_depth = std::max(1, std::min(3, chain_depth));
    
    AssociatedRecall out;
    out.primary = recall(context, n_results);
    
    std::set<std::string> seen;
    for (size_t i = 0; i < out.primary.size(); ++i) {
        seen.insert(out.primary[i].hit.record.id);
    }
    for (size_t i = 0; i < out.primary.size(); ++i) {
        std::vector<ChainEntry> chain;
        try {
            chain = store_->linked_records(out.primary[i].hit.record.id, chain_depth);
        } catch (const NotFoundError&) {
            // Deleted between the search and the walk
            continue;
        }
        for (size_t k = 0; k < chain.size(); ++k) {
            if (chain[k].depth == 0) continue;
            if (!seen.insert(chain[k].record.id).second) continue;
            out.associated.push_back(chain[k]);
        }
    }
    return out;
}

std::vector<MemoryRecord> MemoryManager::list_recent(int limit, const RecordFilter& filter) {
    require_initialized();
    if (limit < 1) {
        throw ValidationError("limit must be at least 1");
    }
    return store_->list_recent(limit, filter);
}

std::vector<MemoryRecord> MemoryManager::search_important(int min_importance,
                                                          int64_t min_access_count, int limit) {
    require_initialized();
    if (min_importance < MIN_IMPORTANCE || min_importance > MAX_IMPORTANCE) {
        throw ValidationError("min_importance must be between 1 and 5");
    }
    if (min_access_count < 0 || limit < 1) {
        throw ValidationError("min_access_count must be >= 0 and limit >= 1");
    }
    return store_->search_important(min_importance, min_access_count, limit);
}

MemoryStats MemoryManager::stats() {
    require_initialized();
    return store_->stats();
}

void MemoryManager::delete_memory(const std::string& id) {
    require_initialized();
    store_->delete_record(id);
    retriever_->on_record_removed(id);
}

// ============ Links ============

void MemoryManager::link(const std::string& source_id, const std::string& target_id,
                         const std::string& link_type, const std::string& note) {
    require_initialized();
    store_->create_link(source_id, target_id, link_type, note);
}

std::vector<ChainEntry> MemoryManager::causal_chain(const std::string& id,
                                                    ChainDirection direction, int max_depth) {
    require_initialized();
    return store_->causal_chain(id, direction, max_depth);
}

std::vector<ChainEntry> MemoryManager::memory_chain(const std::string& id, int depth) {
    require_initialized();
    return store_->linked_records(id, depth);
}

// ============ Association ============

std::vector<RecallResult> MemoryManager::recall_divergent(const RecallParams& params) {
    require_initialized();
    return recall_->recall_divergent(params);
}

RecallDiagnostics MemoryManager::association_diagnostics(const RecallParams& params) {
    require_initialized();
    return recall_->diagnostics(params);
}

ConsolidationStats MemoryManager::consolidate(double window_hours, int64_t max_replay_events,
                                              double link_update_strength) {
    require_initialized();
    return consolidation_->consolidate(window_hours, max_replay_events, link_update_strength);
}

ConsolidationStats MemoryManager::consolidate() {
    const ConsolidationConfig& cc = config_.consolidation;
    return consolidate(cc.window_hours, cc.max_replay_events, cc.link_update_strength);
}

double MemoryManager::association_strength(const std::string& a, const std::string& b) {
    require_initialized();
    return graph_->strength(a, b);
}

std::vector<Neighbor> MemoryManager::association_neighbors(const std::string& id, size_t top_k) {
    require_initialized();
    return graph_->neighbors(id, top_k);
}

// ============ Episodes ============

Episode MemoryManager::create_episode(const std::string& title,
                                      const std::vector<std::string>& member_ids,
                                      const std::vector<std::string>& participants,
                                      const std::string& summary) {
    require_initialized();
    return episodes_->create(title, member_ids, participants, summary);
}

Episode MemoryManager::get_episode(const std::string& id) {
    require_initialized();
    return episodes_->get(id);
}

std::vector<MemoryRecord> MemoryManager::episode_memories(const std::string& id) {
    require_initialized();
    return episodes_->members_chronological(id);
}

std::vector<EpisodeHit> MemoryManager::search_episodes(const std::string& query, int limit) {
    require_initialized();
    return episodes_->search(query, limit);
}

std::vector<Episode> MemoryManager::list_episodes(int limit) {
    require_initialized();
    if (limit < 1) {
        throw ValidationError("limit must be at least 1");
    }
    return episodes_->list(limit);
}

void MemoryManager::delete_episode(const std::string& id) {
    require_initialized();
    episodes_->remove(id);
}

// ============ Working set ============

void MemoryManager::refresh_working_set() {
    require_initialized();
    working_set_->refresh();
}

std::vector<WorkingSetEntry> MemoryManager::working_set() const {
    require_initialized();
    return working_set_->get();
}

// ============ Utility ============

std::string MemoryManager::last_error() const {
    return last_error_;
}

const MemoryConfig& MemoryManager::config() const {
    return config_;
}

RecordStore& MemoryManager::store() {
    require_initialized();
    return *store_;
}

void MemoryManager::set_error(const std::string& error) {
    last_error_ = error;
    LOG_ERROR("Memory: %s", error.c_str());
}

} // namespace engram
