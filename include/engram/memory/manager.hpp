/*
 * engram C++11 - Memory Manager
 * 
 * High-level interface for one deployment. Owns the store, the rankers,
 * the association graph and every engine on top of it, and wires them
 * to the configured embedding collaborator.
 * 
 * initialize() reports failure through last_error(); every operation
 * afterwards raises MemoryError subclasses.
 */
#ifndef ENGRAM_MEMORY_MANAGER_HPP
#define ENGRAM_MEMORY_MANAGER_HPP

#include "types.hpp"
#include "config.hpp"
#include "database.hpp"
#include "store.hpp"
#include "embedding.hpp"
#include "retriever.hpp"
#include "association.hpp"
#include "coactivation.hpp"
#include "recall.hpp"
#include "consolidation.hpp"
#include "working_set.hpp"
#include "episode.hpp"
#include <string>
#include <vector>
#include <memory>

namespace engram {

const double DEFAULT_LINK_THRESHOLD = 0.8;
const size_t MAX_AUTO_LINKS = 5;

// Scored recall plus the records linked to each hit
struct AssociatedRecall {
    std::vector<ScoredHit> primary;
    std::vector<ChainEntry> associated;     // via_id names the record it hangs off
};

class MemoryManager {
public:
    explicit MemoryManager(const MemoryConfig& config);
    
    // Use a caller-owned embedder instead of the configured provider
    MemoryManager(const MemoryConfig& config, Embedder* embedder);
    ~MemoryManager();
    
    // Initialize the memory system
    bool initialize();
    void shutdown();
    bool is_initialized() const;
    
    // ---- Records ----
    
    // Store a record. Its embedding is computed from the content when
    // empty. With auto_link, up to MAX_AUTO_LINKS existing records at
    // least link_threshold similar get a "similar" link from it.
    MemoryRecord remember(const MemoryRecord& draft, bool auto_link = false,
                          double link_threshold = DEFAULT_LINK_THRESHOLD);
    
    // Counts as a read: updates access statistics
    MemoryRecord get(const std::string& id);
    
    std::vector<SearchHit> search(const std::string& query, const RecordFilter& filter,
                                  int n_results);
    std::vector<ScoredHit> search_scored(const std::string& query, const RecordFilter& filter,
                                         int n_results, const ScoringOptions& options);
    
    // Scored search with the default decay and emotion weighting
    std::vector<ScoredHit> recall(const std::string& context, int n_results);
    
    // n_results is clamped to [1, 10] and chain_depth to [1, 3]. Linked
    // records already returned are listed once.
    AssociatedRecall recall_with_associations(const std::string& context, int n_results,
                                              int chain_depth);
    
    std::vector<MemoryRecord> list_recent(int limit, const RecordFilter& filter);
    std::vector<MemoryRecord> search_important(int min_importance, int64_t min_access_count,
                                               int limit);
    MemoryStats stats();
    void delete_memory(const std::string& id);
    
    // ---- Links ----
    
    void link(const std::string& source_id, const std::string& target_id,
              const std::string& link_type, const std::string& note);
    std::vector<ChainEntry> causal_chain(const std::string& id, ChainDirection direction,
                                         int max_depth);
    // Records linked to id in either direction, id first
    std::vector<ChainEntry> memory_chain(const std::string& id, int depth = 2);
    
    // ---- Association ----
    
    std::vector<RecallResult> recall_divergent(const RecallParams& params);
    RecallDiagnostics association_diagnostics(const RecallParams& params);
    ConsolidationStats consolidate(double window_hours, int64_t max_replay_events,
                                   double link_update_strength);
    ConsolidationStats consolidate();
    double association_strength(const std::string& a, const std::string& b);
    std::vector<Neighbor> association_neighbors(const std::string& id, size_t top_k);
    
    // ---- Episodes ----
    
    Episode create_episode(const std::string& title, const std::vector<std::string>& member_ids,
                           const std::vector<std::string>& participants,
                           const std::string& summary);
    Episode get_episode(const std::string& id);
    std::vector<MemoryRecord> episode_memories(const std::string& id);
    std::vector<EpisodeHit> search_episodes(const std::string& query, int limit);
    std::vector<Episode> list_episodes(int limit);
    void delete_episode(const std::string& id);
    
    // ---- Working set ----
    
    void refresh_working_set();
    std::vector<WorkingSetEntry> working_set() const;
    
    // Utility
    std::string last_error() const;
    const MemoryConfig& config() const;
    RecordStore& store();

private:
    MemoryConfig config_;
    std::unique_ptr<Embedder> owned_embedder_;
    Embedder* embedder_;
    
    std::unique_ptr<Database> db_;
    std::unique_ptr<RecordStore> store_;
    std::unique_ptr<CoactivationLog> events_;
    std::unique_ptr<AssociationGraph> graph_;
    std::unique_ptr<HybridRetriever> retriever_;
    std::unique_ptr<RecallEngine> recall_;
    std::unique_ptr<ConsolidationEngine> consolidation_;
    std::unique_ptr<WorkingSetCache> working_set_;
    std::unique_ptr<EpisodeManager> episodes_;
    
    bool initialized_;
    std::string last_error_;
    
    void require_initialized() const;
    void set_error(const std::string& error);
};

} // namespace engram

#endif // ENGRAM_MEMORY_MANAGER_HPP
