/*
 * engram C++11 - Record Store
 * 
 * Durable table of memory records, causal links and episodes; the source
 * of truth for every other component. All tables (including the
 * association and co-activation tables owned by the graph and the
 * consolidation engine) live in one SQLite file created here.
 */
#ifndef ENGRAM_MEMORY_STORE_HPP
#define ENGRAM_MEMORY_STORE_HPP

#include "types.hpp"
#include "database.hpp"
#include <string>
#include <vector>

namespace engram {

// Access statistics of one record, as sampled by the working set
struct AccessStat {
    std::string id;
    int64_t created_at;
    int64_t last_accessed;
    int64_t access_count;
    
    AccessStat() : created_at(0), last_accessed(0), access_count(0) {}
};

class RecordStore {
public:
    RecordStore(Database& db, size_t dimension);
    
    // Create tables and pin the embedding dimension. Throws
    // ValidationError if the file was created with a different dimension.
    void ensure_schema();
    
    size_t dimension() const { return dimension_; }
    Database& database() { return db_; }
    
    // ---- Records ----
    
    // Validates and inserts; returns the new id
    std::string create(const MemoryRecord& record);
    
    // Throws NotFoundError when absent
    MemoryRecord get(const std::string& id);
    bool find(const std::string& id, MemoryRecord& out);
    bool exists(const std::string& id);
    
    // Present records in the order requested; unknown ids are skipped
    std::vector<MemoryRecord> get_many(const std::vector<std::string>& ids);
    
    // Increment access count and set last access to now
    void update_access(const std::string& id);
    
    // update_access for each id in one transaction; unknown ids are skipped
    void touch_many(const std::vector<std::string>& ids);
    
    // Newest first. limit < 0 returns every match.
    std::vector<MemoryRecord> list_recent(int limit, const RecordFilter& filter = RecordFilter());
    
    // Ordered by last access, most recent first
    std::vector<MemoryRecord> search_important(int min_importance, int64_t min_access_count, int limit);
    
    std::vector<AccessStat> access_stats();
    
    int64_t record_count();
    MemoryStats stats();
    
    // Administrative removal; links, association edges, co-activation
    // events and episode membership of the record go with it
    void delete_record(const std::string& id);
    
    // ---- Causal links ----
    
    void create_link(const std::string& source_id, const std::string& target_id,
                     const std::string& link_type, const std::string& note = "");
    bool link_exists(const std::string& source_id, const std::string& target_id,
                     const std::string& link_type);
    std::vector<CausalLink> links_from(const std::string& id);
    std::vector<CausalLink> links_to(const std::string& id);
    
    // Breadth-first walk starting at id (returned first, depth 0)
    std::vector<ChainEntry> causal_chain(const std::string& id, ChainDirection direction,
                                         int max_depth);
    
    // Records joined to id by links of any type in either direction,
    // breadth first; id itself comes first at depth 0. max_depth is
    // clamped to [1, 5].
    std::vector<ChainEntry> linked_records(const std::string& id, int max_depth);
    
    // ---- Episodes ----
    
    // Inserts the episode and sets every member's back-reference in one
    // transaction. Emotion, importance and time span are derived from the
    // members. Returns the stored episode.
    Episode create_episode(const std::string& title,
                           const std::vector<std::string>& member_ids,
                           const std::vector<std::string>& participants,
                           const std::string& summary);
    Episode get_episode(const std::string& id);
    std::vector<Episode> list_episodes(int limit);
    void delete_episode(const std::string& id);

private:
    Database& db_;
    size_t dimension_;
    
    void validate(const MemoryRecord& record) const;
    std::vector<CausalLink> query_links(const std::string& sql, const std::string& id);
    bool load_episode(const std::string& id, Episode& out);
};

} // namespace engram

#endif // ENGRAM_MEMORY_STORE_HPP
