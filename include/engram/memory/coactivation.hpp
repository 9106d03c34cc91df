/*
 * engram C++11 - Co-activation Log
 * 
 * Append-only history of record pairs retrieved together. Search and
 * recall write it; consolidation replays and consumes it.
 */
#ifndef ENGRAM_MEMORY_COACTIVATION_HPP
#define ENGRAM_MEMORY_COACTIVATION_HPP

#include "association.hpp"
#include "database.hpp"
#include <string>
#include <vector>

namespace engram {

struct CoactivationEvent {
    int64_t id;
    std::string a_id;
    std::string b_id;
    std::string source;         // "search" | "recall"
    int64_t created_at;
    int64_t consolidated_at;    // 0 = not yet replayed
    
    CoactivationEvent() : id(0), created_at(0), consolidated_at(0) {}
};

class CoactivationLog {
public:
    explicit CoactivationLog(Database& db);
    
    // One event per pair; self pairs are dropped. created_at 0 means now.
    void record_pairs(const std::vector<IdPair>& pairs, const std::string& source,
                      int64_t created_at = 0);
    
    // One event for every unordered pair of distinct ids
    void record_all_pairs(const std::vector<std::string>& ids, const std::string& source);
    
    // Unconsumed events no older than since_ms, oldest first
    std::vector<CoactivationEvent> pending(int64_t since_ms, int64_t limit);
    
    void mark_consumed(const std::vector<int64_t>& event_ids, int64_t at);
    
    // Delete consumed events created before cutoff_ms; returns how many
    int64_t prune_consumed(int64_t cutoff_ms);
    
    int64_t pending_count();

private:
    Database& db_;
};

} // namespace engram

#endif // ENGRAM_MEMORY_COACTIVATION_HPP
