/*
 * engram C++11 - Episode Manager
 * 
 * Named, ordered groups of records on top of the store's episode tables.
 */
#ifndef ENGRAM_MEMORY_EPISODE_HPP
#define ENGRAM_MEMORY_EPISODE_HPP

#include "store.hpp"
#include "lexical.hpp"
#include <string>
#include <vector>

namespace engram {

struct EpisodeHit {
    Episode episode;
    double score;
    
    EpisodeHit() : score(0) {}
};

class EpisodeManager {
public:
    explicit EpisodeManager(RecordStore& store);
    
    // An empty summary is generated from the members' content in
    // chronological order
    Episode create(const std::string& title, const std::vector<std::string>& member_ids,
                   const std::vector<std::string>& participants = std::vector<std::string>(),
                   const std::string& summary = "");
    
    Episode get(const std::string& id);
    
    // Members ordered by creation time (oldest first)
    std::vector<MemoryRecord> members_chronological(const std::string& id);
    
    // BM25 over titles and summaries
    std::vector<EpisodeHit> search(const std::string& query, int limit);
    
    std::vector<Episode> list(int limit);
    void remove(const std::string& id);
    
    static std::string auto_summary(std::vector<MemoryRecord> members);

private:
    RecordStore& store_;
};

} // namespace engram

#endif // ENGRAM_MEMORY_EPISODE_HPP
