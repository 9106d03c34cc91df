/*
 * engram C++11 - Consolidation Engine
 * 
 * Replays recent co-activation events (oldest first) into the
 * association graph. A run is a single transaction: concurrent readers
 * see either every bump of the run or none of them.
 */
#ifndef ENGRAM_MEMORY_CONSOLIDATION_HPP
#define ENGRAM_MEMORY_CONSOLIDATION_HPP

#include "store.hpp"
#include "association.hpp"
#include "coactivation.hpp"

namespace engram {

struct ConsolidationStats {
    int64_t events_replayed;
    int64_t edges_updated;          // Distinct edges whose strength rose
    int64_t edges_created;
    int64_t edges_capped;           // Bumps clipped at the cap
    int64_t skipped_missing;        // Events naming a record that no longer exists
    int64_t related_links_created;
    int64_t events_pruned;
    
    ConsolidationStats()
        : events_replayed(0), edges_updated(0), edges_created(0), edges_capped(0),
          skipped_missing(0), related_links_created(0), events_pruned(0) {}
};

struct ConsolidationOptions {
    double cap;
    double related_link_threshold;  // 0 disables related-link creation
    double event_retention_hours;
    
    ConsolidationOptions() : cap(1.0), related_link_threshold(0.6), event_retention_hours(168) {}
};

class ConsolidationEngine {
public:
    ConsolidationEngine(RecordStore& store, AssociationGraph& graph, CoactivationLog& events,
                        const ConsolidationOptions& options);
    
    ConsolidationStats consolidate(double window_hours, int64_t max_replay_events,
                                   double link_update_strength);

private:
    RecordStore& store_;
    AssociationGraph& graph_;
    CoactivationLog& events_;
    ConsolidationOptions options_;
};

} // namespace engram

#endif // ENGRAM_MEMORY_CONSOLIDATION_HPP
