/*
 * engram C++11 - Consolidation Engine Implementation
 */
#include <engram/memory/consolidation.hpp>
#include <engram/memory/errors.hpp>
#include <engram/core/logger.hpp>
#include <engram/core/utils.hpp>
#include <cmath>
#include <set>

namespace engram {

namespace {

const double MS_PER_HOUR = 3600.0 * 1000.0;

// Start of a window of `hours` ending at `now`; windows reaching past the
// epoch start at 0.
int64_t window_start(int64_t now, double hours) {
    double span_ms = hours * MS_PER_HOUR;
    if (!(span_ms < static_cast<double>(now))) {
        return 0;
    }
    return now - static_cast<int64_t>(span_ms);
}

} // anonymous namespace

ConsolidationEngine::ConsolidationEngine(RecordStore& store, AssociationGraph& graph,
                                         CoactivationLog& events,
                                         const ConsolidationOptions& options)
    : store_(store)
    , graph_(graph)
    , events_(events)
    , options_(options)
{
}

ConsolidationStats ConsolidationEngine::consolidate(double window_hours, int64_t max_replay_events,
                                                    double link_update_strength) {
    if (!(window_hours >= 0.0) || !std::isfinite(window_hours)) {
        throw ValidationError("window_hours must be a finite value >= 0");
    }
    if (max_replay_events < 0) {
        throw ValidationError("max_replay_events must be >= 0");
    }
    if (!(link_update_strength >= 0.0) || !std::isfinite(link_update_strength)) {
        throw ValidationError("link_update_strength must be a finite value >= 0");
    }
    
    ConsolidationStats stats;
    int64_t now = current_timestamp_ms();
    int64_t since = window_start(now, window_hours);
    
    Transaction tx(store_.database());
    
    std::vector<CoactivationEvent> pending = events_.pending(since, max_replay_events);
    std::vector<int64_t> consumed;
    std::set<IdPair> raised;
    
    for (size_t i = 0; i < pending.size(); ++i) {
        const CoactivationEvent& ev = pending[i];
        consumed.push_back(ev.id);
        
        if (ev.a_id == ev.b_id || !store_.exists(ev.a_id) || !store_.exists(ev.b_id)) {
            stats.skipped_missing++;
            continue;
        }
        
        BumpResult r = graph_.bump(ev.a_id, ev.b_id, link_update_strength, options_.cap);
        stats.events_replayed++;
        if (r.created) stats.edges_created++;
        if (r.capped) stats.edges_capped++;
        if (r.after > r.before) raised.insert(canonical_pair(ev.a_id, ev.b_id));
        
        if (options_.related_link_threshold > 0.0 && r.after >= options_.related_link_threshold &&
            !store_.link_exists(ev.a_id, ev.b_id, "related") &&
            !store_.link_exists(ev.b_id, ev.a_id, "related")) {
            store_.create_link(ev.a_id, ev.b_id, "related", "auto-linked by consolidation replay");
            stats.related_links_created++;
        }
    }
    stats.edges_updated = static_cast<int64_t>(raised.size());
    
    events_.mark_consumed(consumed, now);
    
    stats.events_pruned = events_.prune_consumed(window_start(now, options_.event_retention_hours));
    
    tx.commit();
    
    LOG_INFO("Consolidation: replayed %lld events, %lld edges raised (%lld new, %lld capped), "
             "%lld skipped, %lld related links, %lld pruned",
             static_cast<long long>(stats.events_replayed),
             static_cast<long long>(stats.edges_updated),
             static_cast<long long>(stats.edges_created),
             static_cast<long long>(stats.edges_capped),
             static_cast<long long>(stats.skipped_missing),
             static_cast<long long>(stats.related_links_created),
             static_cast<long long>(stats.events_pruned));
    return stats;
}

} // namespace engram
