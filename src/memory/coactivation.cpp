/*
 * engram C++11 - Co-activation Log Implementation
 */
#include <engram/memory/coactivation.hpp>
#include <engram/core/utils.hpp>

namespace engram {

CoactivationLog::CoactivationLog(Database& db)
    : db_(db)
{
}

void CoactivationLog::record_pairs(const std::vector<IdPair>& pairs, const std::string& source,
                                   int64_t created_at) {
    if (pairs.empty()) return;
    int64_t at = created_at > 0 ? created_at : current_timestamp_ms();
    
    Transaction tx(db_);
    Statement stmt(db_,
        "INSERT INTO coactivation_events (a_id, b_id, source, created_at) VALUES (?, ?, ?, ?)");
    for (size_t i = 0; i < pairs.size(); ++i) {
        if (pairs[i].first == pairs[i].second) continue;
        IdPair key = canonical_pair(pairs[i].first, pairs[i].second);
        stmt.reset();
        stmt.bind_text(1, key.first);
        stmt.bind_text(2, key.second);
        stmt.bind_text(3, source);
        stmt.bind_int64(4, at);
        stmt.step();
    }
    tx.commit();
}

void CoactivationLog::record_all_pairs(const std::vector<std::string>& ids,
                                       const std::string& source) {
    std::vector<IdPair> pairs;
    for (size_t i = 0; i < ids.size(); ++i) {
        for (size_t j = i + 1; j < ids.size(); ++j) {
            if (ids[i] != ids[j]) pairs.push_back(IdPair(ids[i], ids[j]));
        }
    }
    record_pairs(pairs, source);
}

std::vector<CoactivationEvent> CoactivationLog::pending(int64_t since_ms, int64_t limit) {
    std::lock_guard<std::recursive_mutex> lock(db_.mutex());
    Statement stmt(db_,
        "SELECT id, a_id, b_id, source, created_at FROM coactivation_events "
        "WHERE consolidated_at IS NULL AND created_at >= ? "
        "ORDER BY created_at ASC, id ASC LIMIT ?");
    stmt.bind_int64(1, since_ms);
    stmt.bind_int64(2, limit);
    
    std::vector<CoactivationEvent> out;
    while (stmt.step()) {
        CoactivationEvent e;
        e.id = stmt.column_int64(0);
        e.a_id = stmt.column_text(1);
        e.b_id = stmt.column_text(2);
        e.source = stmt.column_text(3);
        e.created_at = stmt.column_int64(4);
        out.push_back(e);
    }
    return out;
}

void CoactivationLog::mark_consumed(const std::vector<int64_t>& event_ids, int64_t at) {
    if (event_ids.empty()) return;
    Transaction tx(db_);
    Statement stmt(db_, "UPDATE coactivation_events SET consolidated_at = ? WHERE id = ?");
    for (size_t i = 0; i < event_ids.size(); ++i) {
        stmt.reset();
        stmt.bind_int64(1, at);
        stmt.bind_int64(2, event_ids[i]);
        stmt.step();
    }
    tx.commit();
}

int64_t CoactivationLog::prune_consumed(int64_t cutoff_ms) {
    Transaction tx(db_);
    Statement stmt(db_,
        "DELETE FROM coactivation_events WHERE consolidated_at IS NOT NULL AND created_at < ?");
    stmt.bind_int64(1, cutoff_ms);
    stmt.step();
    int64_t removed = db_.changes();
    tx.commit();
    return removed;
}

int64_t CoactivationLog::pending_count() {
    std::lock_guard<std::recursive_mutex> lock(db_.mutex());
    Statement stmt(db_, "SELECT COUNT(*) FROM coactivation_events WHERE consolidated_at IS NULL");
    return stmt.step() ? stmt.column_int64(0) : 0;
}

} // namespace engram
