/*
 * engram C++11 - Association Graph Implementation
 */
#include <engram/memory/association.hpp>
#include <engram/memory/errors.hpp>
#include <engram/core/utils.hpp>
#include <algorithm>
#include <cmath>

namespace engram {

IdPair canonical_pair(const std::string& a, const std::string& b) {
    return a < b ? IdPair(a, b) : IdPair(b, a);
}

AssociationGraph::AssociationGraph(Database& db)
    : db_(db)
{
}

double AssociationGraph::strength(const std::string& a, const std::string& b) {
    if (a == b) return 0.0;
    IdPair key = canonical_pair(a, b);
    
    std::lock_guard<std::recursive_mutex> lock(db_.mutex());
    Statement stmt(db_, "SELECT strength FROM associations WHERE a_id = ? AND b_id = ?");
    stmt.bind_text(1, key.first);
    stmt.bind_text(2, key.second);
    return stmt.step() ? stmt.column_double(0) : 0.0;
}

std::vector<Neighbor> AssociationGraph::neighbors(const std::string& id, size_t top_k) {
    std::vector<Neighbor> out;
    if (top_k == 0) return out;
    
    std::lock_guard<std::recursive_mutex> lock(db_.mutex());
    Statement stmt(db_,
        "SELECT other, strength FROM ("
        "  SELECT b_id AS other, strength FROM associations WHERE a_id = ?1"
        "  UNION ALL"
        "  SELECT a_id AS other, strength FROM associations WHERE b_id = ?1"
        ") WHERE strength > 0 ORDER BY strength DESC, other ASC LIMIT ?2");
    stmt.bind_text(1, id);
    stmt.bind_int64(2, static_cast<int64_t>(top_k));
    while (stmt.step()) {
        out.push_back(Neighbor(stmt.column_text(0), stmt.column_double(1)));
    }
    return out;
}

BumpResult AssociationGraph::bump(const std::string& a, const std::string& b,
                                  double delta, double cap) {
    if (a == b) {
        throw ValidationError("Cannot associate a memory with itself");
    }
    if (!(delta >= 0.0) || !(cap >= 0.0) || !std::isfinite(delta) || !std::isfinite(cap)) {
        throw ValidationError("Association delta and cap must be finite and non-negative");
    }
    IdPair key = canonical_pair(a, b);
    
    Transaction tx(db_);
    
    BumpResult result;
    {
        Statement stmt(db_, "SELECT strength FROM associations WHERE a_id = ? AND b_id = ?");
        stmt.bind_text(1, key.first);
        stmt.bind_text(2, key.second);
        if (stmt.step()) {
            result.before = stmt.column_double(0);
        } else {
            result.created = true;
        }
    }
    
    if (result.created) {
        Statement check(db_, "SELECT COUNT(*) FROM memories WHERE id IN (?, ?)");
        check.bind_text(1, key.first);
        check.bind_text(2, key.second);
        if (!check.step() || check.column_int64(0) != 2) {
            throw NotFoundError("Cannot associate unknown memory (" + key.first + ", " +
                                key.second + ")");
        }
    }
    
    double raised = result.before + delta;
    result.capped = raised > cap;
    result.after = std::max(result.before, std::min(cap, raised));
    
    Statement upsert(db_,
        "INSERT INTO associations (a_id, b_id, strength, updated_at) VALUES (?, ?, ?, ?) "
        "ON CONFLICT(a_id, b_id) DO UPDATE SET strength = excluded.strength, "
        "updated_at = excluded.updated_at");
    upsert.bind_text(1, key.first);
    upsert.bind_text(2, key.second);
    upsert.bind_double(3, result.after);
    upsert.bind_int64(4, current_timestamp_ms());
    upsert.step();
    
    tx.commit();
    return result;
}

std::vector<BumpResult> AssociationGraph::bump_many(const std::vector<IdPair>& pairs,
                                                    double delta, double cap) {
    std::vector<BumpResult> results;
    results.reserve(pairs.size());
    Transaction tx(db_);
    for (size_t i = 0; i < pairs.size(); ++i) {
        results.push_back(bump(pairs[i].first, pairs[i].second, delta, cap));
    }
    tx.commit();
    return results;
}

int64_t AssociationGraph::edge_count() {
    std::lock_guard<std::recursive_mutex> lock(db_.mutex());
    Statement stmt(db_, "SELECT COUNT(*) FROM associations");
    return stmt.step() ? stmt.column_int64(0) : 0;
}

std::vector<AssociationEdge> AssociationGraph::edges_of(const std::string& id) {
    std::lock_guard<std::recursive_mutex> lock(db_.mutex());
    Statement stmt(db_,
        "SELECT a_id, b_id, strength, updated_at FROM associations "
        "WHERE a_id = ?1 OR b_id = ?1 ORDER BY strength DESC, a_id ASC, b_id ASC");
    stmt.bind_text(1, id);
    std::vector<AssociationEdge> out;
    while (stmt.step()) {
        AssociationEdge e;
        e.a_id = stmt.column_text(0);
        e.b_id = stmt.column_text(1);
        e.strength = stmt.column_double(2);
        e.updated_at = stmt.column_int64(3);
        out.push_back(e);
    }
    return out;
}

} // namespace engram
