// Tests for the association graph and the co-activation log

#include <engram/memory/association.hpp>
#include <engram/memory/coactivation.hpp>
#include <engram/memory/embedding.hpp>
#include "test_helpers.hpp"
#include <cmath>

using namespace engram;
using engram::test::TempDb;

struct GraphFixture {
    TempDb tmp;
    Database db;
    HashingEmbedder embedder;
    RecordStore store;
    AssociationGraph graph;
    CoactivationLog events;
    
    GraphFixture() : tmp("graph"), embedder(32), store(db, 32), graph(db), events(db) {
        db.open(tmp.path());
        store.ensure_schema();
    }
    
    std::string add(const std::string& content) {
        MemoryRecord r = test::draft(content);
        r.embedding = embedder.embed(content);
        return store.create(r);
    }
};

bool near(double a, double b) {
    return std::fabs(a - b) < 1e-9;
}

void test_symmetric_strength() {
    printf("Testing symmetric edge strength...\n");
    GraphFixture f;
    std::string a = f.add("a"), b = f.add("b");
    
    TEST_ASSERT(f.graph.strength(a, b) == 0.0, "Missing edge has strength 0");
    
    BumpResult r = f.graph.bump(b, a, 0.3, 1.0);
    TEST_ASSERT(r.created && near(r.before, 0.0) && near(r.after, 0.3), "First bump creates");
    TEST_ASSERT(near(f.graph.strength(a, b), 0.3), "Strength from one end");
    TEST_ASSERT(near(f.graph.strength(b, a), 0.3), "Same strength from the other end");
    TEST_ASSERT(f.graph.edge_count() == 1, "One row per unordered pair");
    
    f.graph.bump(a, b, 0.2, 1.0);
    TEST_ASSERT(near(f.graph.strength(b, a), 0.5), "Bumps accumulate");
    
    printf("  PASS\n");
}

void test_cap_and_monotonicity() {
    printf("Testing cap and monotonicity...\n");
    GraphFixture f;
    std::string a = f.add("a"), b = f.add("b");
    
    double last = 0.0;
    for (int i = 0; i < 8; ++i) {
        BumpResult r = f.graph.bump(a, b, 0.3, 1.0);
        TEST_ASSERT(r.after >= last, "Strength never decreases");
        TEST_ASSERT(r.after <= 1.0, "Strength never exceeds the cap");
        last = r.after;
    }
    TEST_ASSERT(near(last, 1.0), "Repeated bumps saturate at the cap");
    
    BumpResult capped = f.graph.bump(a, b, 0.3, 1.0);
    TEST_ASSERT(capped.capped && near(capped.after, 1.0), "Bump past the cap is clipped");
    
    BumpResult lower = f.graph.bump(a, b, 0.1, 0.5);
    TEST_ASSERT(near(lower.after, 1.0), "A lower cap never weakens an edge");
    
    printf("  PASS\n");
}

void test_bump_validation() {
    printf("Testing bump validation...\n");
    GraphFixture f;
    std::string a = f.add("a");
    
    TEST_THROWS(f.graph.bump(a, a, 0.1, 1.0), ValidationError, "Self association");
    TEST_THROWS(f.graph.bump(a, "ghost", 0.1, 1.0), NotFoundError, "Unknown record");
    std::string b = f.add("b");
    TEST_THROWS(f.graph.bump(a, b, -0.1, 1.0), ValidationError, "Negative delta");
    TEST_ASSERT(f.graph.edge_count() == 0, "Rejected bumps leave no edge");
    
    printf("  PASS\n");
}

void test_neighbors() {
    printf("Testing neighbor queries...\n");
    GraphFixture f;
    std::string a = f.add("a"), b = f.add("b"), c = f.add("c"), d = f.add("d");
    
    f.graph.bump(a, b, 0.9, 1.0);
    f.graph.bump(c, a, 0.3, 1.0);
    f.graph.bump(a, d, 0.2, 1.0);
    f.graph.bump(b, c, 0.5, 1.0);
    
    std::vector<Neighbor> top = f.graph.neighbors(a, 2);
    TEST_ASSERT(top.size() == 2, "top_k limits neighbors");
    TEST_ASSERT(top[0].id == b && near(top[0].strength, 0.9), "Strongest neighbor first");
    TEST_ASSERT(top[1].id == c, "Edges are found from either end");
    
    TEST_ASSERT(f.graph.neighbors(a, 10).size() == 3, "All neighbors");
    TEST_ASSERT(f.graph.edges_of(b).size() == 2, "edges_of lists touching edges");
    
    f.store.delete_record(b);
    TEST_ASSERT(f.graph.neighbors(a, 10).size() == 2, "Deleting a record drops its edges");
    
    std::vector<IdPair> pairs;
    pairs.push_back(IdPair(a, c));
    pairs.push_back(IdPair(d, c));
    std::vector<BumpResult> many = f.graph.bump_many(pairs, 0.1, 1.0);
    TEST_ASSERT(many.size() == 2 && many[1].created, "bump_many applies every pair");
    
    printf("  PASS\n");
}

void test_coactivation_log() {
    printf("Testing co-activation log...\n");
    GraphFixture f;
    std::string a = f.add("a"), b = f.add("b"), c = f.add("c");
    
    std::vector<std::string> ids;
    ids.push_back(a);
    ids.push_back(b);
    ids.push_back(c);
    f.events.record_all_pairs(ids, "search");
    TEST_ASSERT(f.events.pending_count() == 3, "Every unordered pair is logged");
    
    std::vector<IdPair> pairs;
    pairs.push_back(IdPair(a, a));
    pairs.push_back(IdPair(c, b));
    f.events.record_pairs(pairs, "recall", 5000);
    TEST_ASSERT(f.events.pending_count() == 4, "Self pairs are skipped");
    
    std::vector<CoactivationEvent> old = f.events.pending(0, 1);
    TEST_ASSERT(old.size() == 1 && old[0].created_at == 5000, "Oldest pending event first");
    TEST_ASSERT(old[0].a_id < old[0].b_id, "Pairs are stored canonically");
    TEST_ASSERT(old[0].source == "recall", "Source is kept");
    
    std::vector<int64_t> consumed;
    consumed.push_back(old[0].id);
    f.events.mark_consumed(consumed, 6000);
    TEST_ASSERT(f.events.pending_count() == 3, "Consumed events are no longer pending");
    TEST_ASSERT(f.events.pending(6000, 10).size() == 3, "Window filters by creation time");
    
    TEST_ASSERT(f.events.prune_consumed(5001) == 1, "Old consumed events are pruned");
    TEST_ASSERT(f.events.prune_consumed(current_timestamp_ms() + 1000) == 0,
                "Pending events are never pruned");
    
    printf("  PASS\n");
}

int main() {
    printf("=== Association Graph Tests ===\n\n");
    test::quiet_logs();
    
    test_symmetric_strength();
    test_cap_and_monotonicity();
    test_bump_validation();
    test_neighbors();
    test_coactivation_log();
    
    printf("\n=== All association tests passed ===\n");
    return 0;
}
