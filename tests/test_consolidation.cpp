// Tests for consolidation replay of co-activation history

#include <engram/memory/consolidation.hpp>
#include <engram/memory/embedding.hpp>
#include "test_helpers.hpp"
#include <cmath>

using namespace engram;
using engram::test::TempDb;

const int64_t HOUR_MS = 3600LL * 1000LL;

struct ConsolidationFixture {
    TempDb tmp;
    Database db;
    HashingEmbedder embedder;
    RecordStore store;
    AssociationGraph graph;
    CoactivationLog events;
    ConsolidationEngine engine;
    std::string a, b, c;
    
    explicit ConsolidationFixture(const ConsolidationOptions& options = ConsolidationOptions())
        : tmp("consolidation"), embedder(32), store(db, 32), graph(db), events(db),
          engine(store, graph, events, options) {
        db.open(tmp.path());
        store.ensure_schema();
        a = add("a");
        b = add("b");
        c = add("c");
    }
    
    std::string add(const std::string& content) {
        MemoryRecord r = test::draft(content);
        r.embedding = embedder.embed(content);
        return store.create(r);
    }
    
    void log(const std::string& x, const std::string& y, int times, int64_t at = 0) {
        std::vector<IdPair> pairs;
        for (int i = 0; i < times; ++i) pairs.push_back(IdPair(x, y));
        events.record_pairs(pairs, "search", at);
    }
};

bool near(double x, double y) {
    return std::fabs(x - y) < 1e-9;
}

void test_replay_strengthens_edges() {
    printf("Testing replay...\n");
    ConsolidationOptions options;
    options.related_link_threshold = 0.5;
    ConsolidationFixture f(options);
    
    f.log(f.a, f.b, 3);
    f.log(f.c, f.a, 1);
    
    ConsolidationStats s = f.engine.consolidate(24, 100, 0.2);
    TEST_ASSERT(s.events_replayed == 4, "Every pending event replayed");
    TEST_ASSERT(s.edges_created == 2, "Two new edges");
    TEST_ASSERT(s.edges_updated == 2, "Two distinct edges raised");
    TEST_ASSERT(s.edges_capped == 0, "Nothing reached the cap");
    TEST_ASSERT(near(f.graph.strength(f.a, f.b), 0.6), "Repeated co-activation accumulates");
    TEST_ASSERT(near(f.graph.strength(f.a, f.c), 0.2), "Single co-activation");
    
    TEST_ASSERT(s.related_links_created == 1, "Strong edge gains a related link");
    TEST_ASSERT(f.store.link_exists(f.a, f.b, "related") ||
                f.store.link_exists(f.b, f.a, "related"), "Related link is stored");
    
    printf("  PASS\n");
}

void test_events_are_consumed_once() {
    printf("Testing single consumption...\n");
    ConsolidationFixture f;
    
    f.log(f.a, f.b, 2);
    ConsolidationStats first = f.engine.consolidate(24, 100, 0.1);
    TEST_ASSERT(first.events_replayed == 2, "First run replays");
    TEST_ASSERT(f.events.pending_count() == 0, "Replayed events are consumed");
    
    double after_first = f.graph.strength(f.a, f.b);
    ConsolidationStats second = f.engine.consolidate(24, 100, 0.1);
    TEST_ASSERT(second.events_replayed == 0, "Second run finds nothing new");
    TEST_ASSERT(near(f.graph.strength(f.a, f.b), after_first), "Strength unchanged");
    
    printf("  PASS\n");
}

void test_cap_and_monotonicity() {
    printf("Testing monotone capped replay...\n");
    ConsolidationFixture f;
    
    f.graph.bump(f.a, f.c, 0.4, 1.0);
    f.log(f.a, f.b, 10);
    f.log(f.a, f.c, 1);
    
    ConsolidationStats s = f.engine.consolidate(24, 100, 0.3);
    TEST_ASSERT(near(f.graph.strength(f.a, f.b), 1.0), "Strength saturates at the cap");
    TEST_ASSERT(s.edges_capped >= 1, "Capped bumps are counted");
    TEST_ASSERT(f.graph.strength(f.a, f.c) > 0.4, "Existing edge only grows");
    
    f.log(f.a, f.b, 1);
    f.engine.consolidate(24, 100, 0.0);
    TEST_ASSERT(near(f.graph.strength(f.a, f.b), 1.0), "Zero strength update changes nothing");
    
    printf("  PASS\n");
}

void test_window_and_limit() {
    printf("Testing replay window and limit...\n");
    ConsolidationFixture f;
    
    int64_t now = current_timestamp_ms();
    f.log(f.a, f.b, 1, now - 48 * HOUR_MS);
    f.log(f.b, f.c, 5, now - HOUR_MS);
    
    ConsolidationStats s = f.engine.consolidate(24, 2, 0.1);
    TEST_ASSERT(s.events_replayed == 2, "max_replay_events bounds a run");
    TEST_ASSERT(f.graph.strength(f.a, f.b) == 0.0, "Events outside the window are ignored");
    TEST_ASSERT(f.events.pending_count() == 4, "Unreplayed events stay pending");
    
    s = f.engine.consolidate(72, 100, 0.1);
    TEST_ASSERT(s.events_replayed == 4, "Wider window picks up the rest");
    
    printf("  PASS\n");
}

void test_pruning() {
    printf("Testing consumed event pruning...\n");
    ConsolidationOptions options;
    options.event_retention_hours = 0;
    ConsolidationFixture f(options);
    
    f.log(f.a, f.b, 3, current_timestamp_ms() - 60 * 1000);
    ConsolidationStats s = f.engine.consolidate(1, 100, 0.1);
    TEST_ASSERT(s.events_replayed == 3, "Events replayed");
    TEST_ASSERT(s.events_pruned == 3, "Consumed events past retention are pruned");
    
    printf("  PASS\n");
}

void test_windows_longer_than_epoch() {
    printf("Testing windows longer than the epoch...\n");
    ConsolidationOptions options;
    options.event_retention_hours = 1e20;
    ConsolidationFixture f(options);
    
    f.log(f.a, f.b, 1, 1);
    f.log(f.b, f.c, 1, current_timestamp_ms());
    
    ConsolidationStats s = f.engine.consolidate(1e20, 100, 0.1);
    TEST_ASSERT(s.events_replayed == 2, "Every event since the epoch is replayed");
    TEST_ASSERT(s.events_pruned == 0, "Unbounded retention prunes nothing");
    
    printf("  PASS\n");
}

void test_validation() {
    printf("Testing consolidation validation...\n");
    ConsolidationFixture f;
    
    TEST_THROWS(f.engine.consolidate(-1, 10, 0.1), ValidationError, "Negative window");
    TEST_THROWS(f.engine.consolidate(24, -1, 0.1), ValidationError, "Negative event limit");
    TEST_THROWS(f.engine.consolidate(24, 10, -0.1), ValidationError, "Negative strength");
    TEST_THROWS(f.engine.consolidate(HUGE_VAL, 10, 0.1), ValidationError, "Infinite window");
    
    printf("  PASS\n");
}

int main() {
    printf("=== Consolidation Tests ===\n\n");
    test::quiet_logs();
    
    test_replay_strengthens_edges();
    test_events_are_consumed_once();
    test_cap_and_monotonicity();
    test_window_and_limit();
    test_pruning();
    test_windows_longer_than_epoch();
    test_validation();
    
    printf("\n=== All consolidation tests passed ===\n");
    return 0;
}
