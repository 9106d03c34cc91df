// Tests for divergent recall over the association graph

#include <engram/memory/manager.hpp>
#include "test_helpers.hpp"
#include <cmath>
#include <limits>
#include <set>

using namespace engram;
using engram::test::TempDb;

// Three seeds matching the context, three unrelated records reachable
// from seed A only through association edges
struct RecallFixture {
    TempDb tmp;
    MemoryManager manager;
    std::string a, s2, s3, b, c, d;
    
    RecallFixture() : tmp("recall"), manager(test::test_config(tmp)) {
        TEST_ASSERT(manager.initialize(), "Manager should initialize");
        a = manager.remember(test::draft("sunset over the harbor")).id;
        s2 = manager.remember(test::draft("sunset over the harbor at dusk")).id;
        s3 = manager.remember(test::draft("harbor sunset photograph")).id;
        b = manager.remember(test::draft("cooked lentil soup")).id;
        c = manager.remember(test::draft("fixed a leaky pipe")).id;
        d = manager.remember(test::draft("jogging in cold wind")).id;
        
        AssociationGraph graph(manager.store().database());
        graph.bump(a, b, 0.9, 1.0);
        graph.bump(a, c, 0.3, 1.0);
        graph.bump(a, d, 0.2, 1.0);
    }
    
    RecallParams params(double temperature, int depth) const {
        RecallParams p;
        p.context = "sunset over the harbor";
        p.n_results = 5;
        p.max_branches = 3;
        p.max_depth = depth;
        p.temperature = temperature;
        return p;
    }
};

void test_step_budget() {
    printf("Testing step budget...\n");
    
    TEST_ASSERT(RecallEngine::step_budget(3, 3) == 27, "b^d");
    TEST_ASSERT(RecallEngine::step_budget(1, 8) == 1, "Single branch budget");
    TEST_ASSERT(RecallEngine::step_budget(10, 40) == std::numeric_limits<uint64_t>::max(),
                "Budget saturates instead of overflowing");
    
    printf("  PASS\n");
}

void test_greedy_recall() {
    printf("Testing zero-temperature recall...\n");
    RecallFixture f;
    
    std::vector<RecallResult> results = f.manager.recall_divergent(f.params(0.0, 3));
    TEST_ASSERT(!results.empty(), "Recall reaches associated records");
    TEST_ASSERT(results[0].record.id == f.b, "Strongest association wins at temperature 0");
    TEST_ASSERT(results[0].origin_seed_id == f.a, "Provenance names the seed");
    TEST_ASSERT(results[0].hops == 1, "Reached in one hop");
    TEST_ASSERT(results[0].activation > 0, "Activation is positive");
    
    for (size_t i = 0; i < results.size(); ++i) {
        const std::string& id = results[i].record.id;
        TEST_ASSERT(id != f.a && id != f.s2 && id != f.s3, "Seeds are never returned");
    }
    
    std::vector<RecallResult> again = f.manager.recall_divergent(f.params(0.0, 3));
    TEST_ASSERT(again.size() == results.size() && again[0].record.id == f.b,
                "Zero temperature is deterministic");
    
    TEST_ASSERT(f.manager.store().get(f.b).access_count == 2, "Returned records count an access");
    TEST_ASSERT(f.manager.stats().pending_events > 0, "Recall logs co-activation events");
    
    printf("  PASS\n");
}

void test_provenance_follows_strongest_parent() {
    printf("Testing provenance through shared nodes...\n");
    TempDb tmp("recall-provenance");
    MemoryManager manager(test::test_config(tmp));
    TEST_ASSERT(manager.initialize(), "Manager should initialize");
    
    std::string a = manager.remember(test::draft("sunset over the harbor")).id;
    std::string s2 = manager.remember(test::draft("sunset over the harbor at dusk")).id;
    std::string x = manager.remember(test::draft("mended the garden fence")).id;
    std::string y = manager.remember(test::draft("wrote a letter home")).id;
    
    // Both seeds reach x in the first round; s2 through the far stronger edge
    AssociationGraph graph(manager.store().database());
    graph.bump(a, x, 0.1, 1.0);
    graph.bump(s2, x, 0.9, 1.0);
    graph.bump(x, y, 1.0, 1.0);
    
    RecallParams p;
    p.context = "sunset over the harbor";
    p.n_results = 5;
    p.max_branches = 2;
    p.max_depth = 2;
    p.temperature = 0.0;
    std::vector<RecallResult> results = manager.recall_divergent(p);
    
    const RecallResult* rx = NULL;
    const RecallResult* ry = NULL;
    for (size_t i = 0; i < results.size(); ++i) {
        if (results[i].record.id == x) rx = &results[i];
        if (results[i].record.id == y) ry = &results[i];
    }
    TEST_ASSERT(rx && ry, "Both hops are returned");
    TEST_ASSERT(rx->origin_seed_id == s2 && rx->hops == 1, "Shared node credits the stronger seed");
    TEST_ASSERT(ry->origin_seed_id == s2 && ry->hops == 2, "Deeper hop inherits the same seed");
    
    printf("  PASS\n");
}

void test_temperature_diversity() {
    printf("Testing high-temperature diversity...\n");
    RecallFixture f;
    
    std::set<std::string> seen;
    for (int i = 0; i < 200; ++i) {
        std::vector<RecallResult> results = f.manager.recall_divergent(f.params(10.0, 1));
        TEST_ASSERT(results.size() <= 5, "Never more than n_results");
        if (!results.empty()) seen.insert(results[0].record.id);
    }
    TEST_ASSERT(seen.size() >= 2, "High temperature explores weaker associations");
    for (std::set<std::string>::const_iterator it = seen.begin(); it != seen.end(); ++it) {
        TEST_ASSERT(*it == f.b || *it == f.c || *it == f.d, "Only associated records surface");
    }
    
    printf("  PASS\n");
}

void test_result_limit_and_budget() {
    printf("Testing result limit and traversal budget...\n");
    RecallFixture f;
    
    RecallParams p = f.params(1.0, 3);
    p.n_results = 1;
    TEST_ASSERT(f.manager.recall_divergent(p).size() <= 1, "n_results bounds the output");
    
    p.max_branches = 2;
    p.max_depth = 2;
    RecallDiagnostics diag = f.manager.association_diagnostics(p);
    TEST_ASSERT(diag.step_budget == 4, "Budget is b^d");
    TEST_ASSERT(diag.traversal_steps <= diag.step_budget, "Traversal stays within budget");
    TEST_ASSERT(diag.seed_count == 2, "max_branches seeds");
    TEST_ASSERT(diag.depth_reached <= 2, "Depth is bounded");
    
    printf("  PASS\n");
}

void test_diagnostics_are_side_effect_free() {
    printf("Testing diagnostics side effects...\n");
    RecallFixture f;
    
    int64_t pending = f.manager.stats().pending_events;
    int64_t b_access = f.manager.store().get(f.b).access_count;
    
    RecallDiagnostics diag = f.manager.association_diagnostics(f.params(0.0, 3));
    TEST_ASSERT(diag.seed_count == 3, "Three seeds");
    TEST_ASSERT(diag.step_budget == 27, "Budget reported");
    TEST_ASSERT(diag.traversal_steps >= 1, "At least one step taken");
    TEST_ASSERT(diag.visited_nodes >= 1, "Visited nodes reported");
    TEST_ASSERT(diag.expanded_nodes >= 3, "Every seed was expanded");
    TEST_ASSERT(!diag.results.empty() && diag.results[0].record.id == f.b, "Would-be results");
    
    TEST_ASSERT(f.manager.stats().pending_events == pending, "No co-activation events");
    TEST_ASSERT(f.manager.store().get(f.b).access_count == b_access, "No access updates");
    
    printf("  PASS\n");
}

void test_prediction_scores() {
    printf("Testing prediction error and novelty...\n");
    
    MemoryRecord r = test::draft("Sunset over the harbor");
    // {sunset, harbor} against {sunset, over, the, harbor, daily}
    TEST_ASSERT(std::fabs(prediction_error("sunset, harbor!", r) - 0.6) < 1e-9, "Jaccard distance");
    r.tags.push_back("Harbor");
    TEST_ASSERT(std::fabs(prediction_error("sunset harbor", r) - 0.6) < 1e-9,
                "Tags join the word set once");
    TEST_ASSERT(prediction_error("   ", r) == 1.0, "No words means full surprise");
    
    TEST_ASSERT(std::fabs(novelty_score(0, 0.6) - 0.84) < 1e-9, "Unseen record");
    TEST_ASSERT(std::fabs(novelty_score(3, 1.0) - 0.55) < 1e-9, "Familiar record");
    TEST_ASSERT(novelty_score(-4, 2.0) == 1.0, "Clamped to 1");
    
    RecallFixture f;
    RecallDiagnostics diag = f.manager.association_diagnostics(f.params(0.0, 1));
    TEST_ASSERT(!diag.results.empty(), "Associated records reached");
    // The associated records share no words with the context and were never read
    for (size_t i = 0; i < diag.results.size(); ++i) {
        TEST_ASSERT(diag.results[i].prediction_error == 1.0, "Unrelated content");
        TEST_ASSERT(std::fabs(diag.results[i].novelty - 1.0) < 1e-9, "Fully novel");
    }
    TEST_ASSERT(diag.avg_prediction_error == 1.0, "Average prediction error");
    TEST_ASSERT(std::fabs(diag.avg_novelty - 1.0) < 1e-9, "Average novelty");
    
    printf("  PASS\n");
}

void test_edge_cases() {
    printf("Testing recall edge cases...\n");
    TempDb tmp("recall-empty");
    MemoryManager manager(test::test_config(tmp));
    TEST_ASSERT(manager.initialize(), "Manager should initialize");
    
    RecallParams p;
    p.context = "anything at all";
    p.n_results = 5;
    p.max_branches = 3;
    p.max_depth = 3;
    p.temperature = 0.7;
    TEST_ASSERT(manager.recall_divergent(p).empty(), "Empty store yields no results");
    
    manager.remember(test::draft("a lonely record"));
    TEST_ASSERT(manager.recall_divergent(p).empty(), "Seed without edges yields no results");
    
    p.n_results = 0;
    TEST_THROWS(manager.recall_divergent(p), ValidationError, "n_results must be positive");
    p.n_results = 5;
    p.temperature = -0.5;
    TEST_THROWS(manager.recall_divergent(p), ValidationError, "Negative temperature");
    p.temperature = 0.7;
    p.max_depth = 0;
    TEST_THROWS(manager.recall_divergent(p), ValidationError, "Zero depth");
    p.max_depth = 3;
    p.context = "  ";
    TEST_THROWS(manager.recall_divergent(p), ValidationError, "Empty context");
    
    printf("  PASS\n");
}

void test_deleted_records_are_skipped() {
    printf("Testing recall after deletion...\n");
    RecallFixture f;
    
    f.manager.delete_memory(f.b);
    for (int i = 0; i < 20; ++i) {
        std::vector<RecallResult> results = f.manager.recall_divergent(f.params(2.0, 2));
        for (size_t k = 0; k < results.size(); ++k) {
            TEST_ASSERT(results[k].record.id != f.b, "Deleted record never surfaces");
        }
    }
    
    printf("  PASS\n");
}

int main() {
    printf("=== Divergent Recall Tests ===\n\n");
    test::quiet_logs();
    
    test_step_budget();
    test_greedy_recall();
    test_provenance_follows_strongest_parent();
    test_temperature_diversity();
    test_result_limit_and_budget();
    test_diagnostics_are_side_effect_free();
    test_prediction_scores();
    test_edge_cases();
    test_deleted_records_are_skipped();
    
    printf("\n=== All recall tests passed ===\n");
    return 0;
}
