/*
 * engram C++11 - Associative Recall Engine
 * 
 * Divergent recall: seeds come from the hybrid retriever, then activation
 * spreads over the association graph for max_depth rounds. Each expanded
 * node picks one of its top max_branches neighbors by softmax sampling
 * over edge strengths, passing on
 *   parent_activation * strength * depth_decay.
 * Traversal is capped at max_branches^max_depth sampling steps.
 */
#ifndef ENGRAM_MEMORY_RECALL_HPP
#define ENGRAM_MEMORY_RECALL_HPP

#include "types.hpp"
#include "store.hpp"
#include "retriever.hpp"
#include "association.hpp"
#include "coactivation.hpp"
#include "sampler.hpp"
#include <string>
#include <vector>
#include <mutex>

namespace engram {

struct RecallParams {
    std::string context;
    int n_results;
    int max_branches;
    int max_depth;
    double temperature;
    
    RecallParams() : n_results(5), max_branches(3), max_depth(3), temperature(0.7) {}
};

// A divergent (non-seed) record with provenance
struct RecallResult {
    MemoryRecord record;
    double activation;          // Summed over every path reaching it
    std::string origin_seed_id; // Seed of the strongest contributing path
    int hops;                   // Length of that path
    double prediction_error;    // 1 - word overlap with the recall context
    double novelty;
    
    RecallResult() : activation(0), hops(0), prediction_error(0), novelty(0) {}
};

// 1 - Jaccard similarity between the lower-cased word sets of context and
// the record's content, category and tags. 1 when either side has no words.
double prediction_error(const std::string& context, const MemoryRecord& record);

// 0.6 / (1 + access_count) + 0.4 * prediction_error, clamped to [0, 1]
double novelty_score(int64_t access_count, double prediction_error);

struct RecallDiagnostics {
    size_t seed_count;
    uint64_t step_budget;
    uint64_t traversal_steps;   // Sampling steps taken
    uint64_t traversed_edges;   // Neighbor edges considered
    size_t visited_nodes;       // Distinct non-seed nodes reached
    size_t expanded_nodes;      // Frontier expansions
    int depth_reached;
    double avg_branching;       // traversed_edges / expanded_nodes
    double avg_prediction_error;
    double avg_novelty;
    std::vector<std::string> seed_ids;
    std::vector<std::string> visited_ids;
    std::vector<RecallResult> results;
    
    RecallDiagnostics()
        : seed_count(0), step_budget(0), traversal_steps(0), traversed_edges(0),
          visited_nodes(0), expanded_nodes(0), depth_reached(0), avg_branching(0),
          avg_prediction_error(0), avg_novelty(0) {}
};

struct RecallOptions {
    double depth_decay;
    uint64_t random_seed;               // 0 = nondeterministic
    bool diagnostics_update_access;
    
    RecallOptions() : depth_decay(0.5), random_seed(0), diagnostics_update_access(false) {}
};

class RecallEngine {
public:
    RecallEngine(RecordStore& store, HybridRetriever& retriever, AssociationGraph& graph,
                 CoactivationLog& events, const RecallOptions& options);
    
    // Ranked divergent records. Touches the returned records and logs a
    // co-activation event for every seed/visited-node pair.
    std::vector<RecallResult> recall_divergent(const RecallParams& params);
    
    // Same traversal; never logs co-activation events. Access statistics
    // are touched only when options.diagnostics_update_access is set.
    RecallDiagnostics diagnostics(const RecallParams& params);
    
    // max_branches^max_depth, saturating, at least 1
    static uint64_t step_budget(int max_branches, int max_depth);

private:
    RecordStore& store_;
    HybridRetriever& retriever_;
    AssociationGraph& graph_;
    CoactivationLog& events_;
    RecallOptions options_;
    
    SoftmaxSampler sampler_;
    std::mutex sampler_mutex_;
    
    RecallDiagnostics run(const RecallParams& params);
    static void validate(const RecallParams& params);
};

} // namespace engram

#endif // ENGRAM_MEMORY_RECALL_HPP
