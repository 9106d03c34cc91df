/*
 * engram C++11 - Associative Recall Engine Implementation
 */
#include <engram/memory/recall.hpp>
#include <engram/memory/similarity.hpp>
#include <engram/memory/errors.hpp>
#include <engram/memory/normalizer.hpp>
#include <engram/core/logger.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <map>
#include <set>

namespace engram {

namespace {

struct Activation {
    double total;
    double best_contribution;
    std::string origin;
    int hops;
    
    Activation() : total(0), best_contribution(-1), hops(0) {}
};

struct FrontierNode {
    std::string id;
    double activation;
    double best_contribution;   // Strongest single parent this round
    std::string origin;
    int hops;
    
    FrontierNode() : activation(0), best_contribution(0), hops(0) {}
};

struct ResultOrder {
    bool operator()(const RecallResult& x, const RecallResult& y) const {
        return ranks_before(x.activation, x.record, y.activation, y.record);
    }
};

// Runs of letters, digits, '_' and any non-ASCII byte
void add_words(const std::string& text, std::set<std::string>& out) {
    std::string norm = normalize_text(text);
    std::string word;
    for (size_t i = 0; i <= norm.size(); ++i) {
        unsigned char c = i < norm.size() ? static_cast<unsigned char>(norm[i]) : ' ';
        if (c >= 0x80 || std::isalnum(c) || c == '_') {
            word += static_cast<char>(c);
        } else if (!word.empty()) {
            out.insert(word);
            word.clear();
        }
    }
}

} // anonymous namespace

double prediction_error(const std::string& context, const MemoryRecord& record) {
    std::set<std::string> expected;
    add_words(context, expected);
    std::set<std::string> actual;
    add_words(record.content, actual);
    add_words(category_to_string(record.category), actual);
    for (size_t i = 0; i < record.tags.size(); ++i) add_words(record.tags[i], actual);
    if (expected.empty() || actual.empty()) return 1.0;
    
    size_t shared = 0;
    for (std::set<std::string>::const_iterator it = expected.begin(); it != expected.end(); ++it) {
        if (actual.count(*it)) ++shared;
    }
    size_t total = expected.size() + actual.size() - shared;
    return 1.0 - static_cast<double>(shared) / static_cast<double>(total);
}

double novelty_score(int64_t access_count, double prediction_error) {
    if (access_count < 0) access_count = 0;
    double familiarity = 1.0 / (1.0 + static_cast<double>(access_count));
    double n = 0.6 * familiarity + 0.4 * prediction_error;
    return std::max(0.0, std::min(1.0, n));
}

RecallEngine::RecallEngine(RecordStore& store, HybridRetriever& retriever, AssociationGraph& graph,
                           CoactivationLog& events, const RecallOptions& options)
    : store_(store)
    , retriever_(retriever)
    , graph_(graph)
    , events_(events)
    , options_(options)
    , sampler_(options.random_seed)
{
}

uint64_t RecallEngine::step_budget(int max_branches, int max_depth) {
    if (max_branches <= 1 || max_depth <= 0) return 1;
    const uint64_t limit = std::numeric_limits<uint64_t>::max();
    uint64_t budget = 1;
    for (int i = 0; i < max_depth; ++i) {
        if (budget > limit / static_cast<uint64_t>(max_branches)) return limit;
        budget *= static_cast<uint64_t>(max_branches);
    }
    return budget;
}

void RecallEngine::validate(const RecallParams& params) {
    if (params.n_results < 1) throw ValidationError("n_results must be at least 1");
    if (params.max_branches < 1) throw ValidationError("max_branches must be at least 1");
    if (params.max_depth < 1) throw ValidationError("max_depth must be at least 1");
    if (!(params.temperature >= 0.0) || !std::isfinite(params.temperature)) {
        throw ValidationError("temperature must be a finite value >= 0");
    }
}

RecallDiagnostics RecallEngine::run(const RecallParams& params) {
    validate(params);
    
    RecallDiagnostics diag;
    diag.step_budget = step_budget(params.max_branches, params.max_depth);
    
    std::vector<SearchHit> seeds = retriever_.rank(params.context, RecordFilter(),
                                                   params.max_branches);
    diag.seed_count = seeds.size();
    
    std::set<std::string> seed_set;
    std::vector<FrontierNode> frontier;
    for (size_t i = 0; i < seeds.size(); ++i) {
        FrontierNode f;
        f.id = seeds[i].record.id;
        f.activation = seeds[i].score;
        f.origin = f.id;
        f.hops = 0;
        frontier.push_back(f);
        seed_set.insert(f.id);
        diag.seed_ids.push_back(f.id);
    }
    
    std::map<std::string, Activation> reached;
    
    for (int round = 1; round <= params.max_depth && !frontier.empty(); ++round) {
        if (diag.traversal_steps >= diag.step_budget) break;
        
        std::map<std::string, FrontierNode> next;
        bool stepped = false;
        for (size_t i = 0; i < frontier.size(); ++i) {
            if (diag.traversal_steps >= diag.step_budget) break;
            const FrontierNode& node = frontier[i];
            
            std::vector<Neighbor> nbrs = graph_.neighbors(node.id,
                                                          static_cast<size_t>(params.max_branches));
            diag.expanded_nodes++;
            diag.traversed_edges += nbrs.size();
            if (nbrs.empty()) continue;
            
            std::vector<double> weights;
            for (size_t k = 0; k < nbrs.size(); ++k) weights.push_back(nbrs[k].strength);
            size_t pick;
            {
                std::lock_guard<std::mutex> lock(sampler_mutex_);
                pick = sampler_.sample(weights, params.temperature);
            }
            diag.traversal_steps++;
            stepped = true;
            
            const Neighbor& chosen = nbrs[pick];
            double contribution = node.activation * chosen.strength * options_.depth_decay;
            
            Activation& act = reached[chosen.id];
            act.total += contribution;
            if (contribution > act.best_contribution) {
                act.best_contribution = contribution;
                act.origin = node.origin;
                act.hops = round;
            }
            
            std::map<std::string, FrontierNode>::iterator it = next.find(chosen.id);
            if (it == next.end()) {
                FrontierNode f;
                f.id = chosen.id;
                f.activation = contribution;
                f.best_contribution = contribution;
                f.origin = node.origin;
                f.hops = round;
                next[chosen.id] = f;
            } else {
                it->second.activation += contribution;
                if (contribution > it->second.best_contribution) {
                    it->second.best_contribution = contribution;
                    it->second.origin = node.origin;
                }
            }
        }
        if (stepped) diag.depth_reached = round;
        
        frontier.clear();
        for (std::map<std::string, FrontierNode>::const_iterator it = next.begin();
             it != next.end(); ++it) {
            frontier.push_back(it->second);
        }
    }
    
    std::vector<std::string> visited;
    for (std::map<std::string, Activation>::const_iterator it = reached.begin();
         it != reached.end(); ++it) {
        if (!seed_set.count(it->first)) visited.push_back(it->first);
    }
    diag.visited_nodes = visited.size();
    diag.visited_ids = visited;
    diag.avg_branching = diag.expanded_nodes > 0
        ? static_cast<double>(diag.traversed_edges) / static_cast<double>(diag.expanded_nodes)
        : 0.0;
    
    // Records deleted since the edge was written are skipped
    std::vector<MemoryRecord> records = store_.get_many(visited);
    for (size_t i = 0; i < records.size(); ++i) {
        const Activation& act = reached[records[i].id];
        RecallResult r;
        r.record = records[i];
        r.activation = act.total;
        r.origin_seed_id = act.origin;
        r.hops = act.hops;
        diag.results.push_back(r);
    }
    std::sort(diag.results.begin(), diag.results.end(), ResultOrder());
    if (diag.results.size() > static_cast<size_t>(params.n_results)) {
        diag.results.resize(static_cast<size_t>(params.n_results));
    }
    for (size_t i = 0; i < diag.results.size(); ++i) {
        RecallResult& r = diag.results[i];
        r.prediction_error = prediction_error(params.context, r.record);
        r.novelty = novelty_score(r.record.access_count, r.prediction_error);
        diag.avg_prediction_error += r.prediction_error;
        diag.avg_novelty += r.novelty;
    }
    if (!diag.results.empty()) {
        diag.avg_prediction_error /= static_cast<double>(diag.results.size());
        diag.avg_novelty /= static_cast<double>(diag.results.size());
    }
    
    LOG_DEBUG("recall: %zu seeds, %llu/%llu steps, %zu visited, depth %d",
              diag.seed_count,
              static_cast<unsigned long long>(diag.traversal_steps),
              static_cast<unsigned long long>(diag.step_budget),
              diag.visited_nodes, diag.depth_reached);
    return diag;
}

std::vector<RecallResult> RecallEngine::recall_divergent(const RecallParams& params) {
    RecallDiagnostics diag = run(params);
    
    std::vector<std::string> returned;
    for (size_t i = 0; i < diag.results.size(); ++i) {
        returned.push_back(diag.results[i].record.id);
    }
    
    std::vector<IdPair> pairs;
    for (size_t s = 0; s < diag.seed_ids.size(); ++s) {
        for (size_t v = 0; v < diag.visited_ids.size(); ++v) {
            pairs.push_back(IdPair(diag.seed_ids[s], diag.visited_ids[v]));
        }
    }
    
    if (!returned.empty() || !pairs.empty()) {
        Transaction tx(store_.database());
        store_.touch_many(returned);
        // Drop pairs whose record vanished after traversal
        std::map<std::string, bool> alive;
        std::vector<IdPair> live;
        for (size_t i = 0; i < pairs.size(); ++i) {
            const std::string* ends[2] = { &pairs[i].first, &pairs[i].second };
            bool ok = true;
            for (int e = 0; e < 2; ++e) {
                std::map<std::string, bool>::iterator it = alive.find(*ends[e]);
                if (it == alive.end()) {
                    it = alive.insert(std::make_pair(*ends[e], store_.exists(*ends[e]))).first;
                }
                ok = ok && it->second;
            }
            if (ok) live.push_back(pairs[i]);
        }
        events_.record_pairs(live, "recall");
        tx.commit();
    }
    
    for (size_t i = 0; i < diag.results.size(); ++i) {
        diag.results[i].record.access_count += 1;
    }
    return diag.results;
}

RecallDiagnostics RecallEngine::diagnostics(const RecallParams& params) {
    RecallDiagnostics diag = run(params);
    if (options_.diagnostics_update_access && !diag.results.empty()) {
        std::vector<std::string> ids;
        for (size_t i = 0; i < diag.results.size(); ++i) {
            ids.push_back(diag.results[i].record.id);
        }
        store_.touch_many(ids);
    }
    return diag;
}

} // namespace engram
