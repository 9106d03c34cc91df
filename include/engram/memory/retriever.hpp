/*
 * engram C++11 - Hybrid Retriever
 * 
 * Merges the similarity and lexical rankers:
 *   score = alpha * similarity_norm + (1 - alpha) * lexical_norm
 * with both inputs min-max normalized over the filtered candidate set.
 *
 * Scored mode re-ranks a wider hybrid pool by recency and salience:
 *   final = score - (1 - time_decay) * 0.3
 *                 + emotion_boost * 0.2 + importance_boost * 0.2
 * floored at 0, highest first.
 */
#ifndef ENGRAM_MEMORY_RETRIEVER_HPP
#define ENGRAM_MEMORY_RETRIEVER_HPP

#include "types.hpp"
#include "store.hpp"
#include "embedding.hpp"
#include "lexical.hpp"
#include "coactivation.hpp"
#include <string>
#include <vector>
#include <mutex>

namespace engram {

struct ScoringOptions {
    bool use_time_decay;
    bool use_emotion_boost;
    double decay_half_life_days;
    
    ScoringOptions() : use_time_decay(true), use_emotion_boost(true), decay_half_life_days(30.0) {}
};

struct ScoredHit {
    SearchHit hit;
    double time_decay;          // 2^(-age_days / half_life), 1 when disabled
    double emotion_boost;       // 0 when disabled
    double importance_boost;    // (importance - 1) / 10
    double final_score;
    
    ScoredHit() : time_decay(1), emotion_boost(0), importance_boost(0), final_score(0) {}
};

// In [0, 1]; records from the future (clock skew) do not decay
double time_decay_factor(int64_t created_at_ms, int64_t now_ms, double half_life_days);
// excited 0.4, surprised 0.35, moved 0.3, sad 0.25, happy 0.2,
// nostalgic 0.15, curious 0.1, neutral 0
double emotion_boost(Emotion emotion);
double importance_boost(int importance);

class HybridRetriever {
public:
    HybridRetriever(RecordStore& store, Embedder& embedder, CoactivationLog& events, double alpha);
    
    // Ranked results. Updates access statistics of every returned record
    // and logs a co-activation event per returned pair, in one transaction.
    std::vector<SearchHit> search(const std::string& query, const RecordFilter& filter,
                                  int n_results);
    
    // Same ranking without side effects
    std::vector<SearchHit> rank(const std::string& query, const RecordFilter& filter,
                                int n_results);
    
    // Scored mode over a pool of min(3 * n_results, 50) hybrid hits, with
    // the same side effects as search()
    std::vector<ScoredHit> search_scored(const std::string& query, const RecordFilter& filter,
                                         int n_results, const ScoringOptions& options);
    std::vector<ScoredHit> rank_scored(const std::string& query, const RecordFilter& filter,
                                       int n_results, const ScoringOptions& options);
    
    // Keep the lexical index in step with the store
    void on_record_added(const MemoryRecord& record);
    void on_record_removed(const std::string& id);
    
    // Embed with dimension check (EmbeddingError on mismatch)
    std::vector<float> embed(const std::string& text);
    
    double alpha() const { return alpha_; }

private:
    RecordStore& store_;
    Embedder& embedder_;
    CoactivationLog& events_;
    double alpha_;
    
    LexicalIndex index_;
    bool index_ready_;
    std::mutex index_mutex_;
    
    void ensure_index();
    void record_reads(std::vector<MemoryRecord*>& records);
};

} // namespace engram

#endif // ENGRAM_MEMORY_RETRIEVER_HPP
