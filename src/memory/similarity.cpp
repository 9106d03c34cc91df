/*
 * engram C++11 - Similarity Ranker Implementation
 */
#include <engram/memory/similarity.hpp>
#include <engram/core/utils.hpp>
#include <algorithm>
#include <cmath>

namespace engram {

double cosine_similarity(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size() || a.empty()) return 0.0;
    
    double dot = 0.0;
    double norm_a = 0.0;
    double norm_b = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        norm_a += static_cast<double>(a[i]) * a[i];
        norm_b += static_cast<double>(b[i]) * b[i];
    }
    if (norm_a <= 0.0 || norm_b <= 0.0) return 0.0;
    
    // Rounding can push |cos| slightly past 1
    return clamp(dot / (std::sqrt(norm_a) * std::sqrt(norm_b)), -1.0, 1.0);
}

bool ranks_before(double score_a, const MemoryRecord& a, double score_b, const MemoryRecord& b) {
    if (score_a != score_b) return score_a > score_b;
    if (a.importance != b.importance) return a.importance > b.importance;
    if (a.created_at != b.created_at) return a.created_at > b.created_at;
    return a.id < b.id;
}

namespace {

struct RankedOrder {
    bool operator()(const RankedRecord& x, const RankedRecord& y) const {
        return ranks_before(x.score, x.record, y.score, y.record);
    }
};

} // anonymous namespace

std::vector<RankedRecord> SimilarityRanker::rank(const std::vector<float>& query,
                                                 const std::vector<MemoryRecord>& candidates) {
    std::vector<RankedRecord> out;
    out.reserve(candidates.size());
    for (size_t i = 0; i < candidates.size(); ++i) {
        out.push_back(RankedRecord(candidates[i], cosine_similarity(query, candidates[i].embedding)));
    }
    std::sort(out.begin(), out.end(), RankedOrder());
    return out;
}

} // namespace engram
