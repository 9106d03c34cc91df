/*
 * engram C++11 - Similarity Ranker
 * 
 * Cosine similarity over stored dense vectors.
 */
#ifndef ENGRAM_MEMORY_SIMILARITY_HPP
#define ENGRAM_MEMORY_SIMILARITY_HPP

#include "types.hpp"
#include <vector>

namespace engram {

// Dot product over the product of magnitudes, in [-1, 1]. Zero-magnitude
// vectors and mismatched sizes give 0.
double cosine_similarity(const std::vector<float>& a, const std::vector<float>& b);

// A record with the score it was ranked by
struct RankedRecord {
    MemoryRecord record;
    double score;
    
    RankedRecord() : score(0) {}
    RankedRecord(const MemoryRecord& r, double s) : record(r), score(s) {}
};

// Higher score first, then higher importance, then newer, then id
bool ranks_before(double score_a, const MemoryRecord& a, double score_b, const MemoryRecord& b);

class SimilarityRanker {
public:
    // Candidates sorted by descending similarity to the query
    static std::vector<RankedRecord> rank(const std::vector<float>& query,
                                          const std::vector<MemoryRecord>& candidates);
};

} // namespace engram

#endif // ENGRAM_MEMORY_SIMILARITY_HPP
