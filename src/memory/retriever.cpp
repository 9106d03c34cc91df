/*
 * engram C++11 - Hybrid Retriever Implementation
 */
#include <engram/memory/retriever.hpp>
#include <engram/memory/similarity.hpp>
#include <engram/memory/errors.hpp>
#include <engram/core/logger.hpp>
#include <engram/core/utils.hpp>
#include <algorithm>
#include <cmath>
#include <sstream>

namespace engram {

namespace {

struct HitOrder {
    bool operator()(const SearchHit& x, const SearchHit& y) const {
        return ranks_before(x.score, x.record, y.score, y.record);
    }
};

struct ScoredOrder {
    bool operator()(const ScoredHit& x, const ScoredHit& y) const {
        return ranks_before(x.final_score, x.hit.record, y.final_score, y.hit.record);
    }
};

const double DECAY_WEIGHT = 0.3;
const double EMOTION_WEIGHT = 0.2;
const double IMPORTANCE_WEIGHT = 0.2;
const int SCORED_POOL_CAP = 50;
const double MS_PER_DAY = 86400.0 * 1000.0;

// Min-max normalization; a flat set maps to 1 when positive, else 0
double normalize(double value, double lo, double hi) {
    if (hi > lo) return (value - lo) / (hi - lo);
    return hi > 0.0 ? 1.0 : 0.0;
}

} // anonymous namespace

double time_decay_factor(int64_t created_at_ms, int64_t now_ms, double half_life_days) {
    if (created_at_ms >= now_ms || !(half_life_days > 0.0)) return 1.0;
    double age_days = static_cast<double>(now_ms - created_at_ms) / MS_PER_DAY;
    return clamp(std::pow(2.0, -age_days / half_life_days), 0.0, 1.0);
}

double emotion_boost(Emotion emotion) {
    switch (emotion) {
        case Emotion::EXCITED: return 0.4;
        case Emotion::SURPRISED: return 0.35;
        case Emotion::MOVED: return 0.3;
        case Emotion::SAD: return 0.25;
        case Emotion::HAPPY: return 0.2;
        case Emotion::NOSTALGIC: return 0.15;
        case Emotion::CURIOUS: return 0.1;
        case Emotion::NEUTRAL: return 0.0;
    }
    return 0.0;
}

double importance_boost(int importance) {
    return static_cast<double>(clamp(importance, 1, 5) - 1) / 10.0;
}

HybridRetriever::HybridRetriever(RecordStore& store, Embedder& embedder,
                                 CoactivationLog& events, double alpha)
    : store_(store)
    , embedder_(embedder)
    , events_(events)
    , alpha_(clamp(alpha, 0.0, 1.0))
    , index_ready_(false)
{
}

std::vector<float> HybridRetriever::embed(const std::string& text) {
    std::vector<float> v = embedder_.embed(text);
    if (v.size() != store_.dimension()) {
        std::ostringstream oss;
        oss << "Embedder '" << embedder_.name() << "' produced dimension " << v.size()
            << ", store expects " << store_.dimension();
        throw EmbeddingError(oss.str());
    }
    return v;
}

void HybridRetriever::ensure_index() {
    std::lock_guard<std::mutex> lock(index_mutex_);
    if (index_ready_) return;
    
    std::vector<MemoryRecord> all = store_.list_recent(-1);
    index_.clear();
    for (size_t i = 0; i < all.size(); ++i) {
        index_.add(all[i].id, all[i].content);
    }
    index_ready_ = true;
    LOG_INFO("Lexical index built over %zu memories", all.size());
}

void HybridRetriever::on_record_added(const MemoryRecord& record) {
    std::lock_guard<std::mutex> lock(index_mutex_);
    // An unbuilt index picks the record up when it is built
    if (index_ready_) index_.add(record.id, record.content);
}

void HybridRetriever::on_record_removed(const std::string& id) {
    std::lock_guard<std::mutex> lock(index_mutex_);
    if (index_ready_) index_.remove(id);
}

std::vector<SearchHit> HybridRetriever::rank(const std::string& query, const RecordFilter& filter,
                                             int n_results) {
    if (trim(query).empty()) {
        throw ValidationError("Search query must not be empty");
    }
    if (n_results < 1) {
        throw ValidationError("n_results must be at least 1");
    }
    
    std::vector<float> query_vec = embed(query);
    ensure_index();
    
    std::vector<MemoryRecord> candidates = store_.list_recent(-1, filter);
    std::vector<SearchHit> hits;
    if (candidates.empty()) return hits;
    
    std::map<std::string, double> lexical = index_.score_all(query);
    
    hits.resize(candidates.size());
    double sim_lo = 0, sim_hi = 0, lex_lo = 0, lex_hi = 0;
    for (size_t i = 0; i < candidates.size(); ++i) {
        SearchHit& h = hits[i];
        h.record = candidates[i];
        h.similarity = cosine_similarity(query_vec, candidates[i].embedding);
        std::map<std::string, double>::const_iterator it = lexical.find(candidates[i].id);
        h.lexical = it != lexical.end() ? it->second : 0.0;
        
        if (i == 0 || h.similarity < sim_lo) sim_lo = h.similarity;
        if (i == 0 || h.similarity > sim_hi) sim_hi = h.similarity;
        if (i == 0 || h.lexical < lex_lo) lex_lo = h.lexical;
        if (i == 0 || h.lexical > lex_hi) lex_hi = h.lexical;
    }
    
    for (size_t i = 0; i < hits.size(); ++i) {
        hits[i].score = alpha_ * normalize(hits[i].similarity, sim_lo, sim_hi) +
                        (1.0 - alpha_) * normalize(hits[i].lexical, lex_lo, lex_hi);
    }
    
    std::sort(hits.begin(), hits.end(), HitOrder());
    if (hits.size() > static_cast<size_t>(n_results)) {
        hits.resize(static_cast<size_t>(n_results));
    }
    return hits;
}

void HybridRetriever::record_reads(std::vector<MemoryRecord*>& records) {
    if (records.empty()) return;
    
    std::vector<std::string> ids;
    for (size_t i = 0; i < records.size(); ++i) ids.push_back(records[i]->id);
    
    {
        Transaction tx(store_.database());
        store_.touch_many(ids);
        events_.record_all_pairs(ids, "search");
        tx.commit();
    }
    
    int64_t now = current_timestamp_ms();
    for (size_t i = 0; i < records.size(); ++i) {
        records[i]->access_count += 1;
        records[i]->last_accessed = now;
    }
}

std::vector<SearchHit> HybridRetriever::search(const std::string& query, const RecordFilter& filter,
                                               int n_results) {
    std::vector<SearchHit> hits = rank(query, filter, n_results);
    
    std::vector<MemoryRecord*> read;
    for (size_t i = 0; i < hits.size(); ++i) read.push_back(&hits[i].record);
    record_reads(read);
    
    LOG_DEBUG("search '%s': %zu results", truncate_safe(query, 60).c_str(), hits.size());
    return hits;
}

std::vector<ScoredHit> HybridRetriever::rank_scored(const std::string& query,
                                                    const RecordFilter& filter, int n_results,
                                                    const ScoringOptions& options) {
    if (n_results < 1) {
        throw ValidationError("n_results must be at least 1");
    }
    if (options.use_time_decay &&
        (!(options.decay_half_life_days > 0.0) || !std::isfinite(options.decay_half_life_days))) {
        throw ValidationError("decay_half_life_days must be a finite value > 0");
    }
    
    int64_t pool = std::min(static_cast<int64_t>(n_results) * 3,
                            static_cast<int64_t>(SCORED_POOL_CAP));
    pool = std::max(pool, static_cast<int64_t>(n_results));
    std::vector<SearchHit> hits = rank(query, filter, static_cast<int>(pool));
    
    int64_t now = current_timestamp_ms();
    std::vector<ScoredHit> scored(hits.size());
    for (size_t i = 0; i < hits.size(); ++i) {
        ScoredHit& s = scored[i];
        s.hit = hits[i];
        s.time_decay = options.use_time_decay
            ? time_decay_factor(hits[i].record.created_at, now, options.decay_half_life_days)
            : 1.0;
        s.emotion_boost = options.use_emotion_boost ? emotion_boost(hits[i].record.emotion) : 0.0;
        s.importance_boost = importance_boost(hits[i].record.importance);
        double final_score = hits[i].score
            - (1.0 - s.time_decay) * DECAY_WEIGHT
            + s.emotion_boost * EMOTION_WEIGHT
            + s.importance_boost * IMPORTANCE_WEIGHT;
        s.final_score = std::max(0.0, final_score);
    }
    
    std::sort(scored.begin(), scored.end(), ScoredOrder());
    if (scored.size() > static_cast<size_t>(n_results)) {
        scored.resize(static_cast<size_t>(n_results));
    }
    return scored;
}

std::vector<ScoredHit> HybridRetriever::search_scored(const std::string& query,
                                                      const RecordFilter& filter, int n_results,
                                                      const ScoringOptions& options) {
    std::vector<ScoredHit> scored = rank_scored(query, filter, n_results, options);
    
    std::vector<MemoryRecord*> read;
    for (size_t i = 0; i < scored.size(); ++i) read.push_back(&scored[i].hit.record);
    record_reads(read);
    
    LOG_DEBUG("scored search '%s': %zu results", truncate_safe(query, 60).c_str(), scored.size());
    return scored;
}

} // namespace engram
