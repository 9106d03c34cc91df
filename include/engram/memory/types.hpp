/*
 * engram C++11 - Memory Types
 * 
 * Records, links, episodes and search results shared by the store,
 * the rankers and the recall engine.
 */
#ifndef ENGRAM_MEMORY_TYPES_HPP
#define ENGRAM_MEMORY_TYPES_HPP

#include <string>
#include <vector>
#include <map>
#include <cstdint>

namespace engram {

const int MIN_IMPORTANCE = 1;
const int MAX_IMPORTANCE = 5;

enum class Emotion {
    HAPPY,
    SAD,
    SURPRISED,
    MOVED,
    EXCITED,
    NOSTALGIC,
    CURIOUS,
    NEUTRAL
};

enum class Category {
    DAILY,
    PHILOSOPHICAL,
    TECHNICAL,
    MEMORY,
    OBSERVATION,
    FEELING,
    CONVERSATION
};

inline std::string emotion_to_string(Emotion e) {
    switch (e) {
        case Emotion::HAPPY: return "happy";
        case Emotion::SAD: return "sad";
        case Emotion::SURPRISED: return "surprised";
        case Emotion::MOVED: return "moved";
        case Emotion::EXCITED: return "excited";
        case Emotion::NOSTALGIC: return "nostalgic";
        case Emotion::CURIOUS: return "curious";
        case Emotion::NEUTRAL: return "neutral";
    }
    return "neutral";
}

inline bool parse_emotion(const std::string& s, Emotion& out) {
    if (s == "happy") { out = Emotion::HAPPY; return true; }
    if (s == "sad") { out = Emotion::SAD; return true; }
    if (s == "surprised") { out = Emotion::SURPRISED; return true; }
    if (s == "moved") { out = Emotion::MOVED; return true; }
    if (s == "excited") { out = Emotion::EXCITED; return true; }
    if (s == "nostalgic") { out = Emotion::NOSTALGIC; return true; }
    if (s == "curious") { out = Emotion::CURIOUS; return true; }
    if (s == "neutral") { out = Emotion::NEUTRAL; return true; }
    return false;
}

inline std::string category_to_string(Category c) {
    switch (c) {
        case Category::DAILY: return "daily";
        case Category::PHILOSOPHICAL: return "philosophical";
        case Category::TECHNICAL: return "technical";
        case Category::MEMORY: return "memory";
        case Category::OBSERVATION: return "observation";
        case Category::FEELING: return "feeling";
        case Category::CONVERSATION: return "conversation";
    }
    return "daily";
}

inline bool parse_category(const std::string& s, Category& out) {
    if (s == "daily") { out = Category::DAILY; return true; }
    if (s == "philosophical") { out = Category::PHILOSOPHICAL; return true; }
    if (s == "technical") { out = Category::TECHNICAL; return true; }
    if (s == "memory") { out = Category::MEMORY; return true; }
    if (s == "observation") { out = Category::OBSERVATION; return true; }
    if (s == "feeling") { out = Category::FEELING; return true; }
    if (s == "conversation") { out = Category::CONVERSATION; return true; }
    return false;
}

// Causal link types accepted by create_link
inline bool is_valid_link_type(const std::string& t) {
    return t == "caused_by" || t == "leads_to" || t == "related" || t == "similar";
}

// A stored unit of experience
struct MemoryRecord {
    std::string id;                 // UUID v4, assigned by the store
    std::string content;
    std::vector<float> embedding;   // Dimension D of the store
    Emotion emotion;
    Category category;
    int importance;                 // MIN_IMPORTANCE..MAX_IMPORTANCE
    int64_t created_at;             // unix ms
    int64_t last_accessed;          // unix ms, 0 = never
    int64_t access_count;
    std::vector<std::string> tags;
    
    // Optional media reference
    std::string media_path;
    std::string media_type;         // "image" | "audio"
    std::string transcript;
    
    // Optional camera pose (degrees)
    bool has_camera;
    double camera_pan;
    double camera_tilt;
    
    std::string episode_id;         // Empty when not in an episode
    
    MemoryRecord()
        : emotion(Emotion::NEUTRAL), category(Category::DAILY), importance(3),
          created_at(0), last_accessed(0), access_count(0),
          has_camera(false), camera_pan(0), camera_tilt(0) {}
};

// Candidate filter shared by list/search operations; unset fields match everything
struct RecordFilter {
    bool has_category;
    Category category;
    bool has_emotion;
    Emotion emotion;
    int64_t created_after;          // inclusive, 0 = unbounded
    int64_t created_before;         // inclusive, 0 = unbounded
    int min_importance;             // 0 = any
    
    RecordFilter()
        : has_category(false), category(Category::DAILY),
          has_emotion(false), emotion(Emotion::NEUTRAL),
          created_after(0), created_before(0), min_importance(0) {}
    
    bool matches(const MemoryRecord& r) const {
        if (has_category && r.category != category) return false;
        if (has_emotion && r.emotion != emotion) return false;
        if (created_after > 0 && r.created_at < created_after) return false;
        if (created_before > 0 && r.created_at > created_before) return false;
        if (min_importance > 0 && r.importance < min_importance) return false;
        return true;
    }
};

// Directed, typed edge between two records
struct CausalLink {
    std::string source_id;
    std::string target_id;
    std::string link_type;
    std::string note;
    int64_t created_at;
    
    CausalLink() : created_at(0) {}
};

enum class ChainDirection {
    FORWARD,    // source -> target
    BACKWARD    // target -> source
};

// One step of a causal chain walk
struct ChainEntry {
    MemoryRecord record;
    std::string via_id;         // Record this one was reached from (empty for the start)
    std::string link_type;      // Link that reached it (empty for the start)
    int depth;                  // Hops from the start record
    
    ChainEntry() : depth(0) {}
};

struct Episode {
    std::string id;
    std::string title;
    std::string summary;
    std::vector<std::string> participants;
    std::vector<std::string> member_ids;   // Insertion order
    Emotion emotion;
    int importance;
    int64_t start_time;
    int64_t end_time;
    int64_t created_at;
    
    Episode()
        : emotion(Emotion::NEUTRAL), importance(MIN_IMPORTANCE),
          start_time(0), end_time(0), created_at(0) {}
};

// Hybrid search result
struct SearchHit {
    MemoryRecord record;
    double score;           // alpha * similarity_norm + (1 - alpha) * lexical_norm
    double similarity;      // Raw cosine similarity
    double lexical;         // Raw BM25 score
    
    SearchHit() : score(0), similarity(0), lexical(0) {}
};

struct MemoryStats {
    int64_t total;
    std::map<std::string, int64_t> by_category;
    std::map<std::string, int64_t> by_emotion;
    int64_t oldest;
    int64_t newest;
    int64_t link_count;
    int64_t episode_count;
    int64_t association_count;
    int64_t pending_events;
    
    MemoryStats()
        : total(0), oldest(0), newest(0), link_count(0), episode_count(0),
          association_count(0), pending_events(0) {}
};

} // namespace engram

#endif // ENGRAM_MEMORY_TYPES_HPP
