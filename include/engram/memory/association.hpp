/*
 * engram C++11 - Association Graph
 * 
 * Symmetric association strengths between records. Each unordered pair
 * is stored once under (min id, max id) and every write goes through
 * bump(), so strength(a, b) == strength(b, a) always holds.
 */
#ifndef ENGRAM_MEMORY_ASSOCIATION_HPP
#define ENGRAM_MEMORY_ASSOCIATION_HPP

#include "database.hpp"
#include <string>
#include <vector>
#include <utility>

namespace engram {

struct Neighbor {
    std::string id;
    double strength;
    
    Neighbor() : strength(0) {}
    Neighbor(const std::string& i, double s) : id(i), strength(s) {}
};

struct AssociationEdge {
    std::string a_id;       // a_id < b_id
    std::string b_id;
    double strength;
    int64_t updated_at;
    
    AssociationEdge() : strength(0), updated_at(0) {}
};

// Outcome of one bump
struct BumpResult {
    double before;
    double after;
    bool created;       // No edge existed before
    bool capped;        // before + delta exceeded the cap
    
    BumpResult() : before(0), after(0), created(false), capped(false) {}
};

typedef std::pair<std::string, std::string> IdPair;

// Orders a pair as (min, max)
IdPair canonical_pair(const std::string& a, const std::string& b);

class AssociationGraph {
public:
    explicit AssociationGraph(Database& db);
    
    // 0 when no edge exists
    double strength(const std::string& a, const std::string& b);
    
    // Strongest first (ties by id), at most top_k
    std::vector<Neighbor> neighbors(const std::string& id, size_t top_k);
    
    // strength = min(cap, strength + delta); never lowers an existing
    // strength. Throws ValidationError for a self pair or negative
    // delta/cap, NotFoundError if either record is missing.
    BumpResult bump(const std::string& a, const std::string& b, double delta, double cap);
    
    // All bumps in one transaction
    std::vector<BumpResult> bump_many(const std::vector<IdPair>& pairs, double delta, double cap);
    
    int64_t edge_count();
    std::vector<AssociationEdge> edges_of(const std::string& id);

private:
    Database& db_;
};

} // namespace engram

#endif // ENGRAM_MEMORY_ASSOCIATION_HPP
