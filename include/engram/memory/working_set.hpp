/*
 * engram C++11 - Working-Set Cache
 * 
 * Bounded, score-ranked view of the most salient records:
 *   score = 2^(-age_hours / half_life_hours) * (1 + ln(1 + access_count))
 * where age is measured from the last access (creation if never read).
 * Advisory only; refresh() rebuilds it from the store.
 */
#ifndef ENGRAM_MEMORY_WORKING_SET_HPP
#define ENGRAM_MEMORY_WORKING_SET_HPP

#include "store.hpp"
#include <string>
#include <vector>
#include <mutex>

namespace engram {

struct WorkingSetEntry {
    std::string id;
    double score;
    int64_t last_activated;
    int64_t access_count;
    
    WorkingSetEntry() : score(0), last_activated(0), access_count(0) {}
};

class WorkingSetCache {
public:
    WorkingSetCache(RecordStore& store, size_t capacity, double half_life_hours);
    
    // Resample from the store's access statistics. now_ms 0 means now.
    void refresh(int64_t now_ms = 0);
    
    // Highest score first
    std::vector<WorkingSetEntry> get() const;
    
    size_t capacity() const { return capacity_; }
    
    static double score(const AccessStat& stat, int64_t now_ms, double half_life_hours);

private:
    RecordStore& store_;
    size_t capacity_;
    double half_life_hours_;
    
    std::vector<WorkingSetEntry> entries_;
    mutable std::mutex mutex_;
};

} // namespace engram

#endif // ENGRAM_MEMORY_WORKING_SET_HPP
