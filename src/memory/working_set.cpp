/*
 * engram C++11 - Working-Set Cache Implementation
 */
#include <engram/memory/working_set.hpp>
#include <engram/memory/errors.hpp>
#include <engram/core/logger.hpp>
#include <engram/core/utils.hpp>
#include <algorithm>
#include <cmath>

namespace engram {

namespace {

bool by_score_desc(const WorkingSetEntry& a, const WorkingSetEntry& b) {
    if (a.score != b.score) return a.score > b.score;
    if (a.last_activated != b.last_activated) return a.last_activated > b.last_activated;
    return a.id < b.id;
}

} // anonymous namespace

WorkingSetCache::WorkingSetCache(RecordStore& store, size_t capacity, double half_life_hours)
    : store_(store)
    , capacity_(capacity)
    , half_life_hours_(half_life_hours)
{
    if (capacity_ == 0) {
        throw ValidationError("Working set capacity must be at least 1");
    }
    if (!(half_life_hours_ > 0.0)) {
        throw ValidationError("Working set half-life must be positive");
    }
}

double WorkingSetCache::score(const AccessStat& stat, int64_t now_ms, double half_life_hours) {
    int64_t last = stat.last_accessed > 0 ? stat.last_accessed : stat.created_at;
    double age_hours = std::max(0.0, static_cast<double>(now_ms - last) / 3600000.0);
    double recency = std::pow(2.0, -age_hours / half_life_hours);
    double frequency = 1.0 + std::log(1.0 + static_cast<double>(stat.access_count));
    return recency * frequency;
}

void WorkingSetCache::refresh(int64_t now_ms) {
    int64_t now = now_ms > 0 ? now_ms : current_timestamp_ms();
    std::vector<AccessStat> stats = store_.access_stats();
    
    std::vector<WorkingSetEntry> fresh;
    fresh.reserve(stats.size());
    for (size_t i = 0; i < stats.size(); ++i) {
        WorkingSetEntry e;
        e.id = stats[i].id;
        e.score = score(stats[i], now, half_life_hours_);
        e.last_activated = stats[i].last_accessed > 0 ? stats[i].last_accessed : stats[i].created_at;
        e.access_count = stats[i].access_count;
        fresh.push_back(e);
    }
    
    // Evict the lowest scores beyond capacity
    if (fresh.size() > capacity_) {
        std::partial_sort(fresh.begin(), fresh.begin() + capacity_, fresh.end(), by_score_desc);
        fresh.resize(capacity_);
    } else {
        std::sort(fresh.begin(), fresh.end(), by_score_desc);
    }
    
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.swap(fresh);
    LOG_DEBUG("Working set refreshed: %zu of %zu records", entries_.size(), stats.size());
}

std::vector<WorkingSetEntry> WorkingSetCache::get() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

} // namespace engram
