/*
 * engram C++11 - Episode Manager Implementation
 */
#include <engram/memory/episode.hpp>
#include <engram/memory/errors.hpp>
#include <engram/core/utils.hpp>
#include <algorithm>

namespace engram {

namespace {

const size_t SUMMARY_CHARS_PER_MEMBER = 50;

bool oldest_first(const MemoryRecord& a, const MemoryRecord& b) {
    if (a.created_at != b.created_at) return a.created_at < b.created_at;
    return a.id < b.id;
}

} // anonymous namespace

EpisodeManager::EpisodeManager(RecordStore& store)
    : store_(store)
{
}

std::string EpisodeManager::auto_summary(std::vector<MemoryRecord> members) {
    std::stable_sort(members.begin(), members.end(), oldest_first);
    std::vector<std::string> parts;
    for (size_t i = 0; i < members.size(); ++i) {
        parts.push_back(utf8_prefix(members[i].content, SUMMARY_CHARS_PER_MEMBER));
    }
    return join(parts, " \xE2\x86\x92 ");
}

Episode EpisodeManager::create(const std::string& title, const std::vector<std::string>& member_ids,
                               const std::vector<std::string>& participants,
                               const std::string& summary) {
    std::string text = summary;
    if (trim(text).empty() && !member_ids.empty()) {
        std::vector<MemoryRecord> members = store_.get_many(member_ids);
        text = auto_summary(members);
    }
    // The store re-checks every member inside its transaction
    return store_.create_episode(title, member_ids, participants, text);
}

Episode EpisodeManager::get(const std::string& id) {
    return store_.get_episode(id);
}

std::vector<MemoryRecord> EpisodeManager::members_chronological(const std::string& id) {
    Episode ep = store_.get_episode(id);
    std::vector<MemoryRecord> members = store_.get_many(ep.member_ids);
    std::stable_sort(members.begin(), members.end(), oldest_first);
    return members;
}

std::vector<EpisodeHit> EpisodeManager::search(const std::string& query, int limit) {
    if (trim(query).empty()) {
        throw ValidationError("Search query must not be empty");
    }
    if (limit < 1) {
        throw ValidationError("limit must be at least 1");
    }
    
    std::vector<Episode> all = store_.list_episodes(-1);
    LexicalIndex index;
    std::map<std::string, size_t> by_id;
    for (size_t i = 0; i < all.size(); ++i) {
        index.add(all[i].id, all[i].title + "\n" + all[i].summary);
        by_id[all[i].id] = i;
    }
    
    std::vector<std::pair<std::string, double> > ranked =
        index.search(query, static_cast<size_t>(limit));
    std::vector<EpisodeHit> hits;
    for (size_t i = 0; i < ranked.size(); ++i) {
        EpisodeHit h;
        h.episode = all[by_id[ranked[i].first]];
        h.score = ranked[i].second;
        hits.push_back(h);
    }
    return hits;
}

std::vector<Episode> EpisodeManager::list(int limit) {
    return store_.list_episodes(limit);
}

void EpisodeManager::remove(const std::string& id) {
    store_.delete_episode(id);
}

} // namespace engram
