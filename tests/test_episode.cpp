// Tests for episode grouping, summaries and lookups

#include <engram/memory/manager.hpp>
#include "test_helpers.hpp"

using namespace engram;
using engram::test::TempDb;

struct EpisodeFixture {
    TempDb tmp;
    MemoryManager manager;
    
    EpisodeFixture() : tmp("episode"), manager(test::test_config(tmp)) {
        TEST_ASSERT(manager.initialize(), "Manager should initialize");
    }
    
    std::string add(const std::string& content, int64_t created_at, int importance = 3,
                    Emotion emotion = Emotion::NEUTRAL) {
        MemoryRecord r = test::draft(content, importance, emotion);
        r.created_at = created_at;
        return manager.remember(r).id;
    }
};

std::vector<std::string> ids_of(const std::string& a, const std::string& b,
                                const std::string& c = "") {
    std::vector<std::string> ids;
    ids.push_back(a);
    ids.push_back(b);
    if (!c.empty()) ids.push_back(c);
    return ids;
}

void test_create_episode() {
    printf("Testing episode creation...\n");
    EpisodeFixture f;
    
    std::string arrive = f.add("Arrived at the beach", 1000, 2, Emotion::EXCITED);
    std::string leave = f.add("Drove home tired", 3000, 3, Emotion::NEUTRAL);
    std::string swim = f.add("Swam past the buoys", 2000, 5, Emotion::HAPPY);
    
    std::vector<std::string> participants;
    participants.push_back("Mika");
    Episode ep = f.manager.create_episode("Beach day", ids_of(arrive, leave, swim),
                                          participants, "");
    
    TEST_ASSERT(!ep.id.empty(), "Episode gets an id");
    TEST_ASSERT(ep.summary == "Arrived at the beach \xE2\x86\x92 Swam past the buoys "
                              "\xE2\x86\x92 Drove home tired",
                "Auto summary follows creation order");
    TEST_ASSERT(ep.start_time == 1000 && ep.end_time == 3000, "Time span of the members");
    TEST_ASSERT(ep.importance == 5, "Importance of the most important member");
    TEST_ASSERT(ep.emotion == Emotion::HAPPY, "Emotion of the most important member");
    
    Episode loaded = f.manager.get_episode(ep.id);
    TEST_ASSERT(loaded.title == "Beach day", "Title survives");
    TEST_ASSERT(loaded.member_ids.size() == 3 && loaded.member_ids[0] == arrive,
                "Members keep their insertion order");
    TEST_ASSERT(loaded.participants.size() == 1 && loaded.participants[0] == "Mika",
                "Participants survive");
    TEST_ASSERT(f.manager.store().get(swim).episode_id == ep.id, "Members point back");
    
    std::vector<MemoryRecord> members = f.manager.episode_memories(ep.id);
    TEST_ASSERT(members.size() == 3, "All members returned");
    TEST_ASSERT(members[0].id == arrive && members[1].id == swim && members[2].id == leave,
                "Members in chronological order");
    
    printf("  PASS\n");
}

void test_summary_is_utf8_safe() {
    printf("Testing summary truncation...\n");
    
    MemoryRecord r;
    r.created_at = 1;
    // 60 copies of a two-byte character
    for (int i = 0; i < 60; ++i) r.content += "\xC3\xA9";
    std::vector<MemoryRecord> members;
    members.push_back(r);
    
    std::string summary = EpisodeManager::auto_summary(members);
    TEST_ASSERT(summary.size() == 100, "Fifty characters are kept");
    TEST_ASSERT(utf8_decode(summary).size() == 50, "No character is split");
    
    TEST_ASSERT(EpisodeManager::auto_summary(std::vector<MemoryRecord>()).empty(),
                "No members, no summary");
    
    printf("  PASS\n");
}

void test_create_is_atomic() {
    printf("Testing atomic episode creation...\n");
    EpisodeFixture f;
    
    std::string a = f.add("one", 1000);
    std::string b = f.add("two", 2000);
    std::string c = f.add("three", 3000);
    
    Episode first = f.manager.create_episode("First", ids_of(a, b), std::vector<std::string>(),
                                             "given summary");
    TEST_ASSERT(first.summary == "given summary", "Explicit summary is kept");
    
    TEST_THROWS(f.manager.create_episode("Second", ids_of(c, b), std::vector<std::string>(), ""),
                ValidationError, "Member already in an episode");
    TEST_ASSERT(f.manager.store().get(c).episode_id.empty(), "Failed creation leaves no trace");
    TEST_ASSERT(f.manager.list_episodes(10).size() == 1, "No second episode");
    
    TEST_THROWS(f.manager.create_episode("Third", ids_of(c, "ghost"), std::vector<std::string>(),
                                         "x"),
                NotFoundError, "Unknown member");
    TEST_THROWS(f.manager.create_episode("  ", ids_of(c, a), std::vector<std::string>(), "x"),
                ValidationError, "Blank title");
    TEST_THROWS(f.manager.create_episode("Empty", std::vector<std::string>(),
                                         std::vector<std::string>(), "x"),
                ValidationError, "No members");
    TEST_THROWS(f.manager.create_episode("Dup", ids_of(c, c), std::vector<std::string>(), "x"),
                ValidationError, "Duplicate members");
    TEST_ASSERT(f.manager.list_episodes(10).size() == 1, "Still a single episode");
    
    printf("  PASS\n");
}

void test_search_list_delete() {
    printf("Testing episode search, list and delete...\n");
    EpisodeFixture f;
    
    std::string a = f.add("Built a sandcastle", 1000);
    std::string b = f.add("Tide washed it away", 2000);
    std::string c = f.add("Debugged the flaky build", 3000);
    
    Episode beach = f.manager.create_episode("Beach afternoon", ids_of(a, b),
                                             std::vector<std::string>(), "");
    Episode work = f.manager.create_episode("Release crunch", std::vector<std::string>(1, c),
                                            std::vector<std::string>(), "");
    
    std::vector<EpisodeHit> hits = f.manager.search_episodes("sandcastle", 5);
    TEST_ASSERT(!hits.empty() && hits[0].episode.id == beach.id, "Search matches summaries");
    hits = f.manager.search_episodes("release", 5);
    TEST_ASSERT(!hits.empty() && hits[0].episode.id == work.id, "Search matches titles");
    TEST_THROWS(f.manager.search_episodes("", 5), ValidationError, "Empty query");
    
    TEST_ASSERT(f.manager.list_episodes(10).size() == 2, "Both episodes listed");
    TEST_ASSERT(f.manager.list_episodes(1).size() == 1, "List limit applies");
    
    f.manager.delete_memory(b);
    TEST_ASSERT(f.manager.get_episode(beach.id).member_ids.size() == 1,
                "Deleted record leaves its episode");
    
    f.manager.delete_episode(beach.id);
    TEST_ASSERT(f.manager.store().get(a).episode_id.empty(), "Back-references are cleared");
    TEST_THROWS(f.manager.get_episode(beach.id), NotFoundError, "Deleted episode is gone");
    TEST_THROWS(f.manager.delete_episode(beach.id), NotFoundError, "Second delete");
    
    Episode again = f.manager.create_episode("Beach again", std::vector<std::string>(1, a),
                                             std::vector<std::string>(), "");
    TEST_ASSERT(!again.id.empty(), "Freed members can join a new episode");
    
    printf("  PASS\n");
}

int main() {
    printf("=== Episode Tests ===\n\n");
    test::quiet_logs();
    
    test_create_episode();
    test_summary_is_utf8_safe();
    test_create_is_atomic();
    test_search_list_delete();
    
    printf("\n=== All episode tests passed ===\n");
    return 0;
}
