// Tests for the SQLite record store: records, causal links and schema checks

#include <engram/memory/store.hpp>
#include <engram/memory/embedding.hpp>
#include "test_helpers.hpp"

using namespace engram;
using engram::test::TempDb;

struct StoreFixture {
    TempDb tmp;
    Database db;
    HashingEmbedder embedder;
    RecordStore store;
    
    StoreFixture() : tmp("store"), embedder(64), store(db, 64) {
        db.open(tmp.path());
        store.ensure_schema();
    }
    
    std::string add(const std::string& content, int importance = 3,
                    Category category = Category::DAILY, int64_t created_at = 0) {
        MemoryRecord r = test::draft(content, importance, Emotion::NEUTRAL, category);
        r.embedding = embedder.embed(content);
        r.created_at = created_at;
        return store.create(r);
    }
};

void test_create_and_get() {
    printf("Testing record create/get...\n");
    StoreFixture f;
    
    MemoryRecord r = test::draft("Watched the sunset from the pier", 4, Emotion::MOVED,
                                 Category::OBSERVATION);
    r.embedding = f.embedder.embed(r.content);
    r.tags.push_back("sunset");
    r.tags.push_back("pier");
    r.media_path = "/captures/pier.jpg";
    r.media_type = "image";
    r.has_camera = true;
    r.camera_pan = 30.5;
    r.camera_tilt = -10;
    r.created_at = 1700000000000LL;
    
    std::string id = f.store.create(r);
    TEST_ASSERT(id.size() == 36, "Id should be a UUID");
    
    MemoryRecord got = f.store.get(id);
    TEST_ASSERT(got.content == r.content, "Content survives");
    TEST_ASSERT(got.emotion == Emotion::MOVED, "Emotion survives");
    TEST_ASSERT(got.category == Category::OBSERVATION, "Category survives");
    TEST_ASSERT(got.importance == 4, "Importance survives");
    TEST_ASSERT(got.created_at == 1700000000000LL, "Supplied creation time is kept");
    TEST_ASSERT(got.access_count == 0 && got.last_accessed == 0, "Fresh record was never read");
    TEST_ASSERT(got.tags.size() == 2 && got.tags[1] == "pier", "Tags survive");
    TEST_ASSERT(got.media_type == "image" && got.media_path == r.media_path, "Media survives");
    TEST_ASSERT(got.has_camera && got.camera_pan == 30.5 && got.camera_tilt == -10,
                "Camera pose survives");
    TEST_ASSERT(got.embedding == r.embedding, "Embedding survives");
    TEST_ASSERT(got.episode_id.empty(), "No episode yet");
    
    f.store.update_access(id);
    f.store.update_access(id);
    got = f.store.get(id);
    TEST_ASSERT(got.access_count == 2, "Access count increments");
    TEST_ASSERT(got.last_accessed > 0, "Last access is stamped");
    
    printf("  PASS\n");
}

void test_validation() {
    printf("Testing record validation...\n");
    StoreFixture f;
    
    MemoryRecord r = test::draft("   ");
    r.embedding = f.embedder.embed("x");
    TEST_THROWS(f.store.create(r), ValidationError, "Blank content is rejected");
    
    r.content = "fine";
    r.embedding.resize(10);
    TEST_THROWS(f.store.create(r), ValidationError, "Wrong dimension is rejected");
    
    r.embedding = f.embedder.embed("fine");
    r.importance = 6;
    TEST_THROWS(f.store.create(r), ValidationError, "Importance above 5 is rejected");
    r.importance = 0;
    TEST_THROWS(f.store.create(r), ValidationError, "Importance below 1 is rejected");
    
    r.importance = 3;
    r.media_path = "/x.mp4";
    r.media_type = "video";
    TEST_THROWS(f.store.create(r), ValidationError, "Unknown media type is rejected");
    
    TEST_ASSERT(f.store.record_count() == 0, "Nothing was stored");
    TEST_THROWS(f.store.get("no-such-id"), NotFoundError, "Missing id is NotFound");
    TEST_THROWS(f.store.update_access("no-such-id"), NotFoundError, "Missing id on access");
    
    printf("  PASS\n");
}

void test_list_recent_and_filters() {
    printf("Testing list_recent and filters...\n");
    StoreFixture f;
    
    std::string a = f.add("first", 2, Category::DAILY, 1000);
    std::string b = f.add("second", 5, Category::TECHNICAL, 2000);
    std::string c = f.add("third", 4, Category::TECHNICAL, 3000);
    
    std::vector<MemoryRecord> all = f.store.list_recent(10);
    TEST_ASSERT(all.size() == 3, "All records listed");
    TEST_ASSERT(all[0].id == c && all[2].id == a, "Newest first");
    
    RecordFilter filter;
    filter.has_category = true;
    filter.category = Category::TECHNICAL;
    filter.min_importance = 5;
    std::vector<MemoryRecord> tech = f.store.list_recent(10, filter);
    TEST_ASSERT(tech.size() == 1 && tech[0].id == b, "Category and importance filter");
    
    RecordFilter range;
    range.created_after = 1500;
    range.created_before = 2500;
    std::vector<MemoryRecord> mid = f.store.list_recent(-1, range);
    TEST_ASSERT(mid.size() == 1 && mid[0].id == b, "Date range filter");
    
    TEST_ASSERT(f.store.list_recent(1).size() == 1, "Limit applies");
    
    f.store.update_access(c);
    std::vector<MemoryRecord> important = f.store.search_important(4, 1, 10);
    TEST_ASSERT(important.size() == 1 && important[0].id == c, "Importance and access threshold");
    
    MemoryStats stats = f.store.stats();
    TEST_ASSERT(stats.total == 3, "Stats total");
    TEST_ASSERT(stats.by_category["technical"] == 2, "Stats by category");
    TEST_ASSERT(stats.oldest == 1000 && stats.newest == 3000, "Stats time range");
    
    std::vector<std::string> ids;
    ids.push_back(a);
    ids.push_back("gone");
    ids.push_back(c);
    TEST_ASSERT(f.store.get_many(ids).size() == 2, "get_many skips missing ids");
    
    printf("  PASS\n");
}

void test_links_and_causal_chain() {
    printf("Testing causal links and chains...\n");
    StoreFixture f;
    
    std::string a = f.add("Forgot the umbrella", 3, Category::DAILY, 1000);
    std::string b = f.add("Got soaked in the rain", 3, Category::DAILY, 2000);
    std::string c = f.add("Caught a cold", 3, Category::DAILY, 3000);
    
    f.store.create_link(a, b, "leads_to", "");
    f.store.create_link(b, c, "leads_to", "");
    
    TEST_THROWS(f.store.create_link(a, b, "because", ""), ValidationError, "Unknown link type");
    TEST_THROWS(f.store.create_link(a, a, "related", ""), ValidationError, "Self link");
    TEST_THROWS(f.store.create_link(a, "missing", "related", ""), NotFoundError,
                "Link to a missing record");
    
    TEST_ASSERT(f.store.link_exists(a, b, "leads_to"), "Link is stored");
    TEST_ASSERT(f.store.links_from(a).size() == 1, "links_from");
    TEST_ASSERT(f.store.links_to(c).size() == 1, "links_to");
    
    std::vector<ChainEntry> back = f.store.causal_chain(c, ChainDirection::BACKWARD, 5);
    TEST_ASSERT(back.size() == 3, "Backward chain reaches the root cause");
    TEST_ASSERT(back[0].record.id == c && back[0].depth == 0, "Start record comes first");
    TEST_ASSERT(back[1].record.id == b && back[1].depth == 1, "Direct cause at depth 1");
    TEST_ASSERT(back[2].record.id == a && back[2].depth == 2, "Root cause at depth 2");
    TEST_ASSERT(back[2].link_type == "leads_to" && back[2].via_id == b, "Link provenance");
    
    std::vector<ChainEntry> shallow = f.store.causal_chain(c, ChainDirection::BACKWARD, 1);
    TEST_ASSERT(shallow.size() == 2, "Depth limit applies");
    
    // Close the loop; each record is still reported once
    f.store.create_link(c, a, "caused_by", "");
    std::vector<ChainEntry> cyc = f.store.causal_chain(a, ChainDirection::FORWARD, 10);
    TEST_ASSERT(cyc.size() == 3, "Cycle is walked without repeats");
    
    TEST_THROWS(f.store.causal_chain("missing", ChainDirection::FORWARD, 3), NotFoundError,
                "Chain from a missing record");
    
    printf("  PASS\n");
}

void test_caused_by_walks_forward_from_source() {
    printf("Testing caused_by chain from the link source...\n");
    StoreFixture f;
    
    std::string a = f.add("saw sunset", 4, Category::OBSERVATION);
    std::string b = f.add("felt moved", 3, Category::FEELING);
    f.store.create_link(a, b, "caused_by", "");
    
    std::vector<ChainEntry> chain = f.store.causal_chain(a, ChainDirection::FORWARD, 3);
    TEST_ASSERT(chain.size() == 2, "Chain is exactly [A, B]");
    TEST_ASSERT(chain[0].record.id == a && chain[0].depth == 0, "A comes first");
    TEST_ASSERT(chain[1].record.id == b && chain[1].depth == 1, "B follows A");
    TEST_ASSERT(chain[1].link_type == "caused_by" && chain[1].via_id == a, "Reached via caused_by");
    
    std::vector<ChainEntry> back = f.store.causal_chain(b, ChainDirection::BACKWARD, 3);
    TEST_ASSERT(back.size() == 2 && back[1].record.id == a, "Backward from B reaches A");
    
    printf("  PASS\n");
}

void test_linked_records_both_directions() {
    printf("Testing linked records...\n");
    StoreFixture f;
    
    std::string a = f.add("Packed the tent", 3, Category::DAILY, 1000);
    std::string b = f.add("Drove to the lake", 3, Category::DAILY, 2000);
    std::string c = f.add("Lit the campfire", 3, Category::DAILY, 3000);
    std::string d = f.add("Roasted marshmallows", 3, Category::DAILY, 4000);
    f.store.create_link(a, b, "leads_to", "");
    f.store.create_link(c, b, "related", "");
    f.store.create_link(c, d, "leads_to", "");
    
    std::vector<ChainEntry> near = f.store.linked_records(b, 1);
    TEST_ASSERT(near.size() == 3, "Incoming and outgoing links both count");
    TEST_ASSERT(near[0].record.id == b && near[0].depth == 0, "Start record comes first");
    
    std::vector<ChainEntry> far = f.store.linked_records(a, 3);
    TEST_ASSERT(far.size() == 4, "Every connected record reached once");
    TEST_ASSERT(far[3].record.id == d && far[3].depth == 3 && far[3].via_id == c,
                "Third hop reached through the campfire");
    
    TEST_ASSERT(f.store.linked_records(a, 0).size() == 2, "Depth is at least one");
    TEST_THROWS(f.store.linked_records("missing", 2), NotFoundError, "Missing start record");
    
    printf("  PASS\n");
}

void test_delete_cascades() {
    printf("Testing delete cascade...\n");
    StoreFixture f;
    
    std::string a = f.add("alpha");
    std::string b = f.add("beta");
    f.store.create_link(a, b, "related", "");
    
    f.store.delete_record(a);
    TEST_ASSERT(!f.store.exists(a), "Record is gone");
    TEST_ASSERT(f.store.links_to(b).empty(), "Links touching it are gone");
    TEST_ASSERT(f.store.stats().link_count == 0, "Link count drops");
    TEST_THROWS(f.store.delete_record(a), NotFoundError, "Second delete is NotFound");
    
    printf("  PASS\n");
}

void test_dimension_is_pinned() {
    printf("Testing embedding dimension pinning...\n");
    TempDb tmp("pinned");
    {
        Database db;
        db.open(tmp.path());
        RecordStore store(db, 64);
        store.ensure_schema();
    }
    {
        Database db;
        db.open(tmp.path());
        RecordStore store(db, 32);
        TEST_THROWS(store.ensure_schema(), ValidationError, "Reopen with another dimension fails");
    }
    {
        Database db;
        db.open(tmp.path());
        RecordStore store(db, 64);
        store.ensure_schema();
        TEST_ASSERT(store.record_count() == 0, "Reopen with the same dimension works");
    }
    
    printf("  PASS\n");
}

void test_transaction_rollback() {
    printf("Testing transaction rollback...\n");
    StoreFixture f;
    
    std::string kept = f.add("kept");
    try {
        Transaction tx(f.db);
        f.add("discarded");
        f.store.create_link(kept, "missing", "related", "");
        tx.commit();
    } catch (const NotFoundError&) {
    }
    TEST_ASSERT(f.store.record_count() == 1, "Failed transaction leaves no partial write");
    
    printf("  PASS\n");
}

int main() {
    printf("=== Record Store Tests ===\n\n");
    test::quiet_logs();
    
    test_create_and_get();
    test_validation();
    test_list_recent_and_filters();
    test_links_and_causal_chain();
    test_caused_by_walks_forward_from_source();
    test_linked_records_both_directions();
    test_delete_cascades();
    test_dimension_is_pinned();
    test_transaction_rollback();
    
    printf("\n=== All record store tests passed ===\n");
    return 0;
}
