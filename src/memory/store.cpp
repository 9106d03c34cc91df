/*
 * engram C++11 - Record Store Implementation
 */
#include <engram/memory/store.hpp>
#include <engram/memory/errors.hpp>
#include <engram/core/json.hpp>
#include <engram/core/logger.hpp>
#include <engram/core/utils.hpp>
#include <algorithm>
#include <cmath>
#include <deque>
#include <set>
#include <sstream>

namespace engram {

namespace {

const char* RECORD_COLUMNS =
    "id, content, embedding, emotion, category, importance, created_at, "
    "last_accessed, access_count, tags, media_path, media_type, transcript, "
    "camera_pan, camera_tilt, episode_id";

std::string encode_string_list(const std::vector<std::string>& items) {
    return Json::string_array(items).dump();
}

std::vector<std::string> decode_string_list(const std::string& text) {
    std::vector<std::string> out;
    if (text.empty()) return out;
    Json parsed;
    try {
        parsed = Json::parse(text);
    } catch (const std::runtime_error& e) {
        throw StoreError(std::string("Corrupt string list in store: ") + e.what());
    }
    const std::vector<Json>& items = parsed.as_array();
    for (size_t i = 0; i < items.size(); ++i) {
        if (items[i].is_string()) out.push_back(items[i].as_string());
    }
    return out;
}

MemoryRecord read_record(const Statement& stmt) {
    MemoryRecord r;
    r.id = stmt.column_text(0);
    r.content = stmt.column_text(1);
    r.embedding = stmt.column_floats(2);
    if (!parse_emotion(stmt.column_text(3), r.emotion)) {
        throw StoreError("Corrupt emotion for record " + r.id);
    }
    if (!parse_category(stmt.column_text(4), r.category)) {
        throw StoreError("Corrupt category for record " + r.id);
    }
    r.importance = static_cast<int>(stmt.column_int64(5));
    r.created_at = stmt.column_int64(6);
    r.last_accessed = stmt.column_int64(7);
    r.access_count = stmt.column_int64(8);
    r.tags = decode_string_list(stmt.column_text(9));
    r.media_path = stmt.column_text(10);
    r.media_type = stmt.column_text(11);
    r.transcript = stmt.column_text(12);
    if (!stmt.column_is_null(13) && !stmt.column_is_null(14)) {
        r.has_camera = true;
        r.camera_pan = stmt.column_double(13);
        r.camera_tilt = stmt.column_double(14);
    }
    r.episode_id = stmt.column_text(15);
    return r;
}

// Appends the WHERE clause for a filter; binds are applied by bind_filter
std::string filter_clause(const RecordFilter& f) {
    std::vector<std::string> conds;
    if (f.has_category) conds.push_back("category = ?");
    if (f.has_emotion) conds.push_back("emotion = ?");
    if (f.created_after > 0) conds.push_back("created_at >= ?");
    if (f.created_before > 0) conds.push_back("created_at <= ?");
    if (f.min_importance > 0) conds.push_back("importance >= ?");
    if (conds.empty()) return "";
    return " WHERE " + join(conds, " AND ");
}

int bind_filter(Statement& stmt, const RecordFilter& f) {
    int idx = 1;
    if (f.has_category) stmt.bind_text(idx++, category_to_string(f.category));
    if (f.has_emotion) stmt.bind_text(idx++, emotion_to_string(f.emotion));
    if (f.created_after > 0) stmt.bind_int64(idx++, f.created_after);
    if (f.created_before > 0) stmt.bind_int64(idx++, f.created_before);
    if (f.min_importance > 0) stmt.bind_int64(idx++, f.min_importance);
    return idx;
}

} // anonymous namespace

RecordStore::RecordStore(Database& db, size_t dimension)
    : db_(db)
    , dimension_(dimension)
{
}

void RecordStore::ensure_schema() {
    if (dimension_ == 0) {
        throw ValidationError("Embedding dimension must be positive");
    }
    
    Transaction tx(db_);
    
    db_.exec(
        "CREATE TABLE IF NOT EXISTS meta ("
        "  key TEXT PRIMARY KEY,"
        "  value TEXT"
        ")"
    );
    
    db_.exec(
        "CREATE TABLE IF NOT EXISTS memories ("
        "  id TEXT PRIMARY KEY,"
        "  content TEXT NOT NULL,"
        "  embedding BLOB NOT NULL,"
        "  emotion TEXT NOT NULL,"
        "  category TEXT NOT NULL,"
        "  importance INTEGER NOT NULL,"
        "  created_at INTEGER NOT NULL,"
        "  last_accessed INTEGER NOT NULL DEFAULT 0,"
        "  access_count INTEGER NOT NULL DEFAULT 0,"
        "  tags TEXT NOT NULL DEFAULT '[]',"
        "  media_path TEXT,"
        "  media_type TEXT,"
        "  transcript TEXT,"
        "  camera_pan REAL,"
        "  camera_tilt REAL,"
        "  episode_id TEXT"
        ")"
    );
    db_.exec("CREATE INDEX IF NOT EXISTS idx_memories_created ON memories(created_at)");
    db_.exec("CREATE INDEX IF NOT EXISTS idx_memories_category ON memories(category)");
    db_.exec("CREATE INDEX IF NOT EXISTS idx_memories_episode ON memories(episode_id)");
    
    // Directed causal links
    db_.exec(
        "CREATE TABLE IF NOT EXISTS links ("
        "  source_id TEXT NOT NULL REFERENCES memories(id) ON DELETE CASCADE,"
        "  target_id TEXT NOT NULL REFERENCES memories(id) ON DELETE CASCADE,"
        "  link_type TEXT NOT NULL,"
        "  note TEXT,"
        "  created_at INTEGER NOT NULL,"
        "  PRIMARY KEY (source_id, target_id, link_type)"
        ")"
    );
    db_.exec("CREATE INDEX IF NOT EXISTS idx_links_target ON links(target_id)");
    
    db_.exec(
        "CREATE TABLE IF NOT EXISTS episodes ("
        "  id TEXT PRIMARY KEY,"
        "  title TEXT NOT NULL,"
        "  summary TEXT,"
        "  participants TEXT NOT NULL DEFAULT '[]',"
        "  emotion TEXT NOT NULL,"
        "  importance INTEGER NOT NULL,"
        "  start_time INTEGER NOT NULL,"
        "  end_time INTEGER NOT NULL,"
        "  created_at INTEGER NOT NULL"
        ")"
    );
    db_.exec(
        "CREATE TABLE IF NOT EXISTS episode_members ("
        "  episode_id TEXT NOT NULL REFERENCES episodes(id) ON DELETE CASCADE,"
        "  position INTEGER NOT NULL,"
        "  memory_id TEXT NOT NULL UNIQUE REFERENCES memories(id) ON DELETE CASCADE,"
        "  PRIMARY KEY (episode_id, position)"
        ")"
    );
    
    // Symmetric association edges, one row per unordered pair
    db_.exec(
        "CREATE TABLE IF NOT EXISTS associations ("
        "  a_id TEXT NOT NULL REFERENCES memories(id) ON DELETE CASCADE,"
        "  b_id TEXT NOT NULL REFERENCES memories(id) ON DELETE CASCADE,"
        "  strength REAL NOT NULL,"
        "  updated_at INTEGER NOT NULL,"
        "  PRIMARY KEY (a_id, b_id),"
        "  CHECK (a_id < b_id)"
        ")"
    );
    db_.exec("CREATE INDEX IF NOT EXISTS idx_associations_b ON associations(b_id)");
    
    // Co-activation history replayed by consolidation
    db_.exec(
        "CREATE TABLE IF NOT EXISTS coactivation_events ("
        "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  a_id TEXT NOT NULL REFERENCES memories(id) ON DELETE CASCADE,"
        "  b_id TEXT NOT NULL REFERENCES memories(id) ON DELETE CASCADE,"
        "  source TEXT NOT NULL,"
        "  created_at INTEGER NOT NULL,"
        "  consolidated_at INTEGER"
        ")"
    );
    db_.exec("CREATE INDEX IF NOT EXISTS idx_events_pending "
             "ON coactivation_events(consolidated_at, created_at)");
    
    std::string stored = db_.get_meta("embedding_dim");
    std::string wanted = std::to_string(dimension_);
    if (stored.empty()) {
        db_.set_meta("embedding_dim", wanted);
    } else if (stored != wanted) {
        throw ValidationError("Store was created with embedding dimension " + stored +
                              ", configured dimension is " + wanted);
    }
    
    tx.commit();
    LOG_INFO("Memory store ready at %s (dimension %zu)", db_.path().c_str(), dimension_);
}

// ============ Records ============

void RecordStore::validate(const MemoryRecord& record) const {
    if (trim(record.content).empty()) {
        throw ValidationError("Memory content must not be empty");
    }
    if (record.embedding.size() != dimension_) {
        std::ostringstream oss;
        oss << "Embedding dimension " << record.embedding.size()
            << " does not match store dimension " << dimension_;
        throw ValidationError(oss.str());
    }
    for (size_t i = 0; i < record.embedding.size(); ++i) {
        if (!std::isfinite(record.embedding[i])) {
            throw ValidationError("Embedding contains a non-finite value");
        }
    }
    if (record.importance < MIN_IMPORTANCE || record.importance > MAX_IMPORTANCE) {
        throw ValidationError("Importance must be between " + std::to_string(MIN_IMPORTANCE) +
                              " and " + std::to_string(MAX_IMPORTANCE));
    }
    if (record.created_at < 0) {
        throw ValidationError("Creation timestamp must not be negative");
    }
    if (!record.media_type.empty() && record.media_type != "image" && record.media_type != "audio") {
        throw ValidationError("Media type must be 'image' or 'audio'");
    }
    if (!record.media_type.empty() && record.media_path.empty()) {
        throw ValidationError("Media type given without a media path");
    }
    if (record.has_camera &&
        (!std::isfinite(record.camera_pan) || !std::isfinite(record.camera_tilt))) {
        throw ValidationError("Camera pose must be finite");
    }
}

std::string RecordStore::create(const MemoryRecord& record) {
    validate(record);
    
    std::string id = generate_uuid();
    int64_t created = record.created_at > 0 ? record.created_at : current_timestamp_ms();
    
    Transaction tx(db_);
    Statement stmt(db_,
        "INSERT INTO memories (id, content, embedding, emotion, category, importance, "
        "created_at, last_accessed, access_count, tags, media_path, media_type, transcript, "
        "camera_pan, camera_tilt, episode_id) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, 0, 0, ?, ?, ?, ?, ?, ?, NULL)");
    stmt.bind_text(1, id);
    stmt.bind_text(2, record.content);
    stmt.bind_floats(3, record.embedding);
    stmt.bind_text(4, emotion_to_string(record.emotion));
    stmt.bind_text(5, category_to_string(record.category));
    stmt.bind_int64(6, record.importance);
    stmt.bind_int64(7, created);
    stmt.bind_text(8, encode_string_list(record.tags));
    if (record.media_path.empty()) {
        stmt.bind_null(9);
        stmt.bind_null(10);
    } else {
        stmt.bind_text(9, record.media_path);
        if (record.media_type.empty()) stmt.bind_null(10);
        else stmt.bind_text(10, record.media_type);
    }
    if (record.transcript.empty()) stmt.bind_null(11);
    else stmt.bind_text(11, record.transcript);
    if (record.has_camera) {
        stmt.bind_double(12, record.camera_pan);
        stmt.bind_double(13, record.camera_tilt);
    } else {
        stmt.bind_null(12);
        stmt.bind_null(13);
    }
    stmt.step();
    tx.commit();
    
    LOG_DEBUG("Created memory %s (%s/%s, importance %d)", id.c_str(),
              category_to_string(record.category).c_str(),
              emotion_to_string(record.emotion).c_str(), record.importance);
    return id;
}

bool RecordStore::find(const std::string& id, MemoryRecord& out) {
    std::lock_guard<std::recursive_mutex> lock(db_.mutex());
    Statement stmt(db_, std::string("SELECT ") + RECORD_COLUMNS + " FROM memories WHERE id = ?");
    stmt.bind_text(1, id);
    if (!stmt.step()) return false;
    out = read_record(stmt);
    return true;
}

MemoryRecord RecordStore::get(const std::string& id) {
    MemoryRecord r;
    if (!find(id, r)) {
        throw NotFoundError("Memory not found: " + id);
    }
    return r;
}

bool RecordStore::exists(const std::string& id) {
    std::lock_guard<std::recursive_mutex> lock(db_.mutex());
    Statement stmt(db_, "SELECT 1 FROM memories WHERE id = ?");
    stmt.bind_text(1, id);
    return stmt.step();
}

std::vector<MemoryRecord> RecordStore::get_many(const std::vector<std::string>& ids) {
    std::lock_guard<std::recursive_mutex> lock(db_.mutex());
    std::vector<MemoryRecord> out;
    Statement stmt(db_, std::string("SELECT ") + RECORD_COLUMNS + " FROM memories WHERE id = ?");
    for (size_t i = 0; i < ids.size(); ++i) {
        stmt.reset();
        stmt.bind_text(1, ids[i]);
        if (stmt.step()) {
            out.push_back(read_record(stmt));
        }
    }
    return out;
}

void RecordStore::update_access(const std::string& id) {
    Transaction tx(db_);
    Statement stmt(db_,
        "UPDATE memories SET access_count = access_count + 1, last_accessed = ? WHERE id = ?");
    stmt.bind_int64(1, current_timestamp_ms());
    stmt.bind_text(2, id);
    stmt.step();
    if (db_.changes() == 0) {
        throw NotFoundError("Memory not found: " + id);
    }
    tx.commit();
}

void RecordStore::touch_many(const std::vector<std::string>& ids) {
    if (ids.empty()) return;
    int64_t now = current_timestamp_ms();
    Transaction tx(db_);
    Statement stmt(db_,
        "UPDATE memories SET access_count = access_count + 1, last_accessed = ? WHERE id = ?");
    for (size_t i = 0; i < ids.size(); ++i) {
        stmt.reset();
        stmt.bind_int64(1, now);
        stmt.bind_text(2, ids[i]);
        stmt.step();
    }
    tx.commit();
}

std::vector<MemoryRecord> RecordStore::list_recent(int limit, const RecordFilter& filter) {
    std::lock_guard<std::recursive_mutex> lock(db_.mutex());
    std::string sql = std::string("SELECT ") + RECORD_COLUMNS + " FROM memories" +
                      filter_clause(filter) + " ORDER BY created_at DESC, id ASC";
    if (limit >= 0) sql += " LIMIT ?";
    
    Statement stmt(db_, sql);
    int idx = bind_filter(stmt, filter);
    if (limit >= 0) stmt.bind_int64(idx, limit);
    
    std::vector<MemoryRecord> out;
    while (stmt.step()) {
        out.push_back(read_record(stmt));
    }
    return out;
}

std::vector<MemoryRecord> RecordStore::search_important(int min_importance,
                                                        int64_t min_access_count,
                                                        int limit) {
    std::lock_guard<std::recursive_mutex> lock(db_.mutex());
    Statement stmt(db_, std::string("SELECT ") + RECORD_COLUMNS + " FROM memories "
        "WHERE importance >= ? AND access_count >= ? "
        "ORDER BY last_accessed DESC, importance DESC, created_at DESC LIMIT ?");
    stmt.bind_int64(1, min_importance);
    stmt.bind_int64(2, min_access_count);
    stmt.bind_int64(3, limit);
    
    std::vector<MemoryRecord> out;
    while (stmt.step()) {
        out.push_back(read_record(stmt));
    }
    return out;
}

std::vector<AccessStat> RecordStore::access_stats() {
    std::lock_guard<std::recursive_mutex> lock(db_.mutex());
    Statement stmt(db_, "SELECT id, created_at, last_accessed, access_count FROM memories");
    std::vector<AccessStat> out;
    while (stmt.step()) {
        AccessStat s;
        s.id = stmt.column_text(0);
        s.created_at = stmt.column_int64(1);
        s.last_accessed = stmt.column_int64(2);
        s.access_count = stmt.column_int64(3);
        out.push_back(s);
    }
    return out;
}

int64_t RecordStore::record_count() {
    std::lock_guard<std::recursive_mutex> lock(db_.mutex());
    Statement stmt(db_, "SELECT COUNT(*) FROM memories");
    return stmt.step() ? stmt.column_int64(0) : 0;
}

MemoryStats RecordStore::stats() {
    std::lock_guard<std::recursive_mutex> lock(db_.mutex());
    MemoryStats s;
    
    {
        Statement stmt(db_, "SELECT COUNT(*), COALESCE(MIN(created_at), 0), "
                            "COALESCE(MAX(created_at), 0) FROM memories");
        if (stmt.step()) {
            s.total = stmt.column_int64(0);
            s.oldest = stmt.column_int64(1);
            s.newest = stmt.column_int64(2);
        }
    }
    {
        Statement stmt(db_, "SELECT category, COUNT(*) FROM memories GROUP BY category");
        while (stmt.step()) s.by_category[stmt.column_text(0)] = stmt.column_int64(1);
    }
    {
        Statement stmt(db_, "SELECT emotion, COUNT(*) FROM memories GROUP BY emotion");
        while (stmt.step()) s.by_emotion[stmt.column_text(0)] = stmt.column_int64(1);
    }
    {
        Statement stmt(db_, "SELECT COUNT(*) FROM links");
        if (stmt.step()) s.link_count = stmt.column_int64(0);
    }
    {
        Statement stmt(db_, "SELECT COUNT(*) FROM episodes");
        if (stmt.step()) s.episode_count = stmt.column_int64(0);
    }
    {
        Statement stmt(db_, "SELECT COUNT(*) FROM associations");
        if (stmt.step()) s.association_count = stmt.column_int64(0);
    }
    {
        Statement stmt(db_, "SELECT COUNT(*) FROM coactivation_events WHERE consolidated_at IS NULL");
        if (stmt.step()) s.pending_events = stmt.column_int64(0);
    }
    return s;
}

void RecordStore::delete_record(const std::string& id) {
    Transaction tx(db_);
    // Foreign keys cascade to links, associations, events and membership
    Statement stmt(db_, "DELETE FROM memories WHERE id = ?");
    stmt.bind_text(1, id);
    stmt.step();
    if (db_.changes() == 0) {
        throw NotFoundError("Memory not found: " + id);
    }
    tx.commit();
    LOG_INFO("Deleted memory %s", id.c_str());
}

// ============ Causal links ============

void RecordStore::create_link(const std::string& source_id, const std::string& target_id,
                              const std::string& link_type, const std::string& note) {
    if (!is_valid_link_type(link_type)) {
        throw ValidationError("Unknown link type '" + link_type +
                              "' (expected caused_by, leads_to, related or similar)");
    }
    if (source_id == target_id) {
        throw ValidationError("A memory cannot link to itself");
    }
    
    Transaction tx(db_);
    if (!exists(source_id)) throw NotFoundError("Memory not found: " + source_id);
    if (!exists(target_id)) throw NotFoundError("Memory not found: " + target_id);
    
    Statement stmt(db_,
        "INSERT OR REPLACE INTO links (source_id, target_id, link_type, note, created_at) "
        "VALUES (?, ?, ?, ?, ?)");
    stmt.bind_text(1, source_id);
    stmt.bind_text(2, target_id);
    stmt.bind_text(3, link_type);
    stmt.bind_text(4, note);
    stmt.bind_int64(5, current_timestamp_ms());
    stmt.step();
    tx.commit();
}

bool RecordStore::link_exists(const std::string& source_id, const std::string& target_id,
                              const std::string& link_type) {
    std::lock_guard<std::recursive_mutex> lock(db_.mutex());
    Statement stmt(db_,
        "SELECT 1 FROM links WHERE source_id = ? AND target_id = ? AND link_type = ?");
    stmt.bind_text(1, source_id);
    stmt.bind_text(2, target_id);
    stmt.bind_text(3, link_type);
    return stmt.step();
}

std::vector<CausalLink> RecordStore::query_links(const std::string& sql, const std::string& id) {
    std::lock_guard<std::recursive_mutex> lock(db_.mutex());
    Statement stmt(db_, sql);
    stmt.bind_text(1, id);
    std::vector<CausalLink> out;
    while (stmt.step()) {
        CausalLink link;
        link.source_id = stmt.column_text(0);
        link.target_id = stmt.column_text(1);
        link.link_type = stmt.column_text(2);
        link.note = stmt.column_text(3);
        link.created_at = stmt.column_int64(4);
        out.push_back(link);
    }
    return out;
}

std::vector<CausalLink> RecordStore::links_from(const std::string& id) {
    return query_links(
        "SELECT source_id, target_id, link_type, note, created_at FROM links "
        "WHERE source_id = ? ORDER BY created_at ASC, target_id ASC", id);
}

std::vector<CausalLink> RecordStore::links_to(const std::string& id) {
    return query_links(
        "SELECT source_id, target_id, link_type, note, created_at FROM links "
        "WHERE target_id = ? ORDER BY created_at ASC, source_id ASC", id);
}

std::vector<ChainEntry> RecordStore::causal_chain(const std::string& id, ChainDirection direction,
                                                  int max_depth) {
    std::lock_guard<std::recursive_mutex> lock(db_.mutex());
    int depth_limit = clamp(max_depth, 1, 10);
    
    std::vector<ChainEntry> chain;
    ChainEntry start;
    start.record = get(id);
    chain.push_back(start);
    
    // Cycles are legal; every record is emitted at most once
    std::set<std::string> visited;
    visited.insert(id);
    std::deque<std::pair<std::string, int> > queue;
    queue.push_back(std::make_pair(id, 0));
    
    while (!queue.empty()) {
        std::string current = queue.front().first;
        int depth = queue.front().second;
        queue.pop_front();
        if (depth >= depth_limit) continue;
        
        std::vector<CausalLink> links = direction == ChainDirection::FORWARD
            ? links_from(current) : links_to(current);
        for (size_t i = 0; i < links.size(); ++i) {
            const std::string& next = direction == ChainDirection::FORWARD
                ? links[i].target_id : links[i].source_id;
            if (visited.count(next)) continue;
            visited.insert(next);
            
            ChainEntry entry;
            if (!find(next, entry.record)) continue;
            entry.via_id = current;
            entry.link_type = links[i].link_type;
            entry.depth = depth + 1;
            chain.push_back(entry);
            queue.push_back(std::make_pair(next, depth + 1));
        }
    }
    return chain;
}

std::vector<ChainEntry> RecordStore::linked_records(const std::string& id, int max_depth) {
    std::lock_guard<std::recursive_mutex> lock(db_.mutex());
    int depth_limit = clamp(max_depth, 1, 5);
    
    std::vector<ChainEntry> out;
    ChainEntry start;
    start.record = get(id);
    out.push_back(start);
    
    std::set<std::string> visited;
    visited.insert(id);
    std::deque<std::pair<std::string, int> > queue;
    queue.push_back(std::make_pair(id, 0));
    
    while (!queue.empty()) {
        std::string current = queue.front().first;
        int depth = queue.front().second;
        queue.pop_front();
        if (depth >= depth_limit) continue;
        
        // Links count in both directions here
        std::vector<CausalLink> links = links_from(current);
        std::vector<CausalLink> incoming = links_to(current);
        links.insert(links.end(), incoming.begin(), incoming.end());
        for (size_t i = 0; i < links.size(); ++i) {
            const std::string& next = links[i].source_id == current
                ? links[i].target_id : links[i].source_id;
            if (visited.count(next)) continue;
            visited.insert(next);
            
            ChainEntry entry;
            if (!find(next, entry.record)) continue;
            entry.via_id = current;
            entry.link_type = links[i].link_type;
            entry.depth = depth + 1;
            out.push_back(entry);
            queue.push_back(std::make_pair(next, depth + 1));
        }
    }
    return out;
}

// ============ Episodes ============

Episode RecordStore::create_episode(const std::string& title,
                                    const std::vector<std::string>& member_ids,
                                    const std::vector<std::string>& participants,
                                    const std::string& summary) {
    if (trim(title).empty()) {
        throw ValidationError("Episode title must not be empty");
    }
    if (member_ids.empty()) {
        throw ValidationError("Episode needs at least one member");
    }
    std::set<std::string> unique(member_ids.begin(), member_ids.end());
    if (unique.size() != member_ids.size()) {
        throw ValidationError("Episode member list contains duplicates");
    }
    
    Transaction tx(db_);
    
    Episode ep;
    ep.id = generate_uuid();
    ep.title = title;
    ep.summary = summary;
    ep.participants = participants;
    ep.member_ids = member_ids;
    ep.created_at = current_timestamp_ms();
    
    int best_importance = 0;
    for (size_t i = 0; i < member_ids.size(); ++i) {
        MemoryRecord r;
        if (!find(member_ids[i], r)) {
            throw NotFoundError("Memory not found: " + member_ids[i]);
        }
        if (!r.episode_id.empty()) {
            throw ValidationError("Memory " + r.id + " already belongs to episode " + r.episode_id);
        }
        if (r.importance > best_importance) {
            best_importance = r.importance;
            ep.emotion = r.emotion;
        }
        if (i == 0 || r.created_at < ep.start_time) ep.start_time = r.created_at;
        if (i == 0 || r.created_at > ep.end_time) ep.end_time = r.created_at;
    }
    ep.importance = best_importance;
    
    {
        Statement stmt(db_,
            "INSERT INTO episodes (id, title, summary, participants, emotion, importance, "
            "start_time, end_time, created_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)");
        stmt.bind_text(1, ep.id);
        stmt.bind_text(2, ep.title);
        stmt.bind_text(3, ep.summary);
        stmt.bind_text(4, encode_string_list(ep.participants));
        stmt.bind_text(5, emotion_to_string(ep.emotion));
        stmt.bind_int64(6, ep.importance);
        stmt.bind_int64(7, ep.start_time);
        stmt.bind_int64(8, ep.end_time);
        stmt.bind_int64(9, ep.created_at);
        stmt.step();
    }
    
    Statement member(db_,
        "INSERT INTO episode_members (episode_id, position, memory_id) VALUES (?, ?, ?)");
    Statement backref(db_, "UPDATE memories SET episode_id = ? WHERE id = ?");
    for (size_t i = 0; i < member_ids.size(); ++i) {
        member.reset();
        member.bind_text(1, ep.id);
        member.bind_int64(2, static_cast<int64_t>(i));
        member.bind_text(3, member_ids[i]);
        member.step();
        
        backref.reset();
        backref.bind_text(1, ep.id);
        backref.bind_text(2, member_ids[i]);
        backref.step();
    }
    
    tx.commit();
    LOG_INFO("Created episode %s '%s' with %zu members", ep.id.c_str(), ep.title.c_str(),
             member_ids.size());
    return ep;
}

bool RecordStore::load_episode(const std::string& id, Episode& out) {
    std::lock_guard<std::recursive_mutex> lock(db_.mutex());
    Statement stmt(db_,
        "SELECT id, title, summary, participants, emotion, importance, start_time, end_time, "
        "created_at FROM episodes WHERE id = ?");
    stmt.bind_text(1, id);
    if (!stmt.step()) return false;
    
    Episode ep;
    ep.id = stmt.column_text(0);
    ep.title = stmt.column_text(1);
    ep.summary = stmt.column_text(2);
    ep.participants = decode_string_list(stmt.column_text(3));
    if (!parse_emotion(stmt.column_text(4), ep.emotion)) {
        throw StoreError("Corrupt emotion for episode " + ep.id);
    }
    ep.importance = static_cast<int>(stmt.column_int64(5));
    ep.start_time = stmt.column_int64(6);
    ep.end_time = stmt.column_int64(7);
    ep.created_at = stmt.column_int64(8);
    
    Statement members(db_,
        "SELECT memory_id FROM episode_members WHERE episode_id = ? ORDER BY position ASC");
    members.bind_text(1, id);
    while (members.step()) {
        ep.member_ids.push_back(members.column_text(0));
    }
    out = ep;
    return true;
}

Episode RecordStore::get_episode(const std::string& id) {
    Episode ep;
    if (!load_episode(id, ep)) {
        throw NotFoundError("Episode not found: " + id);
    }
    return ep;
}

std::vector<Episode> RecordStore::list_episodes(int limit) {
    std::lock_guard<std::recursive_mutex> lock(db_.mutex());
    std::vector<std::string> ids;
    {
        Statement stmt(db_, "SELECT id FROM episodes ORDER BY created_at DESC, id ASC LIMIT ?");
        stmt.bind_int64(1, limit);
        while (stmt.step()) ids.push_back(stmt.column_text(0));
    }
    std::vector<Episode> out;
    for (size_t i = 0; i < ids.size(); ++i) {
        Episode ep;
        if (load_episode(ids[i], ep)) out.push_back(ep);
    }
    return out;
}

void RecordStore::delete_episode(const std::string& id) {
    Transaction tx(db_);
    {
        Statement stmt(db_, "UPDATE memories SET episode_id = NULL WHERE episode_id = ?");
        stmt.bind_text(1, id);
        stmt.step();
    }
    Statement stmt(db_, "DELETE FROM episodes WHERE id = ?");
    stmt.bind_text(1, id);
    stmt.step();
    if (db_.changes() == 0) {
        throw NotFoundError("Episode not found: " + id);
    }
    tx.commit();
    LOG_INFO("Deleted episode %s", id.c_str());
}

} // namespace engram
