/*
 * engram C++11 - SQLite Connection Implementation
 */
#include <engram/memory/database.hpp>
#include <engram/memory/errors.hpp>
#include <engram/core/logger.hpp>
#include <cstring>

namespace engram {

namespace {

std::string db_message(sqlite3* db, const std::string& context) {
    std::string msg = context;
    if (db) {
        msg += ": ";
        msg += sqlite3_errmsg(db);
    }
    return msg;
}

} // anonymous namespace

// ============ Database ============

Database::Database() : db_(nullptr), tx_depth_(0) {}

Database::~Database() {
    close();
}

void Database::open(const std::string& db_path) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (db_) {
        close();
    }
    
    int rc = sqlite3_open_v2(db_path.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::string err = db_message(db_, "Cannot open database '" + db_path + "'");
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw StoreError(err);
    }
    path_ = db_path;
    
    sqlite3_busy_timeout(db_, 5000);
    
    // WAL lets readers proceed while a consolidation run writes
    exec("PRAGMA journal_mode=WAL");
    exec("PRAGMA synchronous=NORMAL");
    exec("PRAGMA foreign_keys=ON");
    
    LOG_DEBUG("Opened database %s", db_path.c_str());
}

void Database::close() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool Database::is_open() const {
    return db_ != nullptr;
}

void Database::exec(const std::string& sql) {
    if (!db_) {
        throw StoreError("Database not open");
    }
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : sqlite3_errstr(rc);
        sqlite3_free(err);
        throw StoreError("SQL error: " + msg);
    }
}

int Database::changes() const {
    return db_ ? sqlite3_changes(db_) : 0;
}

void Database::set_meta(const std::string& key, const std::string& value) {
    Statement stmt(*this, "INSERT OR REPLACE INTO meta (key, value) VALUES (?, ?)");
    stmt.bind_text(1, key);
    stmt.bind_text(2, value);
    stmt.step();
}

std::string Database::get_meta(const std::string& key, const std::string& default_val) {
    Statement stmt(*this, "SELECT value FROM meta WHERE key = ?");
    stmt.bind_text(1, key);
    if (stmt.step()) {
        return stmt.column_text(0);
    }
    return default_val;
}

// ============ Statement ============

Statement::Statement(Database& db, const std::string& sql)
    : db_(db.handle())
    , stmt_(nullptr)
{
    if (!db_) {
        throw StoreError("Database not open");
    }
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
        throw StoreError(db_message(db_, "Failed to prepare statement"));
    }
}

Statement::~Statement() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

void Statement::bind_text(int idx, const std::string& value) {
    if (sqlite3_bind_text(stmt_, idx, value.c_str(), static_cast<int>(value.size()),
                          SQLITE_TRANSIENT) != SQLITE_OK) {
        throw StoreError(db_message(db_, "Failed to bind text"));
    }
}

void Statement::bind_int64(int idx, int64_t value) {
    if (sqlite3_bind_int64(stmt_, idx, static_cast<sqlite3_int64>(value)) != SQLITE_OK) {
        throw StoreError(db_message(db_, "Failed to bind integer"));
    }
}

void Statement::bind_double(int idx, double value) {
    if (sqlite3_bind_double(stmt_, idx, value) != SQLITE_OK) {
        throw StoreError(db_message(db_, "Failed to bind double"));
    }
}

void Statement::bind_null(int idx) {
    if (sqlite3_bind_null(stmt_, idx) != SQLITE_OK) {
        throw StoreError(db_message(db_, "Failed to bind null"));
    }
}

void Statement::bind_floats(int idx, const std::vector<float>& values) {
    int bytes = static_cast<int>(values.size() * sizeof(float));
    const void* data = values.empty() ? static_cast<const void*>("") : static_cast<const void*>(&values[0]);
    if (sqlite3_bind_blob(stmt_, idx, data, bytes, SQLITE_TRANSIENT) != SQLITE_OK) {
        throw StoreError(db_message(db_, "Failed to bind blob"));
    }
}

bool Statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw StoreError(db_message(db_, "Statement failed"));
}

void Statement::reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
}

std::string Statement::column_text(int col) const {
    const unsigned char* text = sqlite3_column_text(stmt_, col);
    if (!text) return "";
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt_, col)));
}

int64_t Statement::column_int64(int col) const {
    return static_cast<int64_t>(sqlite3_column_int64(stmt_, col));
}

double Statement::column_double(int col) const {
    return sqlite3_column_double(stmt_, col);
}

bool Statement::column_is_null(int col) const {
    return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
}

std::vector<float> Statement::column_floats(int col) const {
    const void* blob = sqlite3_column_blob(stmt_, col);
    int bytes = sqlite3_column_bytes(stmt_, col);
    std::vector<float> out;
    if (!blob || bytes <= 0) return out;
    out.resize(static_cast<size_t>(bytes) / sizeof(float));
    std::memcpy(&out[0], blob, out.size() * sizeof(float));
    return out;
}

// ============ Transaction ============

Transaction::Transaction(Database& db)
    : db_(db)
    , lock_(db.mutex())
    , active_(false)
{
    if (db_.tx_depth_ == 0) {
        db_.exec("BEGIN IMMEDIATE");
    } else {
        savepoint_ = "sp_" + std::to_string(db_.tx_depth_);
        db_.exec("SAVEPOINT " + savepoint_);
    }
    ++db_.tx_depth_;
    active_ = true;
}

Transaction::~Transaction() {
    if (!active_) return;
    --db_.tx_depth_;
    try {
        if (savepoint_.empty()) {
            db_.exec("ROLLBACK");
        } else {
            db_.exec("ROLLBACK TO " + savepoint_);
            db_.exec("RELEASE " + savepoint_);
        }
    } catch (const StoreError& e) {
        LOG_ERROR("Transaction rollback failed: %s", e.what());
    }
}

void Transaction::commit() {
    if (!active_) {
        throw StoreError("Transaction already finished");
    }
    if (savepoint_.empty()) {
        db_.exec("COMMIT");
    } else {
        db_.exec("RELEASE " + savepoint_);
    }
    active_ = false;
    --db_.tx_depth_;
}

} // namespace engram
