/*
 * engram C++11 - SQLite Connection
 * 
 * Thin RAII layer over one SQLite connection: prepared statements,
 * nested transactions (savepoints inside an outer BEGIN IMMEDIATE),
 * and the meta key/value table. Every SQLite failure is raised as
 * StoreError.
 */
#ifndef ENGRAM_MEMORY_DATABASE_HPP
#define ENGRAM_MEMORY_DATABASE_HPP

#include <string>
#include <vector>
#include <mutex>
#include <cstdint>
#include <sqlite3.h>

namespace engram {

class Database {
public:
    Database();
    ~Database();
    
    // Open (creating if needed) the database file and apply pragmas
    void open(const std::string& db_path);
    void close();
    bool is_open() const;
    const std::string& path() const { return path_; }
    
    // Execute one or more statements without results
    void exec(const std::string& sql);
    
    // Rows modified by the last statement
    int changes() const;
    
    // Meta operations
    void set_meta(const std::string& key, const std::string& value);
    std::string get_meta(const std::string& key, const std::string& default_val = "");
    
    sqlite3* handle() { return db_; }
    
    // Held by every read sequence and transaction on this connection
    std::recursive_mutex& mutex() { return mutex_; }

private:
    Database(const Database&);
    Database& operator=(const Database&);
    
    friend class Transaction;
    
    sqlite3* db_;
    std::string path_;
    std::recursive_mutex mutex_;
    int tx_depth_;
};

class Statement {
public:
    Statement(Database& db, const std::string& sql);
    ~Statement();
    
    void bind_text(int idx, const std::string& value);
    void bind_int64(int idx, int64_t value);
    void bind_double(int idx, double value);
    void bind_null(int idx);
    void bind_floats(int idx, const std::vector<float>& values);
    
    // true while a row is available, false when done
    bool step();
    void reset();
    
    std::string column_text(int col) const;
    int64_t column_int64(int col) const;
    double column_double(int col) const;
    bool column_is_null(int col) const;
    std::vector<float> column_floats(int col) const;

private:
    Statement(const Statement&);
    Statement& operator=(const Statement&);
    
    sqlite3* db_;
    sqlite3_stmt* stmt_;
};

// Scoped transaction. The outermost one issues BEGIN IMMEDIATE, nested
// ones become savepoints. Anything not committed is rolled back on
// destruction.
class Transaction {
public:
    explicit Transaction(Database& db);
    ~Transaction();
    
    void commit();

private:
    Transaction(const Transaction&);
    Transaction& operator=(const Transaction&);
    
    Database& db_;
    std::unique_lock<std::recursive_mutex> lock_;
    std::string savepoint_;
    bool active_;
};

} // namespace engram

#endif // ENGRAM_MEMORY_DATABASE_HPP
