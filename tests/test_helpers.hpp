/*
 * engram C++11 - shared test harness
 */
#ifndef ENGRAM_TESTS_TEST_HELPERS_HPP
#define ENGRAM_TESTS_TEST_HELPERS_HPP

#include <engram/memory/manager.hpp>
#include <engram/memory/errors.hpp>
#include <engram/core/logger.hpp>
#include <engram/core/utils.hpp>
#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>
#include <string>

#define TEST_ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            fprintf(stderr, "TEST FAILED: %s (%s:%d)\n", msg, __FILE__, __LINE__); \
            exit(1); \
        } \
    } while(0)

// Evaluates stmt and fails unless it throws ExType
#define TEST_THROWS(stmt, ExType, msg) \
    do { \
        bool thrown_ = false; \
        try { \
            stmt; \
        } catch (const ExType&) { \
            thrown_ = true; \
        } \
        TEST_ASSERT(thrown_, msg); \
    } while(0)

namespace engram {
namespace test {

// Throwaway database file in the temp directory, removed with its WAL files
class TempDb {
public:
    explicit TempDb(const std::string& tag) {
        const char* tmp = getenv("TMPDIR");
        std::string dir = (tmp && *tmp) ? tmp : "/tmp";
        path_ = join_path(dir, "engram-" + tag + "-" + generate_uuid() + ".db");
    }
    
    ~TempDb() {
        unlink(path_.c_str());
        unlink((path_ + "-wal").c_str());
        unlink((path_ + "-shm").c_str());
    }
    
    const std::string& path() const { return path_; }

private:
    std::string path_;
};

inline MemoryConfig test_config(const TempDb& db) {
    MemoryConfig config;
    config.db_path = db.path();
    config.embedding.dimension = 128;
    config.recall.options.random_seed = 42;
    return config;
}

inline MemoryRecord draft(const std::string& content, int importance = 3,
                          Emotion emotion = Emotion::NEUTRAL,
                          Category category = Category::DAILY) {
    MemoryRecord r;
    r.content = content;
    r.importance = importance;
    r.emotion = emotion;
    r.category = category;
    return r;
}

inline void quiet_logs() {
    Logger::instance().set_level(LogLevel::ERROR);
}

} // namespace test
} // namespace engram

#endif // ENGRAM_TESTS_TEST_HELPERS_HPP
