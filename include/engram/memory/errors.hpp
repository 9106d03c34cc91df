/*
 * engram C++11 - Memory Errors
 * 
 * Error kinds raised by the memory engine. The tool layer reports
 * error_kind_to_string(kind) to callers unchanged.
 */
#ifndef ENGRAM_MEMORY_ERRORS_HPP
#define ENGRAM_MEMORY_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace engram {

enum class ErrorKind {
    VALIDATION,   // Out-of-domain argument, rejected before any write
    NOT_FOUND,    // Unknown record/episode id
    STORE_IO,     // SQLite failure; the transaction was rolled back
    EMBEDDING     // Embedding collaborator failed or returned the wrong size
};

inline std::string error_kind_to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::VALIDATION: return "ValidationError";
        case ErrorKind::NOT_FOUND: return "NotFound";
        case ErrorKind::STORE_IO: return "StoreIOError";
        case ErrorKind::EMBEDDING: return "EmbeddingError";
    }
    return "StoreIOError";
}

class MemoryError : public std::runtime_error {
public:
    MemoryError(ErrorKind kind, const std::string& msg)
        : std::runtime_error(msg), kind_(kind) {}
    
    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class ValidationError : public MemoryError {
public:
    explicit ValidationError(const std::string& msg) : MemoryError(ErrorKind::VALIDATION, msg) {}
};

class NotFoundError : public MemoryError {
public:
    explicit NotFoundError(const std::string& msg) : MemoryError(ErrorKind::NOT_FOUND, msg) {}
};

class StoreError : public MemoryError {
public:
    explicit StoreError(const std::string& msg) : MemoryError(ErrorKind::STORE_IO, msg) {}
};

class EmbeddingError : public MemoryError {
public:
    explicit EmbeddingError(const std::string& msg) : MemoryError(ErrorKind::EMBEDDING, msg) {}
};

} // namespace engram

#endif // ENGRAM_MEMORY_ERRORS_HPP
