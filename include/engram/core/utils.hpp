#ifndef ENGRAM_CORE_UTILS_HPP
#define ENGRAM_CORE_UTILS_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <ctime>

namespace engram {

// ============ Math utilities ============

// Clamp a value between min and max
template<typename T>
T clamp(T value, T min_val, T max_val) {
    if (value < min_val) return min_val;
    if (value > max_val) return max_val;
    return value;
}

// ============ Time utilities ============

// Get current Unix timestamp in milliseconds
int64_t current_timestamp_ms();

// Format a millisecond timestamp as ISO 8601 string (YYYY-MM-DDTHH:MM:SSZ)
std::string format_timestamp_ms(int64_t timestamp_ms);

// ============ String utilities ============

// Trim whitespace from both ends of a string
std::string trim(const std::string& s);

// Trim whitespace from left side
std::string ltrim(const std::string& s);

// Trim whitespace from right side
std::string rtrim(const std::string& s);

// Convert string to lowercase (ASCII only, UTF-8 bytes pass through)
std::string to_lower(const std::string& s);

// Convert string to uppercase
std::string to_upper(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delimiter);

// Join strings with delimiter
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// Truncate string safely (UTF-8 aware, doesn't break multi-byte chars)
std::string truncate_safe(const std::string& s, size_t max_len);

// First max_chars code points of a UTF-8 string
std::string utf8_prefix(const std::string& s, size_t max_chars);

// Decode UTF-8 into code points; invalid bytes decode as themselves
std::vector<uint32_t> utf8_decode(const std::string& s);

// Encode a single code point as UTF-8
std::string utf8_encode(uint32_t cp);

// ============ Path utilities ============

// Resolve ~ to home directory
std::string resolve_user_path(const std::string& path);

// Get home directory
std::string get_home_dir();

// Join path components
std::string join_path(const std::string& a, const std::string& b);

// Get directory name from path
std::string dirname(const std::string& path);

// Check if path exists
bool path_exists(const std::string& path);

// Create directory (and parents if needed)
bool mkdir_p(const std::string& path);

// ============ UUID utilities ============

// Generate a random UUID v4 (throws std::runtime_error if the RNG fails)
std::string generate_uuid();

// ============ Hashing utilities ============

// Raw 32-byte SHA256 digest
std::string sha256_digest(const std::string& data);

} // namespace engram

#endif // ENGRAM_CORE_UTILS_HPP
