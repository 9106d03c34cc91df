#ifndef ENGRAM_CORE_CONFIG_HPP
#define ENGRAM_CORE_CONFIG_HPP

#include "json.hpp"
#include <string>
#include <fstream>
#include <cstdlib>

namespace engram {

// JSON-backed configuration. Keys use dot notation for nested sections
// ("recall.temperature"); a missing key falls back to the environment
// variable ENGRAM_<KEY> with dots mapped to underscores.
class Config {
public:
    Config();
    
    // Load from JSON file
    bool load_file(const std::string& path);
    
    // Load from JSON string
    bool load_string(const std::string& json_str);
    
    // Get string value with fallback to environment variable
    std::string get_string(const std::string& key, const std::string& def = "") const;
    
    int64_t get_int(const std::string& key, int64_t def = 0) const;
    
    double get_double(const std::string& key, double def = 0.0) const;
    
    bool get_bool(const std::string& key, bool def = false) const;
    
    // Get nested object
    const Json& get_section(const std::string& key) const;
    
    // Error from the last failed load
    const std::string& last_error() const { return last_error_; }

private:
    Json data_;
    std::string last_error_;
    
    const Json& lookup(const std::string& key) const;
    static bool env_value(const std::string& key, std::string& out);
    static std::string to_env_key(const std::string& key);
};

} // namespace engram

#endif // ENGRAM_CORE_CONFIG_HPP
