#include <engram/core/config.hpp>
#include <engram/core/logger.hpp>
#include <engram/core/utils.hpp>

namespace engram {

Config::Config() : data_(Json::object()) {}

bool Config::load_file(const std::string& path) {
    std::ifstream f(path.c_str());
    if (!f.is_open()) {
        last_error_ = "Cannot open config file: " + path;
        return false;
    }
    
    std::string content((std::istreambuf_iterator<char>(f)),
                        std::istreambuf_iterator<char>());
    return load_string(content);
}

bool Config::load_string(const std::string& json_str) {
    try {
        Json parsed = Json::parse(json_str);
        if (!parsed.is_object()) {
            last_error_ = "Config root must be a JSON object";
            return false;
        }
        data_ = parsed;
        return true;
    } catch (const std::exception& e) {
        last_error_ = std::string("Invalid config JSON: ") + e.what();
        return false;
    }
}

// Walk dot-separated sections (e.g., "consolidation.window_hours")
const Json& Config::lookup(const std::string& key) const {
    static Json null_json;
    std::vector<std::string> parts = split(key, '.');
    const Json* node = &data_;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!node->has(parts[i])) {
            LOG_DEBUG("Config: key '%s' not found", key.c_str());
            return null_json;
        }
        node = &(*node)[parts[i]];
    }
    return *node;
}

std::string Config::to_env_key(const std::string& key) {
    std::string env = "ENGRAM_" + to_upper(key);
    for (size_t i = 0; i < env.size(); ++i) {
        if (env[i] == '.' || env[i] == '-') env[i] = '_';
    }
    return env;
}

bool Config::env_value(const std::string& key, std::string& out) {
    const char* v = std::getenv(to_env_key(key).c_str());
    if (!v || !v[0]) return false;
    out = v;
    return true;
}

std::string Config::get_string(const std::string& key, const std::string& def) const {
    const Json& v = lookup(key);
    if (v.is_string()) {
        LOG_DEBUG("Config: found key '%s'", key.c_str());
        return v.as_string();
    }
    std::string env;
    if (env_value(key, env)) return env;
    return def;
}

int64_t Config::get_int(const std::string& key, int64_t def) const {
    const Json& v = lookup(key);
    if (v.is_number()) {
        LOG_DEBUG("Config: found key '%s'", key.c_str());
        return v.as_int();
    }
    std::string env;
    if (env_value(key, env)) {
        char* end = NULL;
        long long parsed = std::strtoll(env.c_str(), &end, 10);
        if (end && *end == '\0') return static_cast<int64_t>(parsed);
        LOG_WARN("Config: ignoring non-integer %s='%s'", to_env_key(key).c_str(), env.c_str());
    }
    return def;
}

double Config::get_double(const std::string& key, double def) const {
    const Json& v = lookup(key);
    if (v.is_number()) {
        LOG_DEBUG("Config: found key '%s'", key.c_str());
        return v.as_number();
    }
    std::string env;
    if (env_value(key, env)) {
        char* end = NULL;
        double parsed = std::strtod(env.c_str(), &end);
        if (end && *end == '\0') return parsed;
        LOG_WARN("Config: ignoring non-numeric %s='%s'", to_env_key(key).c_str(), env.c_str());
    }
    return def;
}

bool Config::get_bool(const std::string& key, bool def) const {
    const Json& v = lookup(key);
    if (v.is_bool()) {
        LOG_DEBUG("Config: found key '%s'", key.c_str());
        return v.as_bool();
    }
    std::string env;
    if (env_value(key, env)) {
        std::string n = to_lower(trim(env));
        if (n == "1" || n == "true" || n == "yes" || n == "on") return true;
        if (n == "0" || n == "false" || n == "no" || n == "off") return false;
    }
    return def;
}

const Json& Config::get_section(const std::string& key) const {
    return lookup(key);
}

} // namespace engram
