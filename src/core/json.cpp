#include <engram/core/json.hpp>
#include <cstdio>
#include <climits>

namespace engram {

namespace {

// Saturating conversions; out-of-range doubles never reach a cast.
int64_t clamp_int64(double d) {
    if (d != d) return 0;
    if (d >= 9223372036854775807.0) return INT64_MAX;
    if (d <= -9223372036854775807.0) return INT64_MIN;
    return static_cast<int64_t>(d);
}

int clamp_int(double d) {
    if (d != d) return 0;
    if (d >= static_cast<double>(INT_MAX)) return INT_MAX;
    if (d <= static_cast<double>(INT_MIN)) return INT_MIN;
    return static_cast<int>(d);
}

} // anonymous namespace

// Type checks
Json::Type Json::type() const { return type_; }
bool Json::is_null() const { return type_ == NUL; }
bool Json::is_bool() const { return type_ == BOOL; }
bool Json::is_number() const { return type_ == NUMBER; }
bool Json::is_string() const { return type_ == STRING; }
bool Json::is_array() const { return type_ == ARRAY; }
bool Json::is_object() const { return type_ == OBJECT; }

// Value accessors
bool Json::as_bool(bool def) const { 
    return type_ == BOOL ? bool_ : def; 
}

double Json::as_number(double def) const { 
    return type_ == NUMBER ? number_ : def; 
}

int64_t Json::as_int(int64_t def) const { 
    return type_ == NUMBER ? clamp_int64(number_) : def; 
}

std::string Json::as_string(const std::string& def) const { 
    return type_ == STRING ? string_ : def; 
}

const std::vector<Json>& Json::as_array() const {
    static std::vector<Json> empty;
    return type_ == ARRAY ? array_ : empty;
}

const std::map<std::string, Json>& Json::as_object() const {
    static std::map<std::string, Json> empty;
    return type_ == OBJECT ? object_ : empty;
}

// Object access
const Json& Json::operator[](const std::string& key) const {
    static Json null_json;
    if (type_ != OBJECT) return null_json;
    std::map<std::string, Json>::const_iterator it = object_.find(key);
    return it != object_.end() ? it->second : null_json;
}

const Json& Json::operator[](size_t idx) const {
    static Json null_json;
    if (type_ != ARRAY || idx >= array_.size()) return null_json;
    return array_[idx];
}

bool Json::has(const std::string& key) const {
    return type_ == OBJECT && object_.find(key) != object_.end();
}

size_t Json::size() const {
    if (type_ == ARRAY) return array_.size();
    if (type_ == OBJECT) return object_.size();
    return 0;
}

// Modifiers
void Json::set(const std::string& key, const Json& value) {
    if (type_ != OBJECT) {
        type_ = OBJECT;
        object_.clear();
    }
    object_[key] = value;
}

void Json::push(const Json& value) {
    if (type_ != ARRAY) {
        type_ = ARRAY;
        array_.clear();
    }
    array_.push_back(value);
}

// Helper getters with defaults
std::string Json::get_string(const std::string& key, const std::string& def) const {
    const Json& v = (*this)[key];
    return v.is_string() ? v.string_ : def;
}

int Json::get_int(const std::string& key, int def) const {
    const Json& v = (*this)[key];
    return v.is_number() ? clamp_int(v.number_) : def;
}

int64_t Json::get_int64(const std::string& key, int64_t def) const {
    const Json& v = (*this)[key];
    return v.is_number() ? clamp_int64(v.number_) : def;
}

double Json::get_double(const std::string& key, double def) const {
    const Json& v = (*this)[key];
    return v.is_number() ? v.number_ : def;
}

bool Json::get_bool(const std::string& key, bool def) const {
    const Json& v = (*this)[key];
    return v.is_bool() ? v.bool_ : def;
}

std::vector<std::string> Json::get_string_list(const std::string& key) const {
    std::vector<std::string> out;
    const std::vector<Json>& items = (*this)[key].as_array();
    for (size_t i = 0; i < items.size(); ++i) {
        if (items[i].is_string()) out.push_back(items[i].string_);
    }
    return out;
}

// Static constructors
Json Json::object() {
    Json j;
    j.type_ = OBJECT;
    return j;
}

Json Json::array() {
    Json j;
    j.type_ = ARRAY;
    return j;
}

Json Json::string_array(const std::vector<std::string>& items) {
    Json j = array();
    for (size_t i = 0; i < items.size(); ++i) {
        j.array_.push_back(Json(items[i]));
    }
    return j;
}

// Serialization
std::string Json::dump(int indent) const {
    std::ostringstream ss;
    dump_impl(ss, indent, 0);
    return ss.str();
}

// Parsing
Json Json::parse(const std::string& str) {
    size_t pos = 0;
    Json value = parse_value(str, pos);
    skip_ws(str, pos);
    if (pos != str.size()) {
        throw std::runtime_error("Unexpected trailing data at position " + std::to_string(pos));
    }
    return value;
}

void Json::write_newline(std::ostringstream& ss, int indent, int depth) {
    if (indent < 0) return;
    ss << '\n';
    for (int i = 0; i < indent * depth; ++i) ss << ' ';
}

void Json::dump_impl(std::ostringstream& ss, int indent, int depth) const {
    switch (type_) {
        case NUL:
            ss << "null";
            break;
        case BOOL:
            ss << (bool_ ? "true" : "false");
            break;
        case NUMBER: {
            int64_t i = clamp_int64(number_);
            if (number_ == static_cast<double>(i) && i != INT64_MAX && i != INT64_MIN) {
                ss << i;
            } else {
                char buf[32];
                snprintf(buf, sizeof(buf), "%.10g", number_);
                ss << buf;
            }
            break;
        }
        case STRING:
            ss << '"';
            escape_string(ss, string_);
            ss << '"';
            break;
        case ARRAY:
            ss << '[';
            for (size_t i = 0; i < array_.size(); ++i) {
                if (i > 0) ss << ',';
                write_newline(ss, indent, depth + 1);
                array_[i].dump_impl(ss, indent, depth + 1);
            }
            if (!array_.empty()) write_newline(ss, indent, depth);
            ss << ']';
            break;
        case OBJECT: {
            ss << '{';
            bool first = true;
            for (std::map<std::string, Json>::const_iterator it = object_.begin();
                 it != object_.end(); ++it) {
                if (!first) ss << ',';
                first = false;
                write_newline(ss, indent, depth + 1);
                ss << '"';
                escape_string(ss, it->first);
                ss << (indent < 0 ? "\":" : "\": ");
                it->second.dump_impl(ss, indent, depth + 1);
            }
            if (!object_.empty()) write_newline(ss, indent, depth);
            ss << '}';
            break;
        }
    }
}

void Json::escape_string(std::ostringstream& ss, const std::string& s) {
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        switch (c) {
            case '"': ss << "\\\""; break;
            case '\\': ss << "\\\\"; break;
            case '\b': ss << "\\b"; break;
            case '\f': ss << "\\f"; break;
            case '\n': ss << "\\n"; break;
            case '\r': ss << "\\r"; break;
            case '\t': ss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    snprintf(buf, sizeof(buf), "\\u%04x", (unsigned char)c);
                    ss << buf;
                } else {
                    ss << c;
                }
        }
    }
}

void Json::append_utf8(std::string& out, unsigned long cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

void Json::skip_ws(const std::string& s, size_t& pos) {
    while (pos < s.size() && std::isspace(static_cast<unsigned char>(s[pos]))) pos++;
}

Json Json::parse_value(const std::string& s, size_t& pos) {
    skip_ws(s, pos);
    if (pos >= s.size()) {
        throw std::runtime_error("Unexpected end of JSON input");
    }
    
    char c = s[pos];
    if (c == 'n') return parse_null(s, pos);
    if (c == 't' || c == 'f') return parse_bool(s, pos);
    if (c == '"') return parse_string(s, pos);
    if (c == '[') return parse_array(s, pos);
    if (c == '{') return parse_object(s, pos);
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parse_number(s, pos);
    
    throw std::runtime_error("Invalid JSON at position " + std::to_string(pos));
}

Json Json::parse_null(const std::string& s, size_t& pos) {
    if (s.compare(pos, 4, "null") == 0) {
        pos += 4;
        return Json();
    }
    throw std::runtime_error("Expected 'null'");
}

Json Json::parse_bool(const std::string& s, size_t& pos) {
    if (s.compare(pos, 4, "true") == 0) {
        pos += 4;
        return Json(true);
    }
    if (s.compare(pos, 5, "false") == 0) {
        pos += 5;
        return Json(false);
    }
    throw std::runtime_error("Expected boolean");
}

Json Json::parse_number(const std::string& s, size_t& pos) {
    size_t start = pos;
    if (s[pos] == '-') pos++;
    while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) pos++;
    if (pos < s.size() && s[pos] == '.') {
        pos++;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) pos++;
    }
    if (pos < s.size() && (s[pos] == 'e' || s[pos] == 'E')) {
        pos++;
        if (pos < s.size() && (s[pos] == '+' || s[pos] == '-')) pos++;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) pos++;
    }
    return Json(std::strtod(s.substr(start, pos - start).c_str(), NULL));
}

Json Json::parse_string(const std::string& s, size_t& pos) {
    pos++; // skip opening quote
    std::string result;
    while (pos < s.size() && s[pos] != '"') {
        if (s[pos] == '\\' && pos + 1 < s.size()) {
            pos++;
            switch (s[pos]) {
                case '"': result += '"'; break;
                case '\\': result += '\\'; break;
                case '/': result += '/'; break;
                case 'b': result += '\b'; break;
                case 'f': result += '\f'; break;
                case 'n': result += '\n'; break;
                case 'r': result += '\r'; break;
                case 't': result += '\t'; break;
                case 'u': {
                    if (pos + 4 >= s.size()) {
                        throw std::runtime_error("Truncated \\u escape");
                    }
                    unsigned long cp = std::strtoul(s.substr(pos + 1, 4).c_str(), NULL, 16);
                    pos += 4;
                    // Surrogate pair
                    if (cp >= 0xD800 && cp <= 0xDBFF && pos + 6 < s.size() &&
                        s[pos + 1] == '\\' && s[pos + 2] == 'u') {
                        unsigned long lo = std::strtoul(s.substr(pos + 3, 4).c_str(), NULL, 16);
                        if (lo >= 0xDC00 && lo <= 0xDFFF) {
                            cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                            pos += 6;
                        }
                    }
                    append_utf8(result, cp);
                    break;
                }
                default: result += s[pos];
            }
        } else {
            result += s[pos];
        }
        pos++;
    }
    if (pos >= s.size()) {
        throw std::runtime_error("Unterminated JSON string");
    }
    pos++; // skip closing quote
    return Json(result);
}

Json Json::parse_array(const std::string& s, size_t& pos) {
    pos++; // skip [
    std::vector<Json> arr;
    skip_ws(s, pos);
    if (pos < s.size() && s[pos] == ']') {
        pos++;
        return Json(arr);
    }
    while (true) {
        arr.push_back(parse_value(s, pos));
        skip_ws(s, pos);
        if (pos >= s.size()) {
            throw std::runtime_error("Unterminated JSON array");
        }
        if (s[pos] == ']') {
            pos++;
            break;
        }
        if (s[pos] != ',') {
            throw std::runtime_error("Expected ',' in array at position " + std::to_string(pos));
        }
        pos++;
    }
    return Json(arr);
}

Json Json::parse_object(const std::string& s, size_t& pos) {
    pos++; // skip {
    std::map<std::string, Json> obj;
    skip_ws(s, pos);
    if (pos < s.size() && s[pos] == '}') {
        pos++;
        return Json(obj);
    }
    while (true) {
        skip_ws(s, pos);
        if (pos >= s.size() || s[pos] != '"') {
            throw std::runtime_error("Expected object key at position " + std::to_string(pos));
        }
        Json key = parse_string(s, pos);
        skip_ws(s, pos);
        if (pos >= s.size() || s[pos] != ':') {
            throw std::runtime_error("Expected ':' at position " + std::to_string(pos));
        }
        pos++; // skip :
        obj[key.as_string()] = parse_value(s, pos);
        skip_ws(s, pos);
        if (pos >= s.size()) {
            throw std::runtime_error("Unterminated JSON object");
        }
        if (s[pos] == '}') {
            pos++;
            break;
        }
        if (s[pos] != ',') {
            throw std::runtime_error("Expected ',' in object at position " + std::to_string(pos));
        }
        pos++;
    }
    return Json(obj);
}

} // namespace engram
