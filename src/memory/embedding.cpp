/*
 * engram C++11 - Embedding Collaborators Implementation
 */
#include <engram/memory/embedding.hpp>
#include <engram/memory/errors.hpp>
#include <engram/memory/lexical.hpp>
#include <engram/memory/normalizer.hpp>
#include <engram/core/logger.hpp>
#include <engram/core/utils.hpp>
#include <cctype>
#include <cmath>
#include <sstream>

namespace engram {

// ============ HashingEmbedder ============

HashingEmbedder::HashingEmbedder(size_t dimension)
    : dimension_(dimension)
{
}

void HashingEmbedder::add_feature(std::vector<float>& v, const std::string& feature,
                                  float weight) const {
    std::string digest = sha256_digest(feature);
    uint32_t bucket = 0;
    for (int i = 0; i < 4; ++i) {
        bucket = (bucket << 8) | static_cast<unsigned char>(digest[i]);
    }
    float sign = (static_cast<unsigned char>(digest[4]) & 1) ? -1.0f : 1.0f;
    v[bucket % dimension_] += sign * weight;
}

std::vector<float> HashingEmbedder::embed(const std::string& text) {
    std::vector<float> v(dimension_, 0.0f);
    if (dimension_ == 0) return v;
    
    std::string normalized = normalize_text(text);
    std::vector<std::string> grams = bigram_tokenize(normalized);
    for (size_t i = 0; i < grams.size(); ++i) {
        add_feature(v, "g:" + grams[i], 1.0f);
    }
    
    // Whole ASCII words sharpen matches on space-delimited text
    std::string word;
    for (size_t i = 0; i <= normalized.size(); ++i) {
        unsigned char c = i < normalized.size() ? static_cast<unsigned char>(normalized[i]) : ' ';
        if (c < 0x80 && std::isalnum(c)) {
            word += static_cast<char>(c);
        } else if (!word.empty()) {
            add_feature(v, "w:" + word, 2.0f);
            word.clear();
        }
    }
    
    double norm = 0.0;
    for (size_t i = 0; i < v.size(); ++i) norm += static_cast<double>(v[i]) * v[i];
    if (norm > 0.0) {
        float inv = static_cast<float>(1.0 / std::sqrt(norm));
        for (size_t i = 0; i < v.size(); ++i) v[i] *= inv;
    }
    return v;
}

// ============ HttpEmbedder ============

HttpEmbedder::HttpEmbedder(const std::string& url, const std::string& model,
                           const std::string& api_key, size_t dimension, long timeout_ms)
    : url_(url)
    , model_(model)
    , api_key_(api_key)
    , dimension_(dimension)
{
    client_.set_timeout(timeout_ms);
}

std::vector<float> HttpEmbedder::embed(const std::string& text) {
    Json body = Json::object();
    body.set("model", model_);
    body.set("input", normalize_text(text));
    
    std::map<std::string, std::string> headers;
    if (!api_key_.empty()) {
        headers["Authorization"] = "Bearer " + api_key_;
    }
    
    HttpResponse resp;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        resp = client_.post_json(url_, body, headers);
    }
    if (!resp.ok()) {
        LOG_WARN("Embedding request to %s failed: %s", url_.c_str(), resp.error.c_str());
        throw EmbeddingError("Embedding request failed: " + resp.error);
    }
    
    Json parsed;
    try {
        parsed = Json::parse(resp.body);
    } catch (const std::runtime_error& e) {
        throw EmbeddingError(std::string("Malformed embedding response: ") + e.what());
    }
    
    // OpenAI-compatible: data[0].embedding; some servers answer {"embedding": [...]}
    const Json* values = &parsed["embedding"];
    if (parsed["data"].is_array() && parsed["data"].size() > 0) {
        values = &parsed["data"][static_cast<size_t>(0)]["embedding"];
    }
    if (!values->is_array()) {
        throw EmbeddingError("Embedding response has no embedding array");
    }
    
    const std::vector<Json>& items = values->as_array();
    if (items.size() != dimension_) {
        std::ostringstream oss;
        oss << "Embedding service returned dimension " << items.size()
            << ", expected " << dimension_;
        throw EmbeddingError(oss.str());
    }
    
    std::vector<float> out;
    out.reserve(items.size());
    for (size_t i = 0; i < items.size(); ++i) {
        if (!items[i].is_number()) {
            throw EmbeddingError("Embedding array contains a non-numeric value");
        }
        out.push_back(static_cast<float>(items[i].as_number()));
    }
    return out;
}

} // namespace engram
