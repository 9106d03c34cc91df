/*
 * engram C++11 - Embedding Collaborators
 * 
 * The engine consumes embeddings through the Embedder interface. Two
 * implementations ship: an offline feature-hashing embedder and a client
 * for OpenAI-compatible /embeddings endpoints.
 */
#ifndef ENGRAM_MEMORY_EMBEDDING_HPP
#define ENGRAM_MEMORY_EMBEDDING_HPP

#include <engram/core/http_client.hpp>
#include <string>
#include <vector>
#include <mutex>

namespace engram {

class Embedder {
public:
    virtual ~Embedder() {}
    
    // Deterministic for identical input; size() == dimension().
    // Throws EmbeddingError on failure.
    virtual std::vector<float> embed(const std::string& text) = 0;
    
    virtual size_t dimension() const = 0;
    virtual std::string name() const = 0;
};

// Signed feature hashing of character bigrams and ASCII words through
// SHA-256, L2-normalized. Empty text embeds to the zero vector.
class HashingEmbedder : public Embedder {
public:
    explicit HashingEmbedder(size_t dimension);
    
    std::vector<float> embed(const std::string& text);
    size_t dimension() const { return dimension_; }
    std::string name() const { return "hashing"; }

private:
    size_t dimension_;
    
    void add_feature(std::vector<float>& v, const std::string& feature, float weight) const;
};

class HttpEmbedder : public Embedder {
public:
    HttpEmbedder(const std::string& url, const std::string& model,
                 const std::string& api_key, size_t dimension, long timeout_ms);
    
    std::vector<float> embed(const std::string& text);
    size_t dimension() const { return dimension_; }
    std::string name() const { return "http:" + model_; }

private:
    std::string url_;
    std::string model_;
    std::string api_key_;
    size_t dimension_;
    HttpClient client_;
    std::mutex mutex_;
};

} // namespace engram

#endif // ENGRAM_MEMORY_EMBEDDING_HPP
