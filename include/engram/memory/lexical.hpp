/*
 * engram C++11 - Lexical Ranker
 * 
 * Character-bigram inverted index with BM25 scoring. Bigrams are taken
 * over Unicode code points inside runs of non-separator characters, so
 * text without whitespace word boundaries (Japanese, Chinese) indexes
 * the same way as space-delimited text.
 */
#ifndef ENGRAM_MEMORY_LEXICAL_HPP
#define ENGRAM_MEMORY_LEXICAL_HPP

#include <string>
#include <vector>
#include <map>
#include <mutex>

namespace engram {

// Overlapping code-point bigrams over normalize_text() output. A run of
// a single character contributes that character as a unigram.
std::vector<std::string> bigram_tokenize(const std::string& text);

class LexicalIndex {
public:
    explicit LexicalIndex(double k1 = 1.5, double b = 0.75);
    
    // Index (or re-index) a document
    void add(const std::string& doc_id, const std::string& text);
    void remove(const std::string& doc_id);
    void clear();
    
    bool contains(const std::string& doc_id) const;
    size_t size() const;
    
    // BM25 score of every document sharing at least one bigram with the
    // query. Documents with no matching bigram are absent.
    std::map<std::string, double> score_all(const std::string& query) const;
    
    // score_all sorted by descending score (ties by id), truncated to limit
    std::vector<std::pair<std::string, double> > search(const std::string& query, size_t limit) const;

private:
    double k1_;
    double b_;
    
    // term -> (doc id -> term frequency)
    std::map<std::string, std::map<std::string, int> > postings_;
    // doc id -> distinct terms, for removal
    std::map<std::string, std::vector<std::string> > doc_terms_;
    std::map<std::string, size_t> doc_len_;
    size_t total_len_;
    
    mutable std::mutex mutex_;
    
    void remove_locked(const std::string& doc_id);
};

} // namespace engram

#endif // ENGRAM_MEMORY_LEXICAL_HPP
