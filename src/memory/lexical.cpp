/*
 * engram C++11 - Lexical Ranker Implementation
 */
#include <engram/memory/lexical.hpp>
#include <engram/memory/normalizer.hpp>
#include <engram/core/utils.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <set>

namespace engram {

namespace {

bool is_separator(uint32_t cp) {
    if (cp < 0x80) {
        return !std::isalnum(static_cast<int>(cp));
    }
    // General punctuation, CJK symbols and punctuation, fullwidth ASCII punctuation
    if (cp >= 0x2000 && cp <= 0x206F) return true;
    if (cp >= 0x3000 && cp <= 0x303F) return true;
    if ((cp >= 0xFF01 && cp <= 0xFF0F) || (cp >= 0xFF1A && cp <= 0xFF20) ||
        (cp >= 0xFF3B && cp <= 0xFF40) || (cp >= 0xFF5B && cp <= 0xFF65)) return true;
    return cp == 0x00A0 || cp == 0x00B7;
}

void flush_run(const std::vector<uint32_t>& run, std::vector<std::string>& out) {
    if (run.size() == 1) {
        out.push_back(utf8_encode(run[0]));
        return;
    }
    for (size_t i = 0; i + 1 < run.size(); ++i) {
        out.push_back(utf8_encode(run[i]) + utf8_encode(run[i + 1]));
    }
}

} // anonymous namespace

std::vector<std::string> bigram_tokenize(const std::string& text) {
    std::vector<uint32_t> cps = utf8_decode(normalize_text(text));
    std::vector<std::string> tokens;
    std::vector<uint32_t> run;
    for (size_t i = 0; i < cps.size(); ++i) {
        if (is_separator(cps[i])) {
            if (!run.empty()) flush_run(run, tokens);
            run.clear();
        } else {
            run.push_back(cps[i]);
        }
    }
    if (!run.empty()) flush_run(run, tokens);
    return tokens;
}

LexicalIndex::LexicalIndex(double k1, double b)
    : k1_(k1)
    , b_(b)
    , total_len_(0)
{
}

void LexicalIndex::add(const std::string& doc_id, const std::string& text) {
    std::vector<std::string> tokens = bigram_tokenize(text);
    std::map<std::string, int> tf;
    for (size_t i = 0; i < tokens.size(); ++i) {
        tf[tokens[i]]++;
    }
    
    std::lock_guard<std::mutex> lock(mutex_);
    remove_locked(doc_id);
    
    std::vector<std::string>& terms = doc_terms_[doc_id];
    for (std::map<std::string, int>::const_iterator it = tf.begin(); it != tf.end(); ++it) {
        postings_[it->first][doc_id] = it->second;
        terms.push_back(it->first);
    }
    doc_len_[doc_id] = tokens.size();
    total_len_ += tokens.size();
}

void LexicalIndex::remove(const std::string& doc_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    remove_locked(doc_id);
}

void LexicalIndex::remove_locked(const std::string& doc_id) {
    std::map<std::string, std::vector<std::string> >::iterator it = doc_terms_.find(doc_id);
    if (it == doc_terms_.end()) return;
    
    for (size_t i = 0; i < it->second.size(); ++i) {
        std::map<std::string, std::map<std::string, int> >::iterator p = postings_.find(it->second[i]);
        if (p == postings_.end()) continue;
        p->second.erase(doc_id);
        if (p->second.empty()) postings_.erase(p);
    }
    total_len_ -= doc_len_[doc_id];
    doc_len_.erase(doc_id);
    doc_terms_.erase(it);
}

void LexicalIndex::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    postings_.clear();
    doc_terms_.clear();
    doc_len_.clear();
    total_len_ = 0;
}

bool LexicalIndex::contains(const std::string& doc_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return doc_len_.count(doc_id) > 0;
}

size_t LexicalIndex::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return doc_len_.size();
}

std::map<std::string, double> LexicalIndex::score_all(const std::string& query) const {
    std::vector<std::string> tokens = bigram_tokenize(query);
    std::set<std::string> terms(tokens.begin(), tokens.end());
    
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, double> scores;
    if (doc_len_.empty()) return scores;
    
    double n_docs = static_cast<double>(doc_len_.size());
    double avg_len = static_cast<double>(total_len_) / n_docs;
    if (avg_len <= 0.0) avg_len = 1.0;
    
    for (std::set<std::string>::const_iterator t = terms.begin(); t != terms.end(); ++t) {
        std::map<std::string, std::map<std::string, int> >::const_iterator p = postings_.find(*t);
        if (p == postings_.end()) continue;
        
        double df = static_cast<double>(p->second.size());
        double idf = std::log((n_docs - df + 0.5) / (df + 0.5) + 1.0);
        
        for (std::map<std::string, int>::const_iterator d = p->second.begin();
             d != p->second.end(); ++d) {
            double tf = static_cast<double>(d->second);
            double len = static_cast<double>(doc_len_.find(d->first)->second);
            double norm = tf + k1_ * (1.0 - b_ + b_ * len / avg_len);
            scores[d->first] += idf * (tf * (k1_ + 1.0)) / norm;
        }
    }
    return scores;
}

namespace {

bool by_score_desc(const std::pair<std::string, double>& a, const std::pair<std::string, double>& b) {
    if (a.second != b.second) return a.second > b.second;
    return a.first < b.first;
}

} // anonymous namespace

std::vector<std::pair<std::string, double> > LexicalIndex::search(const std::string& query,
                                                                   size_t limit) const {
    std::map<std::string, double> scores = score_all(query);
    std::vector<std::pair<std::string, double> > out(scores.begin(), scores.end());
    std::sort(out.begin(), out.end(), by_score_desc);
    if (out.size() > limit) out.resize(limit);
    return out;
}

} // namespace engram
