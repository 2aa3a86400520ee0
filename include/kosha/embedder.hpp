#pragma once
// Embedder: text becoming geometry
//
// Every embedder returns unit vectors of a fixed dimension, or throws
// EmbeddingError. A zero vector is never a valid answer.

#include "types.hpp"
#include "errors.hpp"
#include <array>
#include <cctype>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace kosha {

// Preprocessing pipeline shared by all embedders
class TextPreprocessor {
public:
    // Control characters become spaces, runs of spaces collapse, ends trimmed
    std::string normalize(const std::string& text) const {
        std::string result;
        result.reserve(text.size());

        for (size_t i = 0; i < text.size(); ++i) {
            unsigned char c = text[i];

            // Handle UTF-8 sequences
            if (c < 0x80) {
                if (c == '\t' || c == '\n' || c == '\r') {
                    result += ' ';
                } else if (c >= 0x20 && c != 0x7F) {
                    result += c;
                }
            } else if ((c & 0xE0) == 0xC0 && i + 1 < text.size()) {
                result += c;
                result += text[++i];
            } else if ((c & 0xF0) == 0xE0 && i + 2 < text.size()) {
                result += c;
                result += text[++i];
                result += text[++i];
            } else if ((c & 0xF8) == 0xF0 && i + 3 < text.size()) {
                result += c;
                result += text[++i];
                result += text[++i];
                result += text[++i];
            }
        }

        // Collapse multiple spaces
        std::string collapsed;
        bool last_space = true;
        for (char c : result) {
            if (c == ' ') {
                if (!last_space) {
                    collapsed += c;
                    last_space = true;
                }
            } else {
                collapsed += c;
                last_space = false;
            }
        }

        // Trim
        size_t start = collapsed.find_first_not_of(' ');
        size_t end = collapsed.find_last_not_of(' ');
        if (start == std::string::npos) return "";
        return collapsed.substr(start, end - start + 1);
    }

    // Lowercase (ASCII only, preserve unicode)
    std::string lowercase(const std::string& text) const {
        std::string result = text;
        for (char& c : result) {
            if (c >= 'A' && c <= 'Z') {
                c = c - 'A' + 'a';
            }
        }
        return result;
    }
};

// Abstract embedder interface
class Embedder {
public:
    virtual ~Embedder() = default;

    // Text to unit vector. Throws EmbeddingError.
    virtual Vector embed(const std::string& text) = 0;

    // Batch form; all-or-nothing
    virtual std::vector<Vector> embed_batch(const std::vector<std::string>& texts) {
        std::vector<Vector> results;
        results.reserve(texts.size());
        for (const auto& text : texts) {
            results.push_back(embed(text));
        }
        return results;
    }

    virtual size_t dimension() const = 0;

    virtual std::string name() const = 0;
};

// HashingEmbedder: deterministic, model-free
//
// Signed feature hashing of word unigrams plus boundary-marked character
// trigrams, so "withdraw" lands near "withdrawal" and "withdrawn".
// Stateless, safe to share across threads.
class HashingEmbedder : public Embedder {
public:
    struct Config {
        size_t dimension = EMBED_DIM;
        size_t ngram = 3;
        float word_weight = 1.0f;
        float ngram_weight = 0.5f;
        bool drop_stopwords = true;
    };

    HashingEmbedder() = default;
    explicit HashingEmbedder(Config config) : config_(config) {
        if (config_.dimension == 0) {
            throw std::invalid_argument("HashingEmbedder: dimension must be positive");
        }
    }

    Vector embed(const std::string& text) override {
        std::string normalized = preprocessor_.lowercase(preprocessor_.normalize(text));
        if (normalized.empty()) {
            throw EmbeddingError("text is empty after normalization");
        }

        auto words = split_words(normalized);
        std::vector<const std::string*> terms;
        for (const auto& w : words) {
            if (!config_.drop_stopwords || !is_stopword(w)) terms.push_back(&w);
        }
        // A query made only of stopwords still means something
        if (terms.empty()) {
            for (const auto& w : words) terms.push_back(&w);
        }
        if (terms.empty()) {
            throw EmbeddingError("no indexable terms in text");
        }

        Vector v(config_.dimension);
        for (const std::string* term : terms) {
            add_feature(v, "w:" + *term, config_.word_weight);

            std::string marked = "<" + *term + ">";
            if (config_.ngram > 0 && marked.size() > config_.ngram) {
                for (size_t i = 0; i + config_.ngram <= marked.size(); ++i) {
                    add_feature(v, "g:" + marked.substr(i, config_.ngram), config_.ngram_weight);
                }
            }
        }

        if (v.is_zero()) {
            throw EmbeddingError("features cancelled to a zero vector");
        }
        v.normalize();
        return v;
    }

    size_t dimension() const override { return config_.dimension; }

    std::string name() const override {
        return "hashing-" + std::to_string(config_.dimension);
    }

private:
    // FNV-1a, 64 bit
    static uint64_t hash(const std::string& s) {
        uint64_t h = 1469598103934665603ULL;
        for (unsigned char c : s) {
            h ^= c;
            h *= 1099511628211ULL;
        }
        return h;
    }

    void add_feature(Vector& v, const std::string& feature, float weight) const {
        uint64_t h = hash(feature);
        size_t bucket = static_cast<size_t>(h % config_.dimension);
        float sign = ((h >> 40) & 1) ? -1.0f : 1.0f;
        v[bucket] += sign * weight;
    }

    // Runs of ASCII alphanumerics and UTF-8 bytes; punctuation splits
    static std::vector<std::string> split_words(const std::string& text) {
        std::vector<std::string> words;
        std::string current;
        for (unsigned char c : text) {
            if (c >= 0x80 || std::isalnum(c)) {
                current += static_cast<char>(c);
            } else if (!current.empty()) {
                words.push_back(current);
                current.clear();
            }
        }
        if (!current.empty()) words.push_back(current);
        return words;
    }

    static bool is_stopword(const std::string& w) {
        static const std::unordered_set<std::string> stopwords = {
            "a", "an", "and", "are", "as", "at", "be", "by", "can", "do", "does",
            "for", "from", "how", "i", "in", "is", "it", "me", "my", "of", "on",
            "or", "the", "to", "what", "when", "where", "which", "with", "you", "your"
        };
        return stopwords.count(w) > 0;
    }

    Config config_;
    TextPreprocessor preprocessor_;
};

// CachingEmbedder: wraps any embedder with a bounded LRU cache
class CachingEmbedder : public Embedder {
public:
    CachingEmbedder(std::shared_ptr<Embedder> inner, size_t capacity = 10000)
        : inner_(std::move(inner)), capacity_(capacity) {
        if (!inner_) throw std::invalid_argument("CachingEmbedder: inner embedder is null");
    }

    Vector embed(const std::string& text) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = cache_.find(text);
            if (it != cache_.end()) {
                order_.splice(order_.begin(), order_, it->second.second);
                hits_++;
                return it->second.first;
            }
        }

        // Failures are not cached; the next call retries
        Vector v = inner_->embed(text);

        std::lock_guard<std::mutex> lock(mutex_);
        if (capacity_ == 0 || cache_.count(text)) return v;
        if (cache_.size() >= capacity_) {
            cache_.erase(order_.back());
            order_.pop_back();
        }
        order_.push_front(text);
        cache_.emplace(text, std::make_pair(v, order_.begin()));
        return v;
    }

    size_t dimension() const override { return inner_->dimension(); }

    std::string name() const override { return inner_->name(); }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cache_.size();
    }

    size_t hits() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return hits_;
    }

private:
    using Order = std::list<std::string>;

    std::shared_ptr<Embedder> inner_;
    size_t capacity_;
    mutable std::mutex mutex_;
    Order order_;
    std::unordered_map<std::string, std::pair<Vector, Order::iterator>> cache_;
    size_t hits_ = 0;
};

} // namespace kosha
