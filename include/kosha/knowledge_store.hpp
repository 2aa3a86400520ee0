#pragma once
// KnowledgeStore: passages, their vectors, and the files that hold them
//
// The active state is an immutable Snapshot behind a shared_ptr.
// search() copies the pointer and works on that snapshot without locks.
// ingest() builds the next snapshot on the side, persists it, then swaps.
// A reader therefore sees either the whole old state or the whole new one.
//
// On disk (under config.path):
//   index.bin      FlatIndex::serialize()
//   passages.json  [{id, title, content}, ...] in row order

#include "types.hpp"
#include "errors.hpp"
#include "embedder.hpp"
#include "flat_index.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace kosha {

using json = nlohmann::json;

struct StoreConfig {
    std::string path = "./knowledge_base";  // Empty = memory only, nothing persisted
};

struct StoreStats {
    size_t passages = 0;
    size_t index_size = 0;
    size_t dimension = 0;
    std::string embedder;
};

class KnowledgeStore {
public:
    KnowledgeStore(StoreConfig config, std::shared_ptr<Embedder> embedder)
        : config_(std::move(config))
        , embedder_(std::move(embedder))
    {
        if (!embedder_) throw std::invalid_argument("KnowledgeStore: embedder is null");
        snapshot_ = std::make_shared<const Snapshot>(embedder_->dimension());
    }

    KnowledgeStore(const KnowledgeStore&) = delete;
    KnowledgeStore& operator=(const KnowledgeStore&) = delete;

    // Load persisted state, or start empty when there is none.
    // Throws StoreCorruptError when the files disagree.
    void open() {
        std::lock_guard<std::mutex> write_lock(write_mutex_);
        if (opened_) return;

        if (config_.path.empty()) {
            opened_ = true;
            return;
        }

        bool has_index = file_exists(index_path());
        bool has_meta = file_exists(passages_path());

        if (!has_index && !has_meta) {
            std::cerr << "[KnowledgeStore] No index at " << config_.path << ", starting empty\n";
            opened_ = true;
            return;
        }
        if (has_index != has_meta) {
            throw StoreCorruptError("Knowledge store at " + config_.path + " is incomplete: " +
                (has_index ? passages_path() : index_path()) + " is missing");
        }

        auto loaded = std::make_shared<Snapshot>(embedder_->dimension());
        loaded->index = load_index();
        loaded->passages = load_passages();

        if (loaded->index.size() != loaded->passages.size()) {
            throw StoreCorruptError("Knowledge store at " + config_.path + " is inconsistent: index has " +
                std::to_string(loaded->index.size()) + " rows but metadata lists " +
                std::to_string(loaded->passages.size()) + " passages");
        }
        if (loaded->index.dimension() != embedder_->dimension()) {
            throw StoreCorruptError("Index dimension " + std::to_string(loaded->index.dimension()) +
                " does not match embedder " + embedder_->name() + " (" +
                std::to_string(embedder_->dimension()) + ")");
        }

        for (const auto& p : loaded->passages) {
            loaded->next_id = std::max(loaded->next_id, p.id + 1);
        }

        publish(std::move(loaded));
        opened_ = true;
        std::cerr << "[KnowledgeStore] Loaded " << size() << " passages from " << config_.path << "\n";
    }

    bool is_open() const {
        std::lock_guard<std::mutex> lock(write_mutex_);
        return opened_;
    }

    // Embed, append, persist, swap. All or nothing: on IngestError the
    // active snapshot and the files are as they were.
    // Throws std::logic_error before open(): the files on disk would be
    // overwritten by a snapshot that never saw them.
    std::vector<PassageId> ingest(const std::vector<PassageInput>& inputs) {
        if (!is_open()) throw std::logic_error("KnowledgeStore: ingest before open()");
        if (inputs.empty()) return {};

        // Embed outside the write lock; this is the slow part
        std::vector<Vector> vectors;
        vectors.reserve(inputs.size());
        for (size_t i = 0; i < inputs.size(); ++i) {
            const auto& in = inputs[i];
            if (preprocessor_.normalize(in.title).empty() && preprocessor_.normalize(in.content).empty()) {
                throw IngestError("Passage " + std::to_string(i) + " has neither title nor content");
            }
            try {
                Vector v = embedder_->embed(in.title + "\n" + in.content);
                if (v.size() != embedder_->dimension()) {
                    throw EmbeddingError("embedder returned dimension " + std::to_string(v.size()));
                }
                vectors.push_back(std::move(v));
            } catch (const std::exception& e) {
                throw IngestError("Failed to embed passage " + std::to_string(i) +
                                  " ('" + in.title + "'): " + e.what());
            }
        }

        std::lock_guard<std::mutex> write_lock(write_mutex_);
        auto base = current();
        auto next = std::make_shared<Snapshot>(*base);
        next->index.reserve(base->passages.size() + inputs.size());

        std::vector<PassageId> ids;
        ids.reserve(inputs.size());
        for (size_t i = 0; i < inputs.size(); ++i) {
            Passage p;
            p.id = next->next_id++;
            p.title = inputs[i].title;
            p.content = inputs[i].content;
            next->index.add(vectors[i]);
            next->passages.push_back(std::move(p));
            ids.push_back(next->passages.back().id);
        }

        std::string err = persist(*next);
        if (!err.empty()) {
            // Put the previous files back if one of the pair was replaced
            std::string restore_err = persist(*base);
            if (!restore_err.empty()) {
                std::cerr << "[KnowledgeStore] Failed to restore previous state: " << restore_err << "\n";
            }
            throw IngestError("Failed to persist knowledge store: " + err);
        }

        publish(std::move(next));
        std::cerr << "[KnowledgeStore] Ingested " << ids.size() << " passages (total "
                  << size() << ")\n";
        return ids;
    }

    // Top k passages by similarity. Empty on an empty store.
    // Throws EmbeddingError when the query cannot be embedded.
    std::vector<SearchHit> search(const std::string& query, size_t k) const {
        if (k == 0) throw std::invalid_argument("search: k must be at least 1");

        std::string normalized = preprocessor_.normalize(query);
        if (normalized.empty()) {
            throw EmbeddingError("query is empty after normalization");
        }

        auto snap = current();
        if (snap->passages.empty()) return {};

        Vector q;
        try {
            q = embedder_->embed(normalized);
        } catch (const EmbeddingError&) {
            throw;
        } catch (const std::exception& e) {
            throw EmbeddingError(std::string("embedder failed: ") + e.what());
        }
        if (q.size() != snap->index.dimension()) {
            throw EmbeddingError("query embedding has dimension " + std::to_string(q.size()) +
                                 ", index expects " + std::to_string(snap->index.dimension()));
        }

        std::vector<SearchHit> hits;
        for (const auto& dp : snap->index.search(q, k)) {
            SearchHit hit;
            hit.passage = snap->passages[dp.row];
            hit.distance = dp.distance;
            hit.similarity = distance_to_similarity(dp.distance);
            hits.push_back(std::move(hit));
        }
        return hits;
    }

    // Write the active snapshot. Throws Error on failure, std::logic_error before open().
    void save() const {
        std::lock_guard<std::mutex> write_lock(write_mutex_);
        if (!opened_) throw std::logic_error("KnowledgeStore: save before open()");
        std::string err = persist(*current());
        if (!err.empty()) throw Error("Failed to save knowledge store: " + err);
    }

    StoreStats stats() const {
        auto snap = current();
        StoreStats s;
        s.passages = snap->passages.size();
        s.index_size = snap->index.size();
        s.dimension = snap->index.dimension();
        s.embedder = embedder_->name();
        return s;
    }

    size_t size() const { return current()->passages.size(); }

    std::string index_path() const { return config_.path + "/index.bin"; }
    std::string passages_path() const { return config_.path + "/passages.json"; }
    const StoreConfig& config() const { return config_; }

private:
    struct Snapshot {
        FlatIndex index;
        std::vector<Passage> passages;  // passages[i] <-> index row i
        PassageId next_id = 1;

        explicit Snapshot(size_t dim) : index(dim) {}
    };

    std::shared_ptr<const Snapshot> current() const {
        std::lock_guard<std::mutex> lock(snapshot_mutex_);
        return snapshot_;
    }

    void publish(std::shared_ptr<const Snapshot> next) {
        std::lock_guard<std::mutex> lock(snapshot_mutex_);
        snapshot_ = std::move(next);
    }

    // Empty string on success, reason otherwise
    std::string persist(const Snapshot& snap) const {
        if (config_.path.empty()) return "";

        std::error_code ec;
        std::filesystem::create_directories(config_.path, ec);
        if (ec) return "cannot create " + config_.path + ": " + ec.message();

        auto bytes = snap.index.serialize();
        bool ok = safe_save(index_path(), [&bytes](FILE* f) {
            return ::fwrite(bytes.data(), 1, bytes.size(), f) == bytes.size();
        });
        if (!ok) return "cannot write " + index_path();

        json meta = json::array();
        for (const auto& p : snap.passages) {
            meta.push_back({{"id", p.id}, {"title", p.title}, {"content", p.content}});
        }
        std::string text = meta.dump(2, ' ', false, json::error_handler_t::replace);
        ok = safe_save(passages_path(), [&text](FILE* f) {
            return ::fwrite(text.data(), 1, text.size(), f) == text.size();
        });
        if (!ok) return "cannot write " + passages_path();
        return "";
    }

    FlatIndex load_index() const {
        std::vector<uint8_t> bytes;
        if (!read_file(index_path(), bytes)) {
            throw StoreCorruptError("Cannot read " + index_path());
        }
        try {
            return FlatIndex::deserialize(bytes);
        } catch (const std::runtime_error& e) {
            throw StoreCorruptError(index_path() + ": " + e.what());
        }
    }

    std::vector<Passage> load_passages() const {
        std::vector<uint8_t> bytes;
        if (!read_file(passages_path(), bytes)) {
            throw StoreCorruptError("Cannot read " + passages_path());
        }

        std::vector<Passage> passages;
        try {
            auto meta = json::parse(bytes.begin(), bytes.end());
            if (!meta.is_array()) {
                throw StoreCorruptError(passages_path() + ": expected a JSON array");
            }
            passages.reserve(meta.size());
            for (const auto& entry : meta) {
                Passage p;
                p.id = entry.at("id").get<PassageId>();
                p.title = entry.at("title").get<std::string>();
                p.content = entry.at("content").get<std::string>();
                passages.push_back(std::move(p));
            }
        } catch (const json::exception& e) {
            throw StoreCorruptError(passages_path() + ": " + e.what());
        }
        return passages;
    }

    StoreConfig config_;
    std::shared_ptr<Embedder> embedder_;
    TextPreprocessor preprocessor_;

    mutable std::mutex snapshot_mutex_;  // Guards the pointer only
    mutable std::mutex write_mutex_;     // One writer at a time
    std::shared_ptr<const Snapshot> snapshot_;
    bool opened_ = false;
};

} // namespace kosha
