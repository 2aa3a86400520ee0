#pragma once
// Backend: the explicitly constructed context
//
// Owns the knowledge store, the dispatcher and its budget ledger, and the
// web search client. Lifecycle:
//   Backend backend(config);
//   backend.attach_embedder(...);   // optional, before open()
//   backend.open();                 // load or create, seed, register tools
//   backend.call(conv, tool, args); // every tool call goes through here
//   backend.close();                // persist

#include "config.hpp"
#include "dispatcher.hpp"
#include "embedder.hpp"
#include "http_client.hpp"
#include "knowledge_store.hpp"
#include "samples.hpp"
#include "tools/compute.hpp"
#include "tools/external.hpp"
#include "tools/knowledge.hpp"
#include <iostream>
#include <memory>
#include <mutex>

namespace kosha {

class Backend {
public:
    explicit Backend(BackendConfig config, HttpTransport transport = curl_transport())
        : config_(std::move(config))
        , transport_(std::move(transport))
    {
        config_.validate();
        DispatcherConfig dc;
        dc.budget.max_calls = config_.max_calls;
        dc.budget.max_unproductive = config_.max_unproductive;
        dc.budget.similarity_floor = config_.similarity_floor;
        dc.timeout = config_.tool_timeout;
        dispatcher_ = std::make_unique<Dispatcher>(dc);
    }

    ~Backend() {
        if (!is_open()) return;
        try {
            close();
        } catch (const std::exception& e) {
            std::cerr << "[kosha] Failed to persist on shutdown: " << e.what() << "\n";
        }
    }

    Backend(const Backend&) = delete;
    Backend& operator=(const Backend&) = delete;

    // Replace the default hashing embedder. Only before open().
    void attach_embedder(std::shared_ptr<Embedder> embedder) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (store_) throw std::logic_error("attach_embedder: backend is already open");
        embedder_ = std::move(embedder);
    }

    // Throws StoreCorruptError on inconsistent files, IngestError if seeding fails
    void open() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (store_) return;

        if (!embedder_) {
            HashingEmbedder::Config hc;
            hc.dimension = config_.embed_dim;
            embedder_ = std::make_shared<CachingEmbedder>(std::make_shared<HashingEmbedder>(hc));
        }

        StoreConfig sc;
        sc.path = config_.data_dir;
        auto store = std::make_shared<KnowledgeStore>(sc, embedder_);
        store->open();

        if (store->size() == 0 && config_.seed_samples) {
            auto ids = store->ingest(sample_passages());
            std::cerr << "[kosha] Seeded knowledge base with " << ids.size() << " sample passages\n";
        }

        tools::external::WebSearchConfig wc;
        wc.api_url = config_.search_api_url;
        wc.api_key = config_.search_api_key;
        wc.timeout = config_.external_timeout;
        auto web = std::make_shared<const tools::external::WebSearch>(wc, transport_);

        tools::knowledge::register_tools(*dispatcher_, store, config_.default_k);
        tools::external::register_tools(*dispatcher_, web);
        tools::compute::register_tools(*dispatcher_);

        store_ = std::move(store);
        std::cerr << "[kosha] Backend open: " << store_->size() << " passages, embedder "
                  << embedder_->name() << ", " << dispatcher_->tools().size() << " tools\n";
    }

    // Persist the store. Safe to call more than once.
    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!store_) return;
        store_->save();
        closed_ = true;
    }

    bool is_open() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return store_ != nullptr && !closed_;
    }

    ToolResult call(const std::string& conversation_id, const std::string& tool, const json& arguments) {
        require_open();
        return dispatcher_->dispatch(conversation_id, tool, arguments);
    }

    void start_conversation(const std::string& conversation_id) {
        dispatcher_->budgets().start(conversation_id);
    }

    bool end_conversation(const std::string& conversation_id) {
        return dispatcher_->budgets().end(conversation_id);
    }

    std::vector<PassageId> ingest(const std::vector<PassageInput>& passages) {
        return require_open().ingest(passages);
    }

    StoreStats stats() { return require_open().stats(); }

    Dispatcher& dispatcher() { return *dispatcher_; }
    KnowledgeStore& store() { return require_open(); }
    const BackendConfig& config() const { return config_; }

private:
    KnowledgeStore& require_open() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!store_) throw std::logic_error("Backend is not open");
        return *store_;
    }

    BackendConfig config_;
    HttpTransport transport_;
    std::shared_ptr<Embedder> embedder_;
    std::shared_ptr<KnowledgeStore> store_;
    std::unique_ptr<Dispatcher> dispatcher_;
    mutable std::mutex mutex_;
    bool closed_ = false;
};

} // namespace kosha
