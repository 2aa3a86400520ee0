#include <kosha/kosha.hpp>
#include <kosha/rpc/handler.hpp>
#include <iostream>
#include <cassert>
#include <cmath>
#include <thread>
#include <chrono>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <map>
#include <set>
#include <unistd.h>

using namespace kosha;
namespace fs = std::filesystem;

// Fresh, empty directory under the system temp dir
std::string temp_dir(const std::string& name) {
    fs::path p = fs::temp_directory_path() /
                 ("kosha_test_" + name + "_" + std::to_string(::getpid()));
    fs::remove_all(p);
    return p.string();
}

std::shared_ptr<Embedder> hashing(size_t dim = EMBED_DIM) {
    HashingEmbedder::Config config;
    config.dimension = dim;
    return std::make_shared<HashingEmbedder>(config);
}

// Fails on any text containing POISON
class PoisonEmbedder : public Embedder {
public:
    Vector embed(const std::string& text) override {
        if (text.find("POISON") != std::string::npos) {
            throw EmbeddingError("refusing to embed poisoned text");
        }
        return inner_.embed(text);
    }
    size_t dimension() const override { return inner_.dimension(); }
    std::string name() const override { return "poison"; }

private:
    HashingEmbedder inner_;
};

HttpTransport fake_transport(long status, std::string body,
                             std::shared_ptr<std::string> last_url = nullptr) {
    return [status, body, last_url](const HttpRequest& request) {
        if (last_url) *last_url = request.url;
        HttpResponse r;
        r.status = status;
        r.body = body;
        return r;
    };
}

std::vector<PassageInput> fixture_passages() {
    return {
        {"Alpha", "alpha bravo charlie"},
        {"Delta", "delta echo foxtrot"},
        {"Golf", "golf hotel india"},
        {"Juliet", "juliet kilo lima"},
        {"Mike", "mike november oscar"}
    };
}

// ═══════════════════════════════════════════════════════════════════
// Vectors and embedders
// ═══════════════════════════════════════════════════════════════════

void test_vector() {
    std::cout << "Testing Vector..." << std::endl;

    Vector v(4);
    v[0] = 3.0f;
    v[1] = 4.0f;
    v.normalize();
    assert(std::fabs(v.norm_sq() - 1.0f) < 1e-5f);
    assert(std::fabs(v.cosine(v) - 1.0f) < 1e-5f);
    assert(Vector::zeros(4).is_zero());

    assert(distance_to_similarity(0.0f) == 1.0f);
    assert(distance_to_similarity(4.0f) == -1.0f);
    assert(std::fabs(distance_to_similarity(1.0f) - 0.5f) < 1e-6f);

    std::cout << "  PASS" << std::endl;
}

void test_hashing_embedder() {
    std::cout << "Testing HashingEmbedder..." << std::endl;

    HashingEmbedder e;
    Vector a = e.embed("How do I withdraw money?");
    Vector b = e.embed("how   do I\twithdraw money?");
    assert(a.size() == EMBED_DIM);
    assert(std::fabs(a.norm_sq() - 1.0f) < 1e-4f);
    assert(a.cosine(b) > 0.9999f);  // Whitespace and case don't matter

    Vector withdrawal = e.embed("withdrawal");
    Vector savings = e.embed("savings");
    Vector withdraw = e.embed("withdraw");
    assert(withdraw.cosine(withdrawal) > withdraw.cosine(savings));

    // Stopwords alone still embed
    Vector stop = e.embed("what is it");
    assert(!stop.is_zero());

    bool threw = false;
    try {
        e.embed(" \n\t ");
    } catch (const EmbeddingError&) {
        threw = true;
    }
    assert(threw);
    assert(e.name() == "hashing-384");

    std::cout << "  PASS" << std::endl;
}

void test_caching_embedder() {
    std::cout << "Testing CachingEmbedder..." << std::endl;

    CachingEmbedder cache(hashing(), 2);
    Vector a = cache.embed("one");
    Vector a2 = cache.embed("one");
    assert(a.cosine(a2) > 0.9999f);
    assert(cache.hits() == 1);
    assert(cache.size() == 1);

    cache.embed("two");
    cache.embed("three");  // Evicts "one"
    assert(cache.size() == 2);
    cache.embed("one");
    assert(cache.hits() == 1);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// Flat index
// ═══════════════════════════════════════════════════════════════════

void test_flat_index() {
    std::cout << "Testing FlatIndex..." << std::endl;

    HashingEmbedder e;
    FlatIndex index(EMBED_DIM);
    index.add(e.embed("alpha bravo"));
    index.add(e.embed("charlie delta"));
    index.add(e.embed("alpha bravo"));  // Same vector as row 0

    auto hits = index.search(e.embed("alpha bravo"), 2);
    assert(hits.size() == 2);
    assert(hits[0].row == 0);  // Tie goes to the earlier row
    assert(hits[1].row == 2);
    assert(hits[0].distance <= hits[1].distance);

    assert(index.search(e.embed("alpha"), 10).size() == 3);

    bool threw = false;
    try {
        index.add(Vector(8));
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    // Serialize / deserialize
    auto bytes = index.serialize();
    FlatIndex loaded = FlatIndex::deserialize(bytes);
    assert(loaded.size() == 3);
    assert(loaded.dimension() == EMBED_DIM);
    assert(loaded.row(1).cosine(index.row(1)) > 0.9999f);

    // Truncated payload
    bytes.resize(bytes.size() - 4);
    threw = false;
    try {
        FlatIndex::deserialize(bytes);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    // Bad magic
    auto bad = index.serialize();
    bad[0] ^= 0xFF;
    threw = false;
    try {
        FlatIndex::deserialize(bad);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// Knowledge store
// ═══════════════════════════════════════════════════════════════════

void test_store_search_bounds() {
    std::cout << "Testing KnowledgeStore search bounds..." << std::endl;

    KnowledgeStore store(StoreConfig{""}, hashing());
    store.open();

    // Empty index: empty result, not an error
    assert(store.search("anything at all", 3).empty());

    // Empty query is an embedding failure even on an empty index
    bool threw = false;
    try {
        store.search("  \n ", 3);
    } catch (const EmbeddingError&) {
        threw = true;
    }
    assert(threw);

    store.ingest(fixture_passages());
    assert(store.size() == 5);

    for (size_t k = 1; k <= 7; ++k) {
        auto hits = store.search("alpha echo hotel", k);
        assert(hits.size() == std::min<size_t>(k, 5));
        for (size_t i = 1; i < hits.size(); ++i) {
            assert(hits[i - 1].similarity >= hits[i].similarity);
        }
    }

    threw = false;
    try {
        store.search("alpha", 0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    auto exact = store.search("Golf golf hotel india", 1);
    assert(exact.size() == 1);
    assert(exact[0].passage.title == "Golf");
    assert(exact[0].similarity > 0.99f);

    std::cout << "  PASS" << std::endl;
}

void test_store_duplicates() {
    std::cout << "Testing KnowledgeStore duplicates..." << std::endl;

    KnowledgeStore store(StoreConfig{""}, hashing());
    store.open();

    PassageInput p{"Fees", "There are no inactivity fees."};
    auto first = store.ingest({p});
    auto second = store.ingest({p});
    assert(store.size() == 2);
    assert(first.size() == 1 && second.size() == 1);
    assert(first[0] < second[0]);

    auto hits = store.search("inactivity fees", 5);
    assert(hits.size() == 2);
    assert(hits[0].passage.id == first[0]);  // Equal scores, ingestion order
    assert(hits[1].passage.id == second[0]);
    assert(std::fabs(hits[0].similarity - hits[1].similarity) < 1e-6f);

    std::cout << "  PASS" << std::endl;
}

void test_withdrawal_scenario() {
    std::cout << "Testing withdrawal scenario..." << std::endl;

    KnowledgeStore store(StoreConfig{""}, hashing());
    store.open();
    store.ingest({{"Withdrawal Policy", "Funds may be withdrawn within 3 business days..."}});

    auto hits = store.search("how do I withdraw money", 3);
    assert(hits.size() == 1);
    assert(hits[0].passage.title == "Withdrawal Policy");

    std::cout << "  PASS" << std::endl;
}

void test_store_persistence() {
    std::cout << "Testing KnowledgeStore persistence..." << std::endl;

    std::string dir = temp_dir("persist");
    {
        KnowledgeStore store(StoreConfig{dir}, hashing());
        store.open();
        assert(store.size() == 0);
        store.ingest(fixture_passages());
    }
    assert(file_exists(dir + "/index.bin"));
    assert(file_exists(dir + "/passages.json"));

    {
        KnowledgeStore store(StoreConfig{dir}, hashing());
        store.open();
        assert(store.size() == 5);
        auto hits = store.search("Juliet juliet kilo lima", 1);
        assert(hits.size() == 1);
        assert(hits[0].passage.title == "Juliet");

        // Ids keep counting after a reload
        auto ids = store.ingest({{"November", "papa quebec"}});
        assert(ids[0] == 6);

        auto s = store.stats();
        assert(s.passages == 6);
        assert(s.index_size == 6);
        assert(s.dimension == EMBED_DIM);
        assert(s.embedder == "hashing-384");
    }

    fs::remove_all(dir);
    std::cout << "  PASS" << std::endl;
}

void test_store_reload_mismatch() {
    std::cout << "Testing KnowledgeStore reload mismatch..." << std::endl;

    std::string dir = temp_dir("mismatch");
    {
        KnowledgeStore store(StoreConfig{dir}, hashing());
        store.open();
        store.ingest(fixture_passages());
    }

    // Drop one passage from the metadata
    {
        std::ifstream in(dir + "/passages.json");
        json meta = json::parse(in);
        meta.erase(meta.size() - 1);
        std::ofstream out(dir + "/passages.json", std::ios::trunc);
        out << meta.dump();
    }
    bool threw = false;
    try {
        KnowledgeStore store(StoreConfig{dir}, hashing());
        store.open();
    } catch (const StoreCorruptError&) {
        threw = true;
    }
    assert(threw);

    // Index without metadata
    fs::remove(dir + "/passages.json");
    threw = false;
    try {
        KnowledgeStore store(StoreConfig{dir}, hashing());
        store.open();
    } catch (const StoreCorruptError&) {
        threw = true;
    }
    assert(threw);

    // Index written by a different embedder dimension
    std::string dir2 = temp_dir("dim");
    {
        KnowledgeStore store(StoreConfig{dir2}, hashing(64));
        store.open();
        store.ingest(fixture_passages());
    }
    threw = false;
    try {
        KnowledgeStore store(StoreConfig{dir2}, hashing(EMBED_DIM));
        store.open();
    } catch (const StoreCorruptError&) {
        threw = true;
    }
    assert(threw);

    fs::remove_all(dir);
    fs::remove_all(dir2);
    std::cout << "  PASS" << std::endl;
}

void test_failed_ingest_unchanged() {
    std::cout << "Testing failed ingest leaves store unchanged..." << std::endl;

    std::string dir = temp_dir("atomic");
    KnowledgeStore store(StoreConfig{dir}, std::make_shared<PoisonEmbedder>());
    store.open();
    store.ingest({{"Safe", "a harmless passage"}});

    std::vector<uint8_t> before;
    assert(read_file(dir + "/passages.json", before));

    bool threw = false;
    try {
        store.ingest({{"Fine", "also harmless"}, {"POISON", "bad"}});
    } catch (const IngestError&) {
        threw = true;
    }
    assert(threw);
    assert(store.size() == 1);
    assert(store.search("also harmless", 5).size() == 1);

    std::vector<uint8_t> after;
    assert(read_file(dir + "/passages.json", after));
    assert(before == after);

    // Nothing to embed
    threw = false;
    try {
        store.ingest({{" ", "\n"}});
    } catch (const IngestError&) {
        threw = true;
    }
    assert(threw);
    assert(store.size() == 1);

    // Persistence failure: data dir sits under a regular file
    std::string blocker = dir + "/blocker";
    { std::ofstream(blocker) << "x"; }
    KnowledgeStore unwritable(StoreConfig{blocker + "/kb"}, hashing());
    unwritable.open();
    threw = false;
    try {
        unwritable.ingest(fixture_passages());
    } catch (const IngestError&) {
        threw = true;
    }
    assert(threw);
    assert(unwritable.size() == 0);

    fs::remove_all(dir);
    std::cout << "  PASS" << std::endl;
}

void test_store_requires_open() {
    std::cout << "Testing KnowledgeStore ingest before open..." << std::endl;

    std::string dir = temp_dir("unopened");
    {
        KnowledgeStore store(StoreConfig{dir}, hashing());
        store.open();
        store.ingest(fixture_passages());
    }
    std::vector<uint8_t> before;
    assert(read_file(dir + "/passages.json", before));

    KnowledgeStore unopened(StoreConfig{dir}, hashing());
    bool threw = false;
    try {
        unopened.ingest({{"Late", "would clobber the existing files"}});
    } catch (const std::logic_error&) {
        threw = true;
    }
    assert(threw);
    threw = false;
    try {
        unopened.save();
    } catch (const std::logic_error&) {
        threw = true;
    }
    assert(threw);

    std::vector<uint8_t> after;
    assert(read_file(dir + "/passages.json", after));
    assert(before == after);

    unopened.open();
    assert(unopened.size() == 5);

    fs::remove_all(dir);
    std::cout << "  PASS" << std::endl;
}

void test_concurrent_search_during_ingest() {
    std::cout << "Testing concurrent search during ingest..." << std::endl;

    KnowledgeStore store(StoreConfig{""}, hashing());
    store.open();
    store.ingest({{"Seed", "seed passage one"}, {"Seed", "seed passage two"},
                  {"Seed", "seed passage three"}, {"Seed", "seed passage four"}});

    const size_t batches = 6;
    const size_t batch_size = 3;
    std::set<size_t> allowed;
    for (size_t b = 0; b <= batches; ++b) allowed.insert(4 + b * batch_size);

    std::atomic<bool> done{false};
    std::atomic<bool> bad{false};
    std::vector<std::thread> readers;
    for (int t = 0; t < 4; ++t) {
        readers.emplace_back([&]() {
            size_t last = 0;
            while (!done.load()) {
                auto hits = store.search("seed passage", 1000);
                if (!allowed.count(hits.size()) || hits.size() < last) bad = true;
                last = hits.size();
            }
        });
    }

    for (size_t b = 0; b < batches; ++b) {
        std::vector<PassageInput> batch;
        for (size_t i = 0; i < batch_size; ++i) {
            batch.push_back({"Batch " + std::to_string(b), "seed passage extra " + std::to_string(i)});
        }
        store.ingest(batch);
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    done = true;
    for (auto& r : readers) r.join();

    assert(!bad.load());
    assert(store.size() == 4 + batches * batch_size);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// Dispatcher and budgets
// ═══════════════════════════════════════════════════════════════════

// Retrieval stand-in whose best score comes from its arguments
ToolDescriptor scored_tool() {
    return {
        "scored",
        "Returns the score it is given",
        ToolKind::Retrieval,
        {{"score", ParamType::Number, false, "Best similarity to report"}},
        [](const json& p) {
            ToolOutput out;
            out.text = "scored";
            out.structured = json::object();
            if (p.contains("score")) out.relevance = p["score"].get<float>();
            return out;
        }
    };
}

ToolDescriptor echo_tool() {
    return {
        "echo",
        "Echoes its text",
        ToolKind::Compute,
        {{"text", ParamType::String, true, ""}, {"times", ParamType::Integer, false, ""},
         {"loud", ParamType::Boolean, false, ""}},
        [](const json& p) {
            ToolOutput out;
            out.text = p.at("text").get<std::string>();
            return out;
        }
    };
}

DispatcherConfig inline_config(size_t max_calls, size_t max_unproductive, float floor) {
    DispatcherConfig c;
    c.budget.max_calls = max_calls;
    c.budget.max_unproductive = max_unproductive;
    c.budget.similarity_floor = floor;
    c.timeout = std::chrono::milliseconds(0);
    return c;
}

void test_dispatcher_registration() {
    std::cout << "Testing Dispatcher registration..." << std::endl;

    Dispatcher d;
    d.register_tool(echo_tool());
    d.register_tool(scored_tool());

    bool threw = false;
    try {
        d.register_tool(echo_tool());
    } catch (const DuplicateToolError& e) {
        threw = e.tool() == "echo";
    }
    assert(threw);

    threw = false;
    ToolDescriptor nameless = echo_tool();
    nameless.name = "";
    try {
        d.register_tool(nameless);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    auto tools = d.tools();
    assert(tools.size() == 2);
    assert(tools[0].name == "echo");
    assert(tools[1].name == "scored");

    json schema = tools[0].input_schema();
    assert(schema["type"] == "object");
    assert(schema["properties"]["times"]["type"] == "integer");
    assert(schema["required"].size() == 1);
    assert(schema["required"][0] == "text");

    threw = false;
    try {
        d.descriptor("nope");
    } catch (const UnknownToolError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

void test_dispatcher_unknown_tool() {
    std::cout << "Testing Dispatcher unknown tool..." << std::endl;

    Dispatcher d(inline_config(10, 3, 0.5f));
    d.register_tool(echo_tool());

    auto r = d.dispatch("c1", "does_not_exist", {{"text", "hi"}});
    assert(r.status == ToolStatus::UnknownTool);
    r = d.dispatch("c1", "does_not_exist", json::array({1, 2}));
    assert(r.status == ToolStatus::UnknownTool);
    assert(std::string(r.kind()) == "unknown_tool");

    std::cout << "  PASS" << std::endl;
}

void test_dispatcher_validation() {
    std::cout << "Testing Dispatcher argument validation..." << std::endl;

    Dispatcher d(inline_config(100, 3, 0.5f));
    d.register_tool(echo_tool());

    auto r = d.dispatch("c", "echo", json::object());
    assert(r.status == ToolStatus::InvalidArgument);
    assert(r.parameter == "text");

    r = d.dispatch("c", "echo", {{"text", 5}});
    assert(r.status == ToolStatus::InvalidArgument);
    assert(r.parameter == "text");

    r = d.dispatch("c", "echo", {{"text", "hi"}, {"extra", 1}});
    assert(r.status == ToolStatus::InvalidArgument);
    assert(r.parameter == "extra");

    r = d.dispatch("c", "echo", {{"text", "hi"}, {"times", 2.0}});
    assert(r.ok());
    r = d.dispatch("c", "echo", {{"text", "hi"}, {"times", 2.5}});
    assert(r.status == ToolStatus::InvalidArgument);
    assert(r.parameter == "times");
    r = d.dispatch("c", "echo", {{"text", "hi"}, {"times", "2"}});  // No coercion
    assert(r.status == ToolStatus::InvalidArgument);
    r = d.dispatch("c", "echo", {{"text", "hi"}, {"loud", 1}});
    assert(r.status == ToolStatus::InvalidArgument);
    assert(r.parameter == "loud");

    r = d.dispatch("c", "echo", "not an object");
    assert(r.status == ToolStatus::InvalidArgument);

    r = d.dispatch("c", "echo", {{"text", "hello"}});
    assert(r.ok());
    assert(r.content == "hello");

    // Only the two successful calls were counted
    BudgetState st;
    assert(d.budgets().snapshot("c", st));
    assert(st.calls == 2);

    // Integers must fit the int64_t the handlers read
    r = d.dispatch("c", "echo", {{"text", "hi"}, {"times", 18446744073709551615ULL}});
    assert(r.status == ToolStatus::InvalidArgument);
    assert(r.parameter == "times");
    r = d.dispatch("c", "echo", {{"text", "hi"}, {"times", 9223372036854775807LL}});
    assert(r.ok());

    auto store = std::make_shared<KnowledgeStore>(StoreConfig{""}, hashing());
    store->open();
    store->ingest({{"Fees", "There are no inactivity fees."}});
    Dispatcher tools_d(inline_config(100, 3, 0.5f));
    tools::compute::register_tools(tools_d);
    tools::knowledge::register_tools(tools_d, store, 3);

    r = tools_d.dispatch("c", "calculate_compound_interest",
                         {{"principal", 5000}, {"rate", 5}, {"time", 2}, {"compounds_per_year", 1e300}});
    assert(r.status == ToolStatus::InvalidArgument);
    assert(r.parameter == "compounds_per_year");
    r = tools_d.dispatch("c", "search_knowledge_base", {{"query", "fees"}, {"k", 1e300}});
    assert(r.status == ToolStatus::InvalidArgument);
    assert(r.parameter == "k");
    r = tools_d.dispatch("c", "search_knowledge_base", {{"query", "fees"}, {"k", -1e300}});
    assert(r.status == ToolStatus::InvalidArgument);
    assert(r.parameter == "k");

    std::cout << "  PASS" << std::endl;
}

void test_budget_unproductive() {
    std::cout << "Testing unproductive retrieval budget..." << std::endl;

    Dispatcher d(inline_config(100, 2, 0.5f));
    d.register_tool(scored_tool());
    d.register_tool(echo_tool());

    // Two weak retrievals trip the budget
    assert(d.dispatch("a", "scored", {{"score", 0.1}}).ok());
    assert(d.dispatch("a", "scored", json::object()).ok());  // No results
    auto r = d.dispatch("a", "scored", {{"score", 0.9}});
    assert(r.status == ToolStatus::BudgetExceeded);
    assert(r.terminal());
    // Sticky
    assert(d.dispatch("a", "echo", {{"text", "x"}}).status == ToolStatus::BudgetExceeded);

    // A productive call resets the streak
    assert(d.dispatch("b", "scored", {{"score", 0.1}}).ok());
    assert(d.dispatch("b", "scored", {{"score", 0.5}}).ok());  // At the floor counts
    assert(d.dispatch("b", "scored", {{"score", 0.2}}).ok());
    // Compute tools neither reset nor extend it
    assert(d.dispatch("b", "echo", {{"text", "x"}}).ok());
    BudgetState st;
    assert(d.budgets().snapshot("b", st));
    assert(st.unproductive == 1);
    assert(d.dispatch("b", "scored", {{"score", 0.2}}).ok());
    assert(d.dispatch("b", "scored", {{"score", 0.9}}).status == ToolStatus::BudgetExceeded);

    // conversation/start clears it
    d.budgets().start("a");
    assert(d.dispatch("a", "scored", {{"score", 0.9}}).ok());

    std::cout << "  PASS" << std::endl;
}

void test_budget_with_knowledge_tool() {
    std::cout << "Testing budget with knowledge search..." << std::endl;

    auto store = std::make_shared<KnowledgeStore>(StoreConfig{""}, hashing());
    store->open();
    store->ingest({{"Account Funding", "wire transfer ach deposit check"}});

    Dispatcher d(inline_config(100, 2, 0.5f));
    tools::knowledge::register_tools(d, store, 3);

    // Unrelated queries land below the floor
    auto r = d.dispatch("k", "search_knowledge_base", {{"query", "zebra quantum violin"}});
    assert(r.ok());
    assert(r.structured["relevance"].get<float>() < 0.5f);
    assert(d.dispatch("k", "search_knowledge_base", {{"query", "glacier mountain ski"}}).ok());
    r = d.dispatch("k", "search_knowledge_base",
                   {{"query", "Account Funding wire transfer ach deposit check"}});
    assert(r.status == ToolStatus::BudgetExceeded);

    // Exact text is productive
    d.budgets().start("k");
    r = d.dispatch("k", "search_knowledge_base",
                   {{"query", "Account Funding wire transfer ach deposit check"}, {"k", 1}});
    assert(r.ok());
    assert(r.structured["results"].size() == 1);
    assert(r.structured["relevance"].get<float>() > 0.99f);

    // Empty query is an execution failure and counts as unproductive
    r = d.dispatch("k", "search_knowledge_base", {{"query", "   "}});
    assert(r.status == ToolStatus::ExecutionError);
    BudgetState st;
    assert(d.budgets().snapshot("k", st));
    assert(st.unproductive == 1);
    assert(st.calls == 2);

    r = d.dispatch("k", "search_knowledge_base", {{"query", "funding"}, {"k", 0}});
    assert(r.status == ToolStatus::InvalidArgument);
    assert(r.parameter == "k");

    std::cout << "  PASS" << std::endl;
}

void test_budget_ledger_cap() {
    std::cout << "Testing budget ledger cap..." << std::endl;

    BudgetPolicy policy;
    policy.max_calls = 1;
    policy.max_conversations = 2;
    BudgetLedger ledger(policy);

    ledger.acquire("a")->record(false, nullptr);
    ledger.acquire("b");
    ledger.acquire("a");      // a is now the most recent
    ledger.acquire("c");      // Drops b
    assert(ledger.active() == 2);

    BudgetState st;
    assert(ledger.snapshot("a", st));
    assert(st.calls == 1);
    assert(!ledger.snapshot("b", st));
    assert(ledger.snapshot("c", st));

    // Many one-shot conversations never grow the table past the cap
    for (int i = 0; i < 100; ++i) ledger.acquire("conv-" + std::to_string(i));
    assert(ledger.active() == 2);

    std::cout << "  PASS" << std::endl;
}

void test_budget_total_calls() {
    std::cout << "Testing total call ceiling..." << std::endl;

    Dispatcher d(inline_config(3, 100, 0.5f));
    d.register_tool(echo_tool());

    // Invalid and unknown calls are not counted
    assert(d.dispatch("t", "echo", json::object()).status == ToolStatus::InvalidArgument);
    assert(d.dispatch("t", "nope", json::object()).status == ToolStatus::UnknownTool);

    for (int i = 0; i < 3; ++i) {
        assert(d.dispatch("t", "echo", {{"text", "x"}}).ok());
    }
    auto r = d.dispatch("t", "echo", {{"text", "x"}});
    assert(r.status == ToolStatus::BudgetExceeded);
    assert(r.structured["calls"] == 3);

    // Other conversations are independent
    assert(d.dispatch("u", "echo", {{"text", "x"}}).ok());
    assert(d.budgets().active() == 2);
    assert(d.budgets().end("t"));
    assert(!d.budgets().end("t"));
    assert(d.dispatch("t", "echo", {{"text", "x"}}).ok());

    std::cout << "  PASS" << std::endl;
}

void test_dispatcher_failures() {
    std::cout << "Testing Dispatcher timeouts and failures..." << std::endl;

    DispatcherConfig c;
    c.budget.max_calls = 100;
    c.budget.max_unproductive = 1;
    c.budget.similarity_floor = 0.5f;
    c.timeout = std::chrono::milliseconds(50);
    Dispatcher d(c);

    d.register_tool({"slow", "Sleeps", ToolKind::Retrieval, {},
        [](const json&) {
            std::this_thread::sleep_for(std::chrono::milliseconds(400));
            ToolOutput out;
            out.text = "late";
            out.relevance = 1.0f;
            return out;
        }});
    d.register_tool({"broken", "Throws", ToolKind::External, {},
        [](const json&) -> ToolOutput { throw ExternalToolError("upstream returned 503"); }});
    d.register_tool({"picky", "Rejects", ToolKind::Compute, {},
        [](const json&) -> ToolOutput { throw InvalidArgumentError("years", "years must be positive"); }});

    auto r = d.dispatch("f", "broken", json::object());
    assert(r.status == ToolStatus::ExecutionError);
    assert(r.content.find("upstream returned 503") != std::string::npos);
    assert(r.tool == "broken");

    r = d.dispatch("f", "picky", json::object());
    assert(r.status == ToolStatus::InvalidArgument);
    assert(r.parameter == "years");

    auto start = std::chrono::steady_clock::now();
    r = d.dispatch("f", "slow", json::object());
    auto elapsed = std::chrono::steady_clock::now() - start;
    assert(r.status == ToolStatus::ExecutionError);
    assert(r.content.find("timed out") != std::string::npos);
    assert(elapsed < std::chrono::milliseconds(350));

    BudgetState st;
    assert(d.budgets().snapshot("f", st));
    assert(st.calls == 2);          // broken + slow
    assert(st.unproductive == 1);   // The timed-out retrieval
    assert(d.dispatch("f", "broken", json::object()).status == ToolStatus::BudgetExceeded);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// Tools
// ═══════════════════════════════════════════════════════════════════

void test_compound_interest() {
    std::cout << "Testing compound interest..." << std::endl;

    Dispatcher d(inline_config(100, 3, 0.5f));
    tools::compute::register_tools(d);

    auto r = d.dispatch("m", "calculate_compound_interest",
                        {{"principal", 5000}, {"rate", 5}, {"time", 2}});
    assert(r.ok());
    assert(std::fabs(r.structured["amount"].get<double>() - 5524.71) < 1e-6);
    assert(r.structured["compounds_per_year"] == 12);
    assert(r.content.find("Final Amount: $5,524.71") != std::string::npos);
    assert(r.content.find("Interest Earned: $524.71") != std::string::npos);

    // Same inputs, same answer
    auto again = d.dispatch("m", "calculate_compound_interest",
                            {{"principal", 5000}, {"rate", 5}, {"time", 2}, {"compounds_per_year", 12}});
    assert(again.content == r.content);

    r = d.dispatch("m", "calculate_compound_interest",
                   {{"principal", 5000}, {"rate", 5}, {"time", 2}, {"compounds_per_year", 0}});
    assert(r.status == ToolStatus::InvalidArgument);
    assert(r.parameter == "compounds_per_year");

    r = d.dispatch("m", "calculate_compound_interest", {{"principal", -1}, {"rate", 5}, {"time", 2}});
    assert(r.status == ToolStatus::InvalidArgument);
    assert(r.parameter == "principal");

    r = d.dispatch("m", "calculate_compound_interest", {{"principal", "5000"}, {"rate", 5}, {"time", 2}});
    assert(r.status == ToolStatus::InvalidArgument);
    assert(r.parameter == "principal");

    std::cout << "  PASS" << std::endl;
}

void test_investment_returns() {
    std::cout << "Testing investment returns..." << std::endl;

    Dispatcher d(inline_config(100, 3, 0.5f));
    tools::compute::register_tools(d);

    auto r = d.dispatch("m", "analyze_investment_returns",
                        {{"initial", 1000}, {"final", 2000}, {"years", 5}});
    assert(r.ok());
    assert(r.content.find("Total Return: $1,000.00 (100.00%)") != std::string::npos);
    assert(r.content.find("(CAGR): 14.87%") != std::string::npos);
    assert(r.content.find("Average Annual Return: 20.00% per year") != std::string::npos);

    r = d.dispatch("m", "analyze_investment_returns", {{"initial", 1000}, {"final", 2000}, {"years", 0}});
    assert(r.status == ToolStatus::InvalidArgument);
    assert(r.parameter == "years");

    r = d.dispatch("m", "analyze_investment_returns", {{"initial", 0}, {"final", 2000}, {"years", 1}});
    assert(r.parameter == "initial");

    std::cout << "  PASS" << std::endl;
}

void test_calculator() {
    std::cout << "Testing Calculator..." << std::endl;

    using tools::compute::Calculator;
    assert(Calculator::evaluate("2 + 3 * 4") == 14.0);
    assert(Calculator::evaluate("(2 + 3) * 4") == 20.0);
    assert(Calculator::evaluate("2 ** 3 ** 2") == 512.0);
    assert(Calculator::evaluate("-2 ** 2") == -4.0);
    assert(Calculator::evaluate("2 ** -1") == 0.5);
    assert(Calculator::evaluate("10 / 4") == 2.5);
    assert(Calculator::evaluate("7 % 3") == 1.0);
    assert(Calculator::evaluate("-7 % 3") == 2.0);
    assert(Calculator::evaluate("--3") == 3.0);
    assert(Calculator::evaluate(".5 + 1.25") == 1.75);

    for (const char* bad : {"1 / 0", "5 % 0", "2 +", "abs(1)", "", "1..2", "(1 + 2", "1 2", "0 ** -1"}) {
        bool threw = false;
        try {
            Calculator::evaluate(bad);
        } catch (const InvalidArgumentError& e) {
            threw = e.parameter() == "expression";
        }
        assert(threw);
    }

    using tools::compute::format_money;
    assert(format_money(1234567.891) == "$1,234,567.89");
    assert(format_money(524.7) == "$524.70");
    assert(format_money(-5) == "-$5.00");
    assert(format_money(-0.001) == "$0.00");
    assert(format_money(100) == "$100.00");

    Dispatcher d(inline_config(100, 3, 0.5f));
    tools::compute::register_tools(d);
    auto r = d.dispatch("m", "calculate", {{"expression", "(1500 * 0.045) / 12"}});
    assert(r.ok());
    assert(r.content == "Result: 5.625");
    r = d.dispatch("m", "calculate", {{"expression", "1/0"}});
    assert(r.status == ToolStatus::InvalidArgument);

    std::cout << "  PASS" << std::endl;
}

void test_web_search() {
    std::cout << "Testing web search..." << std::endl;

    json payload = {
        {"AbstractText", "Apple Inc. is a technology company."},
        {"Answer", "AAPL"},
        {"RelatedTopics", json::array({
            {{"Text", "iPhone"}},
            {{"Name", "Products"}, {"Topics", json::array()}},
            {{"Text", "Mac"}},
            {{"Text", "Never shown"}}
        })}
    };
    auto last_url = std::make_shared<std::string>();
    tools::external::WebSearchConfig wc;
    wc.api_url = "https://api.example.test/";
    tools::external::WebSearch web(wc, fake_transport(200, payload.dump(), last_url));

    std::string text = web.invoke("apple stock");
    assert(text == "Summary: Apple Inc. is a technology company.\n\n"
                   "Answer: AAPL\n\n"
                   "Related: iPhone | Mac");
    assert(last_url->find("https://api.example.test/?q=apple%20stock") == 0);
    assert(last_url->find("&format=json&no_html=1&skip_disambig=1") != std::string::npos);

    tools::external::WebSearch empty(wc, fake_transport(200, "{}"));
    text = empty.invoke("obscure thing");
    assert(text.find("no detailed results found for: obscure thing") != std::string::npos);

    for (auto transport : {fake_transport(503, "{}"), fake_transport(200, "<html>")}) {
        tools::external::WebSearch failing(wc, transport);
        bool threw = false;
        try {
            failing.invoke("anything");
        } catch (const ExternalToolError&) {
            threw = true;
        }
        assert(threw);
    }

    // Through the dispatcher the failure is an execution error
    Dispatcher d(inline_config(100, 3, 0.5f));
    tools::external::register_tools(d,
        std::make_shared<const tools::external::WebSearch>(wc, fake_transport(500, "")));
    auto r = d.dispatch("w", "search_web", {{"query", "rates"}});
    assert(r.status == ToolStatus::ExecutionError);
    assert(r.content.find("status 500") != std::string::npos);

    std::cout << "  PASS" << std::endl;
}

void test_market_data() {
    std::cout << "Testing market data..." << std::endl;

    auto last_url = std::make_shared<std::string>();
    tools::external::WebSearchConfig wc;
    Dispatcher d(inline_config(100, 3, 0.5f));
    tools::external::register_tools(d, std::make_shared<const tools::external::WebSearch>(
        wc, fake_transport(200, R"({"Answer": "412.10 USD"})", last_url)));

    auto r = d.dispatch("m", "get_market_data", {{"symbol", "brk.b"}});
    assert(r.ok());
    assert(r.content == "Market data for BRK.B:\nAnswer: 412.10 USD");
    assert(last_url->find("q=BRK.B%20stock%20price") != std::string::npos);
    assert(r.structured["symbol"] == "BRK.B");

    for (const char* bad : {"", "AAPL; rm", "TOOLONGSYMBOL1", "A B"}) {
        r = d.dispatch("m", "get_market_data", {{"symbol", bad}});
        assert(r.status == ToolStatus::InvalidArgument);
        assert(r.parameter == "symbol");
    }
    assert(tools::external::valid_symbol("^GSPC"));
    assert(tools::external::valid_symbol("EURUSD=X"));

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// Configuration, backend, RPC
// ═══════════════════════════════════════════════════════════════════

void test_config_env() {
    std::cout << "Testing BackendConfig environment..." << std::endl;

    std::map<std::string, std::string> env = {
        {"KOSHA_DATA_DIR", "/srv/kb"},
        {"KOSHA_MAX_TOOL_CALLS", "5"},
        {"KOSHA_MAX_UNPRODUCTIVE", "2"},
        {"KOSHA_SIMILARITY_FLOOR", "0.4"},
        {"KOSHA_TOOL_TIMEOUT_MS", "2500"},
        {"KOSHA_SEED_SAMPLES", "false"}
    };
    auto lookup = [&env](const char* name) -> const char* {
        auto it = env.find(name);
        return it == env.end() ? nullptr : it->second.c_str();
    };

    BackendConfig config;
    config.apply_env(lookup);
    assert(config.data_dir == "/srv/kb");
    assert(config.max_calls == 5);
    assert(config.max_unproductive == 2);
    assert(std::fabs(config.similarity_floor - 0.4f) < 1e-6f);
    assert(config.tool_timeout == std::chrono::milliseconds(2500));
    assert(!config.seed_samples);
    assert(config.search_api_url == "https://api.duckduckgo.com/");

    env["KOSHA_MAX_TOOL_CALLS"] = "twelve";
    bool threw = false;
    try {
        BackendConfig bad;
        bad.apply_env(lookup);
    } catch (const std::invalid_argument& e) {
        threw = std::string(e.what()).find("KOSHA_MAX_TOOL_CALLS") != std::string::npos;
    }
    assert(threw);

    env["KOSHA_MAX_TOOL_CALLS"] = "5";
    env["KOSHA_SIMILARITY_FLOOR"] = "1.5";
    threw = false;
    try {
        BackendConfig bad;
        bad.apply_env(lookup);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    env["KOSHA_SIMILARITY_FLOOR"] = "0.4";

    // Unbounded tool or HTTP calls are refused
    for (const char* name : {"KOSHA_TOOL_TIMEOUT_MS", "KOSHA_EXTERNAL_TIMEOUT_MS"}) {
        env[name] = "0";
        threw = false;
        try {
            BackendConfig bad;
            bad.apply_env(lookup);
        } catch (const std::invalid_argument& e) {
            threw = std::string(e.what()).find("timeout") != std::string::npos;
        }
        assert(threw);
        env[name] = "2500";
    }

    BackendConfig zero;
    zero.tool_timeout = std::chrono::milliseconds(0);
    zero.external_timeout = std::chrono::milliseconds(0);
    threw = false;
    try {
        Backend backend(zero, fake_transport(200, "{}"));
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

void test_backend_lifecycle() {
    std::cout << "Testing Backend lifecycle..." << std::endl;

    std::string dir = temp_dir("backend");
    BackendConfig config;
    config.data_dir = dir;

    {
        Backend backend(config, fake_transport(200, "{}"));
        bool threw = false;
        try {
            backend.call("c", "calculate", {{"expression", "1+1"}});
        } catch (const std::logic_error&) {
            threw = true;
        }
        assert(threw);

        backend.open();
        assert(backend.stats().passages == sample_passages().size());
        assert(backend.dispatcher().tools().size() == 6);

        auto r = backend.call("c", "search_knowledge_base", {{"query", "withdraw funds from my account"}});
        assert(r.ok());
        assert(!r.structured["results"].empty());

        // CLI search: size_t k, its own conversation, budget applies
        size_t k = 2;
        r = backend.call("cli", "search_knowledge_base", {{"query", "account closure"}, {"k", k}});
        assert(r.ok());
        assert(r.structured["results"].size() == 2);
        BudgetState st;
        assert(backend.dispatcher().budgets().snapshot("cli", st));
        assert(st.calls == 1);

        threw = false;
        try {
            backend.attach_embedder(hashing());
        } catch (const std::logic_error&) {
            threw = true;
        }
        assert(threw);
        backend.close();
    }

    // Reopen: loaded, not seeded twice
    {
        Backend backend(config, fake_transport(200, "{}"));
        backend.open();
        assert(backend.stats().passages == sample_passages().size());
    }

    // Seeding off
    std::string dir2 = temp_dir("backend_noseed");
    BackendConfig bare = config;
    bare.data_dir = dir2;
    bare.seed_samples = false;
    {
        Backend backend(bare, fake_transport(200, "{}"));
        backend.open();
        assert(backend.stats().passages == 0);
    }

    fs::remove_all(dir);
    fs::remove_all(dir2);
    std::cout << "  PASS" << std::endl;
}

// Blocks inside embed() until released
class GatedEmbedder : public Embedder {
public:
    Vector embed(const std::string& text) override {
        if (text.find("GATED") != std::string::npos) {
            entered = true;
            while (!release.load()) std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        return inner_.embed(text);
    }
    size_t dimension() const override { return inner_.dimension(); }
    std::string name() const override { return "gated"; }

    std::atomic<bool> entered{false};
    std::atomic<bool> release{false};

private:
    HashingEmbedder inner_;
};

void test_close_during_ingest() {
    std::cout << "Testing Backend close during ingest..." << std::endl;

    std::string dir = temp_dir("close_ingest");
    BackendConfig config;
    config.data_dir = dir;
    config.seed_samples = false;
    auto gated = std::make_shared<GatedEmbedder>();

    Backend backend(config, fake_transport(200, "{}"));
    backend.attach_embedder(gated);
    backend.open();

    std::thread ingester([&backend]() {
        backend.ingest({{"GATED", "slow passage"}});
    });
    while (!gated->entered.load()) std::this_thread::sleep_for(std::chrono::milliseconds(1));

    // Shutdown from another thread, as on a signal
    std::atomic<bool> closed{false};
    std::thread closer([&backend, &closed]() {
        backend.close();
        closed = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    gated->release = true;
    ingester.join();
    closer.join();
    assert(closed.load());

    KnowledgeStore reloaded(StoreConfig{dir}, std::make_shared<HashingEmbedder>());
    reloaded.open();
    assert(reloaded.size() == 1);

    fs::remove_all(dir);
    std::cout << "  PASS" << std::endl;
}

json rpc_call(rpc::Handler& handler, const json& request) {
    return json::parse(handler.handle(request.dump()));
}

void test_rpc_handler() {
    std::cout << "Testing RPC handler..." << std::endl;

    std::string dir = temp_dir("rpc");
    BackendConfig config;
    config.data_dir = dir;
    config.seed_samples = false;
    config.max_calls = 2;
    Backend backend(config, fake_transport(200, R"({"AbstractText": "Rates are rising."})"));
    backend.open();
    rpc::Handler handler(&backend);

    json r = json::parse(handler.handle("{not json"));
    assert(r["error"]["code"] == rpc::error::PARSE_ERROR);

    r = rpc_call(handler, {{"id", 1}, {"method", "initialize"}});
    assert(r["error"]["code"] == rpc::error::INVALID_REQUEST);

    r = rpc_call(handler, {{"jsonrpc", "2.0"}, {"id", 2}, {"method", "bogus/method"}});
    assert(r["error"]["code"] == rpc::error::METHOD_NOT_FOUND);

    r = rpc_call(handler, {{"jsonrpc", "2.0"}, {"id", 3}, {"method", "initialize"}});
    assert(r["result"]["serverInfo"]["name"] == "kosha");
    assert(r["id"] == 3);

    // Notifications get no response
    assert(handler.handle(R"({"jsonrpc":"2.0","method":"notifications/initialized"})").empty());

    r = rpc_call(handler, {{"jsonrpc", "2.0"}, {"id", 4}, {"method", "tools/list"}});
    assert(r["result"]["tools"].size() == 6);
    for (const auto& t : r["result"]["tools"]) {
        assert(t["inputSchema"]["type"] == "object");
    }

    auto call = [&handler](int id, const std::string& conv, const std::string& name, const json& args) {
        return rpc_call(handler, {{"jsonrpc", "2.0"}, {"id", id}, {"method", "tools/call"},
                             {"params", {{"name", name}, {"arguments", args}, {"conversation_id", conv}}}});
    };

    r = call(5, "x", "transfer_money", {{"amount", 10}});
    assert(r["error"]["code"] == rpc::error::TOOL_NOT_FOUND);
    assert(r["error"]["data"]["kind"] == "unknown_tool");

    r = call(6, "x", "calculate_compound_interest", {{"rate", 5}, {"time", 2}});
    assert(r["error"]["code"] == rpc::error::INVALID_PARAMS);
    assert(r["error"]["data"]["kind"] == "invalid_argument");
    assert(r["error"]["data"]["parameter"] == "principal");

    r = call(7, "x", "calculate_compound_interest", {{"principal", 5000}, {"rate", 5}, {"time", 2}});
    assert(r["result"]["isError"] == false);
    assert(r["result"]["structured"]["kind"] == "ok");
    assert(r["result"]["structured"]["terminal"] == false);
    assert(r["result"]["content"][0]["type"] == "text");

    r = call(8, "x", "search_web", {{"query", "interest rates"}});
    assert(r["result"]["content"][0]["text"] == "Summary: Rates are rising.");

    // max_calls = 2: the third call in conversation x is refused
    r = call(9, "x", "calculate", {{"expression", "1 + 1"}});
    assert(r["result"]["isError"] == true);
    assert(r["result"]["structured"]["kind"] == "budget_exceeded");
    assert(r["result"]["structured"]["terminal"] == true);

    r = rpc_call(handler, {{"jsonrpc", "2.0"}, {"id", 10}, {"method", "conversation/start"},
                      {"params", {{"conversation_id", "x"}}}});
    assert(r["result"]["status"] == "started");
    r = call(11, "x", "calculate", {{"expression", "1 + 1"}});
    assert(r["result"]["structured"]["kind"] == "ok");
    assert(r["result"]["content"][0]["text"] == "Result: 2");

    r = rpc_call(handler, {{"jsonrpc", "2.0"}, {"id", 12}, {"method", "conversation/start"}});
    assert(r["error"]["code"] == rpc::error::INVALID_PARAMS);

    // Ingest and stats
    r = rpc_call(handler, {{"jsonrpc", "2.0"}, {"id", 13}, {"method", "knowledge/ingest"},
                      {"params", {{"passages", json::array({
                          {{"title", "Withdrawal Policy"}, {"content", "Funds may be withdrawn within 3 business days."}}
                      })}}}});
    assert(r["result"]["total"] == 1);
    r = rpc_call(handler, {{"jsonrpc", "2.0"}, {"id", 14}, {"method", "knowledge/ingest"},
                      {"params", {{"passages", json::array({{{"title", "No content"}}})}}}});
    assert(r["error"]["code"] == rpc::error::INVALID_PARAMS);

    r = call(15, "y", "search_knowledge_base", {{"query", "how do I withdraw money"}});
    assert(r["result"]["structured"]["results"][0]["title"] == "Withdrawal Policy");

    r = rpc_call(handler, {{"jsonrpc", "2.0"}, {"id", 16}, {"method", "knowledge/stats"}});
    assert(r["result"]["passages"] == 1);
    assert(r["result"]["embedder"] == "hashing-384");

    r = rpc_call(handler, {{"jsonrpc", "2.0"}, {"id", 17}, {"method", "shutdown"}});
    assert(r["result"]["status"] == "ok");
    assert(handler.shutdown_requested());
    assert(file_exists(dir + "/passages.json"));

    fs::remove_all(dir);
    std::cout << "  PASS" << std::endl;
}

#ifdef KOSHA_WITH_ONNX
void test_onnx_embedder() {
    std::cout << "Testing OnnxEmbedder..." << std::endl;

    const char* model_path = "../models/model.onnx";
    const char* vocab_path = "../models/vocab.txt";
    std::ifstream model_check(model_path);
    std::ifstream vocab_check(vocab_path);
    if (!model_check || !vocab_check) {
        std::cout << "  SKIP (model files not found)" << std::endl;
        return;
    }

    auto embedder = create_onnx_embedder(model_path, vocab_path);
    std::cout << "  Model loaded, dimension=" << embedder->dimension() << std::endl;

    Vector a = embedder->embed("How do I withdraw money from my account?");
    Vector b = embedder->embed("Withdrawal procedure for investment accounts");
    Vector c = embedder->embed("The weather is sunny today.");
    assert(a.size() == embedder->dimension());
    assert(std::fabs(a.norm_sq() - 1.0f) < 1e-3f);
    assert(a.cosine(b) > a.cosine(c));

    KnowledgeStore store(StoreConfig{""}, embedder);
    store.open();
    store.ingest({{"Withdrawal Policy", "Funds may be withdrawn within 3 business days..."},
                  {"Support Hours", "Support is available on weekdays."}});
    auto hits = store.search("how do I withdraw money", 1);
    assert(hits.size() == 1);
    assert(hits[0].passage.title == "Withdrawal Policy");

    std::cout << "  PASS" << std::endl;
}
#endif

int main() {
    std::cout << "=== Kosha C++ Tests ===" << std::endl;
    std::cout << "EMBED_DIM = " << EMBED_DIM << std::endl;
    std::cout << std::endl;

    test_vector();
    test_hashing_embedder();
    test_caching_embedder();
    test_flat_index();

    std::cout << std::endl;
    std::cout << "=== Knowledge Store Tests ===" << std::endl;
    test_store_search_bounds();
    test_store_duplicates();
    test_withdrawal_scenario();
    test_store_persistence();
    test_store_reload_mismatch();
    test_failed_ingest_unchanged();
    test_store_requires_open();
    test_concurrent_search_during_ingest();

    std::cout << std::endl;
    std::cout << "=== Dispatcher Tests ===" << std::endl;
    test_dispatcher_registration();
    test_dispatcher_unknown_tool();
    test_dispatcher_validation();
    test_budget_unproductive();
    test_budget_with_knowledge_tool();
    test_budget_total_calls();
    test_budget_ledger_cap();
    test_dispatcher_failures();

    std::cout << std::endl;
    std::cout << "=== Tool Tests ===" << std::endl;
    test_compound_interest();
    test_investment_returns();
    test_calculator();
    test_web_search();
    test_market_data();

    std::cout << std::endl;
    std::cout << "=== Backend Tests ===" << std::endl;
    test_config_env();
    test_backend_lifecycle();
    test_close_during_ingest();
    test_rpc_handler();

#ifdef KOSHA_WITH_ONNX
    std::cout << std::endl;
    std::cout << "=== ONNX Embedding Tests ===" << std::endl;
    test_onnx_embedder();
#endif

    std::cout << std::endl;
    std::cout << "All tests passed!" << std::endl;
    return 0;
}
