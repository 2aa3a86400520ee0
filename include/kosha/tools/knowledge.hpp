#pragma once
// Knowledge tools: search_knowledge_base
//
// Internal support articles, searched by meaning. The best similarity
// is reported back to the dispatcher so weak answers count against the
// conversation's budget.

#include "../dispatcher.hpp"
#include "../knowledge_store.hpp"
#include <cstdio>
#include <memory>
#include <sstream>

namespace kosha::tools::knowledge {

using json = nlohmann::json;

constexpr int64_t MAX_K = 20;

inline ToolOutput search_knowledge_base(const KnowledgeStore& store, const json& params, size_t default_k) {
    std::string query = params.at("query").get<std::string>();
    int64_t k = params.contains("k") ? params["k"].get<int64_t>() : static_cast<int64_t>(default_k);
    if (k < 1 || k > MAX_K) {
        throw InvalidArgumentError("k", "k must be between 1 and " + std::to_string(MAX_K));
    }

    auto hits = store.search(query, static_cast<size_t>(k));

    ToolOutput out;
    json results = json::array();
    for (const auto& h : hits) {
        results.push_back({
            {"id", h.passage.id},
            {"title", h.passage.title},
            {"content", h.passage.content},
            {"similarity", h.similarity}
        });
    }
    out.structured = {{"query", query}, {"results", results}};

    if (hits.empty()) {
        out.text = "No relevant information found in the knowledge base.";
        return out;
    }

    out.relevance = hits.front().similarity;

    std::ostringstream ss;
    for (size_t i = 0; i < hits.size(); ++i) {
        char score[16];
        snprintf(score, sizeof(score), "%.2f", hits[i].similarity);
        if (i > 0) ss << "\n\n";
        ss << "Result " << (i + 1) << " - " << hits[i].passage.title
           << " (similarity " << score << "):\n" << hits[i].passage.content;
    }
    out.text = ss.str();
    return out;
}

inline void register_tools(Dispatcher& dispatcher, std::shared_ptr<const KnowledgeStore> store,
                           size_t default_k) {
    dispatcher.register_tool({
        "search_knowledge_base",
        "Search the internal knowledge base of support articles (policies, procedures, "
        "fees, account types). Use this first for company-specific questions.",
        ToolKind::Retrieval,
        {
            {"query", ParamType::String, true, "What the customer wants to know"},
            {"k", ParamType::Integer, false, "Number of passages to return (1-20)",
             static_cast<int64_t>(default_k)}
        },
        [store, default_k](const json& p) { return search_knowledge_base(*store, p, default_k); }
    });
}

} // namespace kosha::tools::knowledge
