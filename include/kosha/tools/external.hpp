#pragma once
// External tools: search_web, get_market_data
//
// Both go through a WebSearch client speaking the DuckDuckGo Instant
// Answer response shape. Failures surface as ExternalToolError and the
// dispatcher reports them as execution errors.

#include "../dispatcher.hpp"
#include "../http_client.hpp"
#include <algorithm>
#include <cctype>
#include <memory>

namespace kosha::tools::external {

using json = nlohmann::json;

struct WebSearchConfig {
    std::string api_url = "https://api.duckduckgo.com/";
    std::string api_key;  // Sent as a bearer token when set
    std::chrono::milliseconds timeout{10000};
};

class WebSearch {
public:
    WebSearch(WebSearchConfig config, HttpTransport transport)
        : config_(std::move(config)), transport_(std::move(transport)) {
        if (!transport_) throw std::invalid_argument("WebSearch: transport is null");
    }

    // Throws ExternalToolError
    std::string invoke(const std::string& query) const {
        HttpRequest request;
        request.url = build_query_url(config_.api_url, {
            {"q", query},
            {"format", "json"},
            {"no_html", "1"},
            {"skip_disambig", "1"}
        });
        request.timeout = config_.timeout;
        if (!config_.api_key.empty()) {
            request.headers.push_back("Authorization: Bearer " + config_.api_key);
        }

        HttpResponse response = transport_(request);
        if (response.status != 200) {
            throw ExternalToolError("search API returned status " + std::to_string(response.status));
        }

        json data = json::parse(response.body, nullptr, false);
        if (data.is_discarded() || !data.is_object()) {
            throw ExternalToolError("search API returned a malformed payload");
        }
        return summarize(data, query);
    }

    // Summary, answer and up to three related topics, blank-line separated
    static std::string summarize(const json& data, const std::string& query) {
        std::vector<std::string> parts;

        auto text_field = [&data](const char* key) -> std::string {
            auto it = data.find(key);
            if (it == data.end() || !it->is_string()) return "";
            return it->get<std::string>();
        };

        std::string abstract = text_field("AbstractText");
        if (!abstract.empty()) parts.push_back("Summary: " + abstract);

        std::string answer = text_field("Answer");
        if (!answer.empty()) parts.push_back("Answer: " + answer);

        auto topics_it = data.find("RelatedTopics");
        if (topics_it != data.end() && topics_it->is_array()) {
            std::string related;
            size_t taken = 0;
            for (const auto& topic : *topics_it) {
                if (taken == 3) break;
                ++taken;
                if (!topic.is_object()) continue;
                auto t = topic.find("Text");
                if (t == topic.end() || !t->is_string() || t->get<std::string>().empty()) continue;
                if (!related.empty()) related += " | ";
                related += t->get<std::string>();
            }
            if (!related.empty()) parts.push_back("Related: " + related);
        }

        if (parts.empty()) {
            return "Search completed but no detailed results found for: " + query +
                   ". For real-time market data, please check financial websites like "
                   "Yahoo Finance or Bloomberg.";
        }

        std::string out;
        for (size_t i = 0; i < parts.size(); ++i) {
            if (i > 0) out += "\n\n";
            out += parts[i];
        }
        return out;
    }

    const WebSearchConfig& config() const { return config_; }

private:
    WebSearchConfig config_;
    HttpTransport transport_;
};

// 1-12 characters of [A-Za-z0-9.-^=], e.g. AAPL, BRK.B, ^GSPC, EURUSD=X
inline bool valid_symbol(const std::string& symbol) {
    if (symbol.empty() || symbol.size() > 12) return false;
    return std::all_of(symbol.begin(), symbol.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '.' || c == '-' || c == '^' || c == '=';
    });
}

inline ToolOutput search_web(const WebSearch& web, const json& params) {
    std::string query = params.at("query").get<std::string>();
    if (query.find_first_not_of(" \t\r\n") == std::string::npos) {
        throw InvalidArgumentError("query", "query must not be empty");
    }
    ToolOutput out;
    out.text = web.invoke(query);
    out.structured = {{"query", query}};
    return out;
}

inline ToolOutput get_market_data(const WebSearch& web, const json& params) {
    std::string symbol = params.at("symbol").get<std::string>();
    if (!valid_symbol(symbol)) {
        throw InvalidArgumentError("symbol",
            "symbol must be 1-12 characters of letters, digits, '.', '-', '^' or '='");
    }
    std::transform(symbol.begin(), symbol.end(), symbol.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    ToolOutput out;
    out.text = "Market data for " + symbol + ":\n" + web.invoke(symbol + " stock price");
    out.structured = {{"symbol", symbol}};
    return out;
}

inline void register_tools(Dispatcher& dispatcher, std::shared_ptr<const WebSearch> web) {
    dispatcher.register_tool({
        "search_web",
        "Search the web for external information such as market news, rates or "
        "general finance topics. Use when the knowledge base has no answer.",
        ToolKind::External,
        {
            {"query", ParamType::String, true, "Search query"}
        },
        [web](const json& p) { return search_web(*web, p); }
    });

    dispatcher.register_tool({
        "get_market_data",
        "Look up current market information for a ticker symbol (stocks, indices, FX).",
        ToolKind::External,
        {
            {"symbol", ParamType::String, true, "Ticker symbol, e.g. AAPL or ^GSPC"}
        },
        [web](const json& p) { return get_market_data(*web, p); }
    });
}

} // namespace kosha::tools::external
