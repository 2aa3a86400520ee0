#pragma once
// RPC Handler: JSON-RPC request handling for the tool server
//
// Transport-agnostic: takes one request line, returns one response line
// (empty for notifications). mcp_server.cpp feeds it from stdin.

#include "protocol.hpp"
#include "../backend.hpp"
#include "../version.hpp"
#include <atomic>
#include <string>

namespace kosha::rpc {

using json = nlohmann::json;

constexpr const char* DEFAULT_CONVERSATION = "default";

class Handler {
public:
    explicit Handler(Backend* backend) : backend_(backend) {}

    // Process a JSON-RPC request string, return response string
    std::string handle(const std::string& request_str) {
        json response;
        try {
            auto request = json::parse(request_str);
            response = handle_request(request);
        } catch (const json::parse_error& e) {
            response = make_error(json(), error::PARSE_ERROR,
                                  std::string("JSON parse error: ") + e.what());
        }
        if (response.is_null()) return "";
        return response.dump(-1, ' ', false, json::error_handler_t::replace);
    }

    // Null for notifications
    json handle_request(const json& request) {
        std::string error_msg;
        if (!validate_request(request, error_msg)) {
            json id = request.is_object() ? request.value("id", json()) : json();
            return make_error(id, error::INVALID_REQUEST, error_msg);
        }

        auto info = parse_request(request);
        json response;
        try {
            response = dispatch(info);
        } catch (const std::exception& e) {
            std::cerr << "[kosha_mcp] " << info.method << " failed: " << e.what() << "\n";
            response = make_error(info.id, error::INTERNAL_ERROR,
                                  std::string("Internal error: ") + e.what());
        }
        if (info.notification) return json();
        return response;
    }

    bool shutdown_requested() const { return shutdown_.load(); }

private:
    Backend* backend_;
    std::atomic<bool> shutdown_{false};

    json dispatch(const RequestInfo& info) {
        const auto& m = info.method;
        if (m == "initialize") return handle_initialize(info.id);
        if (m == "initialized" || m == "notifications/initialized") return json();
        if (m == "tools/list") return handle_tools_list(info.id);
        if (m == "tools/call") return handle_tools_call(info.params, info.id);
        if (m == "conversation/start") return handle_conversation_start(info.params, info.id);
        if (m == "conversation/end") return handle_conversation_end(info.params, info.id);
        if (m == "knowledge/ingest") return handle_ingest(info.params, info.id);
        if (m == "knowledge/stats") return handle_stats(info.id);
        if (m == "shutdown") return handle_shutdown(info.id);
        return make_error(info.id, error::METHOD_NOT_FOUND, "Unknown method: " + m);
    }

    // ═══════════════════════════════════════════════════════════════════
    // Protocol methods
    // ═══════════════════════════════════════════════════════════════════

    json handle_initialize(const json& id) {
        return make_result(id, {
            {"protocolVersion", KOSHA_PROTOCOL_VERSION},
            {"serverInfo", {
                {"name", "kosha"},
                {"version", KOSHA_VERSION}
            }},
            {"capabilities", {{"tools", json::object()}}}
        });
    }

    json handle_tools_list(const json& id) {
        json tools_array = json::array();
        for (const auto& tool : backend_->dispatcher().tools()) {
            tools_array.push_back({
                {"name", tool.name},
                {"description", tool.description},
                {"inputSchema", tool.input_schema()}
            });
        }
        return make_result(id, {{"tools", tools_array}});
    }

    json handle_tools_call(const json& params, const json& id) {
        if (!params.contains("name") || !params["name"].is_string()) {
            return make_error(id, error::INVALID_PARAMS, "Missing tool name");
        }
        std::string conversation;
        if (!conversation_param(params, false, conversation)) {
            return make_error(id, error::INVALID_PARAMS, "conversation_id must be a string");
        }

        std::string name = params["name"];
        json arguments = params.contains("arguments") ? params["arguments"] : json::object();

        ToolResult result = backend_->call(conversation, name, arguments);

        switch (result.status) {
            case ToolStatus::UnknownTool:
                return make_error(id, error::TOOL_NOT_FOUND, result.content,
                                  {{"kind", result.kind()}, {"tool", name}});
            case ToolStatus::InvalidArgument: {
                json data = {{"kind", result.kind()}, {"tool", name}};
                if (!result.parameter.empty()) data["parameter"] = result.parameter;
                return make_error(id, error::INVALID_PARAMS, result.content, data);
            }
            default:
                break;
        }

        json structured = result.structured.is_object() ? result.structured : json::object();
        if (!result.structured.is_null() && !result.structured.is_object()) {
            structured["data"] = result.structured;
        }
        structured["kind"] = result.kind();
        structured["terminal"] = result.terminal();
        structured["tool"] = name;
        return make_result(id, make_tool_response(result.content, result.is_error(), structured));
    }

    json handle_conversation_start(const json& params, const json& id) {
        std::string conversation;
        if (!conversation_param(params, true, conversation)) {
            return make_error(id, error::INVALID_PARAMS, "conversation_id (string) is required",
                              {{"kind", "invalid_argument"}, {"parameter", "conversation_id"}});
        }
        backend_->start_conversation(conversation);
        return make_result(id, {{"conversation_id", conversation}, {"status", "started"}});
    }

    json handle_conversation_end(const json& params, const json& id) {
        std::string conversation;
        if (!conversation_param(params, true, conversation)) {
            return make_error(id, error::INVALID_PARAMS, "conversation_id (string) is required",
                              {{"kind", "invalid_argument"}, {"parameter", "conversation_id"}});
        }
        bool known = backend_->end_conversation(conversation);
        return make_result(id, {{"conversation_id", conversation}, {"ended", known}});
    }

    json handle_ingest(const json& params, const json& id) {
        if (!params.contains("passages") || !params["passages"].is_array()) {
            return make_error(id, error::INVALID_PARAMS, "passages must be an array",
                              {{"kind", "invalid_argument"}, {"parameter", "passages"}});
        }

        std::vector<PassageInput> inputs;
        for (const auto& p : params["passages"]) {
            if (!p.is_object() || !p.contains("title") || !p["title"].is_string() ||
                !p.contains("content") || !p["content"].is_string()) {
                return make_error(id, error::INVALID_PARAMS,
                                  "each passage needs string title and content",
                                  {{"kind", "invalid_argument"}, {"parameter", "passages"}});
            }
            inputs.push_back({p["title"].get<std::string>(), p["content"].get<std::string>()});
        }

        try {
            auto ids = backend_->ingest(inputs);
            return make_result(id, {{"ids", ids}, {"total", backend_->stats().passages}});
        } catch (const IngestError& e) {
            return make_error(id, error::STORE_ERROR, e.what(), {{"kind", "ingest_error"}});
        }
    }

    json handle_stats(const json& id) {
        auto s = backend_->stats();
        return make_result(id, {
            {"passages", s.passages},
            {"index_size", s.index_size},
            {"dimension", s.dimension},
            {"embedder", s.embedder},
            {"conversations", backend_->dispatcher().budgets().active()}
        });
    }

    json handle_shutdown(const json& id) {
        backend_->close();
        shutdown_ = true;
        return make_result(id, {{"status", "ok"}});
    }

    // conversation_id, or "default" when optional and absent
    static bool conversation_param(const json& params, bool required, std::string& out) {
        auto it = params.find("conversation_id");
        if (it == params.end()) {
            if (required) return false;
            out = DEFAULT_CONVERSATION;
            return true;
        }
        if (!it->is_string()) return false;
        out = it->get<std::string>();
        return true;
    }
};

} // namespace kosha::rpc
