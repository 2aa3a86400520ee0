#pragma once
// RPC Protocol: JSON-RPC 2.0 helpers and error codes
//
// Message shapes for the tool server. Tool failures the agent can react
// to (budget, execution) travel as results; caller mistakes (unknown
// tool, bad arguments) travel as JSON-RPC errors.

#include <nlohmann/json.hpp>
#include <string>

namespace kosha::rpc {

using json = nlohmann::json;

// Sanitize string to valid UTF-8, replacing invalid bytes with replacement char
inline std::string sanitize_utf8(const std::string& input) {
    std::string output;
    output.reserve(input.size());

    auto cont = [&input](size_t i) {
        return i < input.size() && (static_cast<unsigned char>(input[i]) & 0xC0) == 0x80;
    };

    size_t i = 0;
    while (i < input.size()) {
        unsigned char c = static_cast<unsigned char>(input[i]);
        size_t len = 0;
        if (c < 0x80) len = 1;
        else if ((c & 0xE0) == 0xC0) len = cont(i + 1) ? 2 : 0;
        else if ((c & 0xF0) == 0xE0) len = cont(i + 1) && cont(i + 2) ? 3 : 0;
        else if ((c & 0xF8) == 0xF0) len = cont(i + 1) && cont(i + 2) && cont(i + 3) ? 4 : 0;

        if (len == 0) {
            output += "\xEF\xBF\xBD";  // U+FFFD
            ++i;
        } else {
            output.append(input, i, len);
            i += len;
        }
    }
    return output;
}

// JSON-RPC 2.0 error codes
namespace error {
    constexpr int PARSE_ERROR = -32700;
    constexpr int INVALID_REQUEST = -32600;
    constexpr int METHOD_NOT_FOUND = -32601;
    constexpr int INVALID_PARAMS = -32602;
    constexpr int INTERNAL_ERROR = -32603;
    // Server-specific errors
    constexpr int TOOL_NOT_FOUND = -32001;
    constexpr int STORE_ERROR = -32003;
}

// Build a JSON-RPC 2.0 success response
inline json make_result(const json& id, const json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

// Build a JSON-RPC 2.0 error response
inline json make_error(const json& id, int code, const std::string& message,
                       const json& data = json()) {
    json err = {
        {"code", code},
        {"message", sanitize_utf8(message)}
    };
    if (!data.is_null()) err["data"] = data;
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", err}
    };
}

// Build a tool call response (MCP content format)
inline json make_tool_response(const std::string& text, bool is_error = false,
                               const json& structured = json()) {
    json content = json::array();
    content.push_back({
        {"type", "text"},
        {"text", sanitize_utf8(text)}
    });

    json response = {
        {"content", content},
        {"isError", is_error}
    };

    if (!structured.is_null()) {
        response["structured"] = structured;
    }

    return response;
}

// Validate JSON-RPC 2.0 request
inline bool validate_request(const json& request, std::string& error_msg) {
    if (!request.is_object()) {
        error_msg = "Request must be a JSON object";
        return false;
    }
    if (!request.contains("jsonrpc") || request["jsonrpc"] != "2.0") {
        error_msg = "Missing or invalid jsonrpc version";
        return false;
    }
    if (!request.contains("method") || !request["method"].is_string()) {
        error_msg = "Missing or invalid method";
        return false;
    }
    if (request.contains("params") && !request["params"].is_object()) {
        error_msg = "params must be an object";
        return false;
    }
    return true;
}

// Extract request components
struct RequestInfo {
    std::string method;
    json params;
    json id;
    bool notification;  // No id: the sender expects no response
};

inline RequestInfo parse_request(const json& request) {
    return {
        request["method"].get<std::string>(),
        request.value("params", json::object()),
        request.value("id", json()),
        !request.contains("id")
    };
}

} // namespace kosha::rpc
