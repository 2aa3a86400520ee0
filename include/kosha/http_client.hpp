#pragma once
// HTTP client: the one place the process talks to the network
//
// Tools take an HttpTransport so tests can hand in a canned response
// instead of reaching a live API.

#include <chrono>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace kosha {

struct HttpRequest {
    std::string url;
    std::vector<std::string> headers;  // "Name: value"
    std::chrono::milliseconds timeout{10000};
};

struct HttpResponse {
    long status = 0;
    std::string body;
};

// Performs a GET. Throws ExternalToolError when no response arrives
// (resolve, connect, timeout). A non-2xx status is still a response.
using HttpTransport = std::function<HttpResponse(const HttpRequest&)>;

// libcurl-backed transport
HttpTransport curl_transport();

// base + "?" + url-encoded key=value pairs ("&" if base already has a query)
std::string build_query_url(const std::string& base,
                            const std::vector<std::pair<std::string, std::string>>& params);

} // namespace kosha
