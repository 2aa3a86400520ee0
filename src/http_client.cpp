#include <kosha/http_client.hpp>
#include <kosha/errors.hpp>
#include <kosha/version.hpp>
#include <curl/curl.h>
#include <memory>
#include <mutex>

namespace kosha {

namespace {

constexpr size_t MAX_BODY_BYTES = 4 * 1024 * 1024;

struct WriteCtx {
    std::string* out;
    size_t max_bytes;
    bool truncated = false;
};

size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<WriteCtx*>(userdata);
    size_t n = size * nmemb;
    if (ctx->out->size() + n > ctx->max_bytes) {
        ctx->truncated = true;
        return 0;  // Aborts the transfer with CURLE_WRITE_ERROR
    }
    ctx->out->append(ptr, n);
    return n;
}

void global_init() {
    static std::once_flag once;
    std::call_once(once, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

struct CurlDeleter {
    void operator()(CURL* c) const { curl_easy_cleanup(c); }
};
struct SlistDeleter {
    void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};

using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

HttpResponse curl_get(const HttpRequest& request) {
    global_init();

    CurlHandle curl(curl_easy_init());
    if (!curl) throw ExternalToolError("HTTP client unavailable: curl_easy_init failed");

    HeaderList headers;
    for (const auto& h : request.headers) {
        curl_slist* next = curl_slist_append(headers.get(), h.c_str());
        if (!next) throw ExternalToolError("HTTP client: cannot build request headers");
        headers.release();
        headers.reset(next);
    }

    HttpResponse response;
    WriteCtx ctx{&response.body, MAX_BODY_BYTES};
    char errbuf[CURL_ERROR_SIZE] = {0};
    std::string user_agent = std::string("kosha/") + KOSHA_VERSION;

    curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(request.timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, user_agent.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);
    if (headers) curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());

    CURLcode rc = curl_easy_perform(curl.get());
    if (rc != CURLE_OK) {
        if (ctx.truncated) {
            throw ExternalToolError("HTTP response exceeds " + std::to_string(MAX_BODY_BYTES) + " bytes");
        }
        if (rc == CURLE_OPERATION_TIMEDOUT) {
            throw ExternalToolError("HTTP request timed out after " +
                                    std::to_string(request.timeout.count()) + " ms");
        }
        throw ExternalToolError(std::string("HTTP request failed: ") +
                                (errbuf[0] ? errbuf : curl_easy_strerror(rc)));
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

} // namespace

HttpTransport curl_transport() {
    return [](const HttpRequest& request) { return curl_get(request); };
}

std::string build_query_url(const std::string& base,
                            const std::vector<std::pair<std::string, std::string>>& params) {
    global_init();
    CurlHandle curl(curl_easy_init());
    if (!curl) throw ExternalToolError("HTTP client unavailable: curl_easy_init failed");

    auto escape = [&curl](const std::string& s) {
        char* e = curl_easy_escape(curl.get(), s.c_str(), static_cast<int>(s.size()));
        if (!e) throw ExternalToolError("HTTP client: cannot url-encode '" + s + "'");
        std::string out(e);
        curl_free(e);
        return out;
    };

    std::string url = base;
    char sep = base.find('?') == std::string::npos ? '?' : '&';
    for (const auto& kv : params) {
        url += sep;
        url += escape(kv.first);
        url += '=';
        url += escape(kv.second);
        sep = '&';
    }
    return url;
}

} // namespace kosha
