#pragma once
// Backend configuration
//
// Defaults, then KOSHA_* environment variables, then command-line flags
// (applied by the binaries). A malformed value throws std::invalid_argument
// naming where it came from.

#include "types.hpp"
#include <chrono>
#include <cstdlib>
#include <functional>
#include <stdexcept>
#include <string>

namespace kosha {

using EnvLookup = std::function<const char*(const char*)>;

namespace config_detail {

inline size_t parse_count(const std::string& source, const std::string& value) {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument(source + ": expected a non-negative integer, got '" + value + "'");
    }
    try {
        return static_cast<size_t>(std::stoull(value));
    } catch (const std::out_of_range&) {
        throw std::invalid_argument(source + ": value out of range: " + value);
    }
}

inline float parse_float(const std::string& source, const std::string& value) {
    size_t used = 0;
    float f = 0.0f;
    try {
        f = std::stof(value, &used);
    } catch (const std::logic_error&) {
        throw std::invalid_argument(source + ": expected a number, got '" + value + "'");
    }
    if (used != value.size()) {
        throw std::invalid_argument(source + ": expected a number, got '" + value + "'");
    }
    return f;
}

inline bool parse_bool(const std::string& source, const std::string& value) {
    if (value == "1" || value == "true" || value == "yes" || value == "on") return true;
    if (value == "0" || value == "false" || value == "no" || value == "off") return false;
    throw std::invalid_argument(source + ": expected true/false, got '" + value + "'");
}

} // namespace config_detail

struct BackendConfig {
    std::string data_dir = "./knowledge_base";
    std::string search_api_url = "https://api.duckduckgo.com/";
    std::string search_api_key;
    size_t max_calls = 12;
    size_t max_unproductive = 3;
    float similarity_floor = 0.25f;
    std::chrono::milliseconds tool_timeout{15000};
    std::chrono::milliseconds external_timeout{10000};
    size_t default_k = 3;
    bool seed_samples = true;
    size_t embed_dim = EMBED_DIM;  // Hashing embedder only; ONNX models bring their own
    std::string model_path;
    std::string vocab_path;

    // Overlay KOSHA_* variables
    void apply_env(const EnvLookup& lookup = [](const char* name) { return std::getenv(name); }) {
        using namespace config_detail;
        auto str = [&lookup](const char* name, std::string& field) {
            if (const char* v = lookup(name)) field = v;
        };
        auto count = [&lookup](const char* name, size_t& field) {
            if (const char* v = lookup(name)) field = parse_count(name, v);
        };
        auto millis = [&lookup](const char* name, std::chrono::milliseconds& field) {
            if (const char* v = lookup(name)) {
                field = std::chrono::milliseconds(static_cast<int64_t>(parse_count(name, v)));
            }
        };

        str("KOSHA_DATA_DIR", data_dir);
        str("KOSHA_SEARCH_API_URL", search_api_url);
        str("KOSHA_SEARCH_API_KEY", search_api_key);
        count("KOSHA_MAX_TOOL_CALLS", max_calls);
        count("KOSHA_MAX_UNPRODUCTIVE", max_unproductive);
        if (const char* v = lookup("KOSHA_SIMILARITY_FLOOR")) {
            similarity_floor = parse_float("KOSHA_SIMILARITY_FLOOR", v);
        }
        millis("KOSHA_TOOL_TIMEOUT_MS", tool_timeout);
        millis("KOSHA_EXTERNAL_TIMEOUT_MS", external_timeout);
        str("KOSHA_MODEL", model_path);
        str("KOSHA_VOCAB", vocab_path);
        if (const char* v = lookup("KOSHA_SEED_SAMPLES")) {
            seed_samples = parse_bool("KOSHA_SEED_SAMPLES", v);
        }
        validate();
    }

    // Ranges the rest of the code relies on
    void validate() const {
        if (similarity_floor < -1.0f || similarity_floor > 1.0f) {
            throw std::invalid_argument("similarity_floor must be within [-1, 1]");
        }
        if (default_k < 1 || default_k > 20) {
            throw std::invalid_argument("default_k must be within [1, 20]");
        }
        if (embed_dim == 0) {
            throw std::invalid_argument("embed_dim must be positive");
        }
        if (tool_timeout.count() <= 0) {
            throw std::invalid_argument("tool_timeout must be positive");
        }
        if (external_timeout.count() <= 0) {
            throw std::invalid_argument("external_timeout must be positive");
        }
        if (search_api_url.empty()) {
            throw std::invalid_argument("search_api_url must not be empty");
        }
    }

    static BackendConfig from_env() {
        BackendConfig config;
        config.apply_env();
        return config;
    }
};

} // namespace kosha
