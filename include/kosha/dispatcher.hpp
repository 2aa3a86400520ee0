#pragma once
// Dispatcher: the single door every tool call goes through
//
// dispatch() looks the tool up, checks the arguments against its schema,
// consults the conversation's budget, runs the handler under a timeout
// and folds every outcome into a ToolResult. It never throws.

#include "budget.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cmath>
#include <functional>
#include <future>
#include <limits>
#include <iostream>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace kosha {

using json = nlohmann::json;

enum class ParamType : uint8_t { String, Number, Integer, Boolean };

// Retrieval tools feed the unproductive-call counter; the others only
// count toward the total.
enum class ToolKind : uint8_t { Retrieval, External, Compute };

inline const char* param_type_name(ParamType t) {
    switch (t) {
        case ParamType::String: return "string";
        case ParamType::Number: return "number";
        case ParamType::Integer: return "integer";
        case ParamType::Boolean: return "boolean";
    }
    return "unknown";
}

struct ParamSpec {
    std::string name;
    ParamType type = ParamType::String;
    bool required = true;
    std::string description;
    json default_value;  // Advertised only; handlers apply their own defaults
};

// What a handler hands back
struct ToolOutput {
    std::string text;
    json structured;
    std::optional<float> relevance;  // Best similarity, retrieval tools only
};

using ToolHandler = std::function<ToolOutput(const json&)>;

struct ToolDescriptor {
    std::string name;
    std::string description;
    ToolKind kind = ToolKind::Compute;
    std::vector<ParamSpec> params;  // Declaration order is advertised order
    ToolHandler handler;

    // JSON Schema object for tools/list
    json input_schema() const {
        json properties = json::object();
        json required = json::array();
        for (const auto& p : params) {
            json prop = {{"type", param_type_name(p.type)}};
            if (!p.description.empty()) prop["description"] = p.description;
            if (!p.default_value.is_null()) prop["default"] = p.default_value;
            properties[p.name] = prop;
            if (p.required) required.push_back(p.name);
        }
        return {
            {"type", "object"},
            {"properties", properties},
            {"required", required},
            {"additionalProperties", false}
        };
    }

    const ParamSpec* param(const std::string& pname) const {
        for (const auto& p : params) {
            if (p.name == pname) return &p;
        }
        return nullptr;
    }
};

enum class ToolStatus : uint8_t {
    Ok,
    UnknownTool,
    InvalidArgument,
    BudgetExceeded,   // Terminal for the conversation
    ExecutionError
};

inline const char* tool_status_kind(ToolStatus s) {
    switch (s) {
        case ToolStatus::Ok: return "ok";
        case ToolStatus::UnknownTool: return "unknown_tool";
        case ToolStatus::InvalidArgument: return "invalid_argument";
        case ToolStatus::BudgetExceeded: return "budget_exceeded";
        case ToolStatus::ExecutionError: return "tool_execution_error";
    }
    return "unknown";
}

struct ToolResult {
    ToolStatus status = ToolStatus::Ok;
    std::string tool;
    std::string content;     // Human-readable text, or the failure message
    json structured;         // Handler payload, or failure details
    std::string parameter;   // Offending parameter for InvalidArgument

    bool ok() const { return status == ToolStatus::Ok; }
    bool is_error() const { return status != ToolStatus::Ok; }
    bool terminal() const { return status == ToolStatus::BudgetExceeded; }
    const char* kind() const { return tool_status_kind(status); }

    static ToolResult success(const std::string& tool, ToolOutput output) {
        ToolResult r;
        r.tool = tool;
        r.content = std::move(output.text);
        r.structured = std::move(output.structured);
        return r;
    }

    static ToolResult failure(ToolStatus status, const std::string& tool,
                              const std::string& message, const std::string& parameter = "") {
        ToolResult r;
        r.status = status;
        r.tool = tool;
        r.content = message;
        r.parameter = parameter;
        return r;
    }
};

struct DispatcherConfig {
    BudgetPolicy budget;
    std::chrono::milliseconds timeout{15000};  // <= 0 runs handlers inline
};

class Dispatcher {
public:
    explicit Dispatcher(DispatcherConfig config = {})
        : config_(config), budgets_(config.budget) {}

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    void register_tool(ToolDescriptor descriptor) {
        if (descriptor.name.empty()) {
            throw std::invalid_argument("register_tool: tool name is empty");
        }
        if (!descriptor.handler) {
            throw std::invalid_argument("register_tool: tool " + descriptor.name + " has no handler");
        }
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (by_name_.count(descriptor.name)) {
            throw DuplicateToolError(descriptor.name);
        }
        by_name_[descriptor.name] = tools_.size();
        tools_.push_back(std::move(descriptor));
    }

    ToolResult dispatch(const std::string& conversation_id,
                        const std::string& name,
                        const json& arguments) {
        // 1. Lookup; copy what we need so registration can't move it under us
        ToolHandler handler;
        ToolKind kind = ToolKind::Compute;
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            auto it = by_name_.find(name);
            if (it == by_name_.end()) {
                return ToolResult::failure(ToolStatus::UnknownTool, name, "Unknown tool: " + name);
            }
            const auto& d = tools_[it->second];
            // 2. Validation
            try {
                validate_arguments(d, arguments);
            } catch (const InvalidArgumentError& e) {
                return ToolResult::failure(ToolStatus::InvalidArgument, name, e.what(), e.parameter());
            }
            handler = d.handler;
            kind = d.kind;
        }

        // 3. Budget; held until accounting is done
        auto budget = budgets_.acquire(conversation_id);
        std::lock_guard<std::mutex> budget_lock(budget->mutex());
        if (!budget->admit()) {
            const auto& st = budget->state();
            ToolResult r = ToolResult::failure(ToolStatus::BudgetExceeded, name,
                "Call budget exhausted for conversation '" + conversation_id + "': " + st.reason);
            r.structured = {
                {"calls", st.calls},
                {"unproductive", st.unproductive},
                {"max_calls", budget->policy().max_calls},
                {"max_unproductive", budget->policy().max_unproductive}
            };
            std::cerr << "[Dispatcher] " << r.content << "\n";
            return r;
        }

        // 4. Invoke
        bool retrieval = kind == ToolKind::Retrieval;
        try {
            ToolOutput output = invoke(name, handler, arguments);
            float best = output.relevance.value_or(0.0f);
            if (retrieval && output.structured.is_object()) {
                output.structured["relevance"] = output.relevance ? json(best) : json();
            }
            budget->record(retrieval, output.relevance ? &best : nullptr);
            return ToolResult::success(name, std::move(output));
        } catch (const InvalidArgumentError& e) {
            // Domain validation inside the tool; not an execution
            return ToolResult::failure(ToolStatus::InvalidArgument, name, e.what(), e.parameter());
        } catch (const ToolExecutionError& e) {
            budget->record(retrieval, nullptr);
            return execution_failure(name, e.cause());
        } catch (const std::exception& e) {
            budget->record(retrieval, nullptr);
            return execution_failure(name, e.what());
        } catch (...) {
            budget->record(retrieval, nullptr);
            return execution_failure(name, "handler threw a non-standard exception");
        }
    }

    // Registration order
    std::vector<ToolDescriptor> tools() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return tools_;
    }

    bool has_tool(const std::string& name) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return by_name_.count(name) > 0;
    }

    // Throws UnknownToolError
    ToolDescriptor descriptor(const std::string& name) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = by_name_.find(name);
        if (it == by_name_.end()) throw UnknownToolError(name);
        return tools_[it->second];
    }

    BudgetLedger& budgets() { return budgets_; }
    const DispatcherConfig& config() const { return config_; }

    // Throws InvalidArgumentError naming the first offending parameter
    static void validate_arguments(const ToolDescriptor& d, const json& arguments) {
        if (!arguments.is_object()) {
            throw InvalidArgumentError("", "Arguments for " + d.name + " must be a JSON object");
        }
        for (auto it = arguments.begin(); it != arguments.end(); ++it) {
            if (!d.param(it.key())) {
                throw InvalidArgumentError(it.key(), "Unexpected parameter for " + d.name + ": " + it.key());
            }
        }
        for (const auto& p : d.params) {
            auto it = arguments.find(p.name);
            if (it == arguments.end()) {
                if (p.required) {
                    throw InvalidArgumentError(p.name, "Missing required parameter: " + p.name);
                }
                continue;
            }
            if (!type_matches(p.type, *it)) {
                throw InvalidArgumentError(p.name, "Parameter " + p.name + " must be " +
                    std::string(param_type_name(p.type)) + ", got " + it->type_name());
            }
        }
    }

private:
    static bool type_matches(ParamType type, const json& v) {
        switch (type) {
            case ParamType::String: return v.is_string();
            case ParamType::Boolean: return v.is_boolean();
            case ParamType::Number: return v.is_number();
            case ParamType::Integer:
                // Handlers read integers as int64_t; anything wider is rejected
                if (v.is_number_unsigned()) {
                    return v.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
                }
                if (v.is_number_integer()) return true;
                if (v.is_number_float()) {
                    double d = v.get<double>();
                    return std::isfinite(d) && std::trunc(d) == d &&
                           d >= -9223372036854775808.0 && d < 9223372036854775808.0;
                }
                return false;
        }
        return false;
    }

    // Run on a worker thread; a late handler is abandoned, not cancelled.
    // Its closure owns what it touches, so finishing late is harmless.
    ToolOutput invoke(const std::string& name, const ToolHandler& handler, const json& arguments) {
        if (config_.timeout.count() <= 0) return handler(arguments);

        auto task = std::make_shared<std::packaged_task<ToolOutput()>>(
            [handler, arguments]() { return handler(arguments); });
        auto future = task->get_future();
        std::thread([task]() { (*task)(); }).detach();

        if (future.wait_for(config_.timeout) != std::future_status::ready) {
            throw ToolExecutionError(name, "timed out after " +
                std::to_string(config_.timeout.count()) + " ms");
        }
        return future.get();
    }

    ToolResult execution_failure(const std::string& name, const std::string& cause) {
        std::cerr << "[Dispatcher] " << name << " failed: " << cause << "\n";
        ToolResult r = ToolResult::failure(ToolStatus::ExecutionError, name,
                                           "Tool " + name + " failed: " + cause);
        r.structured = {{"cause", cause}};
        return r;
    }

    DispatcherConfig config_;
    BudgetLedger budgets_;

    mutable std::shared_mutex mutex_;
    std::vector<ToolDescriptor> tools_;
    std::unordered_map<std::string, size_t> by_name_;
};

} // namespace kosha
