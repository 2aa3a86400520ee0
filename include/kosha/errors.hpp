#pragma once
// Error taxonomy
//
// Everything below the dispatcher throws one of these. The dispatcher
// turns them into ToolResults; nothing raw crosses the tool boundary.
// Running out of budget is not here: it is a status, not a failure.

#include <stdexcept>
#include <string>

namespace kosha {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Ingest aborted. The store keeps its previous state.
class IngestError : public Error {
public:
    using Error::Error;
};

// Text could not be turned into a vector. Means "no answer", not a crash.
class EmbeddingError : public Error {
public:
    using Error::Error;
};

// Persisted index and passage metadata disagree
class StoreCorruptError : public Error {
public:
    using Error::Error;
};

class DuplicateToolError : public Error {
public:
    explicit DuplicateToolError(const std::string& tool)
        : Error("Tool already registered: " + tool), tool_(tool) {}

    const std::string& tool() const { return tool_; }

private:
    std::string tool_;
};

class UnknownToolError : public Error {
public:
    explicit UnknownToolError(const std::string& tool)
        : Error("Unknown tool: " + tool), tool_(tool) {}

    const std::string& tool() const { return tool_; }

private:
    std::string tool_;
};

// Bad caller input. Names the parameter when there is one.
class InvalidArgumentError : public Error {
public:
    InvalidArgumentError(const std::string& parameter, const std::string& message)
        : Error(message), parameter_(parameter) {}

    const std::string& parameter() const { return parameter_; }

private:
    std::string parameter_;
};

// Third-party lookup failed: transport, status or payload
class ExternalToolError : public Error {
public:
    using Error::Error;
};

class ToolExecutionError : public Error {
public:
    ToolExecutionError(const std::string& tool, const std::string& cause)
        : Error(tool + ": " + cause), tool_(tool), cause_(cause) {}

    const std::string& tool() const { return tool_; }
    const std::string& cause() const { return cause_; }

private:
    std::string tool_;
    std::string cause_;
};

} // namespace kosha
