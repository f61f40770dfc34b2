#pragma once

#include "core/Cancellation.hpp"
#include "core/MetricsCollector.hpp"
#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace image_mcp {

using json = nlohmann::json;

/**
 * @brief Metadata for an MCP tool
 */
struct ToolInfo {
    std::string name;
    std::string description;
    json input_schema;               // JSON Schema for tool arguments
    std::optional<json> annotations; // hint block passed through to tools/list
};

/**
 * @brief Function signature for tool execution
 *
 * The handler owns validation of its own arguments and reports failure by
 * throwing. Long-running handlers should poll the token and throw
 * OperationCancelled once it fires.
 *
 * @param args JSON object with tool arguments
 * @param token Cancellation signal from the server
 * @return JSON result object
 */
using ToolHandler = std::function<json(const json& args, const CancellationToken& token)>;

/**
 * @brief Thrown by ToolRegistry::invoke for a name that was never registered
 */
class ToolNotFoundError : public std::runtime_error {
public:
    explicit ToolNotFoundError(const std::string& name)
        : std::runtime_error("Tool not found: " + name) {}
};

/**
 * @brief Thrown by ToolRegistry::invoke when the handler failed
 */
class ToolExecutionError : public std::runtime_error {
public:
    explicit ToolExecutionError(const std::string& cause)
        : std::runtime_error("Tool execution failed: " + cause) {}
};

/**
 * @brief Named lookup table of tools
 *
 * Filled once at startup, read-only while the server runs.
 */
class ToolRegistry {
public:
    /**
     * @brief Register a tool with handler
     * @throws std::invalid_argument on empty name, null handler or duplicate name
     */
    void register_tool(const ToolInfo& info, ToolHandler handler);

    bool contains(const std::string& name) const;
    size_t size() const { return tools_.size(); }

    /**
     * @brief Descriptors for tools/list, one per tool, ordered by name
     */
    json list() const;

    /**
     * @brief Run a tool and record the outcome in metrics
     *
     * The handler runs synchronously on the caller's thread. Exactly one
     * metrics record is written per call that reaches the handler.
     *
     * @throws ToolNotFoundError if no tool has this name
     * @throws ToolExecutionError if the handler threw
     */
    json invoke(const std::string& name,
                const json& args,
                const CancellationToken& token,
                MetricsCollector& metrics) const;

private:
    struct Entry {
        ToolInfo info;
        ToolHandler handler;
    };

    std::map<std::string, Entry> tools_;
};

} // namespace image_mcp
