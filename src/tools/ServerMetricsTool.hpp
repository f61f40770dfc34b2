#pragma once

#include "core/MetricsCollector.hpp"
#include "mcp/ToolRegistry.hpp"

namespace image_mcp {

/**
 * @brief MCP tool reporting the server's own invocation statistics
 *
 * Returns the overall summary plus per-tool stats, or the stats of a
 * single tool when the "tool" argument is given.
 */
class ServerMetricsTool {
public:
    /**
     * @brief Construct tool reading from the given collector
     * @param metrics Collector owned by the server; must outlive the tool
     */
    explicit ServerMetricsTool(const MetricsCollector& metrics);

    /**
     * @brief Get tool metadata and JSON schema
     * @return ToolInfo with name, description, input schema and read-only hints
     */
    static ToolInfo get_info();

    /**
     * @brief Execute tool with arguments
     * @param args JSON object with optional "tool" parameter
     * @return JSON result with summary and stats
     * @throws std::invalid_argument if "tool" is not a string
     */
    json execute(const json& args) const;

private:
    const MetricsCollector& metrics_;
};

} // namespace image_mcp
