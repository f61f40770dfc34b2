#include "ServerMetricsTool.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace image_mcp {

ServerMetricsTool::ServerMetricsTool(const MetricsCollector& metrics)
    : metrics_(metrics) {}

ToolInfo ServerMetricsTool::get_info() {
    return {
        "server_metrics",
        "Report invocation statistics for the tools of this server: call counts, "
        "success rate and latency. Pass 'tool' to get the stats of a single tool.",
        {
            {"type", "object"},
            {"properties", {
                {"tool", {
                    {"type", "string"},
                    {"description", "Only report this tool"}
                }}
            }}
        },
        json{
            {"readOnlyHint", true},
            {"idempotentHint", true}
        }
    };
}

json ServerMetricsTool::execute(const json& args) const {
    json summary = metrics_.get_summary();

    if (args.contains("tool")) {
        if (!args["tool"].is_string()) {
            throw std::invalid_argument("tool must be a string");
        }
        std::string name = args["tool"].get<std::string>();
        spdlog::debug("ServerMetricsTool: stats for {}", name);

        auto stats = metrics_.get_tool_stats(name);
        if (!stats) {
            return {
                {"summary", summary},
                {"tool", name},
                {"found", false}
            };
        }
        return {
            {"summary", summary},
            {"tool", name},
            {"found", true},
            {"stats", *stats}
        };
    }

    json tools = json::array();
    for (const auto& [name, stats] : metrics_.get_all_stats()) {
        tools.push_back(json(stats));
    }

    return {
        {"summary", summary},
        {"tools", tools}
    };
}

} // namespace image_mcp
