#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <nlohmann/json.hpp>

namespace image_mcp {

using json = nlohmann::json;

/**
 * @brief Invocation statistics for a single tool
 */
struct ToolStats {
    std::string name;
    int64_t invocations = 0;
    int64_t successes = 0;
    int64_t failures = 0;
    std::chrono::nanoseconds total_latency{0};
    std::chrono::nanoseconds avg_latency{0};
    std::chrono::nanoseconds min_latency{0};
    std::chrono::nanoseconds max_latency{0};
    std::chrono::system_clock::time_point last_invoked;
};

/**
 * @brief Aggregate over every recorded invocation
 */
struct MetricsSummary {
    int64_t total_invocations = 0;
    int64_t total_successes = 0;
    int64_t total_failures = 0;
    double success_rate_pct = 0.0;  // always within [0, 100]
    int64_t avg_latency_ms = 0;
    size_t tools_count = 0;
};

void to_json(json& j, const ToolStats& stats);
void to_json(json& j, const MetricsSummary& summary);

/**
 * @brief Thread-safe, purely additive aggregation of tool invocation outcomes
 *
 * Readers (get_tool_stats, get_all_stats, get_summary) share the lock;
 * record() and reset() hold it exclusively. Stats are never evicted.
 */
class MetricsCollector {
public:
    MetricsCollector() = default;

    MetricsCollector(const MetricsCollector&) = delete;
    MetricsCollector& operator=(const MetricsCollector&) = delete;

    /**
     * @brief Record one finished invocation
     * @param tool_name Name of the invoked tool
     * @param duration Wall time spent in the handler
     * @param success false when the handler failed
     */
    void record(const std::string& tool_name, std::chrono::nanoseconds duration, bool success);

    /**
     * @brief Copy of the stats for one tool
     * @return std::nullopt if the tool was never invoked
     */
    std::optional<ToolStats> get_tool_stats(const std::string& tool_name) const;

    /**
     * @brief Copy of the stats for every invoked tool, keyed by name
     */
    std::map<std::string, ToolStats> get_all_stats() const;

    MetricsSummary get_summary() const;

    /**
     * @brief Log the summary at info level and each tool at debug level
     */
    void log_summary() const;

    /**
     * @brief Drop every counter and per-tool entry (test isolation)
     */
    void reset();

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, ToolStats> tools_;
    int64_t total_invocations_ = 0;
    int64_t total_successes_ = 0;
    int64_t total_failures_ = 0;
    int64_t total_latency_ms_ = 0;
};

} // namespace image_mcp
