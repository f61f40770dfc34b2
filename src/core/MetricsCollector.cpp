#include "MetricsCollector.hpp"
#include <spdlog/spdlog.h>
#include <ctime>
#include <mutex>

namespace image_mcp {

namespace {

int64_t to_millis(std::chrono::nanoseconds duration) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

std::string format_utc(std::chrono::system_clock::time_point tp) {
    if (tp.time_since_epoch().count() == 0) {
        return "";
    }
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

} // namespace

void to_json(json& j, const ToolStats& stats) {
    j = {
        {"name", stats.name},
        {"invocations", stats.invocations},
        {"successes", stats.successes},
        {"failures", stats.failures},
        {"total_latency_ms", to_millis(stats.total_latency)},
        {"avg_latency_ms", to_millis(stats.avg_latency)},
        {"min_latency_ms", to_millis(stats.min_latency)},
        {"max_latency_ms", to_millis(stats.max_latency)},
        {"last_invoked", format_utc(stats.last_invoked)}
    };
}

void to_json(json& j, const MetricsSummary& summary) {
    j = {
        {"total_invocations", summary.total_invocations},
        {"total_successes", summary.total_successes},
        {"total_failures", summary.total_failures},
        {"success_rate_pct", summary.success_rate_pct},
        {"avg_latency_ms", summary.avg_latency_ms},
        {"tools_count", summary.tools_count}
    };
}

void MetricsCollector::record(const std::string& tool_name,
                              std::chrono::nanoseconds duration,
                              bool success) {
    {
        std::unique_lock lock(mutex_);

        auto it = tools_.find(tool_name);
        if (it == tools_.end()) {
            ToolStats fresh;
            fresh.name = tool_name;
            fresh.min_latency = duration;
            fresh.max_latency = duration;
            it = tools_.emplace(tool_name, std::move(fresh)).first;
        }

        ToolStats& stats = it->second;
        stats.invocations++;
        stats.total_latency += duration;
        stats.avg_latency = stats.total_latency / stats.invocations;
        stats.last_invoked = std::chrono::system_clock::now();

        if (duration < stats.min_latency) {
            stats.min_latency = duration;
        }
        if (duration > stats.max_latency) {
            stats.max_latency = duration;
        }

        if (success) {
            stats.successes++;
            total_successes_++;
        } else {
            stats.failures++;
            total_failures_++;
        }

        total_invocations_++;
        total_latency_ms_ += to_millis(duration);
    }

    if (success) {
        spdlog::debug("[metrics] tool={} duration_ms={} invocation completed",
                      tool_name, to_millis(duration));
    } else {
        spdlog::warn("[metrics] tool={} duration_ms={} invocation failed",
                     tool_name, to_millis(duration));
    }
}

std::optional<ToolStats> MetricsCollector::get_tool_stats(const std::string& tool_name) const {
    std::shared_lock lock(mutex_);

    auto it = tools_.find(tool_name);
    if (it == tools_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::map<std::string, ToolStats> MetricsCollector::get_all_stats() const {
    std::shared_lock lock(mutex_);
    return tools_;
}

MetricsSummary MetricsCollector::get_summary() const {
    std::shared_lock lock(mutex_);

    MetricsSummary summary;
    summary.total_invocations = total_invocations_;
    summary.total_successes = total_successes_;
    summary.total_failures = total_failures_;
    summary.tools_count = tools_.size();

    if (total_invocations_ > 0) {
        summary.success_rate_pct =
            100.0 * static_cast<double>(total_successes_) / static_cast<double>(total_invocations_);
        summary.avg_latency_ms = total_latency_ms_ / total_invocations_;
    }

    return summary;
}

void MetricsCollector::log_summary() const {
    MetricsSummary summary = get_summary();

    spdlog::info("[metrics] summary: invocations={} successes={} failures={} "
                 "success_rate_pct={:.1f} avg_latency_ms={} tools={}",
                 summary.total_invocations, summary.total_successes, summary.total_failures,
                 summary.success_rate_pct, summary.avg_latency_ms, summary.tools_count);

    for (const auto& [name, stats] : get_all_stats()) {
        spdlog::debug("[metrics] tool={} invocations={} successes={} failures={} "
                      "avg_ms={} min_ms={} max_ms={} last_invoked={}",
                      name, stats.invocations, stats.successes, stats.failures,
                      to_millis(stats.avg_latency), to_millis(stats.min_latency),
                      to_millis(stats.max_latency), format_utc(stats.last_invoked));
    }
}

void MetricsCollector::reset() {
    std::unique_lock lock(mutex_);

    tools_.clear();
    total_invocations_ = 0;
    total_successes_ = 0;
    total_failures_ = 0;
    total_latency_ms_ = 0;
}

} // namespace image_mcp
