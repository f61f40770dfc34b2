#include "ToolRegistry.hpp"
#include <spdlog/spdlog.h>
#include <chrono>

namespace image_mcp {

void ToolRegistry::register_tool(const ToolInfo& info, ToolHandler handler) {
    if (info.name.empty()) {
        throw std::invalid_argument("Tool name cannot be empty");
    }
    if (!handler) {
        throw std::invalid_argument("Tool handler cannot be null");
    }
    if (tools_.count(info.name) > 0) {
        throw std::invalid_argument("Tool already registered: " + info.name);
    }

    tools_.emplace(info.name, Entry{info, std::move(handler)});
    spdlog::debug("Registered tool: {}", info.name);
}

bool ToolRegistry::contains(const std::string& name) const {
    return tools_.count(name) > 0;
}

json ToolRegistry::list() const {
    json tools_array = json::array();

    for (const auto& [name, entry] : tools_) {
        json descriptor = {
            {"name", entry.info.name},
            {"description", entry.info.description},
            {"inputSchema", entry.info.input_schema}
        };
        if (entry.info.annotations) {
            descriptor["annotations"] = *entry.info.annotations;
        }
        tools_array.push_back(std::move(descriptor));
    }

    return tools_array;
}

json ToolRegistry::invoke(const std::string& name,
                          const json& args,
                          const CancellationToken& token,
                          MetricsCollector& metrics) const {
    auto it = tools_.find(name);
    if (it == tools_.end()) {
        throw ToolNotFoundError(name);
    }

    spdlog::info("Calling tool: {}", name);
    spdlog::debug("Tool {} arguments: {}", name, args.dump());

    auto start = std::chrono::steady_clock::now();
    auto elapsed = [start]() {
        return std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::steady_clock::now() - start);
    };

    json result;
    try {
        result = it->second.handler(args, token);
    } catch (const std::exception& e) {
        auto duration = elapsed();
        metrics.record(name, duration, false);
        spdlog::error("Tool {} failed after {} ms: {}", name,
                      std::chrono::duration_cast<std::chrono::milliseconds>(duration).count(),
                      e.what());
        throw ToolExecutionError(e.what());
    } catch (...) {
        metrics.record(name, elapsed(), false);
        spdlog::error("Tool {} failed with a non-standard exception", name);
        throw ToolExecutionError("unknown error");
    }

    auto duration = elapsed();
    metrics.record(name, duration, true);
    spdlog::info("Tool {} executed successfully in {} ms", name,
                 std::chrono::duration_cast<std::chrono::milliseconds>(duration).count());
    return result;
}

} // namespace image_mcp
