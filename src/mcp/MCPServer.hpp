#pragma once

#include "ITransport.hpp"
#include "core/Cancellation.hpp"
#include "core/MetricsCollector.hpp"
#include "mcp/Dispatcher.hpp"
#include "mcp/PromptRegistry.hpp"
#include "mcp/ServerConfig.hpp"
#include "mcp/ToolRegistry.hpp"
#include <atomic>
#include <memory>
#include <nlohmann/json.hpp>

namespace image_mcp {

using json = nlohmann::json;

/**
 * @brief MCP Server implementing JSON-RPC 2.0 over a transport
 *
 * Owns the tool and prompt registries, the metrics collector and the
 * dispatcher. Collaborators register tools and prompts before run();
 * afterwards the registries are read-only.
 */
class MCPServer {
public:
    /**
     * @brief Construct MCP server with transport
     * @param transport Unique pointer to transport implementation
     * @param config Name, version and handshake policy
     */
    explicit MCPServer(std::unique_ptr<ITransport> transport, ServerConfig config = {});

    MCPServer(const MCPServer&) = delete;
    MCPServer& operator=(const MCPServer&) = delete;

    /**
     * @brief Register a tool with handler
     * @param info Tool metadata with JSON schema
     * @param handler Function to execute when tool is called
     * @throws std::logic_error once run() has started
     */
    void register_tool(const ToolInfo& info, ToolHandler handler);

    /**
     * @brief Register a prompt template
     * @throws std::logic_error once run() has started
     */
    void register_prompt(const Prompt& prompt);

    /**
     * @brief Start server main loop
     *
     * Blocks until stop() is called or the input ends. Reads one request at
     * a time, dispatches it and writes the response before reading the next.
     *
     * @throws TransportError if the channel to the host fails
     */
    void run();

    /**
     * @brief Signal server to stop gracefully
     *
     * The request in flight is allowed to finish; its handler sees the
     * cancellation token fire. Only touches atomics, so it is safe to call
     * from a signal handler.
     */
    void stop() noexcept;

    /**
     * @brief Tell the host the tool list changed
     */
    void notify_tools_list_changed();

    bool is_running() const { return running_; }

    MetricsCollector& metrics() { return metrics_; }
    const ToolRegistry& tools() const { return tools_; }
    const PromptRegistry& prompts() const { return prompts_; }
    const ServerConfig& config() const { return config_; }

private:
    void ensure_not_started(const char* what) const;

    std::unique_ptr<ITransport> transport_;
    ServerConfig config_;
    MetricsCollector metrics_;
    ToolRegistry tools_;
    PromptRegistry prompts_;
    CancellationSource cancellation_;
    Dispatcher dispatcher_;  // refers to the members above
    std::atomic<bool> running_{false};
    std::atomic<bool> started_{false};
};

} // namespace image_mcp
