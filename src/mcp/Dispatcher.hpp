#pragma once

#include "core/Cancellation.hpp"
#include "core/MetricsCollector.hpp"
#include "mcp/PromptRegistry.hpp"
#include "mcp/Protocol.hpp"
#include "mcp/ServerConfig.hpp"
#include "mcp/ToolRegistry.hpp"
#include <optional>
#include <nlohmann/json.hpp>

namespace image_mcp {

using json = nlohmann::json;

/**
 * @brief Connection handshake state
 */
enum class SessionState {
    Uninitialized,
    Ready
};

/**
 * @brief Routes decoded requests to the registries
 *
 * Never throws: every outcome, including handler failures, is encoded into
 * a Response. The only state it keeps is the handshake state.
 */
class Dispatcher {
public:
    Dispatcher(const ServerConfig& config,
               const ToolRegistry& tools,
               const PromptRegistry& prompts,
               MetricsCollector& metrics);

    /**
     * @brief Decode and dispatch one raw JSON message
     * @param message Parsed JSON document from the transport
     * @param token Cancellation signal forwarded to tool handlers
     * @return Response JSON, or std::nullopt when nothing must be sent back
     *         (notifications, or an invalid message without a usable id)
     */
    std::optional<json> handle_message(const json& message, const CancellationToken& token = {});

    /**
     * @brief Dispatch a decoded request
     */
    Response dispatch(const Request& request, const CancellationToken& token = {});

    SessionState state() const { return state_; }

private:
    void handle_notification(const Request& request);

    Response handle_initialize(const json& id, const InitializeParams& params);
    Response handle_tools_list(const json& id);
    Response handle_tools_call(const json& id, const CallToolParams& params,
                               const CancellationToken& token);
    Response handle_prompts_list(const json& id);
    Response handle_prompts_get(const json& id, const GetPromptParams& params);
    Response handle_resources_list(const json& id);

    const ServerConfig& config_;
    const ToolRegistry& tools_;
    const PromptRegistry& prompts_;
    MetricsCollector& metrics_;
    SessionState state_ = SessionState::Uninitialized;
};

} // namespace image_mcp
