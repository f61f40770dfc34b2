#include "Dispatcher.hpp"
#include <spdlog/spdlog.h>
#include <variant>

namespace image_mcp {

Dispatcher::Dispatcher(const ServerConfig& config,
                       const ToolRegistry& tools,
                       const PromptRegistry& prompts,
                       MetricsCollector& metrics)
    : config_(config), tools_(tools), prompts_(prompts), metrics_(metrics) {}

std::optional<json> Dispatcher::handle_message(const json& message, const CancellationToken& token) {
    Request request;
    try {
        request = decode_request(message);
    } catch (const ProtocolError& e) {
        std::optional<json> id = recover_id(message);
        if (!id) {
            spdlog::warn("Dropping invalid message without id: {}", e.what());
            return std::nullopt;
        }
        spdlog::warn("Rejecting message id={}: {}", id->dump(), e.what());
        return Response::failure(*id, e.code(), e.what()).to_json();
    }

    if (request.is_notification) {
        handle_notification(request);
        return std::nullopt;
    }

    return dispatch(request, token).to_json();
}

Response Dispatcher::dispatch(const Request& request, const CancellationToken& token) {
    const json& id = request.id;
    const RequestPayload& payload = request.payload;

    spdlog::debug("Handling request: method={}, id={}", request.method, id.dump());

    if (std::holds_alternative<UnknownMethodParams>(payload)) {
        spdlog::warn("Method not found: {}", request.method);
        return Response::failure(id, ErrorCode::MethodNotFound, "Method not found: " + request.method);
    }

    try {
        if (const auto* params = std::get_if<InitializeParams>(&payload)) {
            return handle_initialize(id, *params);
        }

        if (config_.require_initialize && state_ != SessionState::Ready) {
            spdlog::warn("Rejecting {} received before initialize", request.method);
            return Response::failure(id, ErrorCode::ServerNotInitialized, "Server not initialized");
        }

        if (std::holds_alternative<ListToolsParams>(payload)) {
            return handle_tools_list(id);
        } else if (const auto* call = std::get_if<CallToolParams>(&payload)) {
            return handle_tools_call(id, *call, token);
        } else if (std::holds_alternative<ListPromptsParams>(payload)) {
            return handle_prompts_list(id);
        } else if (const auto* get = std::get_if<GetPromptParams>(&payload)) {
            return handle_prompts_get(id, *get);
        } else if (std::holds_alternative<ListResourcesParams>(payload)) {
            return handle_resources_list(id);
        }

        // notifications/initialized sent with an id: acknowledge with an empty result
        return Response::success(id, json::object());
    } catch (const std::exception& e) {
        spdlog::error("Error handling method {}: {}", request.method, e.what());
        return Response::failure(id, ErrorCode::InternalError, std::string("Internal error: ") + e.what());
    }
}

void Dispatcher::handle_notification(const Request& request) {
    if (std::holds_alternative<InitializedParams>(request.payload)) {
        spdlog::info("Client sent initialized notification, server is ready");
        return;
    }
    spdlog::info("Notification received (no response sent): {}", request.method);
}

Response Dispatcher::handle_initialize(const json& id, const InitializeParams& params) {
    spdlog::info("Handling initialize request (protocol {})", kProtocolVersion);

    if (params.client_info) {
        spdlog::info("Client: {} version {}", params.client_info->name, params.client_info->version);
    }
    if (!params.protocol_version.empty() && params.protocol_version != kProtocolVersion) {
        spdlog::debug("Client requested protocol {}, answering with {}",
                      params.protocol_version, kProtocolVersion);
    }

    state_ = SessionState::Ready;

    return Response::success(id, {
        {"protocolVersion", kProtocolVersion},
        {"serverInfo", {
            {"name", config_.name},
            {"version", config_.version}
        }},
        {"capabilities", {
            {"tools", {{"listChanged", true}}},
            {"prompts", {{"listChanged", false}}}
        }}
    });
}

Response Dispatcher::handle_tools_list(const json& id) {
    json tools = tools_.list();
    spdlog::debug("Returning {} tools", tools.size());
    return Response::success(id, {{"tools", std::move(tools)}});
}

Response Dispatcher::handle_tools_call(const json& id, const CallToolParams& params,
                                       const CancellationToken& token) {
    json result;
    try {
        result = tools_.invoke(params.name, params.arguments, token, metrics_);
    } catch (const ToolNotFoundError& e) {
        spdlog::warn("{}", e.what());
        return Response::failure(id, ErrorCode::ToolNotFound, e.what());
    } catch (const ToolExecutionError& e) {
        return Response::failure(id, ErrorCode::InternalError, e.what());
    }

    json content_item = {
        {"type", "text"},
        {"text", result.dump(2, ' ', false, json::error_handler_t::replace)}
    };
    return Response::success(id, {{"content", json::array({content_item})}});
}

Response Dispatcher::handle_prompts_list(const json& id) {
    json prompts = prompts_.list();
    spdlog::debug("Returning {} prompts", prompts.size());
    return Response::success(id, {{"prompts", std::move(prompts)}});
}

Response Dispatcher::handle_prompts_get(const json& id, const GetPromptParams& params) {
    spdlog::info("Getting prompt: {}", params.name);

    std::string text;
    try {
        text = prompts_.render(params.name, params.arguments);
    } catch (const PromptError& e) {
        spdlog::warn("Failed to get prompt {}: {}", params.name, e.what());
        return Response::failure(id, ErrorCode::InvalidParams,
                                 std::string("Failed to get prompt: ") + e.what());
    }

    json message = {
        {"role", "user"},
        {"content", {
            {"type", "text"},
            {"text", text}
        }}
    };

    return Response::success(id, {
        {"description", prompts_.find(params.name)->description},
        {"messages", json::array({message})}
    });
}

Response Dispatcher::handle_resources_list(const json& id) {
    spdlog::debug("Listing resources (none registered)");
    return Response::success(id, {{"resources", json::array()}});
}

} // namespace image_mcp
