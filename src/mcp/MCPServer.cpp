#include "MCPServer.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace image_mcp {

MCPServer::MCPServer(std::unique_ptr<ITransport> transport, ServerConfig config)
    : transport_(std::move(transport)),
      config_(std::move(config)),
      dispatcher_(config_, tools_, prompts_, metrics_) {
    if (!transport_) {
        throw std::invalid_argument("Transport cannot be null");
    }
    spdlog::info("MCPServer initialized ({} {})", config_.name, config_.version);
}

void MCPServer::ensure_not_started(const char* what) const {
    if (started_) {
        throw std::logic_error(std::string("Cannot register ") + what + " after the server has started");
    }
}

void MCPServer::register_tool(const ToolInfo& info, ToolHandler handler) {
    ensure_not_started("tool");
    tools_.register_tool(info, std::move(handler));
    spdlog::info("Registered tool: {}", info.name);
}

void MCPServer::register_prompt(const Prompt& prompt) {
    ensure_not_started("prompt");
    prompts_.register_prompt(prompt);
    spdlog::info("Registered prompt: {}", prompt.name);
}

void MCPServer::run() {
    started_ = true;
    running_ = true;
    spdlog::info("MCPServer starting main loop (protocol {}, {} tools, {} prompts)",
                 kProtocolVersion, tools_.size(), prompts_.size());

    try {
        while (!cancellation_.is_cancelled() && transport_->is_open()) {
            std::optional<json> message;
            try {
                message = transport_->read_message();
            } catch (const MalformedMessage& e) {
                spdlog::error("Failed to parse request, dropping it: {}", e.what());
                continue;
            }

            if (!message) {
                spdlog::info("End of input, stopping server");
                break;
            }

            if (cancellation_.is_cancelled()) {
                spdlog::info("Shutdown requested, discarding unread request");
                break;
            }

            std::optional<json> response = dispatcher_.handle_message(*message, cancellation_.token());
            if (response) {
                transport_->write_message(*response);
            }
        }
    } catch (const TransportError& e) {
        running_ = false;
        spdlog::critical("Transport failure: {}", e.what());
        metrics_.log_summary();
        throw;
    }

    running_ = false;
    if (cancellation_.is_cancelled()) {
        spdlog::info("Server shutting down (stop requested)");
    }
    metrics_.log_summary();
    spdlog::info("MCPServer stopped");
}

void MCPServer::stop() noexcept {
    cancellation_.cancel();
}

void MCPServer::notify_tools_list_changed() {
    spdlog::debug("Sending tools/list_changed notification");
    transport_->write_message(make_notification(methods::kToolsListChanged));
}

} // namespace image_mcp
