#include "core/Logging.hpp"
#include "mcp/MCPServer.hpp"
#include "mcp/StdioTransport.hpp"
#include "prompts/BuiltinPrompts.hpp"
#include "tools/ServerMetricsTool.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>

namespace {
    constexpr const char* kServerVersion = "1.0.0";

    std::atomic<int> received_signal{0};
    std::atomic<image_mcp::MCPServer*> global_server{nullptr};

    // Only async-signal-safe work here: atomic loads and stores
    void signal_handler(int signal) {
        received_signal = signal;
        if (auto* server = global_server.load()) {
            server->stop();
        }
    }

    void setup_signal_handlers() {
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);
    }
}

int main(int argc, char** argv) {
    // Parse command-line arguments
    CLI::App app{"Image MCP Stdio Server - image generation and processing tools for AI assistants"};

    std::string log_level = "info";
    app.add_option("-l,--log-level", log_level, "Log level (trace, debug, info, warn, error, critical)")
        ->default_val("info")
        ->envname("IMAGE_MCP_LOG_LEVEL");

    std::string log_file;
    app.add_option("--log-file", log_file, "Also append logs to this file");

    image_mcp::ServerConfig config;
    config.version = kServerVersion;
    app.add_option("--server-name", config.name, "Server name reported during initialize")
        ->default_val(config.name);

    bool lenient_handshake = false;
    app.add_flag("--lenient-handshake", lenient_handshake,
                 "Accept tool and prompt requests before initialize");

    bool version = false;
    app.add_flag("-v,--version", version, "Print version information");

    CLI11_PARSE(app, argc, argv);

    if (version) {
        std::cout << "image-mcp-server version " << kServerVersion << std::endl;
        return 0;
    }

    // Configure logging (stderr only: stdout carries the protocol)
    auto level = image_mcp::parse_log_level(log_level);
    if (!level) {
        std::cerr << "Invalid log level: " << log_level << std::endl;
        return 1;
    }

    try {
        image_mcp::init_logging(*level, log_file);
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
        return 1;
    }

    config.require_initialize = !lenient_handshake;

    spdlog::info("Starting Image MCP Stdio Server");
    spdlog::info("Log level: {}", log_level);

    try {
        // Setup signal handlers for graceful shutdown
        setup_signal_handlers();

        auto transport = std::make_unique<image_mcp::StdioTransport>();
        auto server = std::make_unique<image_mcp::MCPServer>(std::move(transport), config);

        // Store global reference for signal handler
        global_server.store(server.get());

        auto metrics_tool = std::make_shared<image_mcp::ServerMetricsTool>(server->metrics());
        server->register_tool(
            image_mcp::ServerMetricsTool::get_info(),
            [metrics_tool](const nlohmann::json& args, const image_mcp::CancellationToken&) {
                return metrics_tool->execute(args);
            }
        );

        image_mcp::register_builtin_prompts(*server);

        spdlog::info("All tools and prompts registered, starting server");

        // Run server (blocks until stopped)
        server->run();

        global_server.store(nullptr);
        if (received_signal != 0) {
            spdlog::info("Received signal {}, shut down gracefully", received_signal.load());
        }
        spdlog::info("Server stopped cleanly");
        return 0;

    } catch (const std::exception& e) {
        global_server.store(nullptr);
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
