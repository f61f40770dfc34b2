#include "mcp/MCPServer.hpp"
#include "mcp/StdioTransport.hpp"
#include "prompts/BuiltinPrompts.hpp"
#include "tools/ServerMetricsTool.hpp"
#include <gtest/gtest.h>
#include <sstream>
#include <vector>

using namespace image_mcp;
using json = nlohmann::json;

/**
 * @brief Drives a fully wired server through line-delimited streams
 */
class EndToEndTest : public ::testing::Test {
protected:
    void SendRequest(const json& request) {
        input_ << request.dump() << "\n";
    }

    void SendRaw(const std::string& line) {
        input_ << line << "\n";
    }

    // Builds the server the way the executable does and runs it to EOF
    std::vector<json> RunServer(ServerConfig config = {}) {
        std::istringstream in(input_.str());
        std::ostringstream out;

        auto server = std::make_unique<MCPServer>(std::make_unique<StdioTransport>(in, out), config);

        auto metrics_tool = std::make_shared<ServerMetricsTool>(server->metrics());
        server->register_tool(ServerMetricsTool::get_info(),
            [metrics_tool](const json& args, const CancellationToken&) {
                return metrics_tool->execute(args);
            });

        ToolInfo resize{"resize_image", "Resize an image",
                        {{"type", "object"}, {"properties", {{"path", {{"type", "string"}}}}}}};
        server->register_tool(resize, [](const json& args, const CancellationToken&) -> json {
            return {{"path", args.value("path", "")}, {"width", 640}, {"height", 480}};
        });

        register_builtin_prompts(*server);

        server->run();
        EXPECT_FALSE(server->is_running());

        std::vector<json> responses;
        std::istringstream lines(out.str());
        std::string line;
        while (std::getline(lines, line)) {
            responses.push_back(json::parse(line));
        }
        return responses;
    }

    static json Request(int id, const std::string& method, const json& params = json::object()) {
        return {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}};
    }

    void SendHandshake() {
        SendRequest(Request(1, "initialize", {
            {"protocolVersion", "2024-11-05"},
            {"clientInfo", {{"name", "test-client"}, {"version", "0.1"}}}
        }));
        SendRequest({{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}});
    }

    std::ostringstream input_;
};

TEST_F(EndToEndTest, FullSession) {
    SendHandshake();
    SendRequest(Request(2, "tools/list"));
    SendRequest(Request(3, "tools/call", {{"name", "resize_image"}, {"arguments", {{"path", "out.png"}}}}));
    SendRequest(Request(4, "tools/call", {{"name", "server_metrics"}, {"arguments", json::object()}}));
    SendRequest(Request(5, "prompts/list"));
    SendRequest(Request(6, "prompts/get", {{"name", "high_quality_image"}, {"arguments", {{"subject", "a lighthouse"}}}}));

    auto responses = RunServer();
    ASSERT_EQ(responses.size(), 6);

    for (size_t i = 0; i < responses.size(); ++i) {
        EXPECT_EQ(responses[i]["jsonrpc"], "2.0");
        EXPECT_FALSE(responses[i].contains("error")) << responses[i].dump();
    }

    // initialize
    EXPECT_EQ(responses[0]["id"], 1);
    EXPECT_EQ(responses[0]["result"]["protocolVersion"], "2024-11-05");
    EXPECT_EQ(responses[0]["result"]["serverInfo"]["name"], "image-mcp");
    EXPECT_EQ(responses[0]["result"]["capabilities"]["tools"]["listChanged"], true);

    // tools/list is ordered by name
    const auto& tools = responses[1]["result"]["tools"];
    ASSERT_EQ(tools.size(), 2);
    EXPECT_EQ(tools[0]["name"], "resize_image");
    EXPECT_EQ(tools[1]["name"], "server_metrics");
    EXPECT_TRUE(tools[1].contains("annotations"));
    EXPECT_FALSE(tools[0].contains("annotations"));

    // tools/call wraps the handler result as text content
    const auto& content = responses[2]["result"]["content"];
    ASSERT_EQ(content.size(), 1);
    EXPECT_EQ(content[0]["type"], "text");
    json resized = json::parse(content[0]["text"].get<std::string>());
    EXPECT_EQ(resized["path"], "out.png");

    // server_metrics sees the earlier resize_image call
    json stats = json::parse(responses[3]["result"]["content"][0]["text"].get<std::string>());
    EXPECT_EQ(stats["summary"]["total_invocations"], 1);
    EXPECT_EQ(stats["summary"]["total_successes"], 1);
    EXPECT_EQ(stats["tools"][0]["name"], "resize_image");

    // prompts
    EXPECT_EQ(responses[4]["result"]["prompts"].size(), builtin_prompts().size());

    const auto& message = responses[5]["result"]["messages"][0];
    EXPECT_EQ(message["role"], "user");
    std::string text = message["content"]["text"];
    EXPECT_NE(text.find("a lighthouse"), std::string::npos);
    EXPECT_EQ(text.find("{{"), std::string::npos);
}

TEST_F(EndToEndTest, ErrorsKeepTheSessionAlive) {
    SendHandshake();
    SendRaw("{this is not json");
    SendRequest(Request(2, "tools/call", {{"name", "upscale_image"}}));
    SendRequest(Request(3, "tools/call", {{"name", "server_metrics"}, {"arguments", {{"tool", 7}}}}));
    SendRequest(Request(4, "prompts/get", {{"name", "generate_and_crop"}, {"arguments", {{"description", "a cat"}}}}));
    SendRequest(Request(5, "sampling/createMessage"));
    SendRequest(Request(6, "tools/call", {{"name", "resize_image"}, {"arguments", {{"path", "x.png"}}}}));

    auto responses = RunServer();
    ASSERT_EQ(responses.size(), 6);

    EXPECT_EQ(responses[1]["id"], 2);
    EXPECT_EQ(responses[1]["error"]["code"], -32001);

    EXPECT_EQ(responses[2]["id"], 3);
    EXPECT_EQ(responses[2]["error"]["code"], -32603);

    EXPECT_EQ(responses[3]["id"], 4);
    EXPECT_EQ(responses[3]["error"]["code"], -32602);

    EXPECT_EQ(responses[4]["id"], 5);
    EXPECT_EQ(responses[4]["error"]["code"], -32601);

    EXPECT_EQ(responses[5]["id"], 6);
    EXPECT_TRUE(responses[5].contains("result"));
}

TEST_F(EndToEndTest, StrictHandshakeRejectsEarlyCalls) {
    SendRequest(Request(1, "tools/list"));
    SendHandshake();
    SendRequest(Request(2, "tools/list"));

    auto responses = RunServer();
    ASSERT_EQ(responses.size(), 3);

    EXPECT_EQ(responses[0]["id"], 1);
    EXPECT_EQ(responses[0]["error"]["code"], -32002);
    EXPECT_EQ(responses[2]["id"], 2);
    EXPECT_EQ(responses[2]["result"]["tools"].size(), 2);
}

TEST_F(EndToEndTest, LenientHandshakeServesEarlyCalls) {
    SendRequest(Request(1, "prompts/list"));

    ServerConfig config;
    config.require_initialize = false;
    config.name = "custom-name";
    auto responses = RunServer(config);

    ASSERT_EQ(responses.size(), 1);
    EXPECT_EQ(responses[0]["result"]["prompts"].size(), builtin_prompts().size());
}

TEST_F(EndToEndTest, EmptyInputEndsCleanly) {
    auto responses = RunServer();
    EXPECT_TRUE(responses.empty());
}

TEST_F(EndToEndTest, PromptWorkflowToolsAreNotBuiltIn) {
    SendHandshake();
    SendRequest(Request(2, "tools/call", {{"name", "generate_image"}, {"arguments", {{"prompt", "a cat"}}}}));

    auto responses = RunServer();
    ASSERT_EQ(responses.size(), 2);
    EXPECT_EQ(responses[1]["id"], 2);
    EXPECT_EQ(responses[1]["error"]["code"], -32001);
}

TEST_F(EndToEndTest, ObjectIdIsEchoedOnTheWire) {
    SendHandshake();
    SendRequest({{"jsonrpc", "2.0"}, {"id", {{"k", 1}}}, {"method", "resources/list"}});

    auto responses = RunServer();
    ASSERT_EQ(responses.size(), 2);
    EXPECT_EQ(responses[1]["id"], json({{"k", 1}}));
    EXPECT_TRUE(responses[1]["result"]["resources"].empty());
}
