#pragma once

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace image_mcp {

using json = nlohmann::json;

constexpr const char* kJsonRpcVersion = "2.0";
constexpr const char* kProtocolVersion = "2024-11-05";

namespace methods {
constexpr const char* kInitialize = "initialize";
constexpr const char* kInitialized = "notifications/initialized";
constexpr const char* kToolsList = "tools/list";
constexpr const char* kToolsCall = "tools/call";
constexpr const char* kPromptsList = "prompts/list";
constexpr const char* kPromptsGet = "prompts/get";
constexpr const char* kResourcesList = "resources/list";
constexpr const char* kToolsListChanged = "notifications/tools/list_changed";
} // namespace methods

/**
 * @brief JSON-RPC error codes emitted by the server
 *
 * -32700..-32600 are reserved by JSON-RPC 2.0; the -320xx values are
 * server-defined.
 */
enum class ErrorCode : int {
    ParseError = -32700,
    InvalidRequest = -32600,
    MethodNotFound = -32601,
    InvalidParams = -32602,
    InternalError = -32603,
    ToolNotFound = -32001,
    ServerNotInitialized = -32002
};

/**
 * @brief A request that cannot be served, carrying the code to report
 */
class ProtocolError : public std::runtime_error {
public:
    ProtocolError(ErrorCode code, const std::string& message);

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

struct ClientInfo {
    std::string name;
    std::string version;
};

struct InitializeParams {
    std::string protocol_version;
    std::optional<ClientInfo> client_info;
};

struct InitializedParams {};

struct ListToolsParams {};

struct CallToolParams {
    std::string name;
    json arguments = json::object();
};

struct ListPromptsParams {};

struct GetPromptParams {
    std::string name;
    std::map<std::string, std::string> arguments;
};

struct ListResourcesParams {};

/**
 * @brief Payload for a method outside the routing table
 */
struct UnknownMethodParams {};

using RequestPayload = std::variant<
    InitializeParams,
    InitializedParams,
    ListToolsParams,
    CallToolParams,
    ListPromptsParams,
    GetPromptParams,
    ListResourcesParams,
    UnknownMethodParams>;

/**
 * @brief A decoded JSON-RPC message with its method-specific payload
 */
struct Request {
    json id;  // copied verbatim into the response; null for notifications
    std::string method;
    RequestPayload payload;
    bool is_notification = false;
};

struct RpcError {
    ErrorCode code;
    std::string message;
};

/**
 * @brief JSON-RPC response; exactly one of result and error is set
 */
struct Response {
    json id;
    std::optional<json> result;
    std::optional<RpcError> error;

    static Response success(const json& id, json result);
    static Response failure(const json& id, ErrorCode code, const std::string& message);

    bool is_error() const { return error.has_value(); }

    json to_json() const;
};

/**
 * @brief Validate the envelope and decode params for the method
 *
 * Envelope problems raise ProtocolError(InvalidRequest), params problems
 * raise ProtocolError(InvalidParams). Methods outside the routing table
 * decode to UnknownMethodParams.
 *
 * @param message Parsed JSON document
 * @return Request with a typed payload
 */
Request decode_request(const json& message);

/**
 * @brief Recover the id of a message that may be otherwise invalid
 * @return std::nullopt when the message has no usable id (notification or garbage)
 */
std::optional<json> recover_id(const json& message);

/**
 * @brief Build a server-initiated notification
 */
json make_notification(const std::string& method, const json& params = json());

} // namespace image_mcp
