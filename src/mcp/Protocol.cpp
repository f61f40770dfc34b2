#include "Protocol.hpp"

namespace image_mcp {

namespace {

std::string string_member(const json& object, const char* key, const std::string& fallback) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return fallback;
    }
    return it->get<std::string>();
}

const json& params_object(const json& message) {
    static const json empty = json::object();

    auto it = message.find("params");
    if (it == message.end() || it->is_null()) {
        return empty;
    }
    if (!it->is_object()) {
        throw ProtocolError(ErrorCode::InvalidParams, "Invalid params: params must be an object");
    }
    return *it;
}

InitializeParams decode_initialize(const json& params) {
    InitializeParams result;
    result.protocol_version = string_member(params, "protocolVersion", "");

    auto it = params.find("clientInfo");
    if (it != params.end() && it->is_object()) {
        ClientInfo info;
        info.name = string_member(*it, "name", "unknown");
        info.version = string_member(*it, "version", "unknown");
        result.client_info = info;
    }
    return result;
}

CallToolParams decode_call_tool(const json& params) {
    auto name_it = params.find("name");
    if (name_it == params.end() || !name_it->is_string()) {
        throw ProtocolError(ErrorCode::InvalidParams, "Invalid params: missing tool name");
    }

    CallToolParams result;
    result.name = name_it->get<std::string>();

    auto args_it = params.find("arguments");
    if (args_it != params.end() && !args_it->is_null()) {
        if (!args_it->is_object()) {
            throw ProtocolError(ErrorCode::InvalidParams,
                                "Invalid params: arguments must be an object");
        }
        result.arguments = *args_it;
    }
    return result;
}

GetPromptParams decode_get_prompt(const json& params) {
    auto name_it = params.find("name");
    if (name_it == params.end() || !name_it->is_string()) {
        throw ProtocolError(ErrorCode::InvalidParams, "Invalid params: missing prompt name");
    }

    GetPromptParams result;
    result.name = name_it->get<std::string>();

    auto args_it = params.find("arguments");
    if (args_it != params.end() && !args_it->is_null()) {
        if (!args_it->is_object()) {
            throw ProtocolError(ErrorCode::InvalidParams,
                                "Invalid params: arguments must be an object");
        }
        for (const auto& [key, value] : args_it->items()) {
            if (!value.is_string()) {
                throw ProtocolError(ErrorCode::InvalidParams,
                                    "Invalid params: argument '" + key + "' must be a string");
            }
            result.arguments[key] = value.get<std::string>();
        }
    }
    return result;
}

} // namespace

ProtocolError::ProtocolError(ErrorCode code, const std::string& message)
    : std::runtime_error(message), code_(code) {}

Response Response::success(const json& id, json result) {
    Response response;
    response.id = id;
    response.result = std::move(result);
    return response;
}

Response Response::failure(const json& id, ErrorCode code, const std::string& message) {
    Response response;
    response.id = id;
    response.error = RpcError{code, message};
    return response;
}

json Response::to_json() const {
    json message = {
        {"jsonrpc", kJsonRpcVersion},
        {"id", id}
    };

    if (error) {
        message["error"] = {
            {"code", static_cast<int>(error->code)},
            {"message", error->message}
        };
    } else {
        message["result"] = result.value_or(json::object());
    }
    return message;
}

std::optional<json> recover_id(const json& message) {
    if (!message.is_object()) {
        return std::nullopt;
    }
    auto it = message.find("id");
    if (it == message.end() || it->is_null()) {
        return std::nullopt;
    }
    return *it;
}

Request decode_request(const json& message) {
    if (!message.is_object()) {
        throw ProtocolError(ErrorCode::InvalidRequest, "Invalid Request: message must be an object");
    }

    auto version_it = message.find("jsonrpc");
    if (version_it == message.end() || *version_it != kJsonRpcVersion) {
        throw ProtocolError(ErrorCode::InvalidRequest,
                            "Invalid Request: missing or invalid jsonrpc field");
    }

    auto method_it = message.find("method");
    if (method_it == message.end() || !method_it->is_string()) {
        throw ProtocolError(ErrorCode::InvalidRequest, "Invalid Request: missing method field");
    }

    Request request;
    request.method = method_it->get<std::string>();

    auto id_it = message.find("id");
    if (id_it == message.end() || id_it->is_null()) {
        request.is_notification = true;
    } else {
        request.id = *id_it;
    }

    const std::string& method = request.method;
    if (method == methods::kInitialize) {
        request.payload = decode_initialize(params_object(message));
    } else if (method == methods::kInitialized) {
        request.payload = InitializedParams{};
    } else if (method == methods::kToolsList) {
        request.payload = ListToolsParams{};
    } else if (method == methods::kToolsCall) {
        request.payload = decode_call_tool(params_object(message));
    } else if (method == methods::kPromptsList) {
        request.payload = ListPromptsParams{};
    } else if (method == methods::kPromptsGet) {
        request.payload = decode_get_prompt(params_object(message));
    } else if (method == methods::kResourcesList) {
        request.payload = ListResourcesParams{};
    } else {
        request.payload = UnknownMethodParams{};
    }

    return request;
}

json make_notification(const std::string& method, const json& params) {
    json message = {
        {"jsonrpc", kJsonRpcVersion},
        {"method", method}
    };
    if (!params.is_null()) {
        message["params"] = params;
    }
    return message;
}

} // namespace image_mcp
