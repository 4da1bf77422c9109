#include "protocol/rpc_contract.hpp"

namespace agentlink::protocol {

using core::errors::ErrorCategory;
using core::errors::LinkError;
using nlohmann::json;

core::errors::Result<RpcRequest> parse_request(const std::string& line) {
    const json decoded = json::parse(line, nullptr, false);
    if (decoded.is_discarded()) {
        return LinkError{ErrorCategory::Protocol, "Line is not valid JSON.",
                         "invalid_json"};
    }
    if (!decoded.is_object()) {
        return LinkError{ErrorCategory::Protocol, "Request must be a JSON object.",
                         "invalid_request"};
    }

    const auto version = decoded.find("jsonrpc");
    if (version == decoded.end() || !version->is_string() ||
        version->get<std::string>() != kJsonRpcVersion) {
        return LinkError{ErrorCategory::Protocol, "Invalid jsonrpc version",
                         "invalid_jsonrpc_version"};
    }

    RpcRequest request;
    const auto method = decoded.find("method");
    if (method != decoded.end() && method->is_string()) {
        request.method = method->get<std::string>();
    }

    const auto params = decoded.find("params");
    if (params != decoded.end() && !params->is_null()) {
        request.params = *params;
    }

    const auto id = decoded.find("id");
    if (id != decoded.end()) {
        request.id = *id;
    }
    return request;
}

json make_request(const json& id, const std::string& method, const json& params) {
    json message = make_notification(method, params);
    message["id"] = id;
    return message;
}

json make_notification(const std::string& method, const json& params) {
    json message;
    message["jsonrpc"] = kJsonRpcVersion;
    message["method"] = method;
    if (!params.is_null() && !params.empty()) {
        message["params"] = params;
    }
    return message;
}

json make_result_response(const json& id, const json& result) {
    json response;
    response["jsonrpc"] = kJsonRpcVersion;
    response["id"] = id;
    response["result"] = result;
    return response;
}

json make_error_response(const json& id, const RpcError& error) {
    json body;
    body["code"] = error.code;
    body["message"] = error.message;
    if (error.data.has_value()) {
        body["data"] = *error.data;
    }

    json response;
    response["jsonrpc"] = kJsonRpcVersion;
    response["id"] = id;
    response["error"] = body;
    return response;
}

} // namespace agentlink::protocol
