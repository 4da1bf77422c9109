#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/link_errors.hpp"

namespace agentlink::protocol {

    constexpr const char* kJsonRpcVersion = "2.0";

    // The only three error codes on the wire.
    constexpr int kParseError = -32700;
    constexpr int kMethodNotFound = -32601;
    constexpr int kInternalError = -32000;

    // One decoded request line.
    struct RpcRequest {
        std::string method;
        nlohmann::json params = nlohmann::json::object();
        // Absent for notifications. A present "id": null is still an id.
        std::optional<nlohmann::json> id;

        bool is_notification() const { return !id.has_value(); }
    };

    struct RpcError {
        int code;
        std::string message;
        std::optional<nlohmann::json> data;
    };

    // Fails (category Protocol) on invalid JSON, a non-object value, or a wrong
    // "jsonrpc" version. A non-object "params" is kept as-is for the handler to reject.
    core::errors::Result<RpcRequest> parse_request(const std::string& line);

    nlohmann::json make_request(const nlohmann::json& id, const std::string& method,
                                const nlohmann::json& params);
    nlohmann::json make_notification(const std::string& method,
                                     const nlohmann::json& params);
    nlohmann::json make_result_response(const nlohmann::json& id,
                                        const nlohmann::json& result);
    nlohmann::json make_error_response(const nlohmann::json& id, const RpcError& error);

} // namespace agentlink::protocol
