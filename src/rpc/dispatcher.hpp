#pragma once

#include <cstddef>
#include <functional>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/link_errors.hpp"
#include "protocol/rpc_contract.hpp"

namespace agentlink::rpc {

// A handler gets the request params (an object, {} when absent) and returns the
// result document or a LinkError. Handlers never build error envelopes.
using Handler =
    std::function<core::errors::Result<nlohmann::json>(const nlohmann::json& params)>;

struct ToolSpec {
    std::string name;
    std::string description;
    nlohmann::json input_schema = nlohmann::json::object();
};

struct ServerInfo {
    std::string name = "agentlink";
    std::string version = "0.1.0";
    std::string protocol_version = "2024-11-05";
};

// Line-oriented JSON-RPC 2.0 engine: Parse -> Route -> Execute -> Respond, one
// line at a time. Requests with an id get exactly one response line;
// notifications never get one, whatever happens while handling them.
//
// Routing has two namespaces. Protocol methods (initialize, tools/list,
// tools/call) win over direct methods of the same name; tools/call forwards
// {name, arguments} into the direct namespace and wraps the result as a single
// text content item.
class Dispatcher {
public:
    explicit Dispatcher(ServerInfo info = {});
    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    void register_method(ToolSpec spec, Handler handler);
    void register_protocol_method(const std::string& name, Handler handler);

    bool has_method(const std::string& name) const;
    const std::vector<ToolSpec>& tool_specs() const { return specs_; }

    // Response line without the trailing newline, or std::nullopt when nothing
    // may be written (blank line or notification).
    std::optional<std::string> handle_line(const std::string& line) const;

    // Processes lines until EOF, flushing after every response. Returns the
    // number of non-blank lines consumed.
    std::size_t serve(std::istream& in, std::ostream& out) const;

private:
    const Handler* resolve(const std::string& method) const;
    core::errors::Result<nlohmann::json> execute(const std::string& method,
                                                 const Handler& handler,
                                                 const nlohmann::json& params) const;

    core::errors::Result<nlohmann::json> initialize(const nlohmann::json& params) const;
    core::errors::Result<nlohmann::json> list_tools(const nlohmann::json& params) const;
    core::errors::Result<nlohmann::json> call_tool(const nlohmann::json& params) const;

    ServerInfo info_;
    std::unordered_map<std::string, Handler> protocol_methods_;
    std::unordered_map<std::string, Handler> methods_;
    std::vector<ToolSpec> specs_;
};

}  // namespace agentlink::rpc
