#include "rpc/dispatcher.hpp"

#include <exception>
#include <utility>
#include "core/logging/logger.hpp"
#include "store/json_store.hpp"

namespace agentlink::rpc {

using core::errors::ErrorCategory;
using core::errors::LinkError;
using nlohmann::json;
using protocol::RpcError;

namespace {

std::string trim(const std::string& line) {
    const auto first = line.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = line.find_last_not_of(" \t\r\n");
    return line.substr(first, last - first + 1);
}

}  // namespace

Dispatcher::Dispatcher(ServerInfo info) : info_(std::move(info)) {
    register_protocol_method("initialize",
                             [this](const json& params) { return initialize(params); });
    register_protocol_method("tools/list",
                             [this](const json& params) { return list_tools(params); });
    register_protocol_method("tools/call",
                             [this](const json& params) { return call_tool(params); });
}

void Dispatcher::register_method(ToolSpec spec, Handler handler) {
    const std::string name = spec.name;
    if (methods_.find(name) == methods_.end()) {
        specs_.push_back(std::move(spec));
    }
    methods_[name] = std::move(handler);
}

void Dispatcher::register_protocol_method(const std::string& name, Handler handler) {
    protocol_methods_[name] = std::move(handler);
}

bool Dispatcher::has_method(const std::string& name) const {
    return resolve(name) != nullptr;
}

const Handler* Dispatcher::resolve(const std::string& method) const {
    const auto protocol_it = protocol_methods_.find(method);
    if (protocol_it != protocol_methods_.end()) {
        return &protocol_it->second;
    }
    const auto direct_it = methods_.find(method);
    if (direct_it != methods_.end()) {
        return &direct_it->second;
    }
    return nullptr;
}

core::errors::Result<json> Dispatcher::execute(const std::string& method,
                                               const Handler& handler,
                                               const json& params) const {
    if (!params.is_object()) {
        return LinkError{ErrorCategory::Input, "params must be a JSON object",
                         "invalid_params"};
    }
    // Handlers report failures through Result; an escaping exception is still
    // one failed request, not a dead server.
    try {
        return handler(params);
    } catch (const std::exception& ex) {
        LOG_ERROR("Handler " + method + " threw: " + ex.what());
        return LinkError{ErrorCategory::Internal, ex.what(), "unhandled_exception"};
    } catch (...) {
        LOG_ERROR("Handler " + method + " threw a non-standard exception");
        return LinkError{ErrorCategory::Internal, "unknown exception", "unhandled_exception"};
    }
}

std::optional<std::string> Dispatcher::handle_line(const std::string& line) const {
    const std::string text = trim(line);
    if (text.empty()) {
        return std::nullopt;
    }

    // Parse
    auto parsed = protocol::parse_request(text);
    if (core::errors::is_error(parsed)) {
        const auto& err = core::errors::get_error(parsed);
        LOG_WARN("Rejected request line [" + err.code + "]: " + err.message);
        return store::dump_compact(protocol::make_error_response(
            nullptr, RpcError{protocol::kParseError, "Parse error", json(err.message)}));
    }
    const auto& request = core::errors::get_value(parsed);

    // Route
    const Handler* handler = resolve(request.method);
    if (handler == nullptr) {
        if (request.is_notification()) {
            LOG_DEBUG("Dropping notification for unknown method: " + request.method);
            return std::nullopt;
        }
        return store::dump_compact(protocol::make_error_response(
            *request.id,
            RpcError{protocol::kMethodNotFound, "Method not found: " + request.method,
                     std::nullopt}));
    }

    // Execute
    LOG_DEBUG("Dispatching " + request.method +
              (request.is_notification() ? " (notification)" : ""));
    auto outcome = execute(request.method, *handler, request.params);

    // Respond
    if (core::errors::is_error(outcome)) {
        const auto& err = core::errors::get_error(outcome);
        LOG_WARN("Method " + request.method + " failed [" + err.code + "]: " + err.message);
        if (request.is_notification()) {
            return std::nullopt;
        }
        return store::dump_compact(protocol::make_error_response(
            *request.id,
            RpcError{protocol::kInternalError, "Internal error", json(err.message)}));
    }
    if (request.is_notification()) {
        return std::nullopt;
    }
    return store::dump_compact(
        protocol::make_result_response(*request.id, core::errors::get_value(outcome)));
}

std::size_t Dispatcher::serve(std::istream& in, std::ostream& out) const {
    std::size_t processed = 0;
    std::string line;
    while (std::getline(in, line)) {
        auto response = handle_line(line);
        if (!trim(line).empty()) {
            ++processed;
        }
        if (!response.has_value()) {
            continue;
        }
        out << *response << '\n';
        out.flush();
    }
    LOG_INFO("Input closed after " + std::to_string(processed) + " request line(s)");
    return processed;
}

core::errors::Result<json> Dispatcher::initialize(const json& /*params*/) const {
    json server_info;
    server_info["name"] = info_.name;
    server_info["version"] = info_.version;

    json capabilities;
    capabilities["tools"] = json::object();

    json result;
    result["protocolVersion"] = info_.protocol_version;
    result["serverInfo"] = server_info;
    result["capabilities"] = capabilities;
    return result;
}

core::errors::Result<json> Dispatcher::list_tools(const json& /*params*/) const {
    json tools = json::array();
    for (const auto& spec : specs_) {
        json tool;
        tool["name"] = spec.name;
        tool["description"] = spec.description;
        tool["inputSchema"] = spec.input_schema;
        tools.push_back(tool);
    }
    json result;
    result["tools"] = tools;
    return result;
}

core::errors::Result<json> Dispatcher::call_tool(const json& params) const {
    const auto name_it = params.find("name");
    const std::string name =
        (name_it != params.end() && name_it->is_string()) ? name_it->get<std::string>() : "";
    const auto direct_it = methods_.find(name);
    if (direct_it == methods_.end()) {
        return LinkError{ErrorCategory::Input, "Unknown tool: " + name, "unknown_tool"};
    }

    json arguments = json::object();
    const auto args_it = params.find("arguments");
    if (args_it != params.end() && !args_it->is_null()) {
        arguments = *args_it;
    }

    auto outcome = execute(name, direct_it->second, arguments);
    if (core::errors::is_error(outcome)) {
        return core::errors::get_error(outcome);
    }

    json item;
    item["type"] = "text";
    item["text"] = store::dump_compact(core::errors::get_value(outcome));
    json result;
    result["content"] = json::array({item});
    return result;
}

}  // namespace agentlink::rpc
