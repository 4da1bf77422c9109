#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/config/runtime_config.hpp"
#include "core/errors/link_errors.hpp"

namespace agentlink::app::cli {

    enum class OutputMode {
        Json,    // the whole response object, pretty printed
        Text,    // one human-readable line
        Result   // only the "result" member
    };

    struct RelayTarget {
        std::string from;
        std::string to;
    };

    // A validated agentlink-call invocation. Exactly one of method or relay is set.
    struct CallRequest {
        std::string server;
        std::optional<std::string> method;
        std::optional<RelayTarget> relay;
        nlohmann::json params = nlohmann::json::object();
        OutputMode output = OutputMode::Json;
        std::uint32_t timeout_seconds = 30;
        std::uint32_t retry = 1;
        bool verbose = false;
    };

    core::errors::Result<CallRequest> parse_and_validate(int argc, char* argv[],
                                                         const core::config::Environment& env);

    // Replaces ${VAR} and ${VAR:default}; unset variables without a default become "".
    std::string expand_env_vars(const std::string& text, const core::config::Environment& env);

    // Inline JSON or @file, after variable expansion. Must be an object.
    core::errors::Result<nlohmann::json> parse_params(const std::string& input,
                                                      const core::config::Environment& env);

    // Renders a successful response for stdout.
    core::errors::Result<std::string> format_response(OutputMode mode,
                                                      const nlohmann::json& response);

} // namespace agentlink::app::cli
