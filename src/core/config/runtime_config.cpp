#include "core/config/runtime_config.hpp"

#include <charconv>
#include <cstdlib>
#include <system_error>

namespace agentlink::core::config {

using errors::ErrorCategory;
using errors::LinkError;

namespace {

std::optional<std::string> non_empty(const Environment& env, const std::string& name) {
    auto value = env(name);
    if (!value.has_value() || value->empty()) {
        return std::nullopt;
    }
    return value;
}

errors::Result<std::uint32_t> parse_u32(const std::string& name,
                                        const std::string& text) {
    std::uint32_t parsed = 0;
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, parsed);
    if (ec != std::errc() || ptr != end) {
        return LinkError{ErrorCategory::Input,
                         "Invalid number in " + name + ": " + text,
                         "invalid_integer", "Provide a non-negative integer."};
    }
    return parsed;
}

}  // namespace

Environment process_environment() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    };
}

errors::Result<RuntimeConfig> load_runtime_config(const Environment& env) {
    RuntimeConfig config;

    if (auto xdg = non_empty(env, "XDG_RUNTIME_DIR")) {
        config.root = std::filesystem::path(*xdg) / "agentlink";
    } else if (auto root = non_empty(env, "AGENTLINK_ROOT")) {
        config.root = *root;
    }

    if (auto session = non_empty(env, "AGENTLINK_SESSION_ID")) {
        config.session_id = *session;
    } else if (auto pane = non_empty(env, "TMUX_PANE")) {
        config.session_id = *pane;
    }

    if (auto command = non_empty(env, "AGENTLINK_AGENT_CMD")) {
        config.agent_command = *command;
    }

    if (auto history = non_empty(env, "AGENTLINK_HISTORY_LINES")) {
        auto parsed = parse_u32("AGENTLINK_HISTORY_LINES", *history);
        if (errors::is_error(parsed)) {
            return errors::get_error(parsed);
        }
        config.history_lines = errors::get_value(parsed);
    }

    if (auto timeout = non_empty(env, "AGENTLINK_LOCK_TIMEOUT_MS")) {
        auto parsed = parse_u32("AGENTLINK_LOCK_TIMEOUT_MS", *timeout);
        if (errors::is_error(parsed)) {
            return errors::get_error(parsed);
        }
        config.lock_timeout_ms = errors::get_value(parsed);
    }

    if (auto level = non_empty(env, "AGENTLINK_LOG_LEVEL")) {
        auto parsed = logging::Logger::parse_level(*level);
        if (!parsed.has_value()) {
            return LinkError{ErrorCategory::Input,
                             "Unknown log level: " + *level, "invalid_log_level",
                             "Use debug, info, warn or error."};
        }
        config.log_level = *parsed;
    }

    return config;
}

errors::Result<std::filesystem::path> ensure_runtime_layout(const RuntimeConfig& config) {
    std::error_code ec;
    std::filesystem::create_directories(config.inbox_dir(), ec);
    if (ec) {
        return LinkError{ErrorCategory::Storage,
                         "Unable to create runtime root: " + config.inbox_dir().string() +
                             " (" + ec.message() + ")",
                         "runtime_root_create_failed"};
    }
    return config.root;
}

}  // namespace agentlink::core::config
