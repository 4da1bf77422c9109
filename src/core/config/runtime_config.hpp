#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include "core/errors/link_errors.hpp"
#include "core/logging/logger.hpp"

namespace agentlink::core::config {

// Looks up one environment variable; std::nullopt when unset.
using Environment = std::function<std::optional<std::string>(const std::string&)>;

Environment process_environment();

struct RuntimeConfig {
    std::filesystem::path root = "/tmp/agentlink";
    // Identity of the calling agent; absent outside a multiplexer pane.
    std::optional<std::string> session_id;
    std::string agent_command = "claude --dangerously-skip-permissions";
    std::uint32_t history_lines = 2000;
    // 0 waits forever for store locks.
    std::uint32_t lock_timeout_ms = 0;
    logging::LogLevel log_level = logging::LogLevel::WARN;

    std::filesystem::path inbox_dir() const { return root / "inbox"; }
    std::filesystem::path registry_path() const { return root / "registry.json"; }
    std::filesystem::path registry_lock_path() const { return root / ".registry.lock"; }
};

errors::Result<RuntimeConfig> load_runtime_config(const Environment& env);

// Creates <root> and <root>/inbox.
errors::Result<std::filesystem::path> ensure_runtime_layout(const RuntimeConfig& config);

}  // namespace agentlink::core::config
