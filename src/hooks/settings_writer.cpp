#include "hooks/settings_writer.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_set>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"
#include "store/json_store.hpp"

namespace agentlink::hooks {

using core::errors::ErrorCategory;
using core::errors::LinkError;
using nlohmann::json;

namespace {

constexpr const char* kEnableServersKey = "enableAllProjectMcpServers";

json command_entry(const std::string& command) {
    json entry;
    entry["type"] = "command";
    entry["command"] = command;
    return entry;
}

json hooks_array(const std::vector<std::string>& commands) {
    json hooks = json::array();
    for (const auto& command : commands) {
        hooks.push_back(command_entry(command));
    }
    return hooks;
}

bool is_command_hook(const json& hook) {
    return hook.is_object() && hook.contains("command") && hook["command"].is_string();
}

}  // namespace

core::errors::Result<HookMode> parse_hook_mode(const std::string& text) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered.empty() || lowered == "text") {
        return HookMode::Text;
    }
    if (lowered == "screenshot") {
        return HookMode::Screenshot;
    }
    return LinkError{ErrorCategory::Input, "mode must be 'text' or 'screenshot'",
                     "invalid_hook_mode"};
}

std::string shell_single_quote(const std::string& value) {
    std::string escaped = "'";
    escaped.reserve(value.size() + 16);
    for (const char c : value) {
        if (c == '\'') {
            escaped += "'\\''";
        } else {
            escaped.push_back(c);
        }
    }
    escaped += "'";
    return escaped;
}

core::errors::Result<std::vector<std::string>> build_stop_hook_commands(
    const HookMode mode, const std::string& called, const std::optional<std::string>& text,
    const std::string& hooked, const HookClient& client) {
    const std::string prefix = client.client_binary + " --server " +
                               shell_single_quote(client.server_command);

    if (mode == HookMode::Text) {
        if (!text.has_value()) {
            return LinkError{ErrorCategory::Input, "text is required when mode='text'",
                             "missing_param"};
        }
        json params;
        params["target_id"] = called;
        params["text"] = "[msg from " + hooked + "] " + *text;
        return std::vector<std::string>{prefix + " --method inject_input_to --params " +
                                        shell_single_quote(store::dump_compact(params)) +
                                        " --output text"};
    }

    return std::vector<std::string>{prefix + " --relay-screenshot " +
                                    shell_single_quote(hooked) + " " +
                                    shell_single_quote(called)};
}

SettingsWriter::SettingsWriter(HookClient client) : client_(std::move(client)) {}

std::filesystem::path SettingsWriter::settings_path(const std::filesystem::path& workdir) {
    return workdir / ".claude" / "settings.local.json";
}

core::errors::Result<std::filesystem::path> SettingsWriter::ensure_project_settings(
    const std::filesystem::path& workdir) const {
    const auto path = settings_path(workdir);
    auto loaded = store::read_json_for_merge(path, json::object());
    if (core::errors::is_error(loaded)) {
        return core::errors::get_error(loaded);
    }
    json settings = core::errors::get_value(loaded);
    if (settings.contains(kEnableServersKey)) {
        return path;
    }
    settings[kEnableServersKey] = true;

    auto saved = store::write_json(path, settings);
    if (core::errors::is_error(saved)) {
        return core::errors::get_error(saved);
    }
    return path;
}

core::errors::Result<std::filesystem::path> SettingsWriter::overwrite_with_hooks(
    const std::filesystem::path& workdir, const std::vector<std::string>& commands) const {
    json stop_entry;
    stop_entry["hooks"] = hooks_array(commands);

    json settings;
    settings[kEnableServersKey] = true;
    settings["hooks"]["Stop"] = json::array({stop_entry});

    const auto path = settings_path(workdir);
    auto saved = store::write_json(path, settings);
    if (core::errors::is_error(saved)) {
        return core::errors::get_error(saved);
    }
    LOG_INFO("Wrote " + std::to_string(commands.size()) + " Stop hook(s) to " + path.string());
    return path;
}

core::errors::Result<HookMergeReport> SettingsWriter::append_stop_hooks(
    const std::filesystem::path& workdir, const std::vector<std::string>& commands) const {
    HookMergeReport report;
    report.path = settings_path(workdir);

    auto loaded = store::read_json_for_merge(report.path, json::object());
    if (core::errors::is_error(loaded)) {
        return core::errors::get_error(loaded);
    }
    json settings = core::errors::get_value(loaded);

    if (!settings.contains("hooks") || !settings["hooks"].is_object()) {
        settings["hooks"] = json::object();
    }
    json& hooks = settings["hooks"];
    if (!hooks.contains("Stop") || !hooks["Stop"].is_array()) {
        hooks["Stop"] = json::array();
    }
    json& stop_list = hooks["Stop"];

    std::unordered_set<std::string> existing;
    for (const auto& entry : stop_list) {
        if (!entry.is_object() || !entry.contains("hooks") || !entry["hooks"].is_array()) {
            continue;
        }
        for (const auto& hook : entry["hooks"]) {
            if (is_command_hook(hook)) {
                existing.insert(hook["command"].get<std::string>());
            }
        }
    }

    for (const auto& command : commands) {
        if (existing.count(command) > 0) {
            report.skipped.push_back(command);
        } else {
            report.added.push_back(command);
            existing.insert(command);
        }
    }
    if (report.added.empty()) {
        return report;
    }

    json stop_entry;
    stop_entry["hooks"] = hooks_array(report.added);
    stop_list.push_back(stop_entry);

    auto saved = store::write_json(report.path, settings);
    if (core::errors::is_error(saved)) {
        return core::errors::get_error(saved);
    }
    return report;
}

core::errors::Result<bool> SettingsWriter::remove_link_hooks(
    const std::filesystem::path& workdir) const {
    const auto path = settings_path(workdir);
    json settings = store::read_json(path, json());
    if (!settings.is_object() || !settings.contains("hooks") ||
        !settings["hooks"].is_object()) {
        return false;
    }
    json& hooks = settings["hooks"];
    if (!hooks.contains("Stop") || !hooks["Stop"].is_array()) {
        return false;
    }

    bool changed = false;
    json kept_entries = json::array();
    for (const auto& entry : hooks["Stop"]) {
        if (!entry.is_object() || !entry.contains("hooks") || !entry["hooks"].is_array()) {
            kept_entries.push_back(entry);
            continue;
        }
        json filtered = json::array();
        for (const auto& hook : entry["hooks"]) {
            if (is_command_hook(hook) &&
                hook["command"].get<std::string>().find(client_.marker) !=
                    std::string::npos) {
                changed = true;
                continue;
            }
            filtered.push_back(hook);
        }
        if (filtered.empty()) {
            changed = true;
            continue;
        }
        json kept = entry;
        kept["hooks"] = filtered;
        kept_entries.push_back(kept);
    }

    if (!changed) {
        return false;
    }
    hooks["Stop"] = kept_entries;
    auto saved = store::write_json(path, settings);
    if (core::errors::is_error(saved)) {
        return core::errors::get_error(saved);
    }
    LOG_INFO("Removed stale link hooks from " + path.string());
    return true;
}

}  // namespace agentlink::hooks
