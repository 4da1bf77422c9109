#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/link_errors.hpp"

namespace agentlink::hooks {

enum class HookMode {
    Text,       // inject a fixed message into the called agent
    Screenshot  // relay the hooked agent's pane text into the called agent
};

core::errors::Result<HookMode> parse_hook_mode(const std::string& text);

// How hook commands reach this server again.
struct HookClient {
    std::string client_binary = "agentlink-call";
    std::string server_command = "agentlink";
    // Commands containing this marker are treated as ours by remove_link_hooks.
    std::string marker = "agentlink";
};

struct HookMergeReport {
    std::filesystem::path path;
    std::vector<std::string> added;
    std::vector<std::string> skipped;
};

std::string shell_single_quote(const std::string& value);

// Builds the Stop-hook command lines that call back into `called` once the
// agent in `hooked` finishes a turn. Text mode requires text.
core::errors::Result<std::vector<std::string>> build_stop_hook_commands(
    HookMode mode, const std::string& called, const std::optional<std::string>& text,
    const std::string& hooked, const HookClient& client = {});

// Edits <workdir>/.claude/settings.local.json. Every write is atomic.
class SettingsWriter {
public:
    explicit SettingsWriter(HookClient client = {});

    static std::filesystem::path settings_path(const std::filesystem::path& workdir);

    // Sets enableAllProjectMcpServers unless already present.
    core::errors::Result<std::filesystem::path> ensure_project_settings(
        const std::filesystem::path& workdir) const;

    // Replaces the whole file with the settings flag and one Stop entry.
    core::errors::Result<std::filesystem::path> overwrite_with_hooks(
        const std::filesystem::path& workdir,
        const std::vector<std::string>& commands) const;

    // Merges commands into the existing Stop list, skipping ones already there.
    // A corrupt file is backed up to .bak and replaced.
    core::errors::Result<HookMergeReport> append_stop_hooks(
        const std::filesystem::path& workdir,
        const std::vector<std::string>& commands) const;

    // Drops Stop hook commands that mention the marker. Returns whether the
    // file changed.
    core::errors::Result<bool> remove_link_hooks(const std::filesystem::path& workdir) const;

    const HookClient& client() const { return client_; }

private:
    HookClient client_;
};

}  // namespace agentlink::hooks
