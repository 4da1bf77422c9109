#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "tools/multiplexer.hpp"

namespace agentlink::tools {

// Drives the tmux binary. A non-zero exit becomes a tmux_failed error carrying
// tmux's stderr.
class TmuxMultiplexer : public Multiplexer {
public:
    explicit TmuxMultiplexer(std::uint32_t fallback_history_lines = 2000,
                             std::string binary = "tmux");

    core::errors::Result<std::string> current_path(const std::string& pane) override;
    core::errors::Result<std::vector<PaneInfo>> list_panes() override;
    core::errors::Result<std::string> capture_text(
        const std::string& pane, std::optional<std::uint32_t> max_lines) override;
    core::errors::Result<std::string> split_new_pane(const std::string& parent,
                                                     const std::string& workdir,
                                                     const std::string& command,
                                                     SplitDirection direction) override;
    core::errors::Result<core::errors::Ok> set_title(const std::string& pane,
                                                     const std::string& title) override;
    core::errors::Result<core::errors::Ok> send_clear_line(const std::string& pane) override;
    core::errors::Result<core::errors::Ok> set_buffer(const std::string& name,
                                                      const std::string& data) override;
    core::errors::Result<core::errors::Ok> paste_buffer(const std::string& name,
                                                        const std::string& pane,
                                                        bool delete_after) override;
    core::errors::Result<core::errors::Ok> send_enter(const std::string& pane) override;
    core::errors::Result<core::errors::Ok> kill_pane(const std::string& pane) override;

    // tmux's global history-limit, or the fallback when it cannot be read.
    std::uint32_t history_limit();

private:
    core::errors::Result<std::string> run(const std::vector<std::string>& args);
    core::errors::Result<core::errors::Ok> run_quiet(const std::vector<std::string>& args);

    std::uint32_t fallback_history_lines_;
    std::string binary_;
};

// Parses `list-panes -F "#{pane_id}\t#{pane_current_path}\t#{pane_title}"` output.
std::vector<PaneInfo> parse_pane_listing(const std::string& output);

}  // namespace agentlink::tools
