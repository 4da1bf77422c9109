#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/link_errors.hpp"

namespace agentlink::tools {

struct PaneInfo {
    std::string id;
    std::string workdir;
    std::string title;
};

enum class SplitDirection {
    Down,
    Right
};

// Terminal multiplexer operations the link methods depend on. Every call is a
// stateless one-shot command.
class Multiplexer {
public:
    virtual ~Multiplexer() = default;

    virtual core::errors::Result<std::string> current_path(const std::string& pane) = 0;
    virtual core::errors::Result<std::vector<PaneInfo>> list_panes() = 0;
    // max_lines defaults to the multiplexer's history depth.
    virtual core::errors::Result<std::string> capture_text(
        const std::string& pane, std::optional<std::uint32_t> max_lines) = 0;
    // Returns the id of the new pane.
    virtual core::errors::Result<std::string> split_new_pane(const std::string& parent,
                                                             const std::string& workdir,
                                                             const std::string& command,
                                                             SplitDirection direction) = 0;
    virtual core::errors::Result<core::errors::Ok> set_title(const std::string& pane,
                                                             const std::string& title) = 0;
    virtual core::errors::Result<core::errors::Ok> send_clear_line(
        const std::string& pane) = 0;
    virtual core::errors::Result<core::errors::Ok> set_buffer(const std::string& name,
                                                              const std::string& data) = 0;
    virtual core::errors::Result<core::errors::Ok> paste_buffer(const std::string& name,
                                                                const std::string& pane,
                                                                bool delete_after) = 0;
    virtual core::errors::Result<core::errors::Ok> send_enter(const std::string& pane) = 0;
    virtual core::errors::Result<core::errors::Ok> kill_pane(const std::string& pane) = 0;
};

}  // namespace agentlink::tools
