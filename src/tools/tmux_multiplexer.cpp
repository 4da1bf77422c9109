#include "tools/tmux_multiplexer.hpp"

#include <charconv>
#include <sstream>
#include <utility>
#include "core/logging/logger.hpp"
#include "tools/process_runner.hpp"

namespace agentlink::tools {

using core::errors::ErrorCategory;
using core::errors::LinkError;
using core::errors::Ok;

namespace {

constexpr std::uint32_t kTmuxTimeoutMs = 10000;

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

}  // namespace

std::vector<PaneInfo> parse_pane_listing(const std::string& output) {
    std::vector<PaneInfo> panes;
    std::istringstream in(output);
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty()) {
            continue;
        }
        std::vector<std::string> parts;
        std::size_t start = 0;
        while (parts.size() < 2) {
            const auto tab = line.find('\t', start);
            if (tab == std::string::npos) {
                break;
            }
            parts.push_back(line.substr(start, tab - start));
            start = tab + 1;
        }
        parts.push_back(line.substr(start));

        PaneInfo pane;
        pane.id = trim(parts[0]);
        pane.workdir = parts.size() > 1 ? trim(parts[1]) : "";
        pane.title = parts.size() > 2 ? trim(parts[2]) : "";
        panes.push_back(std::move(pane));
    }
    return panes;
}

TmuxMultiplexer::TmuxMultiplexer(const std::uint32_t fallback_history_lines,
                                 std::string binary)
    : fallback_history_lines_(fallback_history_lines), binary_(std::move(binary)) {}

core::errors::Result<std::string> TmuxMultiplexer::run(const std::vector<std::string>& args) {
    ProcessRequest request;
    request.argv.push_back(binary_);
    request.argv.insert(request.argv.end(), args.begin(), args.end());
    request.timeout_ms = kTmuxTimeoutMs;

    auto captured = run_process(request);
    if (core::errors::is_error(captured)) {
        return core::errors::get_error(captured);
    }
    const auto& capture = core::errors::get_value(captured);
    if (capture.timed_out) {
        return LinkError{ErrorCategory::Execution,
                         binary_ + " " + (args.empty() ? "" : args.front()) + " timed out",
                         "tmux_timeout"};
    }
    if (capture.exit_code != 0) {
        std::string detail = trim(capture.stderr_text);
        if (detail.empty()) {
            detail = binary_ + " exited with code " + std::to_string(capture.exit_code);
        }
        LOG_DEBUG("tmux " + (args.empty() ? std::string() : args.front()) +
                  " failed: " + detail);
        return LinkError{ErrorCategory::Execution, detail, "tmux_failed"};
    }
    return capture.stdout_text;
}

core::errors::Result<Ok> TmuxMultiplexer::run_quiet(const std::vector<std::string>& args) {
    auto output = run(args);
    if (core::errors::is_error(output)) {
        return core::errors::get_error(output);
    }
    return Ok{};
}

core::errors::Result<std::string> TmuxMultiplexer::current_path(const std::string& pane) {
    std::vector<std::string> args = {"display", "-p", "#{pane_current_path}"};
    if (!pane.empty()) {
        args.push_back("-t");
        args.push_back(pane);
    }
    auto output = run(args);
    if (core::errors::is_error(output)) {
        return core::errors::get_error(output);
    }
    return trim(core::errors::get_value(output));
}

core::errors::Result<std::vector<PaneInfo>> TmuxMultiplexer::list_panes() {
    auto output = run({"list-panes", "-a", "-F",
                       "#{pane_id}\t#{pane_current_path}\t#{pane_title}"});
    if (core::errors::is_error(output)) {
        return core::errors::get_error(output);
    }
    return parse_pane_listing(core::errors::get_value(output));
}

std::uint32_t TmuxMultiplexer::history_limit() {
    auto output = run({"show", "-gv", "history-limit"});
    if (core::errors::is_error(output)) {
        return fallback_history_lines_;
    }
    const std::string text = trim(core::errors::get_value(output));
    std::uint32_t lines = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), lines);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        return fallback_history_lines_;
    }
    return lines;
}

core::errors::Result<std::string> TmuxMultiplexer::capture_text(
    const std::string& pane, const std::optional<std::uint32_t> max_lines) {
    const std::uint32_t lines = max_lines.has_value() ? *max_lines : history_limit();
    // -e keeps escapes, -J joins wrapped lines.
    return run({"capture-pane", "-p", "-e", "-J", "-S", "-" + std::to_string(lines),
                "-t", pane});
}

core::errors::Result<std::string> TmuxMultiplexer::split_new_pane(
    const std::string& parent, const std::string& workdir, const std::string& command,
    const SplitDirection direction) {
    std::vector<std::string> args = {"split-window"};
    if (direction == SplitDirection::Right) {
        args.push_back("-h");
    }
    args.insert(args.end(), {"-P", "-F", "#{pane_id}", "-c", workdir, "-t", parent, command});
    auto output = run(args);
    if (core::errors::is_error(output)) {
        return core::errors::get_error(output);
    }
    const std::string pane = trim(core::errors::get_value(output));
    if (pane.empty()) {
        return LinkError{ErrorCategory::Execution, "tmux did not report the new pane id",
                         "tmux_failed"};
    }
    return pane;
}

core::errors::Result<Ok> TmuxMultiplexer::set_title(const std::string& pane,
                                                    const std::string& title) {
    return run_quiet({"select-pane", "-t", pane, "-T", title});
}

core::errors::Result<Ok> TmuxMultiplexer::send_clear_line(const std::string& pane) {
    return run_quiet({"send-keys", "-t", pane, "C-u"});
}

core::errors::Result<Ok> TmuxMultiplexer::set_buffer(const std::string& name,
                                                     const std::string& data) {
    return run_quiet({"set-buffer", "-b", name, "--", data});
}

core::errors::Result<Ok> TmuxMultiplexer::paste_buffer(const std::string& name,
                                                       const std::string& pane,
                                                       const bool delete_after) {
    std::vector<std::string> args = {"paste-buffer", "-b", name, "-t", pane};
    if (delete_after) {
        args.push_back("-d");
    }
    return run_quiet(args);
}

core::errors::Result<Ok> TmuxMultiplexer::send_enter(const std::string& pane) {
    return run_quiet({"send-keys", "-t", pane, "Enter"});
}

core::errors::Result<Ok> TmuxMultiplexer::kill_pane(const std::string& pane) {
    return run_quiet({"kill-pane", "-t", pane});
}

}  // namespace agentlink::tools
