#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "core/config/token.hpp"
#include "core/errors/link_errors.hpp"
#include "tools/tmux_multiplexer.hpp"

namespace {

using agentlink::core::errors::get_error;
using agentlink::core::errors::get_value;
using agentlink::core::errors::is_error;
using agentlink::tools::parse_pane_listing;
using agentlink::tools::SplitDirection;
using agentlink::tools::TmuxMultiplexer;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_tmux_" + agentlink::core::config::generate_token());
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

    // Writes an executable stand-in for the tmux binary.
    std::string script(const std::string& name, const std::string& body) const {
        const auto path = root_ / name;
        {
            std::ofstream out(path);
            out << "#!/bin/sh\n" << body << "\n";
        }
        std::filesystem::permissions(path, std::filesystem::perms::owner_all);
        return path.string();
    }

private:
    std::filesystem::path root_;
};

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (start < text.size()) {
        const auto end = text.find('\n', start);
        if (end == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, end - start));
        start = end + 1;
    }
    return lines;
}

TEST(TmuxMultiplexerTest, ParsesPaneListing) {
    const auto panes = parse_pane_listing(
        "%1\t/home/a\tmain\n"
        "%4\t/srv/b\tagent:%4\twith\ttabs\n"
        "\n"
        "%7\t/tmp\n");
    ASSERT_EQ(panes.size(), 3u);
    EXPECT_EQ(panes[0].id, "%1");
    EXPECT_EQ(panes[0].workdir, "/home/a");
    EXPECT_EQ(panes[0].title, "main");
    EXPECT_EQ(panes[1].title, "agent:%4\twith\ttabs");
    EXPECT_EQ(panes[2].id, "%7");
    EXPECT_EQ(panes[2].workdir, "/tmp");
    EXPECT_EQ(panes[2].title, "");
}

TEST(TmuxMultiplexerTest, SplitBuildsArgumentsAndReturnsPaneId) {
    TempWorkspace workspace;
    const auto log = (workspace.root() / "args.log").string();
    const auto fake = workspace.script(
        "tmux", "printf '%s\\n' \"$@\" > '" + log + "'\necho '%42'");
    TmuxMultiplexer tmux(2000, fake);

    auto pane = tmux.split_new_pane("%1", "/work/dir", "claude --flag", SplitDirection::Right);
    ASSERT_FALSE(is_error(pane));
    EXPECT_EQ(get_value(pane), "%42");

    std::ifstream in(log);
    std::string recorded((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    const std::vector<std::string> expected = {"split-window", "-h",   "-P", "-F",
                                               "#{pane_id}",   "-c",   "/work/dir",
                                               "-t",           "%1",   "claude --flag"};
    EXPECT_EQ(split_lines(recorded), expected);
}

TEST(TmuxMultiplexerTest, NonZeroExitBecomesTmuxFailed) {
    TempWorkspace workspace;
    const auto fake = workspace.script("tmux", "echo \"can't find pane: %9\" >&2\nexit 1");
    TmuxMultiplexer tmux(2000, fake);

    auto killed = tmux.kill_pane("%9");
    ASSERT_TRUE(is_error(killed));
    EXPECT_EQ(get_error(killed).code, "tmux_failed");
    EXPECT_EQ(get_error(killed).message, "can't find pane: %9");
}

TEST(TmuxMultiplexerTest, HistoryLimitFallsBackWhenUnreadable) {
    TempWorkspace workspace;
    TmuxMultiplexer broken(1234, workspace.script("tmux", "exit 1"));
    EXPECT_EQ(broken.history_limit(), 1234u);

    TmuxMultiplexer working(1234, workspace.script("tmux2", "echo 50000"));
    EXPECT_EQ(working.history_limit(), 50000u);
}

TEST(TmuxMultiplexerTest, CurrentPathIsTrimmed) {
    TempWorkspace workspace;
    TmuxMultiplexer tmux(2000, workspace.script("tmux", "echo '/home/me/project  '"));

    auto path = tmux.current_path("%1");
    ASSERT_FALSE(is_error(path));
    EXPECT_EQ(get_value(path), "/home/me/project");
}

}  // namespace
