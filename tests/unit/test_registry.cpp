#include <filesystem>
#include <fstream>
#include <string>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/runtime_config.hpp"
#include "core/config/token.hpp"
#include "core/errors/link_errors.hpp"
#include "store/json_store.hpp"
#include "store/registry.hpp"

namespace {

using agentlink::core::config::RuntimeConfig;
using agentlink::core::errors::get_error;
using agentlink::core::errors::get_value;
using agentlink::core::errors::is_error;
using agentlink::store::Registry;
using nlohmann::json;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_registry_" + agentlink::core::config::generate_token());
        std::filesystem::create_directories(root_);
        config_.root = root_;
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const RuntimeConfig& config() const { return config_; }

private:
    std::filesystem::path root_;
    RuntimeConfig config_;
};

TEST(RegistryTest, UnknownChildHasNoFather) {
    TempWorkspace workspace;
    Registry registry(workspace.config());

    auto father = registry.get_father("%4");
    ASSERT_FALSE(is_error(father));
    EXPECT_FALSE(get_value(father).has_value());

    auto children = registry.list_children();
    ASSERT_FALSE(is_error(children));
    EXPECT_TRUE(get_value(children).empty());
}

TEST(RegistryTest, RecordsFatherAndWorkdir) {
    TempWorkspace workspace;
    Registry registry(workspace.config());
    ASSERT_FALSE(is_error(registry.set_child("%1", "%4", "/work/a")));

    auto father = registry.get_father("%4");
    ASSERT_FALSE(is_error(father));
    EXPECT_EQ(get_value(father).value_or(""), "%1");

    auto workdir = registry.get_workdir("%4");
    ASSERT_FALSE(is_error(workdir));
    EXPECT_EQ(get_value(workdir).value_or(""), "/work/a");

    const json document =
        agentlink::store::read_json(workspace.config().registry_path(), json());
    EXPECT_EQ(document["children"]["%4"]["father"], "%1");
    EXPECT_EQ(document["children"]["%4"]["workdir"], "/work/a");
}

TEST(RegistryTest, SetChildReplacesExistingEntry) {
    TempWorkspace workspace;
    Registry registry(workspace.config());
    ASSERT_FALSE(is_error(registry.set_child("%1", "%4", "/work/a")));
    ASSERT_FALSE(is_error(registry.set_child("%2", "%4", "/work/b")));

    EXPECT_EQ(get_value(registry.get_father("%4")).value_or(""), "%2");
    EXPECT_EQ(get_value(registry.get_workdir("%4")).value_or(""), "/work/b");
    EXPECT_EQ(get_value(registry.list_children()).size(), 1u);
}

TEST(RegistryTest, RejectsEmptyIds) {
    TempWorkspace workspace;
    Registry registry(workspace.config());

    auto no_child = registry.set_child("%1", "", "/w");
    ASSERT_TRUE(is_error(no_child));
    EXPECT_EQ(get_error(no_child).code, "invalid_session_id");
    EXPECT_TRUE(is_error(registry.set_child("", "%4", "/w")));
}

TEST(RegistryTest, CorruptDocumentIsTreatedAsEmpty) {
    TempWorkspace workspace;
    {
        std::ofstream out(workspace.config().registry_path());
        out << "{\"children\": {";
    }
    Registry registry(workspace.config());

    EXPECT_FALSE(get_value(registry.get_father("%4")).has_value());
    ASSERT_FALSE(is_error(registry.set_child("%1", "%4", "/w")));
    EXPECT_EQ(get_value(registry.get_father("%4")).value_or(""), "%1");
}

TEST(RegistryTest, ConcurrentWritersLoseNoEntries) {
    TempWorkspace workspace;
    constexpr int kWriters = 4;
    constexpr int kPerWriter = 10;

    std::vector<pid_t> children;
    for (int w = 0; w < kWriters; ++w) {
        const pid_t pid = fork();
        if (pid == 0) {
            Registry registry(workspace.config());
            for (int i = 0; i < kPerWriter; ++i) {
                const std::string child = "%" + std::to_string(100 + w * kPerWriter + i);
                if (is_error(registry.set_child("%" + std::to_string(w), child, "/w"))) {
                    _exit(1);
                }
            }
            _exit(0);
        }
        children.push_back(pid);
    }
    for (const pid_t pid : children) {
        int status = 0;
        waitpid(pid, &status, 0);
        ASSERT_TRUE(WIFEXITED(status));
        EXPECT_EQ(WEXITSTATUS(status), 0);
    }

    Registry registry(workspace.config());
    auto listed = registry.list_children();
    ASSERT_FALSE(is_error(listed));
    EXPECT_EQ(get_value(listed).size(), static_cast<std::size_t>(kWriters * kPerWriter));
}

}  // namespace
