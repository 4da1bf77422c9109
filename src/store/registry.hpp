#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "core/config/runtime_config.hpp"
#include "core/errors/link_errors.hpp"

namespace agentlink::store {

struct ChildEntry {
    std::string child;
    std::string parent;
    std::string workdir;
};

// Parent/child relations between sessions, kept in one shared document:
//   registry.json = {"children": {"<child>": {"father": "<parent>", "workdir": "..."}}}
// Every operation runs under the global .registry.lock.
class Registry {
public:
    explicit Registry(const core::config::RuntimeConfig& config);

    // Upsert; registering the same child again replaces the previous entry.
    core::errors::Result<core::errors::Ok> set_child(const std::string& parent,
                                                     const std::string& child,
                                                     const std::string& workdir) const;

    core::errors::Result<std::optional<std::string>> get_father(
        const std::string& child) const;
    core::errors::Result<std::optional<std::string>> get_workdir(
        const std::string& child) const;
    core::errors::Result<std::vector<ChildEntry>> list_children() const;

private:
    core::errors::Result<std::optional<ChildEntry>> find(const std::string& child) const;

    std::filesystem::path document_path_;
    std::filesystem::path lock_path_;
    std::uint32_t lock_timeout_ms_;
};

}  // namespace agentlink::store
