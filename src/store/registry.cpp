#include "store/registry.hpp"

#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"
#include "store/file_lock.hpp"
#include "store/json_store.hpp"

namespace agentlink::store {

using core::errors::ErrorCategory;
using core::errors::LinkError;
using core::errors::Ok;
using nlohmann::json;

namespace {

json empty_registry() {
    json document;
    document["children"] = json::object();
    return document;
}

json load(const std::filesystem::path& path) {
    json document = read_json(path, empty_registry());
    if (!document.is_object()) {
        return empty_registry();
    }
    if (!document.contains("children") || !document["children"].is_object()) {
        document["children"] = json::object();
    }
    return document;
}

std::string string_field(const json& entry, const char* key) {
    const auto it = entry.find(key);
    if (it == entry.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

}  // namespace

Registry::Registry(const core::config::RuntimeConfig& config)
    : document_path_(config.registry_path()),
      lock_path_(config.registry_lock_path()),
      lock_timeout_ms_(config.lock_timeout_ms) {}

core::errors::Result<Ok> Registry::set_child(const std::string& parent,
                                             const std::string& child,
                                             const std::string& workdir) const {
    if (child.empty() || parent.empty()) {
        return LinkError{ErrorCategory::Input,
                         "Parent and child session ids must be non-empty.",
                         "invalid_session_id"};
    }

    return with_lock<Ok>(lock_path_, lock_timeout_ms_, [&]() -> core::errors::Result<Ok> {
        json document = load(document_path_);
        json entry;
        entry["father"] = parent;
        entry["workdir"] = workdir;
        document["children"][child] = entry;

        auto saved = write_json(document_path_, document);
        if (core::errors::is_error(saved)) {
            return core::errors::get_error(saved);
        }
        LOG_INFO("Registry: " + child + " -> father " + parent);
        return Ok{};
    });
}

core::errors::Result<std::optional<ChildEntry>> Registry::find(
    const std::string& child) const {
    return with_lock<std::optional<ChildEntry>>(
        lock_path_, lock_timeout_ms_,
        [&]() -> core::errors::Result<std::optional<ChildEntry>> {
            const json document = load(document_path_);
            const auto& children = document["children"];
            const auto it = children.find(child);
            if (it == children.end() || !it->is_object()) {
                return std::optional<ChildEntry>{};
            }
            return std::optional<ChildEntry>{
                ChildEntry{child, string_field(*it, "father"), string_field(*it, "workdir")}};
        });
}

core::errors::Result<std::optional<std::string>> Registry::get_father(
    const std::string& child) const {
    auto found = find(child);
    if (core::errors::is_error(found)) {
        return core::errors::get_error(found);
    }
    const auto& entry = core::errors::get_value(found);
    if (!entry.has_value() || entry->parent.empty()) {
        return std::optional<std::string>{};
    }
    return std::optional<std::string>{entry->parent};
}

core::errors::Result<std::optional<std::string>> Registry::get_workdir(
    const std::string& child) const {
    auto found = find(child);
    if (core::errors::is_error(found)) {
        return core::errors::get_error(found);
    }
    const auto& entry = core::errors::get_value(found);
    if (!entry.has_value() || entry->workdir.empty()) {
        return std::optional<std::string>{};
    }
    return std::optional<std::string>{entry->workdir};
}

core::errors::Result<std::vector<ChildEntry>> Registry::list_children() const {
    return with_lock<std::vector<ChildEntry>>(
        lock_path_, lock_timeout_ms_,
        [&]() -> core::errors::Result<std::vector<ChildEntry>> {
            const json document = load(document_path_);
            std::vector<ChildEntry> entries;
            for (const auto& item : document["children"].items()) {
                if (!item.value().is_object()) {
                    continue;
                }
                entries.push_back(ChildEntry{item.key(), string_field(item.value(), "father"),
                                             string_field(item.value(), "workdir")});
            }
            return entries;
        });
}

}  // namespace agentlink::store
