#pragma once

#include <filesystem>
#include <string>
#include "core/errors/link_errors.hpp"

namespace agentlink::policy {

enum class WorkdirMode {
    RequireEmptyExisting,  // must exist and be empty (default)
    UseExisting,           // must exist, contents untouched
    CreateNew,             // must not exist; created
    CreateOrEmpty          // created when missing, otherwise must be empty
};

core::errors::Result<WorkdirMode> parse_workdir_mode(const std::string& text);

// Guards the directory a new agent session is launched in.
class WorkdirPolicy {
public:
    explicit WorkdirPolicy(WorkdirMode mode = WorkdirMode::RequireEmptyExisting);

    // Returns the absolute path once the directory satisfies the mode, creating
    // it where the mode allows.
    core::errors::Result<std::filesystem::path> apply(
        const std::filesystem::path& workdir) const;

    WorkdirMode mode() const { return mode_; }

private:
    static bool is_effectively_empty(const std::filesystem::path& dir);

    WorkdirMode mode_;
};

// Session references must be non-blank strings (e.g. "%7").
core::errors::Result<std::string> validate_session_ref(const std::string& field,
                                                       const std::string& value);

}  // namespace agentlink::policy
