#include "policy/workdir_policy.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>

namespace agentlink::policy {

using core::errors::ErrorCategory;
using core::errors::LinkError;

namespace {

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

}  // namespace

core::errors::Result<WorkdirMode> parse_workdir_mode(const std::string& text) {
    const std::string lowered = lowercase(text);
    if (lowered.empty() || lowered == "require_empty_existing") {
        return WorkdirMode::RequireEmptyExisting;
    }
    if (lowered == "use_existing") {
        return WorkdirMode::UseExisting;
    }
    if (lowered == "create_new") {
        return WorkdirMode::CreateNew;
    }
    if (lowered == "create_or_empty") {
        return WorkdirMode::CreateOrEmpty;
    }
    return LinkError{ErrorCategory::Input, "invalid workdir_policy: " + text,
                     "invalid_workdir_policy",
                     "Use require_empty_existing, use_existing, create_new or "
                     "create_or_empty."};
}

WorkdirPolicy::WorkdirPolicy(const WorkdirMode mode) : mode_(mode) {}

bool WorkdirPolicy::is_effectively_empty(const std::filesystem::path& dir) {
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
        if (entry.path().filename() == ".DS_Store") {
            continue;
        }
        return false;
    }
    return true;
}

core::errors::Result<std::filesystem::path> WorkdirPolicy::apply(
    const std::filesystem::path& workdir) const {
    if (workdir.empty()) {
        return LinkError{ErrorCategory::Input, "workdir cannot be empty",
                         "invalid_workdir"};
    }

    std::error_code ec;
    const std::filesystem::path absolute = std::filesystem::absolute(workdir, ec);
    if (ec) {
        return LinkError{ErrorCategory::Input,
                         "Unable to resolve workdir: " + workdir.string(),
                         "invalid_workdir"};
    }
    const std::filesystem::path resolved = absolute.lexically_normal();
    const bool exists = std::filesystem::is_directory(resolved, ec) && !ec;

    auto create = [&resolved]() -> core::errors::Result<std::filesystem::path> {
        std::error_code create_ec;
        std::filesystem::create_directories(resolved, create_ec);
        if (create_ec) {
            return LinkError{ErrorCategory::Execution,
                             "Unable to create workdir: " + resolved.string(),
                             "workdir_create_failed"};
        }
        return resolved;
    };

    switch (mode_) {
        case WorkdirMode::RequireEmptyExisting:
            if (!exists) {
                return LinkError{ErrorCategory::Policy,
                                 "workdir does not exist: " + resolved.string(),
                                 "workdir_missing"};
            }
            if (!is_effectively_empty(resolved)) {
                return LinkError{ErrorCategory::Policy,
                                 "workdir is not empty: " + resolved.string(),
                                 "workdir_not_empty",
                                 "Pass workdir_policy=use_existing to opt in explicitly."};
            }
            return resolved;
        case WorkdirMode::UseExisting:
            if (!exists) {
                return LinkError{ErrorCategory::Policy,
                                 "workdir does not exist: " + resolved.string(),
                                 "workdir_missing"};
            }
            return resolved;
        case WorkdirMode::CreateNew:
            if (std::filesystem::exists(resolved, ec)) {
                return LinkError{ErrorCategory::Policy,
                                 "workdir already exists: " + resolved.string(),
                                 "workdir_exists"};
            }
            return create();
        case WorkdirMode::CreateOrEmpty:
            if (exists) {
                if (!is_effectively_empty(resolved)) {
                    return LinkError{ErrorCategory::Policy,
                                     "workdir is not empty: " + resolved.string(),
                                     "workdir_not_empty"};
                }
                return resolved;
            }
            return create();
    }
    return LinkError{ErrorCategory::Internal, "Unhandled workdir mode",
                     "invalid_workdir_policy"};
}

core::errors::Result<std::string> validate_session_ref(const std::string& field,
                                                       const std::string& value) {
    const bool blank = std::all_of(value.begin(), value.end(), [](const unsigned char c) {
        return std::isspace(c) != 0;
    });
    if (blank) {
        return LinkError{ErrorCategory::Input,
                         field + " must be a non-empty string (e.g., '%7')",
                         "invalid_session_id"};
    }
    return value;
}

}  // namespace agentlink::policy
