#pragma once

#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/link_errors.hpp"

namespace agentlink::store {

// Reads a JSON document. Missing, unreadable or corrupt files yield fallback.
nlohmann::json read_json(const std::filesystem::path& path,
                         const nlohmann::json& fallback);

// Reads a document that is about to be merged and rewritten. A corrupt file is
// renamed to <path>.bak and fallback is returned; a non-object document is
// replaced by fallback without a backup.
core::errors::Result<nlohmann::json> read_json_for_merge(
    const std::filesystem::path& path, const nlohmann::json& fallback);

// Atomic replace: temp file in the same directory, fsync, rename over path.
core::errors::Result<core::errors::Ok> write_json(const std::filesystem::path& path,
                                                  const nlohmann::json& document);

// Appends one line (a trailing newline is added) and fsyncs the file.
core::errors::Result<core::errors::Ok> append_line(const std::filesystem::path& path,
                                                   const std::string& line);

// Serialization used for every persisted or transmitted document.
std::string dump_compact(const nlohmann::json& document);

}  // namespace agentlink::store
