#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/config/runtime_config.hpp"
#include "core/errors/link_errors.hpp"

namespace agentlink::store {

struct Message {
    std::uint64_t id = 0;
    std::string from;
    std::string text;
    double timestamp = 0.0;  // seconds since the epoch
};

nlohmann::json to_json(const Message& message);

struct InboxSnapshot {
    std::vector<Message> messages;  // ascending id
    std::uint64_t max_id = 0;       // highest id anywhere in the log
};

// Per-recipient append-only message log with a persisted id counter.
//
// Layout under <root>/inbox:
//   <id>.jsonl      one JSON record per line
//   <id>.meta.json  {"next_id": N}
//   .<id>.lock      flock target, never read
//
// All access to one recipient is serialized by its lock file; different
// recipients never contend.
class Mailbox {
public:
    explicit Mailbox(const core::config::RuntimeConfig& config);

    // Allocates the next id, persists the counter, then appends the record.
    core::errors::Result<std::uint64_t> append(const std::string& recipient,
                                               const std::string& sender,
                                               const std::string& text) const;

    core::errors::Result<InboxSnapshot> read_since(const std::string& recipient,
                                                   std::uint64_t since_id) const;

    std::filesystem::path log_path(const std::string& recipient) const;
    std::filesystem::path meta_path(const std::string& recipient) const;
    std::filesystem::path lock_path(const std::string& recipient) const;

private:
    std::uint64_t load_next_id(const std::string& recipient) const;
    std::vector<Message> scan_log(const std::string& recipient) const;

    std::filesystem::path inbox_dir_;
    std::uint32_t lock_timeout_ms_;
};

}  // namespace agentlink::store
