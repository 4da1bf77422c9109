#include "store/mailbox.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>
#include "core/logging/logger.hpp"
#include "store/file_lock.hpp"
#include "store/json_store.hpp"

namespace agentlink::store {

using core::errors::ErrorCategory;
using core::errors::LinkError;
using nlohmann::json;

namespace {

double now_seconds() {
    const auto now = std::chrono::system_clock::now();
    return std::chrono::duration<double>(now.time_since_epoch()).count();
}

// Recipient ids become file names; reject anything that could leave the inbox.
core::errors::Result<core::errors::Ok> validate_recipient(const std::string& recipient) {
    if (recipient.empty() || recipient == "." || recipient == ".." ||
        recipient.find('/') != std::string::npos ||
        recipient.find('\0') != std::string::npos) {
        return LinkError{ErrorCategory::Input,
                         "Invalid session id: '" + recipient + "'",
                         "invalid_session_id",
                         "Session ids are non-empty and contain no '/'."};
    }
    return core::errors::Ok{};
}

bool parse_record(const std::string& line, Message& out) {
    const json record = json::parse(line, nullptr, false);
    if (record.is_discarded() || !record.is_object()) {
        return false;
    }
    const auto id = record.find("id");
    if (id == record.end() || !id->is_number_unsigned()) {
        return false;
    }
    out.id = id->get<std::uint64_t>();

    const auto from = record.find("from");
    out.from = (from != record.end() && from->is_string()) ? from->get<std::string>() : "";
    const auto text = record.find("text");
    out.text = (text != record.end() && text->is_string()) ? text->get<std::string>() : "";
    const auto ts = record.find("ts");
    out.timestamp = (ts != record.end() && ts->is_number()) ? ts->get<double>() : 0.0;
    return true;
}

}  // namespace

json to_json(const Message& message) {
    json payload;
    payload["id"] = message.id;
    payload["from"] = message.from;
    payload["text"] = message.text;
    payload["ts"] = message.timestamp;
    return payload;
}

Mailbox::Mailbox(const core::config::RuntimeConfig& config)
    : inbox_dir_(config.inbox_dir()), lock_timeout_ms_(config.lock_timeout_ms) {}

std::filesystem::path Mailbox::log_path(const std::string& recipient) const {
    return inbox_dir_ / (recipient + ".jsonl");
}

std::filesystem::path Mailbox::meta_path(const std::string& recipient) const {
    return inbox_dir_ / (recipient + ".meta.json");
}

std::filesystem::path Mailbox::lock_path(const std::string& recipient) const {
    return inbox_dir_ / ("." + recipient + ".lock");
}

std::vector<Message> Mailbox::scan_log(const std::string& recipient) const {
    std::vector<Message> records;
    std::ifstream in(log_path(recipient));
    if (!in.is_open()) {
        return records;
    }

    std::string line;
    std::size_t skipped = 0;
    while (std::getline(in, line)) {
        if (line.empty()) {
            continue;
        }
        Message message;
        if (!parse_record(line, message)) {
            ++skipped;
            continue;
        }
        records.push_back(std::move(message));
    }
    if (skipped > 0) {
        LOG_WARN("Mailbox " + recipient + ": skipped " + std::to_string(skipped) +
                 " malformed line(s)");
    }
    return records;
}

// Caller holds the recipient lock.
std::uint64_t Mailbox::load_next_id(const std::string& recipient) const {
    const json meta = read_json(meta_path(recipient), json::object());
    if (meta.is_object()) {
        const auto next = meta.find("next_id");
        if (next != meta.end() && next->is_number_unsigned() &&
            next->get<std::uint64_t>() >= 1) {
            return next->get<std::uint64_t>();
        }
    }

    // Counter missing or damaged: never hand out an id the log already holds.
    std::uint64_t highest = 0;
    for (const auto& message : scan_log(recipient)) {
        highest = std::max(highest, message.id);
    }
    if (highest > 0) {
        LOG_WARN("Mailbox " + recipient + ": rebuilt id counter from log, next_id=" +
                 std::to_string(highest + 1));
    }
    return highest + 1;
}

core::errors::Result<std::uint64_t> Mailbox::append(const std::string& recipient,
                                                    const std::string& sender,
                                                    const std::string& text) const {
    auto valid = validate_recipient(recipient);
    if (core::errors::is_error(valid)) {
        return core::errors::get_error(valid);
    }

    return with_lock<std::uint64_t>(
        lock_path(recipient), lock_timeout_ms_,
        [&]() -> core::errors::Result<std::uint64_t> {
            const std::uint64_t id = load_next_id(recipient);

            // The counter is durable before the record exists, so a crash in
            // between skips an id instead of reissuing it.
            json meta;
            meta["next_id"] = id + 1;
            auto saved = write_json(meta_path(recipient), meta);
            if (core::errors::is_error(saved)) {
                return core::errors::get_error(saved);
            }

            Message message;
            message.id = id;
            message.from = sender;
            message.text = text;
            message.timestamp = now_seconds();
            auto appended = append_line(log_path(recipient), dump_compact(to_json(message)));
            if (core::errors::is_error(appended)) {
                return core::errors::get_error(appended);
            }

            LOG_DEBUG("Mailbox " + recipient + ": appended id " + std::to_string(id) +
                      " from " + sender);
            return id;
        });
}

core::errors::Result<InboxSnapshot> Mailbox::read_since(const std::string& recipient,
                                                        const std::uint64_t since_id) const {
    auto valid = validate_recipient(recipient);
    if (core::errors::is_error(valid)) {
        return core::errors::get_error(valid);
    }

    return with_lock<InboxSnapshot>(
        lock_path(recipient), lock_timeout_ms_,
        [&]() -> core::errors::Result<InboxSnapshot> {
            InboxSnapshot snapshot;
            for (auto& message : scan_log(recipient)) {
                snapshot.max_id = std::max(snapshot.max_id, message.id);
                if (message.id > since_id) {
                    snapshot.messages.push_back(std::move(message));
                }
            }
            std::stable_sort(snapshot.messages.begin(), snapshot.messages.end(),
                             [](const Message& a, const Message& b) { return a.id < b.id; });
            return snapshot;
        });
}

}  // namespace agentlink::store
