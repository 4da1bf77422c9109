#include "rpc/link_methods.hpp"

#include <charconv>
#include <filesystem>
#include <system_error>
#include <thread>
#include <unistd.h>
#include <unordered_map>
#include <utility>
#include "core/config/token.hpp"
#include "core/logging/logger.hpp"
#include "policy/workdir_policy.hpp"
#include "store/json_store.hpp"

namespace agentlink::rpc {

using core::errors::ErrorCategory;
using core::errors::LinkError;
using nlohmann::json;

namespace {

// --- param extraction -------------------------------------------------------

core::errors::Result<std::optional<std::string>> optional_string(const json& params,
                                                                 const std::string& key) {
    const auto it = params.find(key);
    if (it == params.end() || it->is_null()) {
        return std::optional<std::string>{};
    }
    if (!it->is_string()) {
        return LinkError{ErrorCategory::Input, key + " must be a string", "invalid_param"};
    }
    return std::optional<std::string>{it->get<std::string>()};
}

core::errors::Result<std::string> required_string(const json& params,
                                                  const std::string& key) {
    auto value = optional_string(params, key);
    if (core::errors::is_error(value)) {
        return core::errors::get_error(value);
    }
    const auto& present = core::errors::get_value(value);
    if (!present.has_value()) {
        return LinkError{ErrorCategory::Input, key + " is required", "missing_param"};
    }
    return *present;
}

core::errors::Result<bool> optional_bool(const json& params, const std::string& key,
                                         const bool fallback) {
    const auto it = params.find(key);
    if (it == params.end() || it->is_null()) {
        return fallback;
    }
    if (!it->is_boolean()) {
        return LinkError{ErrorCategory::Input, key + " must be a boolean", "invalid_param"};
    }
    return it->get<bool>();
}

// Accepts a non-negative integer or its decimal string form; negatives clamp to 0.
core::errors::Result<std::uint64_t> optional_cursor(const json& params,
                                                    const std::string& key) {
    const auto it = params.find(key);
    if (it == params.end() || it->is_null()) {
        return std::uint64_t{0};
    }
    if (it->is_number_unsigned()) {
        return it->get<std::uint64_t>();
    }
    if (it->is_number_integer()) {
        const auto value = it->get<std::int64_t>();
        return value < 0 ? std::uint64_t{0} : static_cast<std::uint64_t>(value);
    }
    if (it->is_string()) {
        const std::string text = it->get<std::string>();
        std::uint64_t parsed = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
        if (ec == std::errc() && ptr == text.data() + text.size() && !text.empty()) {
            return parsed;
        }
    }
    return LinkError{ErrorCategory::Input, key + " must be a non-negative integer",
                     "invalid_param"};
}

// Message text may arrive as any JSON value; non-strings are stored serialized.
core::errors::Result<std::string> required_text(const json& params, const std::string& key) {
    const auto it = params.find(key);
    if (it == params.end() || it->is_null()) {
        return LinkError{ErrorCategory::Input, key + " is required", "missing_param"};
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    return store::dump_compact(*it);
}

core::errors::Result<std::string> required_session(const json& params,
                                                   const std::string& key) {
    auto value = required_string(params, key);
    if (core::errors::is_error(value)) {
        return core::errors::get_error(value);
    }
    return policy::validate_session_ref(key, core::errors::get_value(value));
}

json ok_result() {
    json result;
    result["ok"] = true;
    return result;
}

// --- tool schemas -----------------------------------------------------------

json prop(const std::string& type, const std::string& description = "") {
    json schema;
    schema["type"] = type;
    if (!description.empty()) {
        schema["description"] = description;
    }
    return schema;
}

json object_schema(const json& properties, const std::vector<std::string>& required) {
    json schema;
    schema["type"] = "object";
    schema["properties"] = properties.is_null() ? json::object() : properties;
    schema["required"] = required;
    return schema;
}

json enum_prop(const std::vector<std::string>& values, const std::string& fallback) {
    json schema = prop("string");
    schema["enum"] = values;
    schema["default"] = fallback;
    return schema;
}

json bool_prop(const bool fallback) {
    json schema = prop("boolean");
    schema["default"] = fallback;
    return schema;
}

}  // namespace

LinkMethods::LinkMethods(const core::config::RuntimeConfig& config,
                         tools::Multiplexer& multiplexer, LinkOptions options)
    : config_(config),
      mailbox_(config),
      registry_(config),
      multiplexer_(multiplexer),
      settings_(options.hook_client),
      options_(std::move(options)) {}

core::errors::Result<std::string> LinkMethods::require_caller() const {
    if (!config_.session_id.has_value() || config_.session_id->empty()) {
        return LinkError{ErrorCategory::Input,
                         "Caller session id is not set; must be run inside a tmux pane",
                         "missing_session_id",
                         "Set TMUX_PANE or AGENTLINK_SESSION_ID."};
    }
    return *config_.session_id;
}

std::string LinkMethods::caller_or_unknown() const {
    if (!config_.session_id.has_value() || config_.session_id->empty()) {
        return "unknown";
    }
    return *config_.session_id;
}

std::string LinkMethods::resolve_pane_path(const std::string& pane) {
    auto path = multiplexer_.current_path(pane);
    if (!core::errors::is_error(path) && !core::errors::get_value(path).empty()) {
        return core::errors::get_value(path);
    }
    std::error_code ec;
    const auto cwd = std::filesystem::current_path(ec);
    return ec ? std::string(".") : cwd.string();
}

core::errors::Result<json> LinkMethods::whoami(const json& /*params*/) {
    auto caller = require_caller();
    if (core::errors::is_error(caller)) {
        return core::errors::get_error(caller);
    }
    const std::string& id = core::errors::get_value(caller);

    auto father = registry_.get_father(id);
    if (core::errors::is_error(father)) {
        return core::errors::get_error(father);
    }

    json result;
    result["id"] = id;
    result["workdir"] = resolve_pane_path(id);
    if (const auto& parent = core::errors::get_value(father); parent.has_value()) {
        result["father"] = *parent;
    }
    return result;
}

core::errors::Result<json> LinkMethods::list(const json& /*params*/) {
    auto panes = multiplexer_.list_panes();
    if (core::errors::is_error(panes)) {
        return core::errors::get_error(panes);
    }
    auto children = registry_.list_children();
    if (core::errors::is_error(children)) {
        return core::errors::get_error(children);
    }

    std::unordered_map<std::string, std::string> fathers;
    for (const auto& entry : core::errors::get_value(children)) {
        fathers[entry.child] = entry.parent;
    }

    json result = json::array();
    for (const auto& pane : core::errors::get_value(panes)) {
        json item;
        item["id"] = pane.id;
        item["workdir"] = pane.workdir;
        item["title"] = pane.title;
        const auto father = fathers.find(pane.id);
        if (father != fathers.end() && !father->second.empty()) {
            item["father"] = father->second;
        }
        result.push_back(item);
    }
    return result;
}

core::errors::Result<json> LinkMethods::start_new_session(const json& params) {
    auto caller = require_caller();
    if (core::errors::is_error(caller)) {
        return core::errors::get_error(caller);
    }
    const std::string parent = core::errors::get_value(caller);

    auto workdir_param = optional_string(params, "workdir");
    auto policy_param = optional_string(params, "workdir_policy");
    auto add_hook = optional_bool(params, "add_hook", false);
    if (core::errors::is_error(workdir_param)) return core::errors::get_error(workdir_param);
    if (core::errors::is_error(policy_param)) return core::errors::get_error(policy_param);
    if (core::errors::is_error(add_hook)) return core::errors::get_error(add_hook);

    auto mode = policy::parse_workdir_mode(
        core::errors::get_value(policy_param).value_or("require_empty_existing"));
    if (core::errors::is_error(mode)) {
        return core::errors::get_error(mode);
    }

    // Hook parameters are checked before any pane exists.
    std::optional<hooks::HookMode> hook_mode;
    std::string called;
    std::optional<std::string> hook_text;
    if (core::errors::get_value(add_hook)) {
        auto mode_param = optional_string(params, "hook_mode");
        if (core::errors::is_error(mode_param)) return core::errors::get_error(mode_param);
        auto parsed_mode =
            hooks::parse_hook_mode(core::errors::get_value(mode_param).value_or("text"));
        if (core::errors::is_error(parsed_mode)) return core::errors::get_error(parsed_mode);
        hook_mode = core::errors::get_value(parsed_mode);

        auto called_param = optional_string(params, "calledagent");
        if (core::errors::is_error(called_param)) return core::errors::get_error(called_param);
        const auto& called_value = core::errors::get_value(called_param);
        if (!called_value.has_value() ||
            core::errors::is_error(policy::validate_session_ref("calledagent", *called_value))) {
            return LinkError{ErrorCategory::Input, "calledagent is required when add_hook=True",
                             "missing_param"};
        }
        called = *called_value;

        auto text_param = optional_string(params, "text");
        if (core::errors::is_error(text_param)) return core::errors::get_error(text_param);
        hook_text = core::errors::get_value(text_param);
        if (*hook_mode == hooks::HookMode::Text && !hook_text.has_value()) {
            return LinkError{ErrorCategory::Input, "text is required when hook_mode='text'",
                             "missing_param"};
        }
    }

    std::string requested = core::errors::get_value(workdir_param).value_or("");
    if (requested.empty()) {
        requested = resolve_pane_path(parent);
    }
    const policy::WorkdirPolicy workdir_policy(core::errors::get_value(mode));
    auto applied = workdir_policy.apply(requested);
    if (core::errors::is_error(applied)) {
        return core::errors::get_error(applied);
    }
    const std::filesystem::path workdir = core::errors::get_value(applied);

    auto split = multiplexer_.split_new_pane(parent, workdir.string(), config_.agent_command,
                                             tools::SplitDirection::Down);
    if (core::errors::is_error(split)) {
        return core::errors::get_error(split);
    }
    const std::string child = core::errors::get_value(split);
    LOG_INFO("Spawned session " + child + " under " + parent + " in " + workdir.string());

    auto titled = multiplexer_.set_title(child, "agent:" + child);
    if (core::errors::is_error(titled)) {
        LOG_WARN("Unable to title pane " + child + ": " +
                 core::errors::get_error(titled).message);
    }

    // Project settings are best effort: the session already exists.
    auto ensured = settings_.ensure_project_settings(workdir);
    if (core::errors::is_error(ensured)) {
        LOG_WARN("Unable to write project settings: " + core::errors::get_error(ensured).message);
    } else if (hook_mode.has_value()) {
        auto commands = hooks::build_stop_hook_commands(*hook_mode, called, hook_text, child,
                                                        settings_.client());
        if (core::errors::is_error(commands)) {
            LOG_WARN("Unable to build hooks: " + core::errors::get_error(commands).message);
        } else {
            auto written =
                settings_.overwrite_with_hooks(workdir, core::errors::get_value(commands));
            if (core::errors::is_error(written)) {
                LOG_WARN("Unable to write hooks: " + core::errors::get_error(written).message);
            }
        }
    } else {
        auto removed = settings_.remove_link_hooks(workdir);
        if (core::errors::is_error(removed)) {
            LOG_WARN("Unable to clean hooks: " + core::errors::get_error(removed).message);
        }
    }

    auto registered = registry_.set_child(parent, child, workdir.string());
    if (core::errors::is_error(registered)) {
        return core::errors::get_error(registered);
    }

    json result;
    result["id"] = child;
    return result;
}

core::errors::Result<json> LinkMethods::get_screenshot_from(const json& params) {
    auto target = required_session(params, "target_id");
    if (core::errors::is_error(target)) {
        return core::errors::get_error(target);
    }

    auto text = multiplexer_.capture_text(core::errors::get_value(target), std::nullopt);
    if (core::errors::is_error(text)) {
        auto err = core::errors::get_error(text);
        err.message = "tmux capture failed: " + err.message;
        return err;
    }

    json result;
    result["text"] = core::errors::get_value(text);
    return result;
}

core::errors::Result<json> LinkMethods::send_message_to(const json& params) {
    auto target = required_session(params, "target_id");
    if (core::errors::is_error(target)) {
        return core::errors::get_error(target);
    }
    auto text = required_text(params, "text");
    if (core::errors::is_error(text)) {
        return core::errors::get_error(text);
    }

    const std::string sender = caller_or_unknown();
    auto appended = mailbox_.append(core::errors::get_value(target), sender,
                                    "From " + sender + ": " + core::errors::get_value(text));
    if (core::errors::is_error(appended)) {
        return core::errors::get_error(appended);
    }
    return ok_result();
}

core::errors::Result<json> LinkMethods::inject_input_to(const json& params) {
    auto target = required_session(params, "target_id");
    if (core::errors::is_error(target)) return core::errors::get_error(target);
    auto text = required_text(params, "text");
    if (core::errors::is_error(text)) return core::errors::get_error(text);
    auto with_from = optional_bool(params, "with_from", false);
    if (core::errors::is_error(with_from)) return core::errors::get_error(with_from);
    auto submit = optional_bool(params, "submit", true);
    if (core::errors::is_error(submit)) return core::errors::get_error(submit);
    auto prefix = optional_string(params, "prefix");
    if (core::errors::is_error(prefix)) return core::errors::get_error(prefix);
    auto mode = optional_string(params, "mode");
    if (core::errors::is_error(mode)) return core::errors::get_error(mode);

    const std::string mode_value = core::errors::get_value(mode).value_or("append");
    if (mode_value != "append" && mode_value != "replace") {
        return LinkError{ErrorCategory::Input, "mode must be 'append' or 'replace'",
                         "invalid_param"};
    }

    const std::string& pane = core::errors::get_value(target);
    std::string payload = core::errors::get_value(text);
    const auto& prefix_value = core::errors::get_value(prefix);
    if (prefix_value.has_value() && !prefix_value->empty()) {
        payload = *prefix_value + payload;
    } else if (core::errors::get_value(with_from)) {
        payload = "From " + caller_or_unknown() + ": " + payload;
    }

    if (mode_value == "replace") {
        auto cleared = multiplexer_.send_clear_line(pane);
        if (core::errors::is_error(cleared)) return core::errors::get_error(cleared);
    }

    // Paste through a named buffer so the text arrives verbatim.
    const std::string buffer =
        core::config::generate_token("agentlink_" + std::to_string(getpid()) + "_");
    auto stored = multiplexer_.set_buffer(buffer, payload);
    if (core::errors::is_error(stored)) return core::errors::get_error(stored);
    auto pasted = multiplexer_.paste_buffer(buffer, pane, true);
    if (core::errors::is_error(pasted)) return core::errors::get_error(pasted);

    if (core::errors::get_value(submit)) {
        std::this_thread::sleep_for(options_.submit_delay);
        auto entered = multiplexer_.send_enter(pane);
        if (core::errors::is_error(entered)) return core::errors::get_error(entered);
    }
    return ok_result();
}

core::errors::Result<json> LinkMethods::add_callback_hook(const json& params) {
    auto hooked = optional_string(params, "hookedagent");
    auto called = optional_string(params, "calledagent");
    if (core::errors::is_error(hooked)) return core::errors::get_error(hooked);
    if (core::errors::is_error(called)) return core::errors::get_error(called);
    const auto& hooked_value = core::errors::get_value(hooked);
    const auto& called_value = core::errors::get_value(called);
    if (!hooked_value.has_value() || hooked_value->empty() || !called_value.has_value() ||
        called_value->empty()) {
        return LinkError{ErrorCategory::Input, "hookedagent and calledagent are required",
                         "missing_param"};
    }

    auto mode_param = optional_string(params, "mode");
    if (core::errors::is_error(mode_param)) return core::errors::get_error(mode_param);
    auto mode = hooks::parse_hook_mode(core::errors::get_value(mode_param).value_or("text"));
    if (core::errors::is_error(mode)) return core::errors::get_error(mode);

    auto text = optional_string(params, "text");
    if (core::errors::is_error(text)) return core::errors::get_error(text);
    if (core::errors::get_value(mode) == hooks::HookMode::Text &&
        !core::errors::get_value(text).has_value()) {
        return LinkError{ErrorCategory::Input, "text is required when mode='text'",
                         "missing_param"};
    }

    auto workdir = optional_string(params, "hooked_workdir");
    if (core::errors::is_error(workdir)) return core::errors::get_error(workdir);
    const auto& workdir_value = core::errors::get_value(workdir);
    if (!workdir_value.has_value() ||
        core::errors::is_error(policy::validate_session_ref("hooked_workdir", *workdir_value))) {
        return LinkError{ErrorCategory::Input,
                         "'hooked_workdir' is required and must be the absolute path of the "
                         "hooked agent's project root",
                         "missing_param"};
    }

    auto commands = hooks::build_stop_hook_commands(
        core::errors::get_value(mode), *called_value, core::errors::get_value(text),
        *hooked_value, settings_.client());
    if (core::errors::is_error(commands)) return core::errors::get_error(commands);

    auto merged = settings_.append_stop_hooks(*workdir_value, core::errors::get_value(commands));
    if (core::errors::is_error(merged)) return core::errors::get_error(merged);
    const auto& report = core::errors::get_value(merged);

    json result;
    result["path"] = report.path.string();
    result["added"] = report.added;
    result["skipped"] = report.skipped;
    return result;
}

core::errors::Result<json> LinkMethods::check_message_box(const json& params) {
    auto caller = require_caller();
    if (core::errors::is_error(caller)) {
        return core::errors::get_error(caller);
    }
    auto since = optional_cursor(params, "since_id");
    if (core::errors::is_error(since)) {
        return core::errors::get_error(since);
    }

    auto snapshot = mailbox_.read_since(core::errors::get_value(caller),
                                        core::errors::get_value(since));
    if (core::errors::is_error(snapshot)) {
        return core::errors::get_error(snapshot);
    }
    const auto& inbox = core::errors::get_value(snapshot);

    json messages = json::array();
    for (const auto& message : inbox.messages) {
        messages.push_back(store::to_json(message));
    }
    json result;
    result["messages"] = messages;
    result["since_id"] = inbox.max_id;
    return result;
}

core::errors::Result<json> LinkMethods::kill_pane_and_agent(const json& params) {
    auto target = required_session(params, "target_id");
    if (core::errors::is_error(target)) {
        return core::errors::get_error(target);
    }
    auto killed = multiplexer_.kill_pane(core::errors::get_value(target));
    if (core::errors::is_error(killed)) {
        auto err = core::errors::get_error(killed);
        err.message = "tmux kill-pane failed: " + err.message;
        return err;
    }
    LOG_INFO("Killed pane " + core::errors::get_value(target));
    return ok_result();
}

void LinkMethods::register_all(Dispatcher& dispatcher) {
    const json pane_ref = prop("string", "Pane id like '%7'.");

    auto bind = [this](core::errors::Result<json> (LinkMethods::*method)(const json&)) {
        return [this, method](const json& params) { return (this->*method)(params); };
    };

    dispatcher.register_method(
        {"whoami", "Return caller pane id, workdir, and father if known.",
         object_schema(json::object(), {})},
        bind(&LinkMethods::whoami));

    dispatcher.register_method(
        {"list", "List all tmux panes with workdir, title, and optional father.",
         object_schema(json::object(), {})},
        bind(&LinkMethods::list));

    json start_props;
    start_props["workdir"] = prop("string");
    start_props["workdir_policy"] = enum_prop(
        {"require_empty_existing", "use_existing", "create_new", "create_or_empty"},
        "require_empty_existing");
    start_props["add_hook"] = bool_prop(false);
    start_props["hook_mode"] = enum_prop({"text", "screenshot"}, "text");
    start_props["calledagent"] = pane_ref;
    start_props["text"] = prop("string");
    dispatcher.register_method(
        {"start_new_session_and_get_return_id",
         "Create a new agent (tmux pane) next to the caller; returns the pane id and sets "
         "its title to 'agent:<id>'. Hooks only take effect for sessions started after "
         "they are written, so pass add_hook at creation time.",
         object_schema(start_props, {})},
        bind(&LinkMethods::start_new_session));

    json target_props;
    target_props["target_id"] = pane_ref;
    dispatcher.register_method(
        {"get_screenshot_from",
         "Capture the full text buffer (not an image) of a target tmux pane.",
         object_schema(target_props, {"target_id"})},
        bind(&LinkMethods::get_screenshot_from));

    json send_props;
    send_props["target_id"] = prop("string");
    send_props["text"] = prop("string");
    dispatcher.register_method(
        {"send_message_to",
         "Passive delivery ONLY: enqueue a message into the target inbox. The target must "
         "call check_message_box to see it. Use inject_input_to for immediate delivery.",
         object_schema(send_props, {"target_id", "text"})},
        bind(&LinkMethods::send_message_to));

    json inject_props;
    inject_props["target_id"] = pane_ref;
    inject_props["text"] = prop("string");
    inject_props["with_from"] = bool_prop(false);
    inject_props["submit"] = bool_prop(true);
    inject_props["mode"] = enum_prop({"append", "replace"}, "append");
    dispatcher.register_method(
        {"inject_input_to",
         "Active delivery: write text to the target input and optionally submit. Optionally "
         "prepend 'From <sender_id>:' via with_from. Modes: append/replace.",
         object_schema(inject_props, {"target_id", "text"})},
        bind(&LinkMethods::inject_input_to));

    json inbox_props;
    json since = prop("integer");
    since["default"] = 0;
    inbox_props["since_id"] = since;
    dispatcher.register_method(
        {"check_message_box",
         "Pull inbox messages for the caller pane with id greater than since_id. Use the "
         "returned since_id as the next cursor.",
         object_schema(inbox_props, {})},
        bind(&LinkMethods::check_message_box));

    json hook_props;
    hook_props["hookedagent"] = prop("string", "Pane id of the agent whose settings are modified.");
    hook_props["hooked_workdir"] =
        prop("string", "Absolute project root of the hooked agent (contains .claude/).");
    hook_props["calledagent"] = prop("string", "Pane id that receives the callback.");
    hook_props["mode"] = enum_prop({"text", "screenshot"}, "text");
    hook_props["text"] = prop("string");
    dispatcher.register_method(
        {"add_callback_hook_when_completed",
         "Append a project Stop hook (text or screenshot) into settings.local.json. Running "
         "sessions do not pick it up until restarted.",
         object_schema(hook_props, {"hookedagent", "hooked_workdir", "calledagent"})},
        bind(&LinkMethods::add_callback_hook));

    dispatcher.register_method(
        {"kill_pane_and_agent",
         "Kill a tmux pane by id; any agent running inside is terminated with it.",
         object_schema(target_props, {"target_id"})},
        bind(&LinkMethods::kill_pane_and_agent));
}

}  // namespace agentlink::rpc
