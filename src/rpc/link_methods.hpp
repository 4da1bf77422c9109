#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/config/runtime_config.hpp"
#include "core/errors/link_errors.hpp"
#include "hooks/settings_writer.hpp"
#include "rpc/dispatcher.hpp"
#include "store/mailbox.hpp"
#include "store/registry.hpp"
#include "tools/multiplexer.hpp"

namespace agentlink::rpc {

struct LinkOptions {
    // Pause between pasting injected text and pressing Enter.
    std::chrono::milliseconds submit_delay{100};
    hooks::HookClient hook_client;
};

// The direct method namespace: messaging, discovery, session spawning and
// pane control. Each method is a synchronous handler over the store and the
// multiplexer.
class LinkMethods {
public:
    LinkMethods(const core::config::RuntimeConfig& config, tools::Multiplexer& multiplexer,
                LinkOptions options = {});

    // Registers every method below, with its tool description and input schema.
    void register_all(Dispatcher& dispatcher);

    core::errors::Result<nlohmann::json> whoami(const nlohmann::json& params);
    core::errors::Result<nlohmann::json> list(const nlohmann::json& params);
    core::errors::Result<nlohmann::json> start_new_session(const nlohmann::json& params);
    core::errors::Result<nlohmann::json> get_screenshot_from(const nlohmann::json& params);
    core::errors::Result<nlohmann::json> send_message_to(const nlohmann::json& params);
    core::errors::Result<nlohmann::json> inject_input_to(const nlohmann::json& params);
    core::errors::Result<nlohmann::json> add_callback_hook(const nlohmann::json& params);
    core::errors::Result<nlohmann::json> check_message_box(const nlohmann::json& params);
    core::errors::Result<nlohmann::json> kill_pane_and_agent(const nlohmann::json& params);

    const store::Mailbox& mailbox() const { return mailbox_; }
    const store::Registry& registry() const { return registry_; }

private:
    core::errors::Result<std::string> require_caller() const;
    std::string caller_or_unknown() const;
    std::string resolve_pane_path(const std::string& pane);

    core::config::RuntimeConfig config_;
    store::Mailbox mailbox_;
    store::Registry registry_;
    tools::Multiplexer& multiplexer_;
    hooks::SettingsWriter settings_;
    LinkOptions options_;
};

}  // namespace agentlink::rpc
