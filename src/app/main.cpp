#include <iostream>
#include <string>
#include "core/config/runtime_config.hpp"
#include "core/errors/link_errors.hpp"
#include "core/logging/logger.hpp"
#include "rpc/dispatcher.hpp"
#include "rpc/link_methods.hpp"
#include "tools/tmux_multiplexer.hpp"

int main() {
    std::ios::sync_with_stdio(false);

    // 1. Resolve configuration from the process environment
    auto loaded = agentlink::core::config::load_runtime_config(
        agentlink::core::config::process_environment());
    if (agentlink::core::errors::is_error(loaded)) {
        const auto& err = agentlink::core::errors::get_error(loaded);
        LOG_ERROR("Configuration error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_ERROR("Hint: " + err.hint);
        }
        return 2;
    }
    const auto& config = agentlink::core::errors::get_value(loaded);

    // 2. Register the caller identity with the global logger
    auto& logger = agentlink::core::logging::Logger::get();
    logger.set_min_level(config.log_level);
    logger.set_session_id(config.session_id.value_or("no-session"));

    auto layout = agentlink::core::config::ensure_runtime_layout(config);
    if (agentlink::core::errors::is_error(layout)) {
        const auto& err = agentlink::core::errors::get_error(layout);
        LOG_ERROR("Runtime root unavailable [" + err.code + "]: " + err.message);
        return 3;
    }
    LOG_INFO("Runtime root: " + agentlink::core::errors::get_value(layout).string());

    // 3. Wire the method surface and serve stdin until EOF
    agentlink::tools::TmuxMultiplexer tmux(config.history_lines);
    agentlink::rpc::LinkMethods methods(config, tmux);
    agentlink::rpc::Dispatcher dispatcher;
    methods.register_all(dispatcher);

    static_cast<void>(dispatcher.serve(std::cin, std::cout));
    return 0;
}
