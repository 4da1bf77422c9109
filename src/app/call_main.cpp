#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>
#include "app/cli_parser.hpp"
#include "client/rpc_client.hpp"
#include "core/config/runtime_config.hpp"
#include "core/errors/link_errors.hpp"
#include "core/logging/logger.hpp"

namespace {

agentlink::core::errors::Result<nlohmann::json> run_once(
    const agentlink::app::cli::CallRequest& req) {
    agentlink::client::RpcClient client(req.timeout_seconds);
    auto connected = client.connect(req.server);
    if (agentlink::core::errors::is_error(connected)) {
        return agentlink::core::errors::get_error(connected);
    }
    LOG_INFO("Connected to server: " + req.server);

    if (req.relay.has_value()) {
        return agentlink::client::relay_screenshot(client, req.relay->from, req.relay->to);
    }
    return client.call(*req.method, req.params);
}

}  // namespace

int main(int argc, char* argv[]) {
    // A dead server must surface as a write error, not kill the client.
    std::signal(SIGPIPE, SIG_IGN);

    auto parsed = agentlink::app::cli::parse_and_validate(
        argc, argv, agentlink::core::config::process_environment());
    if (agentlink::core::errors::is_error(parsed)) {
        const auto& err = agentlink::core::errors::get_error(parsed);
        LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_ERROR("Hint: " + err.hint);
        }
        return 2;
    }
    const auto& req = agentlink::core::errors::get_value(parsed);

    auto& logger = agentlink::core::logging::Logger::get();
    logger.set_session_id("call");
    if (req.verbose) {
        logger.set_min_level(agentlink::core::logging::LogLevel::DEBUG);
    }

    for (std::uint32_t attempt = 0; attempt < req.retry; ++attempt) {
        if (attempt > 0) {
            LOG_INFO("Retry " + std::to_string(attempt) + "...");
        }

        auto response = run_once(req);
        if (!agentlink::core::errors::is_error(response)) {
            auto rendered = agentlink::app::cli::format_response(
                req.output, agentlink::core::errors::get_value(response));
            if (agentlink::core::errors::is_error(rendered)) {
                LOG_ERROR(agentlink::core::errors::get_error(rendered).message);
                return 1;
            }
            std::cout << agentlink::core::errors::get_value(rendered) << std::endl;
            return 0;
        }

        const auto& err = agentlink::core::errors::get_error(response);
        LOG_INFO("Attempt " + std::to_string(attempt + 1) + " failed: " + err.message);
        if (attempt + 1 == req.retry) {
            LOG_ERROR("Call failed [" + err.code + "]: " + err.message);
            return 1;
        }
        std::this_thread::sleep_for(std::chrono::seconds(1));
    }
    return 1;
}
