#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <sys/types.h>
#include <nlohmann/json.hpp>
#include "core/errors/link_errors.hpp"

namespace agentlink::client {

// Splits a server command line on whitespace. No quoting is honoured.
std::vector<std::string> split_command(const std::string& command);

// Talks JSON-RPC to a server it spawns as a child process, one line per
// message over the child's stdin/stdout. The child's stderr is inherited.
class RpcClient {
public:
    explicit RpcClient(std::uint32_t timeout_seconds = 30);
    ~RpcClient();
    RpcClient(const RpcClient&) = delete;
    RpcClient& operator=(const RpcClient&) = delete;

    // Spawns the server, performs initialize and sends
    // notifications/initialized.
    core::errors::Result<core::errors::Ok> connect(const std::string& server_command);

    // Sends a request and waits for its response line. An error response is
    // returned as a LinkError with code "rpc_<code>"; the full response
    // object is returned otherwise.
    core::errors::Result<nlohmann::json> call(const std::string& method,
                                              const nlohmann::json& params);

    core::errors::Result<core::errors::Ok> notify(const std::string& method,
                                                  const nlohmann::json& params);

    // Terminates and reaps the server. Safe to call twice.
    void disconnect();

    bool connected() const { return pid_ > 0; }

private:
    std::string next_id();
    core::errors::Result<core::errors::Ok> write_line(const std::string& line);
    core::errors::Result<std::string> read_line();

    std::uint32_t timeout_seconds_;
    std::uint64_t request_counter_ = 0;
    pid_t pid_ = -1;
    int to_server_ = -1;
    int from_server_ = -1;
    std::string pending_;
};

// Copies the pane text of `from` into the input of `to`, prefixed with
// "[screenshot from <from>]".
core::errors::Result<nlohmann::json> relay_screenshot(RpcClient& client,
                                                      const std::string& from,
                                                      const std::string& to);

}  // namespace agentlink::client
