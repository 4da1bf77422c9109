#include "client/rpc_client.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <fcntl.h>
#include <poll.h>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>
#include "core/logging/logger.hpp"
#include "protocol/rpc_contract.hpp"
#include "store/json_store.hpp"

namespace agentlink::client {

using core::errors::ErrorCategory;
using core::errors::LinkError;
using core::errors::Ok;
using nlohmann::json;

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        static_cast<void>(close(fd));
        fd = -1;
    }
}

void close_pair(int fds[2]) {
    if (fds[0] >= 0) static_cast<void>(close(fds[0]));
    if (fds[1] >= 0) static_cast<void>(close(fds[1]));
}

json client_initialize_params() {
    json params;
    params["protocolVersion"] = "2024-11-05";
    params["capabilities"]["roots"]["listChanged"] = true;
    params["capabilities"]["sampling"] = json::object();
    params["clientInfo"]["name"] = "agentlink-call";
    params["clientInfo"]["version"] = "0.1.0";
    return params;
}

}  // namespace

std::vector<std::string> split_command(const std::string& command) {
    std::vector<std::string> parts;
    std::istringstream stream(command);
    std::string part;
    while (stream >> part) {
        parts.push_back(part);
    }
    return parts;
}

RpcClient::RpcClient(const std::uint32_t timeout_seconds)
    : timeout_seconds_(timeout_seconds) {}

RpcClient::~RpcClient() {
    disconnect();
}

core::errors::Result<Ok> RpcClient::connect(const std::string& server_command) {
    if (connected()) {
        return LinkError{ErrorCategory::Internal, "Client is already connected",
                         "already_connected"};
    }
    const auto args = split_command(server_command);
    if (args.empty()) {
        return LinkError{ErrorCategory::Input, "Server command cannot be empty.",
                         "empty_command"};
    }

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    if (pipe(stdin_pipe) != 0 || pipe(stdout_pipe) != 0) {
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        return LinkError{ErrorCategory::Internal, "Failed to create server pipes.",
                         "pipe_creation_failed"};
    }

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    const pid_t pid = fork();
    if (pid < 0) {
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        return LinkError{ErrorCategory::Internal, "Failed to fork server process.",
                         "fork_failed"};
    }
    if (pid == 0) {
        static_cast<void>(dup2(stdin_pipe[0], STDIN_FILENO));
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        execvp(argv[0], argv.data());
        _exit(127);
    }

    static_cast<void>(close(stdin_pipe[0]));
    static_cast<void>(close(stdout_pipe[1]));
    pid_ = pid;
    to_server_ = stdin_pipe[1];
    from_server_ = stdout_pipe[0];
    static_cast<void>(fcntl(to_server_, F_SETFD, FD_CLOEXEC));
    static_cast<void>(fcntl(from_server_, F_SETFD, FD_CLOEXEC));
    LOG_DEBUG("Spawned server pid " + std::to_string(pid_) + ": " + server_command);

    auto initialized = call("initialize", client_initialize_params());
    if (core::errors::is_error(initialized)) {
        auto err = core::errors::get_error(initialized);
        disconnect();
        err.message = "initialize failed: " + err.message;
        return err;
    }
    auto notified = notify("notifications/initialized", json::object());
    if (core::errors::is_error(notified)) {
        disconnect();
        return core::errors::get_error(notified);
    }
    return Ok{};
}

core::errors::Result<json> RpcClient::call(const std::string& method, const json& params) {
    if (!connected()) {
        return LinkError{ErrorCategory::Internal, "Server is not connected",
                         "not_connected"};
    }
    const std::string id = next_id();
    const json request = protocol::make_request(id, method, params);
    auto sent = write_line(store::dump_compact(request));
    if (core::errors::is_error(sent)) {
        return core::errors::get_error(sent);
    }

    auto line = read_line();
    if (core::errors::is_error(line)) {
        return core::errors::get_error(line);
    }
    const std::string& text = core::errors::get_value(line);
    LOG_DEBUG("Received: " + text);

    json response = json::parse(text, nullptr, false);
    if (response.is_discarded() || !response.is_object()) {
        return LinkError{ErrorCategory::Protocol, "Invalid JSON response: " + text,
                         "invalid_response"};
    }

    if (response.contains("error")) {
        const json& error = response["error"];
        std::string code = "unknown";
        std::string message = "Unknown error";
        if (error.is_object()) {
            if (error.contains("code")) {
                code = error["code"].is_string() ? error["code"].get<std::string>()
                                                 : error["code"].dump();
            }
            if (error.contains("message") && error["message"].is_string()) {
                message = error["message"].get<std::string>();
            }
            if (error.contains("data")) {
                const json& data = error["data"];
                message += " - " + (data.is_string() ? data.get<std::string>()
                                                     : store::dump_compact(data));
            }
        }
        return LinkError{ErrorCategory::Protocol, "[" + code + "]: " + message,
                         "rpc_" + code};
    }
    return response;
}

core::errors::Result<Ok> RpcClient::notify(const std::string& method, const json& params) {
    if (!connected()) {
        return LinkError{ErrorCategory::Internal, "Server is not connected",
                         "not_connected"};
    }
    return write_line(store::dump_compact(protocol::make_notification(method, params)));
}

void RpcClient::disconnect() {
    close_fd(to_server_);
    close_fd(from_server_);
    if (pid_ > 0) {
        static_cast<void>(kill(pid_, SIGTERM));
        int status = 0;
        while (waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
        }
        pid_ = -1;
    }
    pending_.clear();
}

std::string RpcClient::next_id() {
    ++request_counter_;
    return std::to_string(request_counter_);
}

core::errors::Result<Ok> RpcClient::write_line(const std::string& line) {
    LOG_DEBUG("Sending: " + line);
    const std::string payload = line + "\n";
    std::size_t written = 0;
    while (written < payload.size()) {
        const ssize_t n = write(to_server_, payload.data() + written, payload.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return LinkError{ErrorCategory::Execution,
                             "Connection error: unable to write to server",
                             "connection_lost"};
        }
        written += static_cast<std::size_t>(n);
    }
    return Ok{};
}

core::errors::Result<std::string> RpcClient::read_line() {
    const auto deadline =
        std::chrono::steady_clock::now() + std::chrono::seconds(timeout_seconds_);

    while (true) {
        const auto newline = pending_.find('\n');
        if (newline != std::string::npos) {
            std::string line = pending_.substr(0, newline);
            pending_.erase(0, newline + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            return line;
        }

        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                                   deadline - std::chrono::steady_clock::now())
                                   .count();
        if (remaining <= 0) {
            return LinkError{ErrorCategory::Execution,
                             "Server response timed out (" +
                                 std::to_string(timeout_seconds_) + "s)",
                             "response_timeout"};
        }

        pollfd fd{};
        fd.fd = from_server_;
        fd.events = POLLIN;
        const int ready = poll(&fd, 1, static_cast<int>(remaining));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            return LinkError{ErrorCategory::Internal, "poll failed on server pipe",
                             "poll_failed"};
        }
        if (ready == 0) {
            continue;
        }

        char buffer[4096];
        const ssize_t n = read(from_server_, buffer, sizeof(buffer));
        if (n > 0) {
            pending_.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
            continue;
        }
        return LinkError{ErrorCategory::Execution, "Server connection closed",
                         "connection_lost"};
    }
}

core::errors::Result<json> relay_screenshot(RpcClient& client, const std::string& from,
                                            const std::string& to) {
    json capture_params;
    capture_params["target_id"] = from;
    auto captured = client.call("get_screenshot_from", capture_params);
    if (core::errors::is_error(captured)) {
        return core::errors::get_error(captured);
    }

    const json& response = core::errors::get_value(captured);
    std::string body;
    if (response.contains("result")) {
        const json& result = response["result"];
        if (result.is_object() && result.contains("text") && result["text"].is_string()) {
            body = result["text"].get<std::string>();
        } else {
            body = result.is_string() ? result.get<std::string>() : store::dump_compact(result);
        }
    }

    json inject_params;
    inject_params["target_id"] = to;
    inject_params["text"] = "[screenshot from " + from + "]\n" + body;
    return client.call("inject_input_to", inject_params);
}

}  // namespace agentlink::client
