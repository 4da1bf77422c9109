#include "tools/process_runner.hpp"

#include <cerrno>
#include <chrono>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace agentlink::tools {

using core::errors::ErrorCategory;
using core::errors::LinkError;

namespace {

struct OutputStream {
    int fd = -1;
    std::string* sink = nullptr;

    bool open() const { return fd >= 0; }

    void finish() {
        static_cast<void>(close(fd));
        fd = -1;
    }

    // Reads whatever is available without blocking; closes on EOF or error.
    void drain() {
        char chunk[4096];
        while (open()) {
            const ssize_t got = read(fd, chunk, sizeof(chunk));
            if (got > 0) {
                sink->append(chunk, static_cast<std::size_t>(got));
            } else if (got < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
                return;
            } else {
                finish();
            }
        }
    }
};

void close_fds(const int (&fds)[2]) {
    for (const int fd : fds) {
        if (fd >= 0) {
            static_cast<void>(close(fd));
        }
    }
}

int decode_status(const int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

double millis_since(const std::chrono::steady_clock::time_point started) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started)
        .count();
}

}  // namespace

core::errors::Result<ProcessCapture> run_process(const ProcessRequest& request) {
    if (request.argv.empty() || request.argv.front().empty()) {
        return LinkError{ErrorCategory::Input, "Command cannot be empty.", "empty_command"};
    }

    int out_fds[2] = {-1, -1};
    int err_fds[2] = {-1, -1};
    if (pipe(out_fds) != 0 || pipe(err_fds) != 0) {
        close_fds(out_fds);
        close_fds(err_fds);
        return LinkError{ErrorCategory::Internal, "Failed to create process pipes.",
                         "pipe_creation_failed"};
    }

    std::vector<char*> args;
    for (const auto& arg : request.argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    const auto started = std::chrono::steady_clock::now();
    const pid_t child = fork();
    if (child < 0) {
        close_fds(out_fds);
        close_fds(err_fds);
        return LinkError{ErrorCategory::Internal, "Failed to fork process.", "fork_failed"};
    }
    if (child == 0) {
        static_cast<void>(dup2(out_fds[1], STDOUT_FILENO));
        static_cast<void>(dup2(err_fds[1], STDERR_FILENO));
        close_fds(out_fds);
        close_fds(err_fds);
        execvp(args[0], args.data());
        _exit(127);
    }

    static_cast<void>(close(out_fds[1]));
    static_cast<void>(close(err_fds[1]));

    ProcessCapture capture;
    OutputStream streams[2] = {{out_fds[0], &capture.stdout_text},
                               {err_fds[0], &capture.stderr_text}};
    for (const auto& stream : streams) {
        static_cast<void>(fcntl(stream.fd, F_SETFL, fcntl(stream.fd, F_GETFL, 0) | O_NONBLOCK));
    }

    int status = 0;
    bool reaped = false;
    while (!reaped || streams[0].open() || streams[1].open()) {
        if (!reaped && !capture.timed_out && request.timeout_ms > 0 &&
            millis_since(started) > static_cast<double>(request.timeout_ms)) {
            capture.timed_out = true;
            static_cast<void>(kill(child, SIGKILL));
        }

        pollfd waiting[2];
        nfds_t count = 0;
        for (const auto& stream : streams) {
            if (stream.open()) {
                waiting[count++] = pollfd{stream.fd, POLLIN, 0};
            }
        }
        static_cast<void>(poll(count > 0 ? waiting : nullptr, count, count > 0 ? 50 : 10));

        for (auto& stream : streams) {
            stream.drain();
        }
        if (!reaped && waitpid(child, &status, WNOHANG) == child) {
            reaped = true;
        }
    }

    capture.exit_code = decode_status(status);
    capture.duration_ms = millis_since(started);
    return capture;
}

}  // namespace agentlink::tools
