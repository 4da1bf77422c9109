#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "core/errors/link_errors.hpp"

namespace agentlink::tools {

struct ProcessRequest {
    std::vector<std::string> argv;  // argv[0] is looked up on PATH
    std::uint32_t timeout_ms = 10000;
};

struct ProcessCapture {
    int exit_code = -1;
    bool timed_out = false;
    std::string stdout_text;
    std::string stderr_text;
    double duration_ms = 0.0;
};

// Runs argv without a shell, capturing both output streams. Fails only when the
// process could not be started; a non-zero exit is reported in the capture.
core::errors::Result<ProcessCapture> run_process(const ProcessRequest& request);

}  // namespace agentlink::tools
