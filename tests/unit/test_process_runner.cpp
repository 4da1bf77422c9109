#include <string>
#include <gtest/gtest.h>
#include "core/errors/link_errors.hpp"
#include "tools/process_runner.hpp"

namespace {

using agentlink::core::errors::get_error;
using agentlink::core::errors::get_value;
using agentlink::core::errors::is_error;
using agentlink::tools::ProcessRequest;
using agentlink::tools::run_process;

TEST(ProcessRunnerTest, CapturesStdoutAndExitCode) {
    ProcessRequest request;
    request.argv = {"printf", "hello runner"};

    auto result = run_process(request);
    ASSERT_FALSE(is_error(result));
    const auto& capture = get_value(result);
    EXPECT_EQ(capture.exit_code, 0);
    EXPECT_FALSE(capture.timed_out);
    EXPECT_EQ(capture.stdout_text, "hello runner");
    EXPECT_GE(capture.duration_ms, 0.0);
}

TEST(ProcessRunnerTest, ReportsNonZeroExitAndStderr) {
    ProcessRequest request;
    request.argv = {"sh", "-c", "echo oops >&2; exit 3"};

    auto result = run_process(request);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).exit_code, 3);
    EXPECT_EQ(get_value(result).stderr_text, "oops\n");
}

TEST(ProcessRunnerTest, PassesArgumentsWithoutShellInterpretation) {
    ProcessRequest request;
    request.argv = {"printf", "%s|", "a b", "$HOME", "'q'"};

    auto result = run_process(request);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).stdout_text, "a b|$HOME|'q'|");
}

TEST(ProcessRunnerTest, MissingBinaryExitsWith127) {
    ProcessRequest request;
    request.argv = {"agentlink-definitely-not-installed"};

    auto result = run_process(request);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).exit_code, 127);
}

TEST(ProcessRunnerTest, KillsProcessAfterTimeout) {
    ProcessRequest request;
    request.argv = {"sleep", "5"};
    request.timeout_ms = 100;

    auto result = run_process(request);
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).timed_out);
    EXPECT_LT(get_value(result).duration_ms, 4000.0);
}

TEST(ProcessRunnerTest, RejectsEmptyCommand) {
    auto result = run_process(ProcessRequest{});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "empty_command");
}

}  // namespace
