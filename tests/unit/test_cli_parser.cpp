#include <filesystem>
#include <fstream>
#include <map>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "app/cli_parser.hpp"
#include "core/config/token.hpp"
#include "core/errors/link_errors.hpp"

namespace {

using agentlink::app::cli::CallRequest;
using agentlink::app::cli::expand_env_vars;
using agentlink::app::cli::format_response;
using agentlink::app::cli::OutputMode;
using agentlink::app::cli::parse_and_validate;
using agentlink::core::config::Environment;
using agentlink::core::errors::ErrorCategory;
using agentlink::core::errors::get_error;
using agentlink::core::errors::get_value;
using agentlink::core::errors::is_error;
using nlohmann::json;

Environment fake_env(const std::map<std::string, std::string>& values = {}) {
    return [values](const std::string& name) -> std::optional<std::string> {
        const auto it = values.find(name);
        if (it == values.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

agentlink::core::errors::Result<CallRequest> parse_tokens(
    const std::vector<std::string>& tokens, const Environment& env = fake_env()) {
    std::vector<std::string> owned_args;
    owned_args.reserve(tokens.size() + 1);
    owned_args.emplace_back("agentlink-call");
    for (const auto& token : tokens) {
        owned_args.push_back(token);
    }

    std::vector<char*> argv;
    argv.reserve(owned_args.size());
    for (auto& arg : owned_args) {
        argv.push_back(arg.data());
    }

    return parse_and_validate(static_cast<int>(argv.size()), argv.data(), env);
}

TEST(CliParserTest, FailsWhenNoArguments) {
    auto result = parse_tokens({});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(result).code, "missing_command");
}

TEST(CliParserTest, FailsWhenServerMissing) {
    auto result = parse_tokens({"--method", "list"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_required_flag");
}

TEST(CliParserTest, FailsWhenMethodAndRelayBothMissingOrPresent) {
    auto neither = parse_tokens({"--server", "agentlink"});
    ASSERT_TRUE(is_error(neither));
    EXPECT_EQ(get_error(neither).code, "missing_required_flag");

    auto both = parse_tokens(
        {"--server", "agentlink", "--method", "list", "--relay-screenshot", "%5", "%1"});
    ASSERT_TRUE(is_error(both));
    EXPECT_EQ(get_error(both).code, "conflicting_flags");
}

TEST(CliParserTest, FailsOnUnknownArgumentAndMissingValue) {
    auto unknown = parse_tokens({"--server", "agentlink", "--bogus"});
    ASSERT_TRUE(is_error(unknown));
    EXPECT_EQ(get_error(unknown).code, "unknown_argument");

    auto dangling = parse_tokens({"--server", "agentlink", "--method"});
    ASSERT_TRUE(is_error(dangling));
    EXPECT_EQ(get_error(dangling).code, "missing_value");

    auto short_relay = parse_tokens({"--server", "agentlink", "--relay-screenshot", "%5"});
    ASSERT_TRUE(is_error(short_relay));
    EXPECT_EQ(get_error(short_relay).code, "missing_value");
}

TEST(CliParserTest, AppliesDefaults) {
    auto result = parse_tokens({"--server", "agentlink", "--method", "whoami"});
    ASSERT_FALSE(is_error(result));
    const auto& req = get_value(result);
    EXPECT_EQ(req.server, "agentlink");
    EXPECT_EQ(req.method.value_or(""), "whoami");
    EXPECT_FALSE(req.relay.has_value());
    EXPECT_EQ(req.params, json::object());
    EXPECT_EQ(req.output, OutputMode::Json);
    EXPECT_EQ(req.timeout_seconds, 30u);
    EXPECT_EQ(req.retry, 1u);
    EXPECT_FALSE(req.verbose);
}

TEST(CliParserTest, ParsesEveryOption) {
    auto result = parse_tokens({"--server", "agentlink --debug", "--method", "send_message_to",
                                "--params", R"({"target_id":"%2","text":"hi"})", "--output",
                                "result", "--timeout", "5", "--retry", "3", "-v"});
    ASSERT_FALSE(is_error(result));
    const auto& req = get_value(result);
    EXPECT_EQ(req.server, "agentlink --debug");
    EXPECT_EQ(req.params["target_id"], "%2");
    EXPECT_EQ(req.output, OutputMode::Result);
    EXPECT_EQ(req.timeout_seconds, 5u);
    EXPECT_EQ(req.retry, 3u);
    EXPECT_TRUE(req.verbose);
}

TEST(CliParserTest, ParsesRelayScreenshot) {
    auto result = parse_tokens({"--server", "agentlink", "--relay-screenshot", "%5", "%1"});
    ASSERT_FALSE(is_error(result));
    const auto& req = get_value(result);
    ASSERT_TRUE(req.relay.has_value());
    EXPECT_EQ(req.relay->from, "%5");
    EXPECT_EQ(req.relay->to, "%1");
    EXPECT_FALSE(req.method.has_value());
}

TEST(CliParserTest, RejectsBadNumbersAndOutput) {
    auto retry = parse_tokens({"--server", "s", "--method", "m", "--retry", "0"});
    ASSERT_TRUE(is_error(retry));
    EXPECT_EQ(get_error(retry).code, "bounds_error");

    auto timeout = parse_tokens({"--server", "s", "--method", "m", "--timeout", "12abc"});
    ASSERT_TRUE(is_error(timeout));
    EXPECT_EQ(get_error(timeout).code, "invalid_integer");

    auto output = parse_tokens({"--server", "s", "--method", "m", "--output", "yaml"});
    ASSERT_TRUE(is_error(output));
    EXPECT_EQ(get_error(output).code, "invalid_output");
}

TEST(CliParserTest, RejectsInvalidParams) {
    auto broken = parse_tokens({"--server", "s", "--method", "m", "--params", "{oops"});
    ASSERT_TRUE(is_error(broken));
    EXPECT_EQ(get_error(broken).code, "invalid_params_json");

    auto array = parse_tokens({"--server", "s", "--method", "m", "--params", "[1]"});
    ASSERT_TRUE(is_error(array));
    EXPECT_EQ(get_error(array).code, "invalid_params_json");
}

TEST(CliParserTest, ExpandsVariablesWithDefaults) {
    const auto env = fake_env({{"TMUX_PANE", "%3"}});
    EXPECT_EQ(expand_env_vars("${TMUX_PANE}", env), "%3");
    EXPECT_EQ(expand_env_vars("${MISSING:fallback}", env), "fallback");
    EXPECT_EQ(expand_env_vars("${MISSING}", env), "");
    EXPECT_EQ(expand_env_vars("${TMUX_PANE:x}-$HOME-${", env), "%3-$HOME-${");

    auto result = parse_tokens(
        {"--server", "s", "--method", "m", "--params", R"({"target_id":"${TMUX_PANE}"})"}, env);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).params["target_id"], "%3");
}

TEST(CliParserTest, ReadsParamsFromFile) {
    const auto path = std::filesystem::current_path() /
                      (".tmp_cli_params_" + agentlink::core::config::generate_token() + ".json");
    {
        std::ofstream out(path);
        out << R"({"text": "${GREETING:hello}"})";
    }

    auto result = parse_tokens({"--server", "s", "--method", "m", "--params", "@" + path.string()});
    std::filesystem::remove(path);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).params["text"], "hello");

    auto missing = parse_tokens({"--server", "s", "--method", "m", "--params", "@/no/such.json"});
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "params_file_missing");
}

TEST(CliParserTest, FormatsResponsesPerOutputMode) {
    const json response = {{"jsonrpc", "2.0"}, {"id", "3"}, {"result", {{"ok", true}}}};

    auto as_json = format_response(OutputMode::Json, response);
    ASSERT_FALSE(is_error(as_json));
    EXPECT_EQ(json::parse(get_value(as_json)), response);

    auto as_result = format_response(OutputMode::Result, response);
    ASSERT_FALSE(is_error(as_result));
    EXPECT_EQ(json::parse(get_value(as_result)), json({{"ok", true}}));

    auto as_text = format_response(OutputMode::Text, response);
    ASSERT_FALSE(is_error(as_text));
    EXPECT_EQ(get_value(as_text), R"(Success: {"ok":true})");

    const json scalar = {{"result", "plain"}};
    EXPECT_EQ(get_value(format_response(OutputMode::Result, scalar)), "plain");

    auto no_result = format_response(OutputMode::Result, json{{"id", "1"}});
    ASSERT_TRUE(is_error(no_result));
    EXPECT_EQ(get_error(no_result).code, "missing_result");
}

}  // namespace
