#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/errors/link_errors.hpp"
#include "rpc/dispatcher.hpp"

namespace {

using agentlink::core::errors::ErrorCategory;
using agentlink::core::errors::LinkError;
using agentlink::core::errors::Result;
using agentlink::rpc::Dispatcher;
using nlohmann::json;

// Dispatcher with an "echo" method, a "fail" method and a "throw" method, and
// a counter of how many times any of them ran.
class DispatcherFixture : public ::testing::Test {
protected:
    void SetUp() override {
        dispatcher_.register_method(
            {"echo", "Echo params back.", json{{"type", "object"}}},
            [this](const json& params) -> Result<json> {
                ++calls_;
                return json{{"echo", params}};
            });
        dispatcher_.register_method({"fail", "Always fails."},
                                    [this](const json&) -> Result<json> {
                                        ++calls_;
                                        return LinkError{ErrorCategory::Input,
                                                         "target_id is required",
                                                         "missing_param"};
                                    });
        dispatcher_.register_method({"throw", "Throws."},
                                    [this](const json&) -> Result<json> {
                                        ++calls_;
                                        throw std::runtime_error("kaboom");
                                    });
    }

    json handle(const std::string& line) {
        auto response = dispatcher_.handle_line(line);
        EXPECT_TRUE(response.has_value()) << line;
        return response.has_value() ? json::parse(*response) : json();
    }

    Dispatcher dispatcher_;
    int calls_ = 0;
};

TEST_F(DispatcherFixture, RequestGetsResultWithSameId) {
    const json response =
        handle(R"({"jsonrpc":"2.0","id":7,"method":"echo","params":{"a":1}})");
    EXPECT_EQ(response["jsonrpc"], "2.0");
    EXPECT_EQ(response["id"], 7);
    EXPECT_EQ(response["result"]["echo"]["a"], 1);
    EXPECT_FALSE(response.contains("error"));
}

TEST_F(DispatcherFixture, StringIdsAreEchoedVerbatim) {
    const json response = handle(R"({"jsonrpc":"2.0","id":"abc","method":"echo"})");
    EXPECT_EQ(response["id"], "abc");
    EXPECT_EQ(response["result"]["echo"], json::object());
}

TEST_F(DispatcherFixture, NullParamsBecomeEmptyObject) {
    const json response =
        handle(R"({"jsonrpc":"2.0","id":1,"method":"echo","params":null})");
    EXPECT_EQ(response["result"]["echo"], json::object());
}

TEST_F(DispatcherFixture, NotificationsNeverProduceOutput) {
    EXPECT_FALSE(dispatcher_.handle_line(R"({"jsonrpc":"2.0","method":"echo"})").has_value());
    EXPECT_FALSE(dispatcher_.handle_line(R"({"jsonrpc":"2.0","method":"fail"})").has_value());
    EXPECT_FALSE(dispatcher_.handle_line(R"({"jsonrpc":"2.0","method":"throw"})").has_value());
    EXPECT_FALSE(
        dispatcher_.handle_line(R"({"jsonrpc":"2.0","method":"notifications/initialized"})")
            .has_value());
    EXPECT_EQ(calls_, 3);
}

TEST_F(DispatcherFixture, NullIdIsARequestNotANotification) {
    const json response = handle(R"({"jsonrpc":"2.0","id":null,"method":"echo"})");
    EXPECT_TRUE(response.contains("id"));
    EXPECT_TRUE(response["id"].is_null());
    EXPECT_TRUE(response.contains("result"));
}

TEST_F(DispatcherFixture, UnknownMethodReturnsMethodNotFound) {
    const json response = handle(R"({"jsonrpc":"2.0","id":"x","method":"nope"})");
    EXPECT_EQ(response["id"], "x");
    EXPECT_EQ(response["error"]["code"], -32601);
    EXPECT_EQ(response["error"]["message"], "Method not found: nope");
    EXPECT_FALSE(response["error"].contains("data"));
}

TEST_F(DispatcherFixture, InvalidJsonReturnsParseErrorWithNullId) {
    const json response = handle("{not json");
    EXPECT_TRUE(response["id"].is_null());
    EXPECT_EQ(response["error"]["code"], -32700);
    EXPECT_EQ(response["error"]["message"], "Parse error");
    EXPECT_TRUE(response["error"]["data"].is_string());
}

TEST_F(DispatcherFixture, WrongVersionAndNonObjectAreParseErrors) {
    EXPECT_EQ(handle(R"({"jsonrpc":"1.0","id":1,"method":"echo"})")["error"]["code"], -32700);
    EXPECT_EQ(handle("[1,2,3]")["error"]["code"], -32700);
    EXPECT_EQ(calls_, 0);
}

TEST_F(DispatcherFixture, HandlerErrorBecomesInternalErrorWithData) {
    const json response = handle(R"({"jsonrpc":"2.0","id":3,"method":"fail"})");
    EXPECT_EQ(response["id"], 3);
    EXPECT_EQ(response["error"]["code"], -32000);
    EXPECT_EQ(response["error"]["message"], "Internal error");
    EXPECT_EQ(response["error"]["data"], "target_id is required");
}

TEST_F(DispatcherFixture, EscapingExceptionBecomesInternalError) {
    const json response = handle(R"({"jsonrpc":"2.0","id":4,"method":"throw"})");
    EXPECT_EQ(response["error"]["code"], -32000);
    EXPECT_EQ(response["error"]["data"], "kaboom");
}

TEST_F(DispatcherFixture, NonStandardThrowIsStillOneFailedRequest) {
    dispatcher_.register_method({"throw_int", "Throws an int."}, [](const json&) -> Result<json> {
        throw 42;
    });
    std::istringstream in(
        "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"throw_int\"}\n"
        "{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"echo\"}\n");
    std::ostringstream out;

    EXPECT_EQ(dispatcher_.serve(in, out), 2u);
    std::istringstream lines(out.str());
    std::string line;
    ASSERT_TRUE(std::getline(lines, line));
    const json failed = json::parse(line);
    EXPECT_EQ(failed["id"], 1);
    EXPECT_EQ(failed["error"]["code"], -32000);
    EXPECT_EQ(failed["error"]["data"], "unknown exception");
    ASSERT_TRUE(std::getline(lines, line));
    EXPECT_EQ(json::parse(line)["id"], 2);
}

TEST_F(DispatcherFixture, NonObjectParamsAreRejectedBeforeTheHandler) {
    const json response =
        handle(R"({"jsonrpc":"2.0","id":5,"method":"echo","params":[1,2]})");
    EXPECT_EQ(response["error"]["code"], -32000);
    EXPECT_EQ(calls_, 0);
}

TEST_F(DispatcherFixture, InitializeAdvertisesServer) {
    const json response = handle(R"({"jsonrpc":"2.0","id":1,"method":"initialize"})");
    const json& result = response["result"];
    EXPECT_EQ(result["protocolVersion"], "2024-11-05");
    EXPECT_EQ(result["serverInfo"]["name"], "agentlink");
    EXPECT_TRUE(result["capabilities"]["tools"].is_object());
}

TEST_F(DispatcherFixture, ToolsListKeepsRegistrationOrder) {
    const json response = handle(R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})");
    const json& tools = response["result"]["tools"];
    ASSERT_EQ(tools.size(), 3u);
    EXPECT_EQ(tools[0]["name"], "echo");
    EXPECT_EQ(tools[0]["description"], "Echo params back.");
    EXPECT_EQ(tools[0]["inputSchema"]["type"], "object");
    EXPECT_EQ(tools[1]["name"], "fail");
    EXPECT_EQ(tools[2]["name"], "throw");
}

TEST_F(DispatcherFixture, ToolsCallWrapsResultAsTextContent) {
    const json response = handle(
        R"({"jsonrpc":"2.0","id":9,"method":"tools/call","params":{"name":"echo","arguments":{"b":2}}})");
    const json& content = response["result"]["content"];
    ASSERT_EQ(content.size(), 1u);
    EXPECT_EQ(content[0]["type"], "text");
    EXPECT_EQ(json::parse(content[0]["text"].get<std::string>()), json({{"echo", {{"b", 2}}}}));
}

TEST_F(DispatcherFixture, ToolsCallWithNullArgumentsPassesEmptyObject) {
    const json response = handle(
        R"({"jsonrpc":"2.0","id":9,"method":"tools/call","params":{"name":"echo","arguments":null}})");
    const std::string text = response["result"]["content"][0]["text"].get<std::string>();
    EXPECT_EQ(json::parse(text)["echo"], json::object());
}

TEST_F(DispatcherFixture, ToolsCallPropagatesFailures) {
    const json unknown = handle(
        R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"nope"}})");
    EXPECT_EQ(unknown["error"]["code"], -32000);
    EXPECT_EQ(unknown["error"]["data"], "Unknown tool: nope");

    const json failed = handle(
        R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"fail"}})");
    EXPECT_EQ(failed["error"]["data"], "target_id is required");
}

TEST_F(DispatcherFixture, ProtocolMethodsWinOverDirectOnes) {
    dispatcher_.register_method({"initialize", "shadow"}, [](const json&) -> Result<json> {
        return json{{"shadowed", true}};
    });
    const json response = handle(R"({"jsonrpc":"2.0","id":1,"method":"initialize"})");
    EXPECT_FALSE(response["result"].contains("shadowed"));
    EXPECT_TRUE(response["result"].contains("protocolVersion"));
}

TEST_F(DispatcherFixture, ServeWritesOneLinePerRequestInOrder) {
    std::istringstream in(
        "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"echo\"}\n"
        "\n"
        "   \n"
        "{\"jsonrpc\":\"2.0\",\"method\":\"echo\"}\n"
        "garbage\n"
        "{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"missing\"}\n");
    std::ostringstream out;

    const auto processed = dispatcher_.serve(in, out);
    EXPECT_EQ(processed, 4u);

    std::vector<json> responses;
    std::istringstream lines(out.str());
    std::string line;
    while (std::getline(lines, line)) {
        responses.push_back(json::parse(line));
    }
    ASSERT_EQ(responses.size(), 3u);
    EXPECT_EQ(responses[0]["id"], 1);
    EXPECT_EQ(responses[1]["error"]["code"], -32700);
    EXPECT_EQ(responses[2]["id"], 2);
    EXPECT_EQ(responses[2]["error"]["code"], -32601);
}

}  // namespace
