#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include "httplib.h"
#include "nlohmann/json.hpp"
#include "providers/anthropic_provider.hpp"

namespace {

using clerk::providers::AnthropicProvider;
using clerk::providers::BuildMessagesPayload;
using clerk::providers::ContentBlock;
using clerk::providers::ContentType;
using clerk::providers::DescribeHttpError;
using clerk::providers::Message;
using clerk::providers::ParseMessagesResponse;
using clerk::providers::Role;
using clerk::providers::ToolDefinition;

std::vector<Message> SampleTranscript() {
    return {
        Message{Role::kUser, {ContentBlock::Text("read notes.txt")}},
        Message{Role::kAssistant, {
            ContentBlock::Text("Reading it."),
            ContentBlock::ToolUse("toolu_01", "read_file", {{"path", "notes.txt"}}),
        }},
        Message{Role::kUser, {ContentBlock::ToolResult("toolu_01", "Contents of file notes.txt:\nhi")}},
    };
}

std::vector<ToolDefinition> SampleTools() {
    return {
        ToolDefinition{"read_file", "Read a file.",
                       R"({"type":"object","properties":{"path":{"type":"string"}},"required":["path"]})"},
    };
}

TEST(AnthropicPayloadTest, CarriesModelSettingsAndSystemPrompt) {
    const auto payload = BuildMessagesPayload("be terse", {}, {}, "claude-test", 1024, 0.5);
    EXPECT_EQ(payload["model"], "claude-test");
    EXPECT_EQ(payload["max_tokens"], 1024);
    EXPECT_DOUBLE_EQ(payload["temperature"].get<double>(), 0.5);
    EXPECT_EQ(payload["system"], "be terse");
    EXPECT_TRUE(payload["messages"].is_array());
    EXPECT_FALSE(payload.contains("tools"));
}

TEST(AnthropicPayloadTest, EmptySystemPromptIsOmitted) {
    const auto payload = BuildMessagesPayload("", {}, {}, "claude-test", 1024, 1.0);
    EXPECT_FALSE(payload.contains("system"));
}

TEST(AnthropicPayloadTest, ToolsUseInputSchema) {
    const auto payload = BuildMessagesPayload("", {}, SampleTools(), "claude-test", 1024, 1.0);
    ASSERT_EQ(payload["tools"].size(), 1u);
    const auto& tool = payload["tools"][0];
    EXPECT_EQ(tool["name"], "read_file");
    EXPECT_EQ(tool["description"], "Read a file.");
    EXPECT_EQ(tool["input_schema"]["type"], "object");
    EXPECT_EQ(tool["input_schema"]["required"], nlohmann::json::array({"path"}));
}

TEST(AnthropicPayloadTest, TranscriptBlocksKeepWireShape) {
    const auto payload = BuildMessagesPayload("", SampleTranscript(), {}, "claude-test", 1024, 1.0);
    const auto& messages = payload["messages"];
    ASSERT_EQ(messages.size(), 3u);

    EXPECT_EQ(messages[0]["role"], "user");
    EXPECT_EQ(messages[0]["content"][0]["type"], "text");
    EXPECT_EQ(messages[0]["content"][0]["text"], "read notes.txt");

    EXPECT_EQ(messages[1]["role"], "assistant");
    const auto& tool_use = messages[1]["content"][1];
    EXPECT_EQ(tool_use["type"], "tool_use");
    EXPECT_EQ(tool_use["id"], "toolu_01");
    EXPECT_EQ(tool_use["name"], "read_file");
    EXPECT_EQ(tool_use["input"]["path"], "notes.txt");

    EXPECT_EQ(messages[2]["role"], "user");
    const auto& tool_result = messages[2]["content"][0];
    EXPECT_EQ(tool_result["type"], "tool_result");
    EXPECT_EQ(tool_result["tool_use_id"], "toolu_01");
    EXPECT_EQ(tool_result["content"], "Contents of file notes.txt:\nhi");
}

TEST(AnthropicResponseTest, ParsesTextToolUseAndUsage) {
    const auto body = nlohmann::json::parse(R"({
        "id": "msg_01",
        "type": "message",
        "role": "assistant",
        "content": [
            {"type": "text", "text": "Let me check."},
            {"type": "tool_use", "id": "toolu_02", "name": "list_files", "input": {"path": "."}}
        ],
        "stop_reason": "tool_use",
        "usage": {"input_tokens": 120, "output_tokens": 30}
    })");

    const auto response = ParseMessagesResponse(body);
    EXPECT_FALSE(response.IsError());
    EXPECT_TRUE(response.HasToolCalls());
    EXPECT_EQ(response.finish_reason, "tool_use");
    EXPECT_EQ(response.FirstText(), "Let me check.");
    ASSERT_EQ(response.content.size(), 2u);
    EXPECT_EQ(response.content[1].type, ContentType::kToolUse);
    EXPECT_EQ(response.content[1].id, "toolu_02");
    EXPECT_EQ(response.content[1].name, "list_files");
    EXPECT_EQ(response.content[1].input["path"], ".");
    EXPECT_EQ(response.usage.at("prompt_tokens"), 120);
    EXPECT_EQ(response.usage.at("completion_tokens"), 30);
    EXPECT_EQ(response.usage.at("total_tokens"), 150);
}

TEST(AnthropicResponseTest, UnknownBlockTypesAreSkipped) {
    const auto body = nlohmann::json::parse(R"({
        "content": [{"type": "thinking", "thinking": "..."}, {"type": "text", "text": "done"}],
        "stop_reason": "end_turn"
    })");

    const auto response = ParseMessagesResponse(body);
    ASSERT_EQ(response.content.size(), 1u);
    EXPECT_EQ(response.FirstText(), "done");
    EXPECT_FALSE(response.HasToolCalls());
}

TEST(AnthropicResponseTest, BodyWithoutContentIsAnError) {
    const auto response = ParseMessagesResponse(nlohmann::json::parse(R"({"type": "message"})"));
    EXPECT_TRUE(response.IsError());
    EXPECT_EQ(response.error, "invalid response from model service");
}

TEST(AnthropicErrorTest, DescribesServiceErrorBody) {
    const std::string body =
        R"({"type":"error","error":{"type":"rate_limit_error","message":"Number of requests exceeded"}})";
    EXPECT_EQ(DescribeHttpError(429, body), "HTTP 429 rate_limit_error: Number of requests exceeded");
}

TEST(AnthropicErrorTest, FallsBackToStatusForOpaqueBody) {
    EXPECT_EQ(DescribeHttpError(502, "<html>Bad Gateway</html>"), "HTTP 502");
    EXPECT_EQ(DescribeHttpError(500, ""), "HTTP 500");
}

class LocalMessagesServer {
public:
    // Handlers must be registered before Start().
    void Start() {
        port_ = server_.bind_to_any_port("127.0.0.1");
        thread_ = std::thread([this] { server_.listen_after_bind(); });
    }

    ~LocalMessagesServer() {
        server_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    httplib::Server& server() { return server_; }
    std::string base() const { return "http://127.0.0.1:" + std::to_string(port_) + "/v1"; }

private:
    httplib::Server server_;
    std::thread thread_;
    int port_ = 0;
};

TEST(AnthropicProviderTest, PostsToMessagesEndpointWithHeaders) {
    LocalMessagesServer local;
    std::string seen_key;
    std::string seen_version;
    nlohmann::json seen_body;
    local.server().Post("/v1/messages", [&](const httplib::Request& req, httplib::Response& res) {
        seen_key = req.get_header_value("x-api-key");
        seen_version = req.get_header_value("anthropic-version");
        seen_body = nlohmann::json::parse(req.body, nullptr, false);
        res.set_content(R"({"content":[{"type":"text","text":"pong"}],"stop_reason":"end_turn"})",
                        "application/json");
    });
    local.Start();

    AnthropicProvider provider("sk-test-key-123456", local.base(), "claude-default", 5);
    const auto response = provider.Chat("sys", SampleTranscript(), SampleTools(), "", 256, 1.0);

    ASSERT_FALSE(response.IsError()) << response.error;
    EXPECT_EQ(response.FirstText(), "pong");
    EXPECT_EQ(seen_key, "sk-test-key-123456");
    EXPECT_EQ(seen_version, "2023-06-01");
    EXPECT_EQ(seen_body["model"], "claude-default");
    EXPECT_EQ(seen_body["messages"].size(), 3u);
}

TEST(AnthropicProviderTest, HttpErrorBecomesErrorResponse) {
    LocalMessagesServer local;
    local.server().Post("/v1/messages", [](const httplib::Request&, httplib::Response& res) {
        res.status = 401;
        res.set_content(R"({"type":"error","error":{"type":"authentication_error","message":"invalid x-api-key"}})",
                        "application/json");
    });
    local.Start();

    AnthropicProvider provider("bad", local.base(), "claude-default", 5);
    const auto response = provider.Chat("", SampleTranscript(), {}, "", 256, 1.0);
    EXPECT_TRUE(response.IsError());
    EXPECT_EQ(response.error, "HTTP 401 authentication_error: invalid x-api-key");
}

TEST(AnthropicProviderTest, MalformedBodyBecomesErrorResponse) {
    LocalMessagesServer local;
    local.server().Post("/v1/messages", [](const httplib::Request&, httplib::Response& res) {
        res.set_content("not json", "text/plain");
    });
    local.Start();

    AnthropicProvider provider("key", local.base(), "claude-default", 5);
    const auto response = provider.Chat("", SampleTranscript(), {}, "", 256, 1.0);
    EXPECT_TRUE(response.IsError());
    EXPECT_EQ(response.error, "invalid response from model service");
}

TEST(AnthropicProviderTest, UnreachableServiceIsReportedNotThrown) {
    AnthropicProvider provider("key", "http://127.0.0.1:1/v1", "claude-default", 2);
    const auto response = provider.Chat("", SampleTranscript(), {}, "", 256, 1.0);
    EXPECT_TRUE(response.IsError());
    EXPECT_EQ(response.error.rfind("request to model service failed", 0), 0u);
}

}  // namespace
