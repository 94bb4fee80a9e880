#include <memory>
#include <sstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "bridge/mcp_session.hpp"
#include "bridge/message_framing.hpp"
#include "bridge/stdio_loop.hpp"

namespace {

using nlohmann::json;
using knife::bridge::BackendReply;
using knife::bridge::FrameStatus;
using knife::bridge::McpSession;
using knife::bridge::MessageReader;
using knife::bridge::ToolBackend;
using knife::bridge::write_message;
using knife::protocol::ToolDefinition;

std::string frame(const std::string& body, const std::string& eol = "\r\n") {
    return "Content-Length: " + std::to_string(body.size()) + eol + eol + body;
}

// Decodes every frame written to `out`.
std::vector<json> read_all(const std::string& out) {
    std::istringstream in(out);
    MessageReader reader(in);
    std::vector<json> messages;
    while (true) {
        auto next = reader.read();
        if (next.status != FrameStatus::Message) {
            break;
        }
        messages.push_back(next.message);
    }
    return messages;
}

class EmptyBackend : public ToolBackend {
public:
    knife::core::errors::Result<std::vector<ToolDefinition>> fetch_tools() override {
        return std::vector<ToolDefinition>{};
    }

    BackendReply call_tool(const ToolDefinition&, const json&) override {
        return BackendReply{json{{"ok", true}}, false};
    }
};

// Registry with a hidden health route and one visible tool.
class HealthBackend : public ToolBackend {
public:
    knife::core::errors::Result<std::vector<ToolDefinition>> fetch_tools() override {
        ToolDefinition health;
        health.name = "health";
        health.method = "GET";
        health.path = "/health";
        ToolDefinition read;
        read.name = "fs.read";
        read.path = "/fs/read";
        return std::vector<ToolDefinition>{health, read};
    }

    BackendReply call_tool(const ToolDefinition& tool, const json&) override {
        called.push_back(tool.path);
        return BackendReply{json{{"ok", true}}, false};
    }

    std::vector<std::string> called;
};

TEST(MessageFramingTest, ReadsConsecutiveFrames) {
    std::istringstream in(frame(R"({"id":1})") + frame(R"({"id":2})"));
    MessageReader reader(in);

    auto first = reader.read();
    ASSERT_EQ(first.status, FrameStatus::Message);
    EXPECT_EQ(first.message["id"], 1);

    auto second = reader.read();
    ASSERT_EQ(second.status, FrameStatus::Message);
    EXPECT_EQ(second.message["id"], 2);

    EXPECT_EQ(reader.read().status, FrameStatus::EndOfStream);
}

TEST(MessageFramingTest, AcceptsBareNewlinesAndExtraHeaders) {
    const std::string body = R"({"method":"ping"})";
    std::istringstream in("content-type: application/json\ncontent-length: " +
                          std::to_string(body.size()) + "\n\n" + body);
    MessageReader reader(in);

    auto next = reader.read();
    ASSERT_EQ(next.status, FrameStatus::Message);
    EXPECT_EQ(next.message["method"], "ping");
}

TEST(MessageFramingTest, MissingOrZeroLengthEndsStream) {
    std::istringstream no_length("X-Other: 1\r\n\r\n{}");
    EXPECT_EQ(MessageReader(no_length).read().status, FrameStatus::EndOfStream);

    std::istringstream zero("Content-Length: 0\r\n\r\n");
    EXPECT_EQ(MessageReader(zero).read().status, FrameStatus::EndOfStream);

    std::istringstream short_body("Content-Length: 50\r\n\r\n{}");
    EXPECT_EQ(MessageReader(short_body).read().status, FrameStatus::EndOfStream);
}

TEST(MessageFramingTest, FlagsInvalidJsonBody) {
    std::istringstream in(frame("{not json") + frame("{}"));
    MessageReader reader(in);

    auto bad = reader.read();
    EXPECT_EQ(bad.status, FrameStatus::Malformed);
    EXPECT_FALSE(bad.error.empty());

    EXPECT_EQ(reader.read().status, FrameStatus::Message);
}

TEST(MessageFramingTest, WritesAsciiBodyWithLengthHeader) {
    std::ostringstream out;
    write_message(out, json{{"text", "caf\xC3\xA9"}});

    const std::string body = R"({"text":"caf\u00e9"})";
    EXPECT_EQ(out.str(), "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body);
}

TEST(StdioLoopTest, AnswersRequestsUntilShutdown) {
    auto session = McpSession(std::make_shared<EmptyBackend>());
    std::istringstream in(
        frame(R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})") +
        frame(R"({"jsonrpc":"2.0","method":"notifications/initialized"})") +
        frame("[oops") +
        frame(R"({"jsonrpc":"2.0","id":2,"method":"shutdown"})") +
        frame(R"({"jsonrpc":"2.0","id":3,"method":"ping"})"));
    std::ostringstream out;

    const auto handled = knife::bridge::run_stdio_loop(session, in, out);
    EXPECT_EQ(handled, 4u);

    const auto replies = read_all(out.str());
    ASSERT_EQ(replies.size(), 3u);
    EXPECT_EQ(replies[0]["id"], 1);
    EXPECT_EQ(replies[0]["result"]["serverInfo"]["name"], "swissknife");
    EXPECT_TRUE(replies[1]["id"].is_null());
    EXPECT_EQ(replies[1]["error"]["code"], -32700);
    EXPECT_EQ(replies[2]["id"], 2);
    EXPECT_TRUE(replies[2]["result"].empty());
}

TEST(StdioLoopTest, HandshakeListAndHiddenToolCall) {
    auto backend = std::make_shared<HealthBackend>();
    auto session = McpSession(backend);
    std::istringstream in(
        frame(R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})") +
        frame(R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})") +
        frame(R"({"jsonrpc":"2.0","id":3,"method":"tools/call","params":{"name":"health"}})") +
        frame(R"({"jsonrpc":"2.0","method":"notifications/initialized"})"));
    std::ostringstream out;

    EXPECT_EQ(knife::bridge::run_stdio_loop(session, in, out), 4u);

    const auto replies = read_all(out.str());
    ASSERT_EQ(replies.size(), 3u);
    EXPECT_EQ(replies[0]["id"], 1);
    EXPECT_EQ(replies[0]["result"]["protocolVersion"], "2024-11-05");

    EXPECT_EQ(replies[1]["id"], 2);
    const auto& tools = replies[1]["result"]["tools"];
    ASSERT_EQ(tools.size(), 1u);
    EXPECT_EQ(tools[0]["name"], "fs.read");

    EXPECT_EQ(replies[2]["id"], 3);
    const auto text = replies[2]["result"]["content"][0]["text"].get<std::string>();
    EXPECT_EQ(json::parse(text), (json{{"ok", true}}));
    EXPECT_EQ(backend->called, (std::vector<std::string>{"/health"}));
}

TEST(StdioLoopTest, StopsAtEndOfInput) {
    auto session = McpSession(std::make_shared<EmptyBackend>());
    std::istringstream in(frame(R"({"jsonrpc":"2.0","id":"a","method":"ping"})"));
    std::ostringstream out;

    EXPECT_EQ(knife::bridge::run_stdio_loop(session, in, out), 1u);
    const auto replies = read_all(out.str());
    ASSERT_EQ(replies.size(), 1u);
    EXPECT_EQ(replies[0]["id"], "a");
    EXPECT_FALSE(session.shutdown_requested());
}

}  // namespace
