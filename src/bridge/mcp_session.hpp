#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "bridge/tool_backend.hpp"
#include "bridge/tool_cache.hpp"

namespace knife::bridge {

namespace rpc {
inline constexpr int kParseError = -32700;
inline constexpr int kInvalidRequest = -32600;
inline constexpr int kMethodNotFound = -32601;
inline constexpr int kInvalidParams = -32602;
inline constexpr int kBackendFailure = -32010;
inline constexpr int kBackendTimeout = -32011;
}  // namespace rpc

struct SessionOptions {
    std::string server_name = "swissknife";
    std::string server_version = "0.1.0";
    std::string protocol_version = "2024-11-05";
    std::chrono::duration<double> tools_cache_ttl{5.0};
    bool enable_resources = false;
    bool enable_prompts = false;
    ToolCache::Clock clock = [] { return std::chrono::steady_clock::now(); };
};

// JSON-RPC 2.0 method dispatch for one MCP client. One message in, at most
// one message out; nothing here touches the transport.
class McpSession {
public:
    McpSession(std::shared_ptr<ToolBackend> backend, SessionOptions options = {});

    // nullopt for notifications and for unknown methods without an id.
    std::optional<nlohmann::json> handle(const nlohmann::json& message);

    bool shutdown_requested() const { return shutdown_requested_; }

    static nlohmann::json error_response(const nlohmann::json& id, int code,
                                         const std::string& message,
                                         const std::optional<nlohmann::json>& data = std::nullopt);

private:
    nlohmann::json initialize_result() const;
    nlohmann::json tools_list(const nlohmann::json& id);
    nlohmann::json tools_call(const nlohmann::json& params, const nlohmann::json& id);

    std::shared_ptr<ToolBackend> backend_;
    SessionOptions options_;
    ToolCache cache_;
    bool shutdown_requested_ = false;
};

}  // namespace knife::bridge
