#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include "bridge/tool_backend.hpp"

namespace knife::bridge {

struct HttpBackendOptions {
    std::string base_url = "http://127.0.0.1:8000";
    std::chrono::seconds timeout{30};
};

// Registry client over cpp-httplib. Every request is bounded by the
// configured connection, read and write timeouts.
class HttpToolBackend : public ToolBackend {
public:
    explicit HttpToolBackend(HttpBackendOptions options);

    core::errors::Result<std::vector<protocol::ToolDefinition>> fetch_tools() override;

    BackendReply call_tool(const protocol::ToolDefinition& tool,
                           const nlohmann::json& arguments) override;

    // Raw request against `<base_url><path>`; never throws.
    BackendReply request(const std::string& method, const std::string& path,
                         const std::optional<nlohmann::json>& payload = std::nullopt) const;

    const std::string& base_url() const { return options_.base_url; }

private:
    HttpBackendOptions options_;
    std::string origin_;       // scheme://host[:port]
    std::string path_prefix_;  // base URL path, without trailing '/'
};

}  // namespace knife::bridge
