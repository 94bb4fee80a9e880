#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/knife_errors.hpp"
#include "protocol/tool_contract.hpp"

namespace knife::bridge {

// A registry reply. `timed_out` marks a transport timeout, which is distinct
// from a tool that itself reported `error: "timeout"`.
struct BackendReply {
    nlohmann::json body;
    bool timed_out = false;

    bool ok() const {
        if (!body.is_object()) {
            return false;
        }
        const auto it = body.find("ok");
        return it == body.end() || !it->is_boolean() || it->get<bool>();
    }
};

// The registry as seen from the bridge.
class ToolBackend {
public:
    virtual ~ToolBackend() = default;

    virtual core::errors::Result<std::vector<protocol::ToolDefinition>> fetch_tools() = 0;

    virtual BackendReply call_tool(const protocol::ToolDefinition& tool,
                                   const nlohmann::json& arguments) = 0;
};

}  // namespace knife::bridge
