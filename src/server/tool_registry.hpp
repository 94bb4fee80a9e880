#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "protocol/tool_contract.hpp"
#include "telemetry/telemetry_recorder.hpp"

namespace knife::server {

using ToolHandler = std::function<nlohmann::json(const nlohmann::json& payload)>;

// Named tools with their advertised definitions. Every invocation is
// recorded in telemetry, including failed and unknown ones.
class ToolRegistry {
public:
    explicit ToolRegistry(std::shared_ptr<telemetry::TelemetryRecorder> telemetry);

    // Replaces any earlier tool with the same name.
    void add(protocol::ToolDefinition definition, ToolHandler handler);

    std::vector<protocol::ToolDefinition> definitions() const;

    std::optional<protocol::ToolDefinition> find(const std::string& name) const;

    nlohmann::json list_tools() const;

    // Handler exceptions become internal_error responses; the registry
    // never lets one escape to the transport.
    nlohmann::json invoke(const std::string& name, const nlohmann::json& payload) const;

    telemetry::TelemetryRecorder& telemetry() const { return *telemetry_; }

private:
    struct Entry {
        protocol::ToolDefinition definition;
        ToolHandler handler;
    };

    std::shared_ptr<telemetry::TelemetryRecorder> telemetry_;
    std::vector<std::string> order_;
    std::map<std::string, Entry> tools_;
};

}  // namespace knife::server
