#include "server/tool_registry.hpp"

#include <exception>
#include <utility>
#include "core/logging/logger.hpp"

namespace knife::server {

ToolRegistry::ToolRegistry(std::shared_ptr<telemetry::TelemetryRecorder> telemetry)
    : telemetry_(std::move(telemetry)) {}

void ToolRegistry::add(protocol::ToolDefinition definition, ToolHandler handler) {
    const std::string name = definition.name;
    if (tools_.count(name) == 0) {
        order_.push_back(name);
    }
    tools_[name] = Entry{std::move(definition), std::move(handler)};
}

std::vector<protocol::ToolDefinition> ToolRegistry::definitions() const {
    std::vector<protocol::ToolDefinition> out;
    out.reserve(order_.size());
    for (const auto& name : order_) {
        out.push_back(tools_.at(name).definition);
    }
    return out;
}

std::optional<protocol::ToolDefinition> ToolRegistry::find(const std::string& name) const {
    const auto it = tools_.find(name);
    if (it == tools_.end()) {
        return std::nullopt;
    }
    return it->second.definition;
}

nlohmann::json ToolRegistry::list_tools() const {
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& definition : definitions()) {
        tools.push_back(protocol::to_json(definition));
    }
    return protocol::success({{"tools", tools}});
}

nlohmann::json ToolRegistry::invoke(const std::string& name,
                                    const nlohmann::json& payload) const {
    const auto it = tools_.find(name);
    if (it == tools_.end()) {
        auto response = protocol::failure(core::errors::codes::kNotFound,
                                          "Unknown tool: " + name);
        telemetry_->record_tool_call(name, "POST", "", payload, response);
        return response;
    }

    const auto& definition = it->second.definition;
    nlohmann::json response;
    try {
        response = it->second.handler(payload);
    } catch (const nlohmann::json::exception& e) {
        KNIFE_LOG_ERROR(name + " failed on malformed data: " + e.what());
        response = protocol::failure(core::errors::codes::kInternalError, e.what());
    } catch (const std::exception& e) {
        KNIFE_LOG_ERROR(name + " raised: " + e.what());
        response = protocol::failure(core::errors::codes::kInternalError, e.what());
    }

    telemetry_->record_tool_call(definition.name, definition.method, definition.path, payload,
                                 response);
    return response;
}

}  // namespace knife::server
