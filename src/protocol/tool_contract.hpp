#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/knife_errors.hpp"
#include "protocol/audit_contract.hpp"

namespace knife::protocol {

    // A capability exposed by the registry, as advertised by /tools/list.
    struct ToolDefinition {
        std::string name;         // e.g., "process.start"
        std::string method = "POST";
        std::string path;         // e.g., "/process/start"
        std::string description;
        std::optional<nlohmann::json> request_schema;
    };

    inline nlohmann::json to_json(const ToolDefinition& tool) {
        nlohmann::json payload{
            {"name", tool.name},
            {"method", tool.method},
            {"path", tool.path},
            {"description", tool.description}};
        if (tool.request_schema.has_value()) {
            payload["request_schema"] = tool.request_schema.value();
        }
        return payload;
    }

    // Lenient decode of a registry entry; entries without a string name are
    // rejected by returning nullopt.
    inline std::optional<ToolDefinition> tool_from_json(const nlohmann::json& payload) {
        if (!payload.is_object()) {
            return std::nullopt;
        }
        const auto name = payload.find("name");
        if (name == payload.end() || !name->is_string() || name->get<std::string>().empty()) {
            return std::nullopt;
        }

        ToolDefinition tool;
        tool.name = name->get<std::string>();
        if (payload.contains("method") && payload["method"].is_string()) {
            tool.method = payload["method"].get<std::string>();
        }
        if (payload.contains("path") && payload["path"].is_string()) {
            tool.path = payload["path"].get<std::string>();
        }
        if (payload.contains("description") && payload["description"].is_string()) {
            tool.description = payload["description"].get<std::string>();
        }
        if (payload.contains("request_schema") && payload["request_schema"].is_object()) {
            tool.request_schema = payload["request_schema"];
        }
        return tool;
    }

    // Uniform response shapes. Every response carries `ok`.
    inline nlohmann::json success(nlohmann::json fields = nlohmann::json::object()) {
        fields["ok"] = true;
        return fields;
    }

    inline nlohmann::json failure(const std::string& code, const std::string& message = "") {
        return nlohmann::json{
            {"ok", false},
            {"error", code},
            {"message", message.empty() ? core::errors::default_message(code) : message}};
    }

    inline nlohmann::json failure(const core::errors::ToolError& error) {
        auto payload = failure(error.code, error.message);
        if (!error.hint.empty()) {
            payload["hint"] = error.hint;
        }
        return payload;
    }

    inline nlohmann::json policy_denied_response(const std::string& reason,
                                                 const AuditRecord& audit) {
        return nlohmann::json{
            {"ok", false},
            {"error", core::errors::codes::kPolicyDenied},
            {"reason", reason},
            {"audit", to_json(audit)}};
    }

} // namespace knife::protocol
