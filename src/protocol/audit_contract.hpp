#pragma once
#include <optional>
#include <string>
#include <utility>
#include <nlohmann/json.hpp>

namespace knife::protocol {

    // Immutable record correlating one execution attempt (allowed or not)
    // with a redacted preview of the command.
    struct AuditRecord {
        std::string execution_id;
        std::string policy_profile;
        std::string tool;
        std::string command_preview;
    };

    struct PolicyDecision {
        bool allowed = true;
        std::optional<std::string> reason;

        static PolicyDecision allow() { return PolicyDecision{true, std::nullopt}; }
        static PolicyDecision deny(std::string reason) {
            return PolicyDecision{false, std::move(reason)};
        }
    };

    // An execution attempt that never produced a running command. `code` is
    // policy_denied for rule violations and malformed commands.
    struct ExecutionRejection {
        std::string code;
        std::string reason;
        AuditRecord audit;
    };

    inline nlohmann::json to_json(const AuditRecord& audit) {
        return nlohmann::json{
            {"execution_id", audit.execution_id},
            {"policy_profile", audit.policy_profile},
            {"tool", audit.tool},
            {"command_preview", audit.command_preview}};
    }

} // namespace knife::protocol
