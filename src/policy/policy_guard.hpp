#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "core/errors/knife_errors.hpp"
#include "protocol/audit_contract.hpp"
#include "protocol/command_contract.hpp"

namespace knife::policy {

struct ExecutionPolicy {
    std::filesystem::path sandbox_root = std::filesystem::current_path();
    std::string profile_name = "default-restricted-v1";
    int max_timeout_s = 300;
    std::set<std::string> denied_commands = {
        "shutdown",
        "reboot",
        "poweroff",
        "halt",
        "mkfs"};
    std::set<std::string> denied_env_exact = {
        "LD_PRELOAD",
        "LD_LIBRARY_PATH",
        "LD_AUDIT",
        "DYLD_INSERT_LIBRARIES",
        "DYLD_LIBRARY_PATH"};
    std::vector<std::string> denied_env_prefixes = {"BASH_FUNC_"};
    std::size_t preview_max_len = 240;
};

// Decides whether a command may run. Stateless apart from the policy value,
// so one instance can be shared across threads.
class PolicyGuard {
public:
    explicit PolicyGuard(ExecutionPolicy policy = {});

    const ExecutionPolicy& policy() const { return policy_; }

    core::errors::Result<std::vector<std::string>> normalize_command(
        const protocol::CommandInput& cmd) const;

    // nullopt in, nullopt out: no cwd constraint.
    core::errors::Result<std::optional<std::filesystem::path>> resolve_policy_cwd(
        const std::optional<std::string>& cwd) const;

    protocol::PolicyDecision check_execution_policy(
        const std::string& tool_name, const std::vector<std::string>& argv,
        const std::optional<std::string>& cwd,
        const std::optional<protocol::EnvOverrides>& env,
        std::optional<int> timeout_s) const;

    protocol::AuditRecord build_audit_metadata(const std::vector<std::string>& argv,
                                               const std::string& tool_name) const;

    std::string sanitize_command_preview(const std::vector<std::string>& argv) const;

    // Confinement check shared by every path-taking tool.
    core::errors::Result<std::filesystem::path> validate_path_in_workspace(
        const std::filesystem::path& workspace_root,
        const std::filesystem::path& target_path) const;

    core::errors::Result<std::filesystem::path> resolve_in_sandbox(
        const std::filesystem::path& target_path) const;

    // Best-effort argv for audit records when normalization failed.
    static std::vector<std::string> fallback_argv(const protocol::CommandInput& cmd);

    // Denial reason for a command that failed normalization.
    static std::string rejection_reason(const core::errors::ToolError& error);

private:
    static bool is_within_root(const std::filesystem::path& root,
                               const std::filesystem::path& child);
    static std::string lowercase(std::string value);
    static std::string sanitize_arg(const std::string& arg);

    ExecutionPolicy policy_;
};

}  // namespace knife::policy
