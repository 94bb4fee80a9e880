#include "policy/policy_guard.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <system_error>
#include <utility>
#include "core/config/execution_id.hpp"
#include "policy/shell_words.hpp"

namespace knife::policy {

using core::errors::ErrorCategory;
using core::errors::ToolError;
using protocol::PolicyDecision;

namespace {

constexpr std::array<const char*, 5> kSecretMarkers = {
    "password", "secret", "token", "apikey", "api_key"};

bool contains_secret_marker(const std::string& lowered) {
    return std::any_of(kSecretMarkers.begin(), kSecretMarkers.end(),
                       [&lowered](const char* marker) {
                           return lowered.find(marker) != std::string::npos;
                       });
}

std::filesystem::path strip_trailing_separator(std::filesystem::path path) {
    if (path.has_relative_path() && path.filename().empty()) {
        path = path.parent_path();
    }
    return path;
}

}  // namespace

PolicyGuard::PolicyGuard(ExecutionPolicy policy) : policy_(std::move(policy)) {}

bool PolicyGuard::is_within_root(const std::filesystem::path& root,
                                 const std::filesystem::path& child) {
    auto root_it = root.begin();
    auto child_it = child.begin();
    for (; root_it != root.end() && child_it != child.end(); ++root_it, ++child_it) {
        if (*root_it != *child_it) {
            return false;
        }
    }
    return root_it == root.end();
}

std::string PolicyGuard::lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

core::errors::Result<std::filesystem::path> PolicyGuard::validate_path_in_workspace(
    const std::filesystem::path& workspace_root,
    const std::filesystem::path& target_path) const {
    std::error_code ec;
    if (!std::filesystem::is_directory(workspace_root, ec) || ec) {
        return ToolError{ErrorCategory::Input,
                         "Allowed base directory does not exist: " +
                             workspace_root.string(),
                         core::errors::codes::kInvalidPath};
    }

    const std::filesystem::path canonical_root = strip_trailing_separator(
        std::filesystem::weakly_canonical(workspace_root, ec));
    if (ec) {
        return ToolError{ErrorCategory::Input,
                         "Unable to resolve allowed base directory: " +
                             workspace_root.string(),
                         core::errors::codes::kInvalidPath};
    }

    std::filesystem::path candidate = target_path;
    if (candidate.is_relative()) {
        candidate = canonical_root / candidate;
    }

    // Symlinks in the existing prefix are resolved before the containment
    // check, so a link inside the root cannot point the result outside it.
    const std::filesystem::path canonical_candidate =
        strip_trailing_separator(std::filesystem::weakly_canonical(candidate, ec));
    if (ec) {
        return ToolError{ErrorCategory::Input,
                         "Could not resolve path '" + target_path.string() + "'",
                         core::errors::codes::kInvalidPath};
    }

    if (!is_within_root(canonical_root, canonical_candidate)) {
        return ToolError{ErrorCategory::Policy,
                         "Path is outside allowed base directory: " +
                             target_path.string(),
                         core::errors::codes::kPermissionDenied};
    }

    return canonical_candidate;
}

core::errors::Result<std::filesystem::path> PolicyGuard::resolve_in_sandbox(
    const std::filesystem::path& target_path) const {
    if (target_path.empty()) {
        return ToolError{ErrorCategory::Input, "Path must be a non-empty string.",
                         core::errors::codes::kInvalidPath};
    }
    return validate_path_in_workspace(policy_.sandbox_root, target_path);
}

core::errors::Result<std::vector<std::string>> PolicyGuard::normalize_command(
    const protocol::CommandInput& cmd) const {
    std::vector<std::string> argv;
    if (const auto* text = std::get_if<std::string>(&cmd)) {
        auto split = split_shell_words(*text);
        if (core::errors::is_error(split)) {
            return core::errors::get_error(split);
        }
        argv = core::errors::get_value(split);
    } else {
        argv = std::get<std::vector<std::string>>(cmd);
    }

    if (argv.empty()) {
        return ToolError{ErrorCategory::Input, "Command cannot be empty.",
                         core::errors::codes::kEmptyCommand};
    }
    return argv;
}

std::string PolicyGuard::rejection_reason(const core::errors::ToolError& error) {
    if (error.code == core::errors::codes::kEmptyCommand) {
        return error.code;
    }
    return error.code + ": " + error.message;
}

std::vector<std::string> PolicyGuard::fallback_argv(const protocol::CommandInput& cmd) {
    if (const auto* text = std::get_if<std::string>(&cmd)) {
        return {*text};
    }
    return std::get<std::vector<std::string>>(cmd);
}

core::errors::Result<std::optional<std::filesystem::path>> PolicyGuard::resolve_policy_cwd(
    const std::optional<std::string>& cwd) const {
    if (!cwd.has_value()) {
        return std::optional<std::filesystem::path>{};
    }
    auto resolved = validate_path_in_workspace(policy_.sandbox_root, cwd.value());
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    return std::optional<std::filesystem::path>{core::errors::get_value(resolved)};
}

PolicyDecision PolicyGuard::check_execution_policy(
    const std::string& tool_name, const std::vector<std::string>& argv,
    const std::optional<std::string>& cwd,
    const std::optional<protocol::EnvOverrides>& env,
    const std::optional<int> timeout_s) const {
    static_cast<void>(tool_name);
    if (argv.empty()) {
        return PolicyDecision::deny(core::errors::codes::kEmptyCommand);
    }

    const std::string binary = std::filesystem::path(argv.front()).filename().string();
    if (policy_.denied_commands.count(binary) > 0 || binary.rfind("mkfs.", 0) == 0) {
        return PolicyDecision::deny("command '" + binary + "' is denied");
    }

    if (cwd.has_value()) {
        auto resolved = resolve_policy_cwd(cwd);
        if (core::errors::is_error(resolved)) {
            return PolicyDecision::deny(core::errors::get_error(resolved).message);
        }
    }

    if (timeout_s.has_value() && timeout_s.value() > policy_.max_timeout_s) {
        return PolicyDecision::deny("timeout_s exceeds maximum policy limit (" +
                                    std::to_string(policy_.max_timeout_s) + ")");
    }

    if (env.has_value()) {
        for (const auto& [key, value] : env.value()) {
            static_cast<void>(value);
            const bool prefixed = std::any_of(
                policy_.denied_env_prefixes.begin(), policy_.denied_env_prefixes.end(),
                [&key](const std::string& prefix) { return key.rfind(prefix, 0) == 0; });
            if (policy_.denied_env_exact.count(key) > 0 || prefixed) {
                return PolicyDecision::deny("env var '" + key + "' is denied");
            }
        }
    }

    return PolicyDecision::allow();
}

// Any token mentioning a secret marker is masked whole, so a
// `token=value` pair loses its key as well.
std::string PolicyGuard::sanitize_arg(const std::string& arg) {
    if (contains_secret_marker(lowercase(arg))) {
        return "***";
    }
    return arg;
}

std::string PolicyGuard::sanitize_command_preview(
    const std::vector<std::string>& argv) const {
    std::vector<std::string> masked;
    masked.reserve(argv.size());
    for (const auto& arg : argv) {
        masked.push_back(sanitize_arg(arg));
    }

    std::string preview = join_shell_words(masked);
    const std::size_t max_len = std::max<std::size_t>(policy_.preview_max_len, 4);
    if (preview.size() > max_len) {
        preview = preview.substr(0, max_len - 3) + "...";
    }
    return preview;
}

protocol::AuditRecord PolicyGuard::build_audit_metadata(
    const std::vector<std::string>& argv, const std::string& tool_name) const {
    protocol::AuditRecord audit;
    audit.execution_id = core::config::generate_execution_id();
    audit.policy_profile = policy_.profile_name;
    audit.tool = tool_name;
    audit.command_preview = sanitize_command_preview(argv);
    return audit;
}

}  // namespace knife::policy
