#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "core/config/execution_id.hpp"
#include "core/errors/knife_errors.hpp"
#include "policy/policy_guard.hpp"

namespace {

using knife::core::errors::get_error;
using knife::core::errors::get_value;
using knife::core::errors::is_error;
using knife::policy::ExecutionPolicy;
using knife::policy::PolicyGuard;
using knife::protocol::EnvOverrides;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_policy_guard_" + knife::core::config::generate_execution_id());
        std::filesystem::create_directories(root_ / "sub");
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

void write_file(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path);
    out << content;
}

PolicyGuard guard_for(const std::filesystem::path& root) {
    ExecutionPolicy policy;
    policy.sandbox_root = root;
    return PolicyGuard(policy);
}

TEST(PolicyGuardTest, AllowsPathInsideWorkspace) {
    TempWorkspace workspace;
    write_file(workspace.root() / "sub/sample.txt", "ok");

    PolicyGuard guard;
    auto result =
        guard.validate_path_in_workspace(workspace.root(), "sub/sample.txt");
    ASSERT_FALSE(is_error(result));

    const auto resolved = get_value(result);
    EXPECT_TRUE(resolved.is_absolute());
    EXPECT_EQ(resolved.filename().string(), "sample.txt");
}

TEST(PolicyGuardTest, AllowsPathThatDoesNotExistYet) {
    TempWorkspace workspace;
    PolicyGuard guard;

    auto result = guard.validate_path_in_workspace(workspace.root(), "new/dir/file.txt");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).filename().string(), "file.txt");
}

TEST(PolicyGuardTest, RejectsPathOutsideWorkspace) {
    TempWorkspace workspace;
    const auto outside = workspace.root().parent_path() / "outside.txt";

    PolicyGuard guard;
    auto result = guard.validate_path_in_workspace(workspace.root(), outside);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "permission_denied");
    EXPECT_EQ(get_error(result).message,
              "Path is outside allowed base directory: " + outside.string());
}

TEST(PolicyGuardTest, RejectsDotDotEscape) {
    TempWorkspace workspace;
    PolicyGuard guard;

    auto result = guard.validate_path_in_workspace(workspace.root(), "sub/../../escape.txt");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "permission_denied");
}

TEST(PolicyGuardTest, RejectsSiblingWithSharedPrefix) {
    TempWorkspace workspace;
    const auto sibling = workspace.root().string() + "_sibling/file.txt";

    PolicyGuard guard;
    auto result = guard.validate_path_in_workspace(workspace.root(), sibling);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "permission_denied");
}

TEST(PolicyGuardTest, RejectsSymlinkPointingOutside) {
    TempWorkspace workspace;
    std::filesystem::create_directory_symlink("/", workspace.root() / "escape");

    PolicyGuard guard;
    auto result = guard.validate_path_in_workspace(workspace.root(), "escape/etc/passwd");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "permission_denied");
}

TEST(PolicyGuardTest, FailsWhenWorkspaceIsMissing) {
    TempWorkspace workspace;
    PolicyGuard guard;

    auto result = guard.validate_path_in_workspace(workspace.root() / "missing", "a.txt");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_path");
}

TEST(PolicyGuardTest, RejectsEmptySandboxPath) {
    TempWorkspace workspace;
    const auto guard = guard_for(workspace.root());

    auto result = guard.resolve_in_sandbox("");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_path");
}

TEST(PolicyGuardTest, NormalizesStringAndArgvCommands) {
    PolicyGuard guard;

    auto split = guard.normalize_command(std::string("echo 'hello world'"));
    ASSERT_FALSE(is_error(split));
    EXPECT_EQ(get_value(split), (std::vector<std::string>{"echo", "hello world"}));

    auto argv = guard.normalize_command(std::vector<std::string>{"ls", "-l"});
    ASSERT_FALSE(is_error(argv));
    EXPECT_EQ(get_value(argv), (std::vector<std::string>{"ls", "-l"}));
}

TEST(PolicyGuardTest, NormalizeRejectsEmptyAndMalformedCommands) {
    PolicyGuard guard;

    auto empty = guard.normalize_command(std::string("   "));
    ASSERT_TRUE(is_error(empty));
    EXPECT_EQ(get_error(empty).code, "empty_command");
    EXPECT_EQ(PolicyGuard::rejection_reason(get_error(empty)), "empty_command");

    auto unclosed = guard.normalize_command(std::string("echo \"oops"));
    ASSERT_TRUE(is_error(unclosed));
    EXPECT_EQ(get_error(unclosed).code, "invalid_command");
    EXPECT_EQ(PolicyGuard::rejection_reason(get_error(unclosed)),
              "invalid_command: No closing quotation");
}

TEST(PolicyGuardTest, DeniesListedBinariesByBasename) {
    PolicyGuard guard;

    auto decision = guard.check_execution_policy(
        "shell.exec", {"/sbin/shutdown", "-h", "now"}, std::nullopt, std::nullopt, std::nullopt);
    EXPECT_FALSE(decision.allowed);
    EXPECT_EQ(decision.reason.value_or(""), "command 'shutdown' is denied");

    auto mkfs = guard.check_execution_policy("shell.exec", {"mkfs.ext4", "/dev/sda1"},
                                             std::nullopt, std::nullopt, std::nullopt);
    EXPECT_FALSE(mkfs.allowed);
    EXPECT_EQ(mkfs.reason.value_or(""), "command 'mkfs.ext4' is denied");

    auto allowed = guard.check_execution_policy("shell.exec", {"echo", "shutdown"},
                                                std::nullopt, std::nullopt, std::nullopt);
    EXPECT_TRUE(allowed.allowed);
}

TEST(PolicyGuardTest, EnforcesTimeoutCeiling) {
    PolicyGuard guard;

    auto at_limit = guard.check_execution_policy("shell.exec", {"true"}, std::nullopt,
                                                 std::nullopt, 300);
    EXPECT_TRUE(at_limit.allowed);

    auto over = guard.check_execution_policy("shell.exec", {"true"}, std::nullopt,
                                             std::nullopt, 301);
    EXPECT_FALSE(over.allowed);
    EXPECT_EQ(over.reason.value_or(""), "timeout_s exceeds maximum policy limit (300)");
}

TEST(PolicyGuardTest, DeniesLoaderEnvironmentVariables) {
    PolicyGuard guard;

    auto exact = guard.check_execution_policy(
        "shell.exec", {"true"}, std::nullopt, EnvOverrides{{"LD_PRELOAD", "/tmp/x.so"}},
        std::nullopt);
    EXPECT_FALSE(exact.allowed);
    EXPECT_EQ(exact.reason.value_or(""), "env var 'LD_PRELOAD' is denied");

    auto prefixed = guard.check_execution_policy(
        "shell.exec", {"true"}, std::nullopt,
        EnvOverrides{{"BASH_FUNC_ls%%", "() { :; }"}}, std::nullopt);
    EXPECT_FALSE(prefixed.allowed);
    EXPECT_EQ(prefixed.reason.value_or(""), "env var 'BASH_FUNC_ls%%' is denied");

    auto benign = guard.check_execution_policy(
        "shell.exec", {"true"}, std::nullopt, EnvOverrides{{"FOO", "bar"}}, std::nullopt);
    EXPECT_TRUE(benign.allowed);
}

TEST(PolicyGuardTest, DeniesCwdOutsideSandbox) {
    TempWorkspace workspace;
    const auto guard = guard_for(workspace.root());

    auto decision = guard.check_execution_policy("shell.exec", {"ls"}, std::string("/"),
                                                 std::nullopt, std::nullopt);
    EXPECT_FALSE(decision.allowed);
    EXPECT_EQ(decision.reason.value_or(""), "Path is outside allowed base directory: /");

    auto inside = guard.check_execution_policy("shell.exec", {"ls"}, std::string("sub"),
                                               std::nullopt, std::nullopt);
    EXPECT_TRUE(inside.allowed);
}

TEST(PolicyGuardTest, ChecksDenyListBeforeTimeout) {
    PolicyGuard guard;

    auto decision = guard.check_execution_policy(
        "shell.exec", {"reboot"}, std::nullopt, EnvOverrides{{"LD_PRELOAD", "x"}}, 9999);
    EXPECT_FALSE(decision.allowed);
    EXPECT_EQ(decision.reason.value_or(""), "command 'reboot' is denied");
}

TEST(PolicyGuardTest, MasksSecretsInPreview) {
    PolicyGuard guard;

    const auto preview = guard.sanitize_command_preview(
        {"curl", "token=abc123", "--header", "my-secret-value", "plain"});
    EXPECT_EQ(preview, "curl '***' --header '***' plain");
    EXPECT_EQ(preview.find("abc123"), std::string::npos);
    EXPECT_EQ(preview.find("my-secret-value"), std::string::npos);
    EXPECT_NE(preview.find("plain"), std::string::npos);
}

TEST(PolicyGuardTest, AuditPreviewRedactsSplitCommand) {
    PolicyGuard guard;

    auto argv = guard.normalize_command(std::string("token=abc123 password:letmein"));
    ASSERT_FALSE(is_error(argv));
    const auto audit = guard.build_audit_metadata(get_value(argv), "shell.exec");

    EXPECT_EQ(audit.command_preview.find("abc123"), std::string::npos);
    EXPECT_EQ(audit.command_preview.find("letmein"), std::string::npos);
    EXPECT_EQ(audit.command_preview, "'***' '***'");
}

TEST(PolicyGuardTest, TruncatesLongPreview) {
    ExecutionPolicy policy;
    policy.preview_max_len = 20;
    PolicyGuard guard(policy);

    const auto preview = guard.sanitize_command_preview(
        {"echo", "aaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa"});
    EXPECT_EQ(preview.size(), 20u);
    EXPECT_EQ(preview.substr(17), "...");
}

TEST(PolicyGuardTest, BuildsAuditMetadata) {
    PolicyGuard guard;

    const auto first = guard.build_audit_metadata({"echo", "hi"}, "shell.exec");
    const auto second = guard.build_audit_metadata({"echo", "hi"}, "shell.exec");
    EXPECT_EQ(first.execution_id.size(), 32u);
    EXPECT_NE(first.execution_id, second.execution_id);
    EXPECT_EQ(first.policy_profile, "default-restricted-v1");
    EXPECT_EQ(first.tool, "shell.exec");
    EXPECT_EQ(first.command_preview, "echo hi");
}

}  // namespace
