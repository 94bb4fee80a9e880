#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/execution_id.hpp"
#include "core/errors/knife_errors.hpp"
#include "server/builtin_tools.hpp"
#include "server/request_parsing.hpp"
#include "server/tool_registry.hpp"

namespace {

using nlohmann::json;
using knife::core::errors::get_error;
using knife::core::errors::get_value;
using knife::core::errors::is_error;
using knife::policy::ExecutionPolicy;
using knife::policy::PolicyGuard;
using knife::process::ProcessSupervisor;
using knife::protocol::ToolDefinition;
using knife::server::ToolRegistry;
using knife::telemetry::TelemetryRecorder;
using knife::tools::ToolHost;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_registry_" + knife::core::config::generate_execution_id());
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

ToolDefinition definition(const std::string& name, const std::string& path) {
    ToolDefinition tool;
    tool.name = name;
    tool.path = path;
    tool.description = name + " tool";
    return tool;
}

// Registry wired with the built-in tools over a temporary workspace.
class BuiltinRegistry {
public:
    explicit BuiltinRegistry(const std::filesystem::path& root)
        : registry_(std::make_shared<TelemetryRecorder>()) {
        ExecutionPolicy policy;
        policy.sandbox_root = root;
        auto guard = std::make_shared<const PolicyGuard>(policy);
        supervisor_ = std::make_shared<ProcessSupervisor>(guard);
        knife::server::register_builtin_tools(registry_, std::make_shared<ToolHost>(guard),
                                              supervisor_);
    }

    ToolRegistry& registry() { return registry_; }
    ProcessSupervisor& supervisor() { return *supervisor_; }

private:
    ToolRegistry registry_;
    std::shared_ptr<ProcessSupervisor> supervisor_;
};

TEST(ToolRegistryTest, ListsToolsInRegistrationOrder) {
    ToolRegistry registry(std::make_shared<TelemetryRecorder>());
    registry.add(definition("b.tool", "/b"), [](const json&) { return json{{"ok", true}}; });
    registry.add(definition("a.tool", "/a"), [](const json&) { return json{{"ok", true}}; });

    const auto listed = registry.list_tools();
    EXPECT_TRUE(listed["ok"].get<bool>());
    ASSERT_EQ(listed["tools"].size(), 2u);
    EXPECT_EQ(listed["tools"][0]["name"], "b.tool");
    EXPECT_EQ(listed["tools"][0]["method"], "POST");
    EXPECT_EQ(listed["tools"][1]["path"], "/a");
    EXPECT_FALSE(listed["tools"][1].contains("request_schema"));
}

TEST(ToolRegistryTest, UnknownToolIsNotFoundAndRecorded) {
    auto telemetry = std::make_shared<TelemetryRecorder>();
    ToolRegistry registry(telemetry);

    const auto response = registry.invoke("nope", json::object());
    EXPECT_FALSE(response["ok"].get<bool>());
    EXPECT_EQ(response["error"], "not_found");
    EXPECT_EQ(response["message"], "Unknown tool: nope");

    EXPECT_EQ(telemetry->history()["total"], 1);
    EXPECT_EQ(telemetry->error_counters()["not_found"], 1);
}

TEST(ToolRegistryTest, HandlerExceptionBecomesInternalError) {
    ToolRegistry registry(std::make_shared<TelemetryRecorder>());
    registry.add(definition("boom", "/boom"),
                 [](const json&) -> json { throw std::runtime_error("kaput"); });

    const auto response = registry.invoke("boom", json::object());
    EXPECT_FALSE(response["ok"].get<bool>());
    EXPECT_EQ(response["error"], "internal_error");
    EXPECT_EQ(response["message"], "kaput");
}

TEST(ToolRegistryTest, RecordsEveryInvocation) {
    auto telemetry = std::make_shared<TelemetryRecorder>();
    ToolRegistry registry(telemetry);
    registry.add(definition("echo", "/echo"),
                 [](const json& payload) { return json{{"ok", true}, {"echo", payload}}; });

    registry.invoke("echo", json{{"value", 1}});
    registry.invoke("echo", json{{"value", 2}});

    const auto history = telemetry->history();
    ASSERT_EQ(history["total"], 2);
    EXPECT_EQ(history["items"][0]["request"]["value"], 2);
    EXPECT_EQ(history["items"][0]["path"], "/echo");
    EXPECT_EQ(history["items"][1]["request"]["value"], 1);
}

TEST(ToolRegistryTest, AdvertisesBuiltinTools) {
    TempWorkspace workspace;
    BuiltinRegistry builtin(workspace.root());

    std::vector<std::string> names;
    for (const auto& tool : builtin.registry().definitions()) {
        names.push_back(tool.name);
    }
    EXPECT_EQ(names, (std::vector<std::string>{"health", "shell.exec", "fs.read", "fs.write",
                                               "fs.list", "fs.stat", "search.text",
                                               "json.patch", "git.status", "git.diff",
                                               "git.commit", "process.start", "process.status",
                                               "process.kill", "process.read",
                                               "process.list"}));

    const auto health = builtin.registry().find("health");
    ASSERT_TRUE(health.has_value());
    EXPECT_EQ(health->method, "GET");
    EXPECT_EQ(builtin.registry().invoke("health", json::object())["ok"], true);

    const auto exec = builtin.registry().find("shell.exec");
    ASSERT_TRUE(exec.has_value());
    ASSERT_TRUE(exec->request_schema.has_value());
    EXPECT_EQ((*exec->request_schema)["required"], json::array({"cmd"}));
}

TEST(ToolRegistryTest, RejectsMalformedPayloads) {
    TempWorkspace workspace;
    BuiltinRegistry builtin(workspace.root());

    const auto missing = builtin.registry().invoke("fs.read", json::object());
    EXPECT_EQ(missing["error"], "invalid_request");
    EXPECT_EQ(missing["message"], "Field 'path' is required.");

    const auto wrong_type = builtin.registry().invoke("shell.exec", json{{"cmd", 42}});
    EXPECT_EQ(wrong_type["error"], "invalid_request");

    const auto out_of_range =
        builtin.registry().invoke("search.text", json{{"pattern", "x"}, {"max_results", 0}});
    EXPECT_EQ(out_of_range["error"], "invalid_request");
}

TEST(ToolRegistryTest, ShellExecDenialCarriesAudit) {
    TempWorkspace workspace;
    BuiltinRegistry builtin(workspace.root());

    const auto response =
        builtin.registry().invoke("shell.exec", json{{"cmd", "shutdown -h now"}});
    EXPECT_FALSE(response["ok"].get<bool>());
    EXPECT_EQ(response["error"], "policy_denied");
    EXPECT_EQ(response["reason"], "command 'shutdown' is denied");
    EXPECT_EQ(response["audit"]["tool"], "shell.exec");
    EXPECT_EQ(response["audit"]["policy_profile"], "default-restricted-v1");

    const auto denials = builtin.registry().telemetry().policy_denials();
    ASSERT_EQ(denials["total"], 1);
    EXPECT_EQ(denials["items"][0]["name"], "shell.exec");
    EXPECT_EQ(denials["items"][0]["reason"], "command 'shutdown' is denied");
}

TEST(ToolRegistryTest, FileToolsRoundTripThroughJson) {
    TempWorkspace workspace;
    BuiltinRegistry builtin(workspace.root());
    auto& registry = builtin.registry();

    const auto written =
        registry.invoke("fs.write", json{{"path", "docs/readme.md"}, {"content", "hello"}});
    ASSERT_TRUE(written["ok"].get<bool>());
    EXPECT_EQ(written["bytes_written"], 5);

    const auto read = registry.invoke("fs.read", json{{"path", "docs/readme.md"}});
    ASSERT_TRUE(read["ok"].get<bool>());
    EXPECT_EQ(read["content"], "hello");
    EXPECT_EQ(read["encoding"], "utf-8");
    EXPECT_EQ(read["truncated"], false);

    const auto stat = registry.invoke("fs.stat", json{{"path", "docs"}});
    ASSERT_TRUE(stat["ok"].get<bool>());
    EXPECT_EQ(stat["type"], "dir");
    EXPECT_TRUE(stat["size"].is_number());

    const auto listing = registry.invoke("fs.list", json{{"path", "docs"}});
    ASSERT_TRUE(listing["ok"].get<bool>());
    ASSERT_EQ(listing["entries"].size(), 1u);
    EXPECT_EQ(listing["entries"][0]["rel_path"], "docs/readme.md");

    const auto found = registry.invoke("search.text", json{{"pattern", "hell"}});
    ASSERT_TRUE(found["ok"].get<bool>());
    ASSERT_EQ(found["matches"].size(), 1u);
    EXPECT_EQ(found["matches"][0]["line_number"], 1);
}

TEST(ToolRegistryTest, NonUtf8FileNamesStaySerializable) {
    TempWorkspace workspace;
    std::ofstream(workspace.root() / "bad\xff.txt") << "needle\n";
    BuiltinRegistry builtin(workspace.root());
    auto& registry = builtin.registry();

    const auto listing = registry.invoke("fs.list", json{{"path", "."}});
    ASSERT_TRUE(listing["ok"].get<bool>());
    EXPECT_NO_THROW(static_cast<void>(listing.dump()));
    EXPECT_EQ(listing["entries"][0]["rel_path"], "bad\u00ff.txt");

    const auto found = registry.invoke("search.text", json{{"pattern", "needle"}});
    ASSERT_TRUE(found["ok"].get<bool>());
    EXPECT_NO_THROW(static_cast<void>(found.dump()));

    const auto stat = registry.invoke("fs.stat", json{{"path", "bad\u00ff.txt"}});
    EXPECT_EQ(stat["error"], "not_found");

    EXPECT_NO_THROW(static_cast<void>(registry.telemetry().history().dump()));
}

TEST(ToolRegistryTest, JsonPatchAndGitToolsThroughJson) {
    TempWorkspace workspace;
    BuiltinRegistry builtin(workspace.root());
    auto& registry = builtin.registry();

    const auto created = registry.invoke(
        "json.patch", json{{"path", "data.json"},
                           {"patch", json::array({json{{"op", "add"}, {"path", "/k"}, {"value", 1}}})},
                           {"create_if_missing", true}});
    ASSERT_TRUE(created["ok"].get<bool>()) << created.dump();
    EXPECT_EQ(registry.invoke("fs.read", json{{"path", "data.json"}})["content"],
              "{\n  \"k\": 1\n}\n");

    const auto not_a_list =
        registry.invoke("json.patch", json{{"path", "data.json"}, {"patch", json::object()}});
    EXPECT_EQ(not_a_list["error"], "invalid_request");
    EXPECT_EQ(not_a_list["message"], "Field 'patch' must be a list.");

    const auto denied = registry.invoke("git.status", json{{"cwd", "/"}});
    EXPECT_EQ(denied["error"], "policy_denied");
    EXPECT_EQ(denied["audit"]["tool"], "git.status");

    const auto no_message = registry.invoke("git.commit", json::object());
    EXPECT_EQ(no_message["error"], "invalid_request");
    const auto empty_message = registry.invoke("git.commit", json{{"message", ""}});
    EXPECT_EQ(empty_message["message"], "Field 'message' must not be empty.");
}

TEST(ToolRegistryTest, OutsidePathCountsAsPolicyDenial) {
    TempWorkspace workspace;
    BuiltinRegistry builtin(workspace.root());

    const auto response = builtin.registry().invoke("fs.read", json{{"path", "/etc/passwd"}});
    EXPECT_EQ(response["error"], "permission_denied");

    const auto denials = builtin.registry().telemetry().policy_denials();
    ASSERT_EQ(denials["total"], 1);
    EXPECT_EQ(denials["items"][0]["error"], "permission_denied");
}

TEST(ToolRegistryTest, ProcessToolsReportLifecycle) {
    TempWorkspace workspace;
    BuiltinRegistry builtin(workspace.root());
    auto& registry = builtin.registry();

    const auto started = registry.invoke("process.start", json{{"cmd", json::array({"true"})}});
    ASSERT_TRUE(started["ok"].get<bool>());
    const int pid = started["pid"].get<int>();
    EXPECT_EQ(started["execution_id"], started["audit"]["execution_id"]);

    const auto killed =
        registry.invoke("process.kill", json{{"pid", pid}, {"timeout_s", 5}});
    ASSERT_TRUE(killed["ok"].get<bool>());

    const auto status = registry.invoke("process.status", json{{"pid", pid}});
    ASSERT_TRUE(status["ok"].get<bool>());
    EXPECT_FALSE(status["running"].get<bool>());
    EXPECT_EQ(status["cmd"], json::array({"true"}));

    const auto listed = registry.invoke("process.list", json::object());
    ASSERT_TRUE(listed["ok"].get<bool>());
    EXPECT_EQ(listed["processes"].size(), 1u);

    const auto snapshot = knife::server::process_snapshot(builtin.supervisor());
    EXPECT_EQ(snapshot["total"], 1);
    EXPECT_EQ(snapshot["items"][0]["pid"], pid);

    const auto unknown = registry.invoke("process.status", json{{"pid", 999999}});
    EXPECT_EQ(unknown["error"], "not_found");
}

TEST(RequestParsingTest, AppliesDefaults) {
    auto exec = knife::server::parse_exec_request(json{{"cmd", "ls"}});
    ASSERT_FALSE(is_error(exec));
    EXPECT_EQ(get_value(exec).timeout_s, 60);
    EXPECT_FALSE(get_value(exec).cwd.has_value());

    auto read = knife::server::parse_process_read_request(json{{"pid", 12}});
    ASSERT_FALSE(is_error(read));
    EXPECT_EQ(get_value(read).stream, "stdout");
    EXPECT_EQ(get_value(read).max_bytes, 20000);
    EXPECT_TRUE(get_value(read).tail);

    auto kill = knife::server::parse_process_kill_request(json{{"pid", 12}});
    ASSERT_FALSE(is_error(kill));
    EXPECT_EQ(get_value(kill).timeout_s, 5);
    EXPECT_FALSE(get_value(kill).force);
}

TEST(RequestParsingTest, DecodesGitAndPatchRequests) {
    auto status = knife::server::parse_git_request(json::object());
    ASSERT_FALSE(is_error(status));
    EXPECT_FALSE(get_value(status).cwd.has_value());
    EXPECT_EQ(get_value(status).timeout_s, 60);

    auto commit = knife::server::parse_git_commit_request(
        json{{"message", "fix"}, {"cwd", "repo"}});
    ASSERT_FALSE(is_error(commit));
    EXPECT_EQ(get_value(commit).message, "fix");
    EXPECT_EQ(get_value(commit).cwd.value_or(""), "repo");

    auto patch = knife::server::parse_json_patch_request(
        json{{"path", "a.json"}, {"patch", json::array()}});
    ASSERT_FALSE(is_error(patch));
    EXPECT_TRUE(get_value(patch).patch.empty());
    EXPECT_FALSE(get_value(patch).create_if_missing);

    auto missing_patch = knife::server::parse_json_patch_request(json{{"path", "a.json"}});
    ASSERT_TRUE(is_error(missing_patch));
    EXPECT_EQ(get_error(missing_patch).message, "Field 'patch' is required.");
}

TEST(RequestParsingTest, TreatsNullAsAbsent) {
    auto search = knife::server::parse_search_request(
        json{{"pattern", "todo"}, {"path", nullptr}, {"max_results", nullptr}});
    ASSERT_FALSE(is_error(search));
    EXPECT_EQ(get_value(search).path, ".");
    EXPECT_EQ(get_value(search).max_results, 200u);
}

TEST(RequestParsingTest, RejectsBadShapes) {
    auto not_object = knife::server::parse_fs_stat_request(json::array({1, 2}));
    ASSERT_TRUE(is_error(not_object));
    EXPECT_EQ(get_error(not_object).code, "invalid_request");

    auto bad_env = knife::server::parse_process_start_request(
        json{{"cmd", "env"}, {"env", {{"A", 1}}}});
    ASSERT_TRUE(is_error(bad_env));
    EXPECT_EQ(get_error(bad_env).message, "Field 'env.A' must be a string.");

    auto bad_pid = knife::server::parse_process_status_request(json{{"pid", 0}});
    ASSERT_TRUE(is_error(bad_pid));
    EXPECT_EQ(get_error(bad_pid).code, "invalid_request");

    auto float_timeout =
        knife::server::parse_exec_request(json{{"cmd", "ls"}, {"timeout_s", 1.5}});
    ASSERT_TRUE(is_error(float_timeout));
    EXPECT_EQ(get_error(float_timeout).message, "Field 'timeout_s' must be an integer.");
}

}  // namespace
