#include "server/builtin_tools.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include "core/text/utf8.hpp"
#include "core/time/timestamps.hpp"
#include "server/request_parsing.hpp"

namespace knife::server {

using nlohmann::json;

namespace {

// File names are raw bytes; JSON strings must be valid UTF-8.
std::string path_text(const std::string& raw) {
    return core::text::decode_output(raw).text;
}

std::string path_text(const std::filesystem::path& path) {
    return path_text(path.string());
}

json optional_path(const std::optional<std::filesystem::path>& path) {
    return path.has_value() ? json(path_text(*path)) : json(nullptr);
}

json optional_int(const std::optional<int>& value) {
    return value.has_value() ? json(value.value()) : json(nullptr);
}

json rejection_json(const protocol::ExecutionRejection& rejection) {
    if (rejection.code == core::errors::codes::kPolicyDenied) {
        return protocol::policy_denied_response(rejection.reason, rejection.audit);
    }
    auto payload = protocol::failure(rejection.code, rejection.reason);
    payload["audit"] = protocol::to_json(rejection.audit);
    return payload;
}

json path_info_json(const tools::PathInfo& info) {
    return json{{"path", path_text(info.path)},
                {"rel_path", path_text(info.rel_path)},
                {"type", info.type},
                {"size", info.size.has_value() ? json(info.size.value()) : json(nullptr)},
                {"mtime", info.mtime.has_value() ? json(info.mtime.value()) : json(nullptr)}};
}

json command_schema() {
    return json{{"anyOf",
                 json::array({json{{"type", "string"}},
                              json{{"type", "array"}, {"items", {{"type", "string"}}}}})}};
}

json env_schema() {
    return json{{"type", "object"}, {"additionalProperties", {{"type", "string"}}}};
}

json object_schema(json properties, json required) {
    return json{{"type", "object"}, {"properties", std::move(properties)},
                {"required", std::move(required)}};
}

protocol::ToolDefinition define(std::string name, std::string path, std::string description,
                                std::optional<json> schema, std::string method = "POST") {
    protocol::ToolDefinition definition;
    definition.name = std::move(name);
    definition.method = std::move(method);
    definition.path = std::move(path);
    definition.description = std::move(description);
    definition.request_schema = std::move(schema);
    return definition;
}

// Adapts a typed parser and operation into a JSON handler.
template <typename Parse, typename Run>
ToolHandler handler(Parse parse, Run run) {
    return [parse, run](const json& payload) -> json {
        auto request = parse(payload);
        if (core::errors::is_error(request)) {
            return protocol::failure(core::errors::get_error(request));
        }
        return run(core::errors::get_value(request));
    };
}

void register_file_tools(ToolRegistry& registry, const std::shared_ptr<tools::ToolHost>& host) {
    registry.add(
        define("shell.exec", "/shell/exec",
               "Run a command synchronously and return its exit code and output.",
               object_schema({{"cmd", command_schema()},
                              {"cwd", {{"type", "string"}}},
                              {"env", env_schema()},
                              {"timeout_s", {{"type", "integer"}, {"default", 60}}}},
                             json::array({"cmd"}))),
        handler(parse_exec_request,
                [host](const protocol::ExecRequest& request) { return to_json(host->exec(request)); }));

    registry.add(
        define("fs.read", "/fs/read", "Read a file inside the allowed base directory.",
               object_schema({{"path", {{"type", "string"}}},
                              {"max_bytes", {{"type", "integer"}}}},
                             json::array({"path"}))),
        handler(parse_fs_read_request, [host](const tools::ReadRequest& request) {
            auto result = host->read_file(request);
            if (core::errors::is_error(result)) {
                return protocol::failure(core::errors::get_error(result));
            }
            const auto& file = core::errors::get_value(result);
            return protocol::success({{"path", path_text(file.path)},
                                      {"size", file.size},
                                      {"content", file.content},
                                      {"encoding", file.encoding},
                                      {"truncated", file.truncated}});
        }));

    registry.add(
        define("fs.write", "/fs/write", "Write or append to a file inside the allowed base directory.",
               object_schema({{"path", {{"type", "string"}}},
                              {"content", {{"type", "string"}}},
                              {"mode",
                               {{"type", "string"},
                                {"enum", json::array({"overwrite", "append"})},
                                {"default", "overwrite"}}}},
                             json::array({"path", "content"}))),
        handler(parse_fs_write_request, [host](const tools::WriteRequest& request) {
            auto result = host->write_file(request);
            if (core::errors::is_error(result)) {
                return protocol::failure(core::errors::get_error(result));
            }
            const auto& receipt = core::errors::get_value(result);
            return protocol::success(
                {{"path", path_text(receipt.path)}, {"bytes_written", receipt.bytes_written}});
        }));

    registry.add(
        define("fs.list", "/fs/list", "List directory contents.",
               object_schema({{"path", {{"type", "string"}}},
                              {"recursive", {{"type", "boolean"}, {"default", false}}},
                              {"max_entries", {{"type", "integer"}, {"default", 2000}}}},
                             json::array({"path"}))),
        handler(parse_fs_list_request, [host](const tools::ListRequest& request) {
            auto result = host->list_dir(request);
            if (core::errors::is_error(result)) {
                return protocol::failure(core::errors::get_error(result));
            }
            const auto& listing = core::errors::get_value(result);
            json entries = json::array();
            for (const auto& entry : listing.entries) {
                entries.push_back(path_info_json(entry));
            }
            return protocol::success({{"path", path_text(listing.path)},
                                      {"entries", entries},
                                      {"truncated", listing.truncated}});
        }));

    registry.add(
        define("fs.stat", "/fs/stat", "Stat a file or directory.",
               object_schema({{"path", {{"type", "string"}}}}, json::array({"path"}))),
        handler(parse_fs_stat_request, [host](const std::string& path) {
            auto result = host->stat_path(path);
            if (core::errors::is_error(result)) {
                return protocol::failure(core::errors::get_error(result));
            }
            auto payload = path_info_json(core::errors::get_value(result));
            return protocol::success(std::move(payload));
        }));

    registry.add(
        define("search.text", "/search/text",
               "Search text files for a literal substring.",
               object_schema({{"pattern", {{"type", "string"}}},
                              {"path", {{"type", "string"}, {"default", "."}}},
                              {"max_results", {{"type", "integer"}, {"default", 200}}}},
                             json::array({"pattern"}))),
        handler(parse_search_request, [host](const tools::SearchRequest& request) {
            auto result = host->search(request);
            if (core::errors::is_error(result)) {
                return protocol::failure(core::errors::get_error(result));
            }
            const auto& found = core::errors::get_value(result);
            json matches = json::array();
            for (const auto& match : found.matches) {
                matches.push_back(json{{"path", path_text(match.path)},
                                       {"line_number", match.line_number},
                                       {"line", match.line}});
            }
            return protocol::success({{"matches", matches}, {"truncated", found.truncated}});
        }));

    registry.add(
        define("json.patch", "/json/patch",
               "Apply RFC 6902 JSON Patch operations to a JSON file.",
               object_schema({{"path", {{"type", "string"}}},
                              {"patch", {{"type", "array"}, {"items", {{"type", "object"}}}}},
                              {"create_if_missing", {{"type", "boolean"}, {"default", false}}}},
                             json::array({"path", "patch"}))),
        handler(parse_json_patch_request, [host](const tools::JsonPatchRequest& request) {
            auto result = host->patch_json(request);
            if (core::errors::is_error(result)) {
                return protocol::failure(core::errors::get_error(result));
            }
            const auto& receipt = core::errors::get_value(result);
            return protocol::success(
                {{"path", path_text(receipt.path)}, {"bytes_written", receipt.bytes_written}});
        }));
}

void register_git_tools(ToolRegistry& registry, const std::shared_ptr<tools::ToolHost>& host) {
    const auto git_schema = object_schema({{"cwd", {{"type", "string"}}},
                                           {"timeout_s", {{"type", "integer"}, {"default", 60}}}},
                                          json::array());
    registry.add(
        define("git.status", "/git/status",
               "Concise git status with branch and untracked files.", git_schema),
        handler(parse_git_request, [host](const protocol::GitRequest& request) {
            return to_json(host->git_status(request));
        }));

    registry.add(
        define("git.diff", "/git/diff", "Staged and unstaged diff without color.", git_schema),
        handler(parse_git_request, [host](const protocol::GitRequest& request) {
            return to_json(host->git_diff(request));
        }));

    registry.add(
        define("git.commit", "/git/commit", "Stage all changes and commit them.",
               object_schema({{"message", {{"type", "string"}}},
                              {"cwd", {{"type", "string"}}},
                              {"timeout_s", {{"type", "integer"}, {"default", 60}}}},
                             json::array({"message"}))),
        handler(parse_git_commit_request, [host](const protocol::GitCommitRequest& request) {
            return to_json(host->git_commit(request));
        }));
}

void register_process_tools(ToolRegistry& registry,
                            const std::shared_ptr<process::ProcessSupervisor>& supervisor) {
    registry.add(
        define("process.start", "/process/start",
               "Start a long-running process and return its pid.",
               object_schema({{"cmd", command_schema()},
                              {"cwd", {{"type", "string"}}},
                              {"env", env_schema()},
                              {"capture_output", {{"type", "boolean"}, {"default", true}}}},
                             json::array({"cmd"}))),
        handler(parse_process_start_request,
                [supervisor](const protocol::ProcessStartRequest& request) {
                    return to_json(supervisor->start(request));
                }));

    registry.add(
        define("process.status", "/process/status", "Process status.",
               object_schema({{"pid", {{"type", "integer"}}}}, json::array({"pid"}))),
        handler(parse_process_status_request,
                [supervisor](const protocol::ProcessStatusRequest& request) {
                    auto result = supervisor->status(request.pid);
                    if (core::errors::is_error(result)) {
                        return protocol::failure(core::errors::get_error(result));
                    }
                    return protocol::success(to_json(core::errors::get_value(result)));
                }));

    registry.add(
        define("process.kill", "/process/kill", "Kill a process started by the server.",
               object_schema({{"pid", {{"type", "integer"}}},
                              {"force", {{"type", "boolean"}, {"default", false}}},
                              {"timeout_s", {{"type", "integer"}, {"default", 5}}}},
                             json::array({"pid"}))),
        handler(parse_process_kill_request,
                [supervisor](const protocol::ProcessKillRequest& request) {
                    auto result = supervisor->kill(request.pid, request.force,
                                                   std::chrono::seconds(request.timeout_s));
                    if (core::errors::is_error(result)) {
                        return protocol::failure(core::errors::get_error(result));
                    }
                    const auto& outcome = core::errors::get_value(result);
                    return protocol::success(
                        {{"status", outcome.status}, {"returncode", optional_int(outcome.returncode)}});
                }));

    registry.add(
        define("process.read", "/process/read", "Read captured process output.",
               object_schema({{"pid", {{"type", "integer"}}},
                              {"stream",
                               {{"type", "string"},
                                {"enum", json::array({"stdout", "stderr"})},
                                {"default", "stdout"}}},
                              {"max_bytes", {{"type", "integer"}, {"default", 20000}}},
                              {"tail", {{"type", "boolean"}, {"default", true}}}},
                             json::array({"pid"}))),
        handler(parse_process_read_request,
                [supervisor](const protocol::ProcessReadRequest& request) {
                    auto result = supervisor->read(request.pid, request.stream,
                                                   request.max_bytes, request.tail);
                    if (core::errors::is_error(result)) {
                        return protocol::failure(core::errors::get_error(result));
                    }
                    const auto& slice = core::errors::get_value(result);
                    return protocol::success({{"pid", slice.pid},
                                              {"stream", slice.stream},
                                              {"size", slice.size},
                                              {"content", slice.content},
                                              {"encoding", slice.encoding},
                                              {"truncated", slice.truncated}});
                }));

    registry.add(define("process.list", "/process/list", "List server-started processes.",
                        std::nullopt),
                 [supervisor](const json&) {
                     json processes = json::array();
                     for (const auto& status : supervisor->list()) {
                         processes.push_back(to_json(status));
                     }
                     return protocol::success({{"processes", processes}});
                 });
}

}  // namespace

void register_builtin_tools(ToolRegistry& registry, std::shared_ptr<tools::ToolHost> host,
                            std::shared_ptr<process::ProcessSupervisor> supervisor) {
    registry.add(define("health", "/health", "Health check", std::nullopt, "GET"),
                 [](const json&) { return protocol::success(); });
    register_file_tools(registry, host);
    register_git_tools(registry, host);
    register_process_tools(registry, supervisor);
}

json to_json(const tools::ExecOutcome& outcome) {
    if (const auto* rejection = std::get_if<protocol::ExecutionRejection>(&outcome)) {
        return rejection_json(*rejection);
    }
    const auto& result = std::get<tools::ExecResult>(outcome);
    return json{{"ok", result.ok},
                {"exit_code", result.exit_code},
                {"stdout", result.stdout_text},
                {"stderr", result.stderr_text},
                {"timestamp", result.timestamp},
                {"audit", protocol::to_json(result.audit)}};
}

json to_json(const process::StartOutcome& outcome) {
    if (const auto* rejection = std::get_if<protocol::ExecutionRejection>(&outcome)) {
        return rejection_json(*rejection);
    }
    const auto& started = std::get<process::StartedProcess>(outcome);
    return protocol::success({{"pid", started.pid},
                              {"execution_id", started.execution_id},
                              {"cwd", optional_path(started.cwd)},
                              {"stdout_path", optional_path(started.stdout_path)},
                              {"stderr_path", optional_path(started.stderr_path)},
                              {"audit", protocol::to_json(started.audit)}});
}

json to_json(const process::ProcessStatus& status) {
    return json{{"pid", status.pid},
                {"execution_id", status.execution_id},
                {"running", status.running},
                {"returncode", optional_int(status.returncode)},
                {"cmd", status.argv},
                {"cwd", optional_path(status.cwd)},
                {"start_time", core::time::to_unix_seconds(status.start_time)},
                {"capture_output", status.capture_output},
                {"stdout_path", optional_path(status.stdout_path)},
                {"stderr_path", optional_path(status.stderr_path)},
                {"audit", protocol::to_json(status.audit)}};
}

json process_snapshot(process::ProcessSupervisor& supervisor) {
    json items = json::array();
    for (const auto& status : supervisor.list()) {
        items.push_back(json{{"pid", status.pid},
                             {"running", status.running},
                             {"returncode", optional_int(status.returncode)},
                             {"cmd", status.argv},
                             {"cwd", optional_path(status.cwd)},
                             {"start_time", core::time::to_unix_seconds(status.start_time)},
                             {"capture_output", status.capture_output}});
    }
    return json{{"total", items.size()}, {"items", items}};
}

}  // namespace knife::server
