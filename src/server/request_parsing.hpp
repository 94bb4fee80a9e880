#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/knife_errors.hpp"
#include "protocol/command_contract.hpp"
#include "tools/tool_host.hpp"

namespace knife::server {

// Typed decoding of registry request bodies. Missing required fields,
// wrong JSON types and out-of-range numbers all fail with invalid_request.

core::errors::Result<protocol::ExecRequest> parse_exec_request(const nlohmann::json& payload);

core::errors::Result<protocol::ProcessStartRequest> parse_process_start_request(
    const nlohmann::json& payload);

core::errors::Result<protocol::ProcessStatusRequest> parse_process_status_request(
    const nlohmann::json& payload);

core::errors::Result<protocol::ProcessKillRequest> parse_process_kill_request(
    const nlohmann::json& payload);

core::errors::Result<protocol::ProcessReadRequest> parse_process_read_request(
    const nlohmann::json& payload);

core::errors::Result<tools::ReadRequest> parse_fs_read_request(const nlohmann::json& payload);

core::errors::Result<tools::WriteRequest> parse_fs_write_request(const nlohmann::json& payload);

core::errors::Result<tools::ListRequest> parse_fs_list_request(const nlohmann::json& payload);

core::errors::Result<std::string> parse_fs_stat_request(const nlohmann::json& payload);

core::errors::Result<tools::SearchRequest> parse_search_request(const nlohmann::json& payload);

core::errors::Result<protocol::GitRequest> parse_git_request(const nlohmann::json& payload);

core::errors::Result<protocol::GitCommitRequest> parse_git_commit_request(
    const nlohmann::json& payload);

core::errors::Result<tools::JsonPatchRequest> parse_json_patch_request(
    const nlohmann::json& payload);

}  // namespace knife::server
