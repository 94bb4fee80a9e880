#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/knife_errors.hpp"
#include "policy/policy_guard.hpp"
#include "protocol/audit_contract.hpp"
#include "protocol/command_contract.hpp"

namespace knife::tools {

struct ToolHostOptions {
    std::uintmax_t max_read_bytes = 200000;
    std::size_t output_cap_chars = 20000;
    std::chrono::milliseconds write_lock_timeout = std::chrono::seconds(5);
};

struct ExecResult {
    bool ok = false;
    int exit_code = -2;
    std::string stdout_text;
    std::string stderr_text;
    std::string timestamp;
    protocol::AuditRecord audit;
};

using ExecOutcome = std::variant<ExecResult, protocol::ExecutionRejection>;

struct ReadRequest {
    std::string path;
    std::optional<std::int64_t> max_bytes;
};

struct WriteRequest {
    std::string path;
    std::string content;
    std::string mode = "overwrite";
};

struct ListRequest {
    std::string path;
    bool recursive = false;
    std::size_t max_entries = 2000;
};

struct SearchRequest {
    std::string pattern;
    std::string path = ".";
    std::size_t max_results = 200;
};

// RFC 6902 operations applied to a JSON file in place.
struct JsonPatchRequest {
    std::string path;
    nlohmann::json patch = nlohmann::json::array();
    bool create_if_missing = false;
};

struct FileContent {
    std::filesystem::path path;
    std::uintmax_t size = 0;
    std::string content;
    std::string encoding;
    bool truncated = false;
};

struct WriteReceipt {
    std::filesystem::path path;
    std::size_t bytes_written = 0;
};

struct PathInfo {
    std::filesystem::path path;
    std::string rel_path;
    std::string type;  // "file", "dir" or "other"
    std::optional<std::uintmax_t> size;
    std::optional<double> mtime;
};

struct DirListing {
    std::filesystem::path path;
    std::vector<PathInfo> entries;
    bool truncated = false;
};

struct SearchMatch {
    std::filesystem::path path;
    std::size_t line_number = 0;
    std::string line;
};

struct SearchResult {
    std::vector<SearchMatch> matches;
    bool truncated = false;
};

// Synchronous tools. Every path argument goes through the confinement
// check of the shared guard before the filesystem is touched.
class ToolHost {
public:
    explicit ToolHost(std::shared_ptr<const policy::PolicyGuard> guard,
                      ToolHostOptions options = {});

    // `tool_name` is stamped on the audit record and the policy check.
    ExecOutcome exec(const protocol::ExecRequest& request,
                     const std::string& tool_name = "shell.exec") const;

    ExecOutcome git_status(const protocol::GitRequest& request) const;

    ExecOutcome git_diff(const protocol::GitRequest& request) const;

    // `git add -A` then `git commit -m`; a failed add is returned as is.
    ExecOutcome git_commit(const protocol::GitCommitRequest& request) const;

    core::errors::Result<WriteReceipt> patch_json(const JsonPatchRequest& request) const;

    core::errors::Result<FileContent> read_file(const ReadRequest& request) const;

    core::errors::Result<WriteReceipt> write_file(const WriteRequest& request) const;

    core::errors::Result<DirListing> list_dir(const ListRequest& request) const;

    core::errors::Result<PathInfo> stat_path(const std::string& path) const;

    core::errors::Result<SearchResult> search(const SearchRequest& request) const;

private:
    std::shared_ptr<const policy::PolicyGuard> guard_;
    ToolHostOptions options_;
};

}  // namespace knife::tools
