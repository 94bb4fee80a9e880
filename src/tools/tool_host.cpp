#include "tools/tool_host.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <poll.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <system_error>
#include <unistd.h>
#include <utility>
#include "core/fs/scoped_file_lock.hpp"
#include "core/logging/logger.hpp"
#include "core/text/utf8.hpp"
#include "core/time/timestamps.hpp"
#include "process/spawn.hpp"
#include "process/unique_fd.hpp"

namespace knife::tools {

using core::errors::ErrorCategory;
using core::errors::ToolError;
using protocol::ExecutionRejection;

namespace {

struct ProcessCapture {
    int exit_code = -1;
    bool timed_out = false;
    std::string stdout_text;
    std::string stderr_text;
    std::string wait_error;  // set when the exit status could not be collected
};

bool is_probably_binary(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return false;
    }

    constexpr std::size_t kProbeSize = 1024;
    char buffer[kProbeSize];
    in.read(buffer, static_cast<std::streamsize>(kProbeSize));
    const std::streamsize read_bytes = in.gcount();
    for (std::streamsize i = 0; i < read_bytes; ++i) {
        if (buffer[i] == '\0') {
            return true;
        }
    }
    return false;
}

std::string trim_line(const std::string& line) {
    constexpr std::size_t kMaxLineLength = 240;
    if (line.size() <= kMaxLineLength) {
        return line;
    }
    return core::text::truncate_code_points(line, kMaxLineLength) + "...";
}

void drain_pipe(process::UniqueFd& fd, std::string& out) {
    if (!fd.valid()) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = ::read(fd.get(), buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        fd.reset();
        return;
    }
}

core::errors::Result<std::pair<process::UniqueFd, process::UniqueFd>> make_pipe() {
    int fds[2] = {-1, -1};
    if (pipe2(fds, O_CLOEXEC) != 0) {
        return ToolError{ErrorCategory::Internal,
                         std::string("Failed to create process pipes: ") + std::strerror(errno),
                         core::errors::codes::kInternalError};
    }
    process::UniqueFd read_end(fds[0]);
    process::UniqueFd write_end(fds[1]);
    const int flags = fcntl(read_end.get(), F_GETFL, 0);
    if (flags != -1) {
        static_cast<void>(fcntl(read_end.get(), F_SETFL, flags | O_NONBLOCK));
    }
    return std::make_pair(std::move(read_end), std::move(write_end));
}

// Runs argv to completion, collecting both streams through non-blocking
// pipes. On timeout the child is killed and the loop stops as soon as it
// has been reaped, even if a grandchild still holds the pipes open.
core::errors::Result<ProcessCapture> run_captured(
    const std::vector<std::string>& argv, const std::optional<std::filesystem::path>& cwd,
    const std::optional<protocol::EnvOverrides>& env, const int timeout_s) {
    auto out_pipe = make_pipe();
    if (core::errors::is_error(out_pipe)) {
        return core::errors::get_error(out_pipe);
    }
    auto err_pipe = make_pipe();
    if (core::errors::is_error(err_pipe)) {
        return core::errors::get_error(err_pipe);
    }
    using PipeEnds = std::pair<process::UniqueFd, process::UniqueFd>;
    auto [stdout_read, stdout_write] = std::move(std::get<PipeEnds>(out_pipe));
    auto [stderr_read, stderr_write] = std::move(std::get<PipeEnds>(err_pipe));

    process::SpawnOptions spawn;
    spawn.argv = argv;
    spawn.cwd = cwd;
    spawn.env = env;
    spawn.stdout_fd = stdout_write.get();
    spawn.stderr_fd = stderr_write.get();

    const auto started = std::chrono::steady_clock::now();
    auto spawned = process::spawn_process(spawn);
    stdout_write.reset();
    stderr_write.reset();
    if (core::errors::is_error(spawned)) {
        return core::errors::get_error(spawned);
    }
    const pid_t pid = core::errors::get_value(spawned);

    ProcessCapture capture;
    bool child_exited = false;
    bool reaped = false;
    int status = 0;

    while (true) {
        const auto elapsed = std::chrono::steady_clock::now() - started;
        if (!capture.timed_out && timeout_s > 0 && !child_exited &&
            elapsed > std::chrono::seconds(timeout_s)) {
            capture.timed_out = true;
            static_cast<void>(::kill(pid, SIGKILL));
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        if (stdout_read.valid()) {
            fds[nfds].fd = stdout_read.get();
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (stderr_read.valid()) {
            fds[nfds].fd = stderr_read.get();
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (nfds > 0) {
            static_cast<void>(poll(fds, nfds, 50));
        } else if (!child_exited) {
            static_cast<void>(poll(nullptr, 0, 10));
        }

        drain_pipe(stdout_read, capture.stdout_text);
        drain_pipe(stderr_read, capture.stderr_text);

        if (!child_exited) {
            const pid_t waited = waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                child_exited = true;
                reaped = true;
            } else if (waited < 0 && errno != EINTR) {
                capture.wait_error = "Failed to collect exit status of pid " +
                                     std::to_string(pid) + ": " + std::strerror(errno);
                child_exited = true;
            }
        }

        const bool pipes_closed = !stdout_read.valid() && !stderr_read.valid();
        if (child_exited && (pipes_closed || capture.timed_out)) {
            break;
        }
    }

    capture.exit_code = reaped ? process::decode_wait_status(status) : -1;
    return capture;
}

std::string escape_output(const std::string& raw, const std::size_t cap) {
    if (raw.empty()) {
        return raw;
    }
    const std::string text = core::text::decode_output(raw).text;
    std::string escaped;
    escaped.reserve(text.size());
    for (const char c : text) {
        if (c == '\n') {
            escaped += "\\n";
        } else {
            escaped.push_back(c);
        }
    }
    return core::text::truncate_code_points(escaped, cap);
}

std::string entry_type(const struct stat& st) {
    if (S_ISDIR(st.st_mode)) {
        return "dir";
    }
    if (S_ISREG(st.st_mode)) {
        return "file";
    }
    return "other";
}

std::string relative_to_root(const std::filesystem::path& root,
                             const std::filesystem::path& path) {
    std::error_code ec;
    const auto resolved = std::filesystem::weakly_canonical(path, ec);
    if (!ec) {
        const auto rel = resolved.lexically_relative(root);
        if (!rel.empty() && *rel.begin() != "..") {
            return rel.string();
        }
    }
    return path.filename().string();
}

PathInfo describe_path(const std::filesystem::path& root, const std::filesystem::path& path) {
    PathInfo info;
    info.path = path;
    info.rel_path = relative_to_root(root, path);
    struct stat st {};
    if (::stat(path.c_str(), &st) == 0) {
        info.type = entry_type(st);
        info.size = static_cast<std::uintmax_t>(st.st_size);
        info.mtime = static_cast<double>(st.st_mtim.tv_sec) +
                     static_cast<double>(st.st_mtim.tv_nsec) / 1e9;
    } else {
        info.type = "other";
    }
    return info;
}

ToolError missing(const std::string& what, const std::string& path) {
    return ToolError{ErrorCategory::Input, what + " not found: " + path,
                     core::errors::codes::kNotFound};
}

protocol::ExecRequest git_exec_request(std::vector<std::string> argv,
                                       const std::optional<std::string>& cwd,
                                       const int timeout_s) {
    protocol::ExecRequest request;
    request.cmd = std::move(argv);
    request.cwd = cwd;
    request.timeout_s = timeout_s;
    return request;
}

bool exec_succeeded(const ExecOutcome& outcome) {
    const auto* result = std::get_if<ExecResult>(&outcome);
    return result != nullptr && result->ok;
}

}  // namespace

ToolHost::ToolHost(std::shared_ptr<const policy::PolicyGuard> guard, ToolHostOptions options)
    : guard_(std::move(guard)), options_(std::move(options)) {}

ExecOutcome ToolHost::exec(const protocol::ExecRequest& request,
                           const std::string& tool_name) const {
    auto normalized = guard_->normalize_command(request.cmd);
    if (core::errors::is_error(normalized)) {
        const auto audit = guard_->build_audit_metadata(
            policy::PolicyGuard::fallback_argv(request.cmd), tool_name);
        const auto reason =
            policy::PolicyGuard::rejection_reason(core::errors::get_error(normalized));
        KNIFE_LOG_WARN(tool_name + " rejected [" + audit.execution_id + "]: " + reason);
        return ExecutionRejection{core::errors::codes::kPolicyDenied, reason, audit};
    }
    const auto& argv = core::errors::get_value(normalized);
    const auto audit = guard_->build_audit_metadata(argv, tool_name);

    const auto decision = guard_->check_execution_policy(tool_name, argv, request.cwd,
                                                         request.env, request.timeout_s);
    if (!decision.allowed) {
        const std::string reason = decision.reason.value_or("policy denied");
        KNIFE_LOG_WARN(tool_name + " denied [" + audit.execution_id + "]: " + reason);
        return ExecutionRejection{core::errors::codes::kPolicyDenied, reason, audit};
    }

    auto resolved_cwd = guard_->resolve_policy_cwd(request.cwd);
    if (core::errors::is_error(resolved_cwd)) {
        const auto& err = core::errors::get_error(resolved_cwd);
        return ExecutionRejection{err.code, err.message, audit};
    }

    KNIFE_LOG_INFO(tool_name + " [" + audit.execution_id + "]: " + audit.command_preview);
    ExecResult result;
    result.audit = audit;
    result.timestamp = core::time::utc_now_iso8601();

    auto captured = run_captured(argv, core::errors::get_value(resolved_cwd), request.env,
                                 request.timeout_s);
    if (core::errors::is_error(captured)) {
        const auto& err = core::errors::get_error(captured);
        KNIFE_LOG_ERROR(tool_name + " failed [" + audit.execution_id + "]: " + err.message);
        result.exit_code = -2;
        result.stderr_text = "Error: " + err.message;
        return result;
    }

    const auto& capture = core::errors::get_value(captured);
    if (capture.timed_out) {
        KNIFE_LOG_WARN(tool_name + " timed out [" + audit.execution_id + "] after " +
                       std::to_string(request.timeout_s) + "s");
        result.exit_code = -1;
        result.stderr_text = "Timeout: command timed out after " +
                             std::to_string(request.timeout_s) + " seconds";
        return result;
    }

    result.stdout_text = escape_output(capture.stdout_text, options_.output_cap_chars);
    if (!capture.wait_error.empty()) {
        KNIFE_LOG_ERROR(tool_name + " lost exit status [" + audit.execution_id + "]: " +
                        capture.wait_error);
        result.exit_code = -1;
        result.stderr_text = "Error: " + capture.wait_error;
        return result;
    }

    result.exit_code = capture.exit_code;
    result.ok = capture.exit_code == 0;
    result.stderr_text = escape_output(capture.stderr_text, options_.output_cap_chars);
    return result;
}

core::errors::Result<FileContent> ToolHost::read_file(const ReadRequest& request) const {
    auto resolved = guard_->resolve_in_sandbox(request.path);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const auto file_path = core::errors::get_value(resolved);

    std::error_code ec;
    if (!std::filesystem::exists(file_path, ec)) {
        return missing("File", request.path);
    }
    if (std::filesystem::is_directory(file_path, ec)) {
        return ToolError{ErrorCategory::Input,
                         "Expected a file but got directory: " + request.path,
                         core::errors::codes::kInvalidPath};
    }

    const std::uintmax_t limit = request.max_bytes.has_value() && *request.max_bytes > 0
                                     ? static_cast<std::uintmax_t>(*request.max_bytes)
                                     : options_.max_read_bytes;
    const auto size = std::filesystem::file_size(file_path, ec);
    if (ec) {
        return ToolError{ErrorCategory::Execution,
                         "Unable to stat " + file_path.string() + ": " + ec.message(),
                         core::errors::codes::kInternalError};
    }

    std::ifstream in(file_path, std::ios::binary);
    if (!in.is_open()) {
        return ToolError{ErrorCategory::Execution, "Failed to open file: " + file_path.string(),
                         core::errors::codes::kPermissionDenied};
    }
    std::string data(static_cast<std::size_t>(std::min(limit, size)), '\0');
    in.read(data.data(), static_cast<std::streamsize>(data.size()));
    data.resize(static_cast<std::size_t>(in.gcount()));

    auto decoded = core::text::decode_output(data);
    FileContent content;
    content.path = file_path;
    content.size = size;
    content.content = std::move(decoded.text);
    content.encoding = std::move(decoded.encoding);
    content.truncated = size > limit;
    return content;
}

core::errors::Result<WriteReceipt> ToolHost::write_file(const WriteRequest& request) const {
    if (request.mode != "overwrite" && request.mode != "append") {
        return ToolError{ErrorCategory::Input, "Unsupported mode: " + request.mode,
                         core::errors::codes::kInvalidArgument,
                         "Use 'overwrite' or 'append'."};
    }
    auto resolved = guard_->resolve_in_sandbox(request.path);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const auto file_path = core::errors::get_value(resolved);

    std::error_code ec;
    if (std::filesystem::is_directory(file_path, ec)) {
        return ToolError{ErrorCategory::Input,
                         "Expected a file but got directory: " + request.path,
                         core::errors::codes::kInvalidPath};
    }
    std::filesystem::create_directories(file_path.parent_path(), ec);
    if (ec) {
        return ToolError{ErrorCategory::Execution,
                         "Unable to create " + file_path.parent_path().string() + ": " +
                             ec.message(),
                         core::errors::codes::kInternalError};
    }

    auto lock = core::fs::ScopedFileLock::acquire(file_path, options_.write_lock_timeout);
    if (core::errors::is_error(lock)) {
        return core::errors::get_error(lock);
    }

    const auto open_mode = std::ios::binary |
                           (request.mode == "append" ? std::ios::app : std::ios::trunc);
    std::ofstream out(file_path, std::ios::out | open_mode);
    if (!out.is_open()) {
        return ToolError{ErrorCategory::Execution,
                         "Failed to open file for writing: " + file_path.string(),
                         core::errors::codes::kPermissionDenied};
    }
    out << request.content;
    out.flush();
    if (!out.good()) {
        return ToolError{ErrorCategory::Execution,
                         "I/O error while writing file: " + file_path.string(),
                         core::errors::codes::kInternalError};
    }

    KNIFE_LOG_DEBUG("fs.write " + request.mode + " " + file_path.string());
    return WriteReceipt{file_path, request.content.size()};
}

core::errors::Result<DirListing> ToolHost::list_dir(const ListRequest& request) const {
    auto resolved = guard_->resolve_in_sandbox(request.path);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const auto dir_path = core::errors::get_value(resolved);

    std::error_code ec;
    if (!std::filesystem::exists(dir_path, ec)) {
        return missing("Directory", request.path);
    }
    if (!std::filesystem::is_directory(dir_path, ec)) {
        return ToolError{ErrorCategory::Input,
                         "Expected a directory but got file: " + request.path,
                         core::errors::codes::kInvalidPath};
    }

    const auto root = std::filesystem::weakly_canonical(guard_->policy().sandbox_root, ec);
    DirListing listing;
    listing.path = dir_path;

    const auto add_entry = [&](const std::filesystem::path& path) {
        if (listing.entries.size() >= request.max_entries) {
            listing.truncated = true;
            return false;
        }
        listing.entries.push_back(describe_path(root, path));
        return true;
    };

    const auto options = std::filesystem::directory_options::skip_permission_denied;
    if (request.recursive) {
        for (std::filesystem::recursive_directory_iterator it(dir_path, options, ec), end;
             !ec && it != end; it.increment(ec)) {
            if (!add_entry(it->path())) {
                break;
            }
        }
    } else {
        for (std::filesystem::directory_iterator it(dir_path, options, ec), end;
             !ec && it != end; it.increment(ec)) {
            if (!add_entry(it->path())) {
                break;
            }
        }
    }
    if (ec) {
        KNIFE_LOG_WARN("fs.list stopped early in " + dir_path.string() + ": " + ec.message());
    }
    return listing;
}

core::errors::Result<PathInfo> ToolHost::stat_path(const std::string& path) const {
    auto resolved = guard_->resolve_in_sandbox(path);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const auto target = core::errors::get_value(resolved);

    std::error_code ec;
    if (!std::filesystem::exists(target, ec)) {
        return missing("Path", path);
    }
    const auto root = std::filesystem::weakly_canonical(guard_->policy().sandbox_root, ec);
    return describe_path(root, target);
}

core::errors::Result<SearchResult> ToolHost::search(const SearchRequest& request) const {
    if (request.pattern.empty()) {
        return ToolError{ErrorCategory::Input, "Search pattern cannot be empty.",
                         core::errors::codes::kInvalidArgument};
    }
    if (request.max_results == 0) {
        return ToolError{ErrorCategory::Input, "max_results must be greater than zero.",
                         core::errors::codes::kInvalidArgument};
    }

    auto resolved = guard_->resolve_in_sandbox(request.path);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const auto scope_path = core::errors::get_value(resolved);

    std::error_code ec;
    if (!std::filesystem::exists(scope_path, ec)) {
        return missing("Path", request.path);
    }

    std::vector<std::filesystem::path> files;
    if (std::filesystem::is_regular_file(scope_path, ec)) {
        files.push_back(scope_path);
    } else if (std::filesystem::is_directory(scope_path, ec)) {
        const auto options = std::filesystem::directory_options::skip_permission_denied;
        for (std::filesystem::recursive_directory_iterator it(scope_path, options, ec), end;
             !ec && it != end; it.increment(ec)) {
            std::error_code type_ec;
            if (!it->is_regular_file(type_ec)) {
                continue;
            }
            // A symlinked file may point outside the root.
            if (core::errors::is_error(guard_->resolve_in_sandbox(it->path()))) {
                KNIFE_LOG_DEBUG("search.text skipped " + it->path().string());
                continue;
            }
            files.push_back(it->path());
        }
        std::sort(files.begin(), files.end());
    } else {
        return ToolError{ErrorCategory::Input,
                         "Scope is neither a file nor directory: " + request.path,
                         core::errors::codes::kInvalidPath};
    }

    constexpr std::uintmax_t kMaxFileBytes = 1024 * 1024;
    SearchResult result;
    for (const auto& file : files) {
        if (result.truncated) {
            break;
        }
        const auto size = std::filesystem::file_size(file, ec);
        if (ec || size > kMaxFileBytes || is_probably_binary(file)) {
            continue;
        }

        std::ifstream in(file);
        if (!in.is_open()) {
            continue;
        }

        std::string line;
        std::size_t line_no = 0;
        while (std::getline(in, line)) {
            ++line_no;
            if (line.find(request.pattern) == std::string::npos) {
                continue;
            }
            result.matches.push_back(SearchMatch{
                file, line_no, trim_line(core::text::decode_output(line).text)});
            if (result.matches.size() >= request.max_results) {
                result.truncated = true;
                break;
            }
        }
    }
    return result;
}

ExecOutcome ToolHost::git_status(const protocol::GitRequest& request) const {
    return exec(git_exec_request(
                    {"git", "status", "--porcelain", "--branch", "--untracked-files=all"},
                    request.cwd, request.timeout_s),
                "git.status");
}

ExecOutcome ToolHost::git_diff(const protocol::GitRequest& request) const {
    return exec(git_exec_request({"git", "--no-pager", "diff", "--no-color"}, request.cwd,
                                 request.timeout_s),
                "git.diff");
}

ExecOutcome ToolHost::git_commit(const protocol::GitCommitRequest& request) const {
    auto staged = exec(git_exec_request({"git", "add", "-A"}, request.cwd, request.timeout_s),
                       "git.commit.add");
    if (!exec_succeeded(staged)) {
        return staged;
    }
    return exec(git_exec_request({"git", "commit", "-m", request.message}, request.cwd,
                                 request.timeout_s),
                "git.commit");
}

core::errors::Result<WriteReceipt> ToolHost::patch_json(const JsonPatchRequest& request) const {
    if (!request.patch.is_array()) {
        return ToolError{ErrorCategory::Input,
                         "Patch body must be a list of RFC 6902 operations.",
                         core::errors::codes::kInvalidArgument};
    }
    auto resolved = guard_->resolve_in_sandbox(request.path);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const auto file_path = core::errors::get_value(resolved);

    std::error_code ec;
    if (std::filesystem::is_directory(file_path, ec)) {
        return ToolError{ErrorCategory::Input,
                         "Expected a file but got directory: " + request.path,
                         core::errors::codes::kInvalidPath};
    }
    const bool exists = std::filesystem::exists(file_path, ec);
    if (!exists && !request.create_if_missing) {
        return missing("JSON file", request.path);
    }
    std::filesystem::create_directories(file_path.parent_path(), ec);
    if (ec) {
        return ToolError{ErrorCategory::Execution,
                         "Unable to create " + file_path.parent_path().string() + ": " +
                             ec.message(),
                         core::errors::codes::kInternalError};
    }

    auto lock = core::fs::ScopedFileLock::acquire(file_path, options_.write_lock_timeout);
    if (core::errors::is_error(lock)) {
        return core::errors::get_error(lock);
    }

    nlohmann::json document = nlohmann::json::object();
    if (exists) {
        std::ifstream in(file_path, std::ios::binary);
        if (!in.is_open()) {
            return ToolError{ErrorCategory::Execution,
                             "Failed to open file: " + file_path.string(),
                             core::errors::codes::kPermissionDenied};
        }
        document = nlohmann::json::parse(in, nullptr, false);
        if (document.is_discarded()) {
            return ToolError{ErrorCategory::Input,
                             "File does not contain valid JSON: " + request.path,
                             core::errors::codes::kInvalidArgument};
        }
    }

    try {
        document = document.patch(request.patch);
    } catch (const nlohmann::json::exception& e) {
        return ToolError{ErrorCategory::Input,
                         std::string("Patch could not be applied: ") + e.what(),
                         core::errors::codes::kInvalidArgument};
    }

    const std::string text =
        document.dump(2, ' ', true, nlohmann::json::error_handler_t::replace) + "\n";
    std::ofstream out(file_path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return ToolError{ErrorCategory::Execution,
                         "Failed to open file for writing: " + file_path.string(),
                         core::errors::codes::kPermissionDenied};
    }
    out << text;
    out.flush();
    if (!out.good()) {
        return ToolError{ErrorCategory::Execution,
                         "I/O error while writing file: " + file_path.string(),
                         core::errors::codes::kInternalError};
    }

    KNIFE_LOG_DEBUG("json.patch applied " + std::to_string(request.patch.size()) +
                    " operation(s) to " + file_path.string());
    return WriteReceipt{file_path, text.size()};
}

}  // namespace knife::tools
