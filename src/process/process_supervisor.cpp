#include "process/process_supervisor.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <sys/wait.h>
#include <system_error>
#include <thread>
#include <utility>
#include "core/config/execution_id.hpp"
#include "core/logging/logger.hpp"
#include "core/text/utf8.hpp"
#include "process/spawn.hpp"

namespace knife::process {

using core::errors::ErrorCategory;
using core::errors::ToolError;
using protocol::ExecutionRejection;

namespace {

constexpr const char* kStartTool = "process.start";

ToolError not_found(const pid_t pid) {
    return ToolError{ErrorCategory::Input,
                     "No process with pid " + std::to_string(pid) +
                         " was started by this server.",
                     core::errors::codes::kNotFound};
}

core::errors::Result<UniqueFd> open_capture_file(const std::filesystem::path& path) {
    const int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        return ToolError{ErrorCategory::Internal,
                         "Unable to open capture file " + path.string() + ": " +
                             std::strerror(errno),
                         core::errors::codes::kInternalError};
    }
    return UniqueFd(fd);
}

void remove_quietly(const std::optional<std::filesystem::path>& path) {
    if (!path.has_value()) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove(path.value(), ec);
}

}  // namespace

ProcessSupervisor::ProcessSupervisor(std::shared_ptr<const policy::PolicyGuard> guard,
                                     SupervisorOptions options)
    : guard_(std::move(guard)), options_(std::move(options)) {}

StartOutcome ProcessSupervisor::start(const protocol::ProcessStartRequest& request) {
    auto normalized = guard_->normalize_command(request.cmd);
    if (core::errors::is_error(normalized)) {
        const auto& err = core::errors::get_error(normalized);
        const auto audit = guard_->build_audit_metadata(
            policy::PolicyGuard::fallback_argv(request.cmd), kStartTool);
        const std::string reason = policy::PolicyGuard::rejection_reason(err);
        KNIFE_LOG_WARN("process.start rejected [" + audit.execution_id + "]: " + reason);
        return ExecutionRejection{core::errors::codes::kPolicyDenied, reason, audit};
    }
    const auto& argv = core::errors::get_value(normalized);
    const auto audit = guard_->build_audit_metadata(argv, kStartTool);

    const auto decision = guard_->check_execution_policy(kStartTool, argv, request.cwd,
                                                         request.env, std::nullopt);
    if (!decision.allowed) {
        const std::string reason = decision.reason.value_or("policy denied");
        KNIFE_LOG_WARN("process.start denied [" + audit.execution_id + "]: " + reason);
        return ExecutionRejection{core::errors::codes::kPolicyDenied, reason, audit};
    }

    auto resolved_cwd = guard_->resolve_policy_cwd(request.cwd);
    if (core::errors::is_error(resolved_cwd)) {
        const auto& err = core::errors::get_error(resolved_cwd);
        return ExecutionRejection{err.code, err.message, audit};
    }

    auto entry = std::make_shared<ProcessEntry>();
    entry->execution_id = audit.execution_id;
    entry->argv = argv;
    entry->cwd = core::errors::get_value(resolved_cwd);
    entry->capture_output = request.capture_output;
    entry->audit = audit;

    if (request.capture_output) {
        const auto capture_dir = guard_->policy().sandbox_root / options_.capture_subdir;
        std::error_code ec;
        std::filesystem::create_directories(capture_dir, ec);
        if (ec) {
            return ExecutionRejection{core::errors::codes::kInternalError,
                                      "Unable to create capture directory " +
                                          capture_dir.string() + ": " + ec.message(),
                                      audit};
        }

        // Named by a fresh token; the pid is unknown until after the spawn.
        const std::string token = core::config::generate_execution_id();
        entry->stdout_path = capture_dir / (token + ".stdout.log");
        entry->stderr_path = capture_dir / (token + ".stderr.log");

        auto stdout_fd = open_capture_file(entry->stdout_path.value());
        if (core::errors::is_error(stdout_fd)) {
            const auto& err = core::errors::get_error(stdout_fd);
            return ExecutionRejection{err.code, err.message, audit};
        }
        auto stderr_fd = open_capture_file(entry->stderr_path.value());
        if (core::errors::is_error(stderr_fd)) {
            remove_quietly(entry->stdout_path);
            const auto& err = core::errors::get_error(stderr_fd);
            return ExecutionRejection{err.code, err.message, audit};
        }
        entry->stdout_fd = std::move(std::get<UniqueFd>(stdout_fd));
        entry->stderr_fd = std::move(std::get<UniqueFd>(stderr_fd));
    }

    SpawnOptions spawn;
    spawn.argv = argv;
    spawn.cwd = entry->cwd;
    spawn.env = request.env;
    spawn.stdout_fd = entry->stdout_fd.get();
    spawn.stderr_fd = entry->stderr_fd.get();

    auto spawned = spawn_process(spawn);
    if (core::errors::is_error(spawned)) {
        const auto& err = core::errors::get_error(spawned);
        entry->stdout_fd.reset();
        entry->stderr_fd.reset();
        remove_quietly(entry->stdout_path);
        remove_quietly(entry->stderr_path);
        KNIFE_LOG_ERROR("process.start spawn failed [" + audit.execution_id + "]: " +
                        err.message);
        return ExecutionRejection{core::errors::codes::kInternalError, err.message, audit};
    }

    entry->pid = core::errors::get_value(spawned);
    entry->start_time = std::chrono::system_clock::now();

    StartedProcess started;
    started.pid = entry->pid;
    started.execution_id = entry->execution_id;
    started.cwd = entry->cwd;
    started.stdout_path = entry->stdout_path;
    started.stderr_path = entry->stderr_path;
    started.audit = audit;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        evict_expired_locked();
        const std::string id = entry->execution_id;
        pid_index_[entry->pid] = id;
        entries_.emplace(id, std::move(entry));
    }

    KNIFE_LOG_INFO("process.start pid=" + std::to_string(started.pid) + " [" +
                   audit.execution_id + "]: " + audit.command_preview);
    return started;
}

ProcessSupervisor::EntryPtr ProcessSupervisor::find_locked(const pid_t pid) const {
    const auto index = pid_index_.find(pid);
    if (index == pid_index_.end()) {
        return nullptr;
    }
    const auto it = entries_.find(index->second);
    if (it == entries_.end() || it->second->pid != pid) {
        return nullptr;
    }
    return it->second;
}

void ProcessSupervisor::refresh_locked(ProcessEntry& entry) {
    if (entry.state == ProcessState::Exited) {
        return;
    }

    int status = 0;
    const pid_t waited = waitpid(entry.pid, &status, WNOHANG);
    if (waited == 0) {
        return;
    }
    if (waited == entry.pid) {
        entry.exit_code = decode_wait_status(status);
    } else if (!(waited < 0 && errno == ECHILD)) {
        return;
    }

    entry.state = ProcessState::Exited;
    entry.exited_at = std::chrono::steady_clock::now();
    entry.stdout_fd.reset();
    entry.stderr_fd.reset();
    KNIFE_LOG_DEBUG("process pid=" + std::to_string(entry.pid) + " exited with " +
                    (entry.exit_code ? std::to_string(*entry.exit_code) : "unknown"));
}

void ProcessSupervisor::evict_expired_locked() {
    if (options_.retention.count() <= 0) {
        return;
    }
    const auto now = std::chrono::steady_clock::now();
    for (auto it = entries_.begin(); it != entries_.end();) {
        const auto& entry = *it->second;
        if (entry.state == ProcessState::Exited && entry.exited_at.has_value() &&
            now - entry.exited_at.value() > options_.retention) {
            const auto index = pid_index_.find(entry.pid);
            if (index != pid_index_.end() && index->second == entry.execution_id) {
                pid_index_.erase(index);
            }
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
}

ProcessStatus ProcessSupervisor::to_status(const ProcessEntry& entry) {
    ProcessStatus status;
    status.pid = entry.pid;
    status.execution_id = entry.execution_id;
    status.running = entry.state == ProcessState::Running;
    status.returncode = entry.exit_code;
    status.argv = entry.argv;
    status.cwd = entry.cwd;
    status.start_time = entry.start_time;
    status.capture_output = entry.capture_output;
    status.stdout_path = entry.stdout_path;
    status.stderr_path = entry.stderr_path;
    status.audit = entry.audit;
    return status;
}

core::errors::Result<ProcessStatus> ProcessSupervisor::status(const pid_t pid) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto entry = find_locked(pid);
    if (!entry) {
        return not_found(pid);
    }
    refresh_locked(*entry);
    return to_status(*entry);
}

std::optional<int> ProcessSupervisor::wait_for_exit(
    const EntryPtr& entry, const std::chrono::steady_clock::time_point deadline) {
    while (true) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            refresh_locked(*entry);
            if (entry->state == ProcessState::Exited) {
                return entry->exit_code.value_or(-1);
            }
        }
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return std::nullopt;
        }
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(
            options_.poll_interval, deadline - now));
    }
}

core::errors::Result<KillOutcome> ProcessSupervisor::kill(
    const pid_t pid, const bool force, const std::chrono::milliseconds timeout) {
    const auto wait_bound = std::max(timeout, std::chrono::milliseconds(0));
    EntryPtr entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entry = find_locked(pid);
        if (!entry) {
            return not_found(pid);
        }
        refresh_locked(*entry);
        if (entry->state == ProcessState::Exited) {
            return KillOutcome{"exited", entry->exit_code};
        }
        // Signalled under the lock: an unreaped child keeps its pid, so the
        // signal cannot reach a recycled process.
        static_cast<void>(::kill(pid, SIGTERM));
    }
    KNIFE_LOG_INFO("process.kill sent SIGTERM to pid=" + std::to_string(pid));

    auto code = wait_for_exit(entry, std::chrono::steady_clock::now() + wait_bound);
    if (code.has_value()) {
        return KillOutcome{"terminated", code};
    }

    if (!force) {
        return ToolError{ErrorCategory::Execution,
                         "Process " + std::to_string(pid) +
                             " did not exit after SIGTERM within the timeout.",
                         core::errors::codes::kTimeout,
                         "Retry with force=true to send SIGKILL."};
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        refresh_locked(*entry);
        if (entry->state == ProcessState::Exited) {
            return KillOutcome{"terminated", entry->exit_code};
        }
        static_cast<void>(::kill(pid, SIGKILL));
    }
    KNIFE_LOG_WARN("process.kill escalated to SIGKILL for pid=" + std::to_string(pid));

    code = wait_for_exit(entry, std::chrono::steady_clock::now() + wait_bound);
    if (code.has_value()) {
        return KillOutcome{"killed", code};
    }
    return ToolError{ErrorCategory::Execution,
                     "Process " + std::to_string(pid) + " did not exit after SIGKILL.",
                     core::errors::codes::kTimeout};
}

core::errors::Result<OutputSlice> ProcessSupervisor::read(const pid_t pid,
                                                          const std::string& stream,
                                                          const std::int64_t max_bytes,
                                                          const bool tail) {
    if (stream != "stdout" && stream != "stderr") {
        return ToolError{ErrorCategory::Input,
                         "stream must be 'stdout' or 'stderr', got '" + stream + "'",
                         core::errors::codes::kInvalidArgument};
    }
    if (max_bytes <= 0) {
        return ToolError{ErrorCategory::Input, "max_bytes must be greater than zero.",
                         core::errors::codes::kInvalidArgument};
    }

    std::optional<std::filesystem::path> path;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto entry = find_locked(pid);
        if (!entry) {
            return not_found(pid);
        }
        if (!entry->capture_output) {
            return ToolError{ErrorCategory::Input,
                             "Output capture was disabled for pid " + std::to_string(pid),
                             core::errors::codes::kNoOutput};
        }
        path = stream == "stdout" ? entry->stdout_path : entry->stderr_path;
    }
    if (!path.has_value()) {
        return ToolError{ErrorCategory::Input, "No captured " + stream + " for this process.",
                         core::errors::codes::kNoOutput};
    }

    std::error_code ec;
    const auto size = std::filesystem::file_size(path.value(), ec);
    if (ec) {
        return ToolError{ErrorCategory::Execution,
                         "Capture file is missing: " + path->string(),
                         core::errors::codes::kNotFound};
    }

    const auto limit = std::min<std::uintmax_t>(static_cast<std::uintmax_t>(max_bytes),
                                                options_.max_read_bytes);
    std::ifstream in(path.value(), std::ios::binary);
    if (!in.is_open()) {
        return ToolError{ErrorCategory::Execution,
                         "Capture file is missing: " + path->string(),
                         core::errors::codes::kNotFound};
    }
    if (tail && size > limit) {
        in.seekg(static_cast<std::streamoff>(size - limit));
    }

    std::string data(static_cast<std::size_t>(limit), '\0');
    in.read(data.data(), static_cast<std::streamsize>(limit));
    data.resize(static_cast<std::size_t>(in.gcount()));

    auto decoded = core::text::decode_output(data);
    OutputSlice slice;
    slice.pid = pid;
    slice.stream = stream;
    slice.size = size;
    slice.truncated = size > data.size();
    slice.content = std::move(decoded.text);
    slice.encoding = std::move(decoded.encoding);
    return slice;
}

std::vector<ProcessStatus> ProcessSupervisor::list() {
    std::lock_guard<std::mutex> lock(mutex_);
    evict_expired_locked();
    std::vector<ProcessStatus> statuses;
    statuses.reserve(entries_.size());
    for (auto& [id, entry] : entries_) {
        static_cast<void>(id);
        refresh_locked(*entry);
        statuses.push_back(to_status(*entry));
    }
    std::sort(statuses.begin(), statuses.end(),
              [](const ProcessStatus& a, const ProcessStatus& b) {
                  return a.start_time < b.start_time;
              });
    return statuses;
}

std::size_t ProcessSupervisor::tracked_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

}  // namespace knife::process
