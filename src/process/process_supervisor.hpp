#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <sys/types.h>
#include <unordered_map>
#include <variant>
#include <vector>
#include "core/errors/knife_errors.hpp"
#include "policy/policy_guard.hpp"
#include "process/unique_fd.hpp"
#include "protocol/audit_contract.hpp"
#include "protocol/command_contract.hpp"

namespace knife::process {

enum class ProcessState {
    Running,
    Exited
};

struct SupervisorOptions {
    std::filesystem::path capture_subdir = ".knife/process";
    std::uintmax_t max_read_bytes = 200000;
    // Exited entries older than this are evicted; 0 keeps them forever.
    std::chrono::seconds retention{0};
    std::chrono::milliseconds poll_interval{20};
};

struct StartedProcess {
    pid_t pid = -1;
    std::string execution_id;
    std::optional<std::filesystem::path> cwd;
    std::optional<std::filesystem::path> stdout_path;
    std::optional<std::filesystem::path> stderr_path;
    protocol::AuditRecord audit;
};

using StartOutcome = std::variant<StartedProcess, protocol::ExecutionRejection>;

struct ProcessStatus {
    pid_t pid = -1;
    std::string execution_id;
    bool running = false;
    std::optional<int> returncode;
    std::vector<std::string> argv;
    std::optional<std::filesystem::path> cwd;
    std::chrono::system_clock::time_point start_time;
    bool capture_output = false;
    std::optional<std::filesystem::path> stdout_path;
    std::optional<std::filesystem::path> stderr_path;
    protocol::AuditRecord audit;
};

struct KillOutcome {
    std::string status;  // "exited", "terminated" or "killed"
    std::optional<int> returncode;
};

struct OutputSlice {
    pid_t pid = -1;
    std::string stream;
    std::uintmax_t size = 0;
    std::string content;
    std::string encoding;
    bool truncated = false;
};

// Owns every child process started through `start`. Entries are keyed by
// the audit execution id; the pid index always points at the newest entry
// for a pid, so a reused pid never aliases an older record.
class ProcessSupervisor {
public:
    ProcessSupervisor(std::shared_ptr<const policy::PolicyGuard> guard,
                      SupervisorOptions options = {});
    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    StartOutcome start(const protocol::ProcessStartRequest& request);

    core::errors::Result<ProcessStatus> status(pid_t pid);

    core::errors::Result<KillOutcome> kill(pid_t pid, bool force,
                                           std::chrono::milliseconds timeout);

    core::errors::Result<OutputSlice> read(pid_t pid, const std::string& stream,
                                           std::int64_t max_bytes, bool tail);

    std::vector<ProcessStatus> list();

    std::size_t tracked_count() const;

private:
    struct ProcessEntry {
        std::string execution_id;
        pid_t pid = -1;
        std::vector<std::string> argv;
        std::optional<std::filesystem::path> cwd;
        std::chrono::system_clock::time_point start_time;
        bool capture_output = false;
        std::optional<std::filesystem::path> stdout_path;
        std::optional<std::filesystem::path> stderr_path;
        UniqueFd stdout_fd;
        UniqueFd stderr_fd;
        protocol::AuditRecord audit;
        ProcessState state = ProcessState::Running;
        std::optional<int> exit_code;
        std::optional<std::chrono::steady_clock::time_point> exited_at;
    };

    using EntryPtr = std::shared_ptr<ProcessEntry>;

    EntryPtr find_locked(pid_t pid) const;
    // Non-blocking reap; caches the exit status exactly once.
    void refresh_locked(ProcessEntry& entry);
    void evict_expired_locked();
    std::optional<int> wait_for_exit(const EntryPtr& entry,
                                     std::chrono::steady_clock::time_point deadline);
    static ProcessStatus to_status(const ProcessEntry& entry);

    std::shared_ptr<const policy::PolicyGuard> guard_;
    SupervisorOptions options_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, EntryPtr> entries_;
    std::unordered_map<pid_t, std::string> pid_index_;
};

}  // namespace knife::process
