#include "process/spawn.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace knife::process {

using core::errors::ErrorCategory;
using core::errors::ToolError;

namespace {

std::vector<std::string> build_environment(
    const std::optional<protocol::EnvOverrides>& overrides) {
    std::vector<std::string> entries;
    for (char** it = environ; it != nullptr && *it != nullptr; ++it) {
        const std::string entry(*it);
        const auto eq = entry.find('=');
        const std::string key = eq == std::string::npos ? entry : entry.substr(0, eq);
        if (overrides.has_value() && overrides->count(key) > 0) {
            continue;
        }
        entries.push_back(entry);
    }
    if (overrides.has_value()) {
        for (const auto& [key, value] : overrides.value()) {
            entries.push_back(key + "=" + value);
        }
    }
    return entries;
}

std::vector<char*> to_c_array(std::vector<std::string>& values) {
    std::vector<char*> pointers;
    pointers.reserve(values.size() + 1);
    for (auto& value : values) {
        pointers.push_back(value.data());
    }
    pointers.push_back(nullptr);
    return pointers;
}

[[noreturn]] void fail_in_child(const int error_fd) {
    const int err = errno;
    static_cast<void>(write(error_fd, &err, sizeof(err)));
    _exit(127);
}

}  // namespace

int decode_wait_status(const int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return -WTERMSIG(status);
    }
    return -1;
}

core::errors::Result<pid_t> spawn_process(const SpawnOptions& options) {
    if (options.argv.empty()) {
        return ToolError{ErrorCategory::Input, "Command cannot be empty.",
                         core::errors::codes::kEmptyCommand};
    }

    // Everything the child touches is allocated before fork.
    std::vector<std::string> argv_storage = options.argv;
    std::vector<std::string> env_storage = build_environment(options.env);
    std::vector<char*> argv = to_c_array(argv_storage);
    std::vector<char*> envp = to_c_array(env_storage);
    const std::string cwd = options.cwd.has_value() ? options.cwd->string() : "";

    const int null_fd = open("/dev/null", O_RDWR | O_CLOEXEC);
    if (null_fd < 0) {
        return ToolError{ErrorCategory::Internal, "Failed to open /dev/null.",
                         core::errors::codes::kInternalError};
    }

    int error_pipe[2] = {-1, -1};
    if (pipe2(error_pipe, O_CLOEXEC) != 0) {
        static_cast<void>(close(null_fd));
        return ToolError{ErrorCategory::Internal, "Failed to create process pipes.",
                         core::errors::codes::kInternalError};
    }

    const pid_t pid = fork();
    if (pid < 0) {
        const std::string reason = std::strerror(errno);
        static_cast<void>(close(null_fd));
        static_cast<void>(close(error_pipe[0]));
        static_cast<void>(close(error_pipe[1]));
        return ToolError{ErrorCategory::Internal, "Failed to fork process: " + reason,
                         core::errors::codes::kInternalError};
    }

    if (pid == 0) {
        // The parent may block stop signals for its own watcher thread.
        sigset_t no_signals;
        sigemptyset(&no_signals);
        static_cast<void>(sigprocmask(SIG_SETMASK, &no_signals, nullptr));
        static_cast<void>(signal(SIGPIPE, SIG_DFL));
        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            fail_in_child(error_pipe[1]);
        }
        const int out_fd = options.stdout_fd >= 0 ? options.stdout_fd : null_fd;
        const int err_fd = options.stderr_fd >= 0 ? options.stderr_fd : null_fd;
        if (dup2(null_fd, STDIN_FILENO) < 0 || dup2(out_fd, STDOUT_FILENO) < 0 ||
            dup2(err_fd, STDERR_FILENO) < 0) {
            fail_in_child(error_pipe[1]);
        }
        execvpe(argv[0], argv.data(), envp.data());
        fail_in_child(error_pipe[1]);
    }

    static_cast<void>(close(null_fd));
    static_cast<void>(close(error_pipe[1]));

    int child_errno = 0;
    ssize_t n = 0;
    do {
        n = read(error_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    static_cast<void>(close(error_pipe[0]));

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        static_cast<void>(waitpid(pid, &status, 0));
        return ToolError{ErrorCategory::Execution,
                         "Failed to start '" + options.argv.front() +
                             "': " + std::strerror(child_errno),
                         core::errors::codes::kInternalError};
    }

    return pid;
}

}  // namespace knife::process
