#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>
#include "core/errors/knife_errors.hpp"
#include "protocol/command_contract.hpp"

namespace knife::process {

struct SpawnOptions {
    std::vector<std::string> argv;
    std::optional<std::filesystem::path> cwd;
    std::optional<protocol::EnvOverrides> env;  // merged over the current environment
    int stdout_fd = -1;  // -1 redirects to /dev/null
    int stderr_fd = -1;
};

// fork + execvpe, never through a shell. Exec and chdir failures in the child
// are reported back through a close-on-exec pipe, so a returned pid always
// belongs to a child that reached exec.
core::errors::Result<pid_t> spawn_process(const SpawnOptions& options);

// Exit status as reported to callers: the exit code, or minus the signal
// number for a child killed by a signal.
int decode_wait_status(int status);

}  // namespace knife::process
