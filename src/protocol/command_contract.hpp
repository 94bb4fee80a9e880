#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace knife::protocol {

    // A command as the caller sent it: one string to be word-split, or argv.
    using CommandInput = std::variant<std::string, std::vector<std::string>>;

    using EnvOverrides = std::map<std::string, std::string>;

    struct ExecRequest {
        CommandInput cmd;
        std::optional<std::string> cwd;
        std::optional<EnvOverrides> env;
        int timeout_s = 60;
    };

    // git.status and git.diff run in `cwd` (default: the server's cwd).
    struct GitRequest {
        std::optional<std::string> cwd;
        int timeout_s = 60;
    };

    struct GitCommitRequest {
        std::string message;
        std::optional<std::string> cwd;
        int timeout_s = 60;
    };

    struct ProcessStartRequest {
        CommandInput cmd;
        std::optional<std::string> cwd;
        std::optional<EnvOverrides> env;
        bool capture_output = true;
    };

    struct ProcessStatusRequest {
        int pid = 0;
    };

    struct ProcessKillRequest {
        int pid = 0;
        bool force = false;
        int timeout_s = 5;
    };

    struct ProcessReadRequest {
        int pid = 0;
        std::string stream = "stdout";
        std::int64_t max_bytes = 20000;
        bool tail = true;
    };

} // namespace knife::protocol
