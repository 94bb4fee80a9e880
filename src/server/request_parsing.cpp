#include "server/request_parsing.hpp"

#include <cstdint>
#include <limits>
#include <optional>
#include <utility>

namespace knife::server {

using core::errors::ErrorCategory;
using core::errors::ToolError;
using nlohmann::json;

namespace {

// Reads fields off a request object, keeping only the first failure.
// Accessors return a fallback once a failure has been recorded.
class FieldReader {
public:
    explicit FieldReader(const json& payload) : payload_(payload) {
        if (!payload_.is_object()) {
            fail("Request body must be a JSON object.");
        }
    }

    bool ok() const { return !error_.has_value(); }
    const ToolError& error() const { return error_.value(); }

    std::string required_string(const char* key) {
        const json* value = find(key);
        if (value == nullptr) {
            fail(std::string("Field '") + key + "' is required.");
            return {};
        }
        if (!value->is_string()) {
            fail(std::string("Field '") + key + "' must be a string.");
            return {};
        }
        return value->get<std::string>();
    }

    std::optional<std::string> optional_string(const char* key) {
        const json* value = find(key);
        if (value == nullptr) {
            return std::nullopt;
        }
        if (!value->is_string()) {
            fail(std::string("Field '") + key + "' must be a string.");
            return std::nullopt;
        }
        return value->get<std::string>();
    }

    std::string string_or(const char* key, std::string fallback) {
        auto value = optional_string(key);
        return value.has_value() ? std::move(value.value()) : std::move(fallback);
    }

    std::optional<std::int64_t> optional_integer(const char* key, const std::int64_t min,
                                                 const std::int64_t max) {
        const json* value = find(key);
        if (value == nullptr) {
            return std::nullopt;
        }
        if (!value->is_number_integer()) {
            fail(std::string("Field '") + key + "' must be an integer.");
            return std::nullopt;
        }
        if (value->is_number_unsigned() &&
            value->get<std::uint64_t>() >
                static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            fail(std::string("Field '") + key + "' is out of range.");
            return std::nullopt;
        }
        const auto number = value->get<std::int64_t>();
        if (number < min || number > max) {
            fail(std::string("Field '") + key + "' must be between " + std::to_string(min) +
                 " and " + std::to_string(max) + ".");
            return std::nullopt;
        }
        return number;
    }

    std::int64_t integer_or(const char* key, const std::int64_t fallback,
                            const std::int64_t min, const std::int64_t max) {
        return optional_integer(key, min, max).value_or(fallback);
    }

    std::int64_t required_integer(const char* key, const std::int64_t min,
                                  const std::int64_t max) {
        if (find(key) == nullptr) {
            fail(std::string("Field '") + key + "' is required.");
            return 0;
        }
        return optional_integer(key, min, max).value_or(0);
    }

    json required_array(const char* key) {
        const json* value = find(key);
        if (value == nullptr) {
            fail(std::string("Field '") + key + "' is required.");
            return json::array();
        }
        if (!value->is_array()) {
            fail(std::string("Field '") + key + "' must be a list.");
            return json::array();
        }
        return *value;
    }

    bool boolean_or(const char* key, const bool fallback) {
        const json* value = find(key);
        if (value == nullptr) {
            return fallback;
        }
        if (!value->is_boolean()) {
            fail(std::string("Field '") + key + "' must be a boolean.");
            return fallback;
        }
        return value->get<bool>();
    }

    std::optional<protocol::EnvOverrides> env(const char* key) {
        const json* value = find(key);
        if (value == nullptr) {
            return std::nullopt;
        }
        if (!value->is_object()) {
            fail(std::string("Field '") + key + "' must be an object of strings.");
            return std::nullopt;
        }
        protocol::EnvOverrides overrides;
        for (auto it = value->begin(); it != value->end(); ++it) {
            if (!it.value().is_string()) {
                fail(std::string("Field '") + key + "." + it.key() + "' must be a string.");
                return std::nullopt;
            }
            overrides[it.key()] = it.value().get<std::string>();
        }
        return overrides;
    }

    protocol::CommandInput command(const char* key) {
        const json* value = find(key);
        if (value == nullptr) {
            fail(std::string("Field '") + key + "' is required.");
            return std::string();
        }
        if (value->is_string()) {
            return value->get<std::string>();
        }
        if (value->is_array()) {
            std::vector<std::string> argv;
            for (const auto& item : *value) {
                if (!item.is_string()) {
                    fail(std::string("Field '") + key + "' must contain only strings.");
                    return std::string();
                }
                argv.push_back(item.get<std::string>());
            }
            return argv;
        }
        fail(std::string("Field '") + key + "' must be a string or a list of strings.");
        return std::string();
    }

private:
    // Absent and null fields are treated alike.
    const json* find(const char* key) const {
        if (!ok()) {
            return nullptr;
        }
        const auto it = payload_.find(key);
        if (it == payload_.end() || it->is_null()) {
            return nullptr;
        }
        return &*it;
    }

    void fail(std::string message) {
        if (!error_.has_value()) {
            error_ = ToolError{ErrorCategory::Input, std::move(message),
                               core::errors::codes::kInvalidRequest};
        }
    }

    const json& payload_;
    std::optional<ToolError> error_;
};

constexpr std::int64_t kMaxInt = std::numeric_limits<int>::max();
constexpr std::int64_t kMaxInt64 = std::numeric_limits<std::int64_t>::max();

}  // namespace

core::errors::Result<protocol::ExecRequest> parse_exec_request(const json& payload) {
    FieldReader reader(payload);
    protocol::ExecRequest request;
    request.cmd = reader.command("cmd");
    request.cwd = reader.optional_string("cwd");
    request.env = reader.env("env");
    request.timeout_s = static_cast<int>(reader.integer_or("timeout_s", 60, 1, kMaxInt));
    if (!reader.ok()) {
        return reader.error();
    }
    return request;
}

core::errors::Result<protocol::ProcessStartRequest> parse_process_start_request(
    const json& payload) {
    FieldReader reader(payload);
    protocol::ProcessStartRequest request;
    request.cmd = reader.command("cmd");
    request.cwd = reader.optional_string("cwd");
    request.env = reader.env("env");
    request.capture_output = reader.boolean_or("capture_output", true);
    if (!reader.ok()) {
        return reader.error();
    }
    return request;
}

core::errors::Result<protocol::ProcessStatusRequest> parse_process_status_request(
    const json& payload) {
    FieldReader reader(payload);
    protocol::ProcessStatusRequest request;
    request.pid = static_cast<int>(reader.required_integer("pid", 1, kMaxInt));
    if (!reader.ok()) {
        return reader.error();
    }
    return request;
}

core::errors::Result<protocol::ProcessKillRequest> parse_process_kill_request(
    const json& payload) {
    FieldReader reader(payload);
    protocol::ProcessKillRequest request;
    request.pid = static_cast<int>(reader.required_integer("pid", 1, kMaxInt));
    request.force = reader.boolean_or("force", false);
    request.timeout_s = static_cast<int>(reader.integer_or("timeout_s", 5, 0, 3600));
    if (!reader.ok()) {
        return reader.error();
    }
    return request;
}

core::errors::Result<protocol::ProcessReadRequest> parse_process_read_request(
    const json& payload) {
    FieldReader reader(payload);
    protocol::ProcessReadRequest request;
    request.pid = static_cast<int>(reader.required_integer("pid", 1, kMaxInt));
    request.stream = reader.string_or("stream", "stdout");
    request.max_bytes = reader.integer_or("max_bytes", 20000, 1, kMaxInt64);
    request.tail = reader.boolean_or("tail", true);
    if (!reader.ok()) {
        return reader.error();
    }
    return request;
}

core::errors::Result<tools::ReadRequest> parse_fs_read_request(const json& payload) {
    FieldReader reader(payload);
    tools::ReadRequest request;
    request.path = reader.required_string("path");
    request.max_bytes = reader.optional_integer("max_bytes", 0, kMaxInt64);
    if (!reader.ok()) {
        return reader.error();
    }
    return request;
}

core::errors::Result<tools::WriteRequest> parse_fs_write_request(const json& payload) {
    FieldReader reader(payload);
    tools::WriteRequest request;
    request.path = reader.required_string("path");
    request.content = reader.required_string("content");
    request.mode = reader.string_or("mode", "overwrite");
    if (!reader.ok()) {
        return reader.error();
    }
    return request;
}

core::errors::Result<tools::ListRequest> parse_fs_list_request(const json& payload) {
    FieldReader reader(payload);
    tools::ListRequest request;
    request.path = reader.required_string("path");
    request.recursive = reader.boolean_or("recursive", false);
    request.max_entries =
        static_cast<std::size_t>(reader.integer_or("max_entries", 2000, 1, kMaxInt));
    if (!reader.ok()) {
        return reader.error();
    }
    return request;
}

core::errors::Result<std::string> parse_fs_stat_request(const json& payload) {
    FieldReader reader(payload);
    std::string path = reader.required_string("path");
    if (!reader.ok()) {
        return reader.error();
    }
    return path;
}

core::errors::Result<tools::SearchRequest> parse_search_request(const json& payload) {
    FieldReader reader(payload);
    tools::SearchRequest request;
    request.pattern = reader.required_string("pattern");
    request.path = reader.string_or("path", ".");
    request.max_results =
        static_cast<std::size_t>(reader.integer_or("max_results", 200, 1, 10000));
    if (!reader.ok()) {
        return reader.error();
    }
    return request;
}

core::errors::Result<protocol::GitRequest> parse_git_request(const json& payload) {
    FieldReader reader(payload);
    protocol::GitRequest request;
    request.cwd = reader.optional_string("cwd");
    request.timeout_s = static_cast<int>(reader.integer_or("timeout_s", 60, 1, kMaxInt));
    if (!reader.ok()) {
        return reader.error();
    }
    return request;
}

core::errors::Result<protocol::GitCommitRequest> parse_git_commit_request(const json& payload) {
    FieldReader reader(payload);
    protocol::GitCommitRequest request;
    request.message = reader.required_string("message");
    request.cwd = reader.optional_string("cwd");
    request.timeout_s = static_cast<int>(reader.integer_or("timeout_s", 60, 1, kMaxInt));
    if (reader.ok() && request.message.empty()) {
        return ToolError{ErrorCategory::Input, "Field 'message' must not be empty.",
                         core::errors::codes::kInvalidRequest};
    }
    if (!reader.ok()) {
        return reader.error();
    }
    return request;
}

core::errors::Result<tools::JsonPatchRequest> parse_json_patch_request(const json& payload) {
    FieldReader reader(payload);
    tools::JsonPatchRequest request;
    request.path = reader.required_string("path");
    request.patch = reader.required_array("patch");
    request.create_if_missing = reader.boolean_or("create_if_missing", false);
    if (!reader.ok()) {
        return reader.error();
    }
    return request;
}

}  // namespace knife::server
