#pragma once
#include <string>
#include <variant>

namespace knife::core::errors {

    // Typed error categories
    enum class ErrorCategory {
        Input,      // E.g., malformed command or tool parameters
        Execution,  // E.g., a spawned process or file operation failed
        Backend,    // E.g., the tool registry did not answer in time
        Policy,     // E.g., command denied or path outside the sandbox root
        Internal    // E.g., unexpected library failure
    };

    // Error codes surfaced in every `{ok: false, error: ...}` response
    namespace codes {
        inline constexpr const char* kInvalidCommand = "invalid_command";
        inline constexpr const char* kEmptyCommand = "empty_command";
        inline constexpr const char* kPolicyDenied = "policy_denied";
        inline constexpr const char* kNotFound = "not_found";
        inline constexpr const char* kTimeout = "timeout";
        inline constexpr const char* kNoOutput = "no_output";
        inline constexpr const char* kPermissionDenied = "permission_denied";
        inline constexpr const char* kInvalidPath = "invalid_path";
        inline constexpr const char* kInvalidArgument = "invalid_argument";
        inline constexpr const char* kInvalidRequest = "invalid_request";
        inline constexpr const char* kInternalError = "internal_error";
    } // namespace codes

    // The standardized error payload
    struct ToolError {
            ErrorCategory category;
            std::string message;
            std::string code = codes::kInternalError;
            std::string hint = "";              // Helpful tips for the caller
        };

    // A Result holds either a successful value of type T, OR a ToolError.
    template <typename T>
    using Result = std::variant<T, ToolError>;

    // Operations with nothing to return on success
    struct Ok {};

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<ToolError>(result);
    }

    template <typename T>
    const ToolError& get_error(const Result<T>& result) {
        return std::get<ToolError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    // Default human-readable text for a code, used when a failure site has
    // nothing more specific to say.
    inline std::string default_message(const std::string& code) {
        if (code == codes::kNotFound) return "Requested resource was not found.";
        if (code == codes::kInvalidPath) return "Provided path or path-like input is invalid.";
        if (code == codes::kPermissionDenied) {
            return "Operation is not permitted in the allowed base directory.";
        }
        if (code == codes::kTimeout) return "Operation timed out.";
        if (code == codes::kNoOutput) return "Output capture was disabled for this process.";
        if (code == codes::kInternalError) return "Unexpected internal error.";
        return "Operation failed.";
    }

} // namespace knife::core::errors
