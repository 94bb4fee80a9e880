#include "cli_parser.hpp"
#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <system_error>
#include <vector>

namespace knife::app::cli {

    using namespace knife::core::errors;
    using knife::core::config::BridgeConfig;
    using knife::core::config::ServerConfig;

    namespace {

        // 1. Raw Options Structs (Internal only)
        struct RawServerOptions {
            std::optional<std::string> allowed_base;
            std::optional<std::string> host;
            std::optional<std::string> port;
            std::optional<std::string> max_timeout;
            std::optional<std::string> max_read_bytes;
            std::optional<std::string> retention;
            std::optional<std::string> log_level;
        };

        struct RawBridgeOptions {
            std::optional<std::string> base_url;
            std::optional<std::string> cache_ttl;
            std::optional<std::string> backend_timeout;
            std::optional<std::string> log_level;
            bool print_config = false;
        };

        ToolError missing_value(const std::string& flag) {
            return ToolError{ErrorCategory::Input, "Missing value for " + flag, "missing_value"};
        }

        ToolError unknown_argument(const std::string& arg) {
            return ToolError{ErrorCategory::Input, "Unknown argument: " + arg, "unknown_argument"};
        }

        // Exception-free integer parsing with inclusive bounds
        template <typename Int>
        Result<Int> parse_bounded(const std::string& flag, const std::string& text, Int min, Int max) {
            Int value{};
            const char* begin = text.data();
            const char* end = text.data() + text.size();
            auto [ptr, ec] = std::from_chars(begin, end, value);
            if (ec != std::errc() || ptr != end) {
                return ToolError{ErrorCategory::Input, "Invalid number for " + flag, "invalid_integer", "Provide a whole number."};
            }
            if (value < min || value > max) {
                return ToolError{ErrorCategory::Input, flag + " out of bounds", "bounds_error",
                                 "Must be between " + std::to_string(min) + " and " + std::to_string(max) + "."};
            }
            return value;
        }

        Result<double> parse_seconds(const std::string& flag, const std::string& text) {
            char* end = nullptr;
            const double value = std::strtod(text.c_str(), &end);
            if (text.empty() || *end != '\0') {
                return ToolError{ErrorCategory::Input, "Invalid number for " + flag, "invalid_number"};
            }
            return value;
        }

        Result<core::logging::LogLevel> parse_level(const std::string& text) {
            const auto level = core::logging::parse_level(text);
            if (!level) {
                return ToolError{ErrorCategory::Input, "Unknown log level: " + text, "invalid_log_level", "Use debug, info, warn or error."};
            }
            return *level;
        }

        std::vector<std::string> collect_args(int argc, char* argv[]) {
            std::vector<std::string> args;
            for (int i = 1; i < argc; ++i) { // Start at 1 to skip program name
                args.push_back(argv[i]);
            }
            return args;
        }

        // Reads the value following a flag into `slot`.
        bool take_value(const std::vector<std::string>& args, size_t& i, std::optional<std::string>& slot) {
            if (i + 1 >= args.size()) {
                return false;
            }
            slot = args[++i];
            return true;
        }

    } // namespace

    Result<ServerConfig> parse_server_args(int argc, char* argv[], ServerConfig base) {
        const auto args = collect_args(argc, argv);
        RawServerOptions raw;

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& flag = args[i];
            std::optional<std::string>* slot = nullptr;
            if (flag == "--allowed-base") slot = &raw.allowed_base;
            else if (flag == "--host") slot = &raw.host;
            else if (flag == "--port") slot = &raw.port;
            else if (flag == "--max-timeout") slot = &raw.max_timeout;
            else if (flag == "--max-read-bytes") slot = &raw.max_read_bytes;
            else if (flag == "--process-retention") slot = &raw.retention;
            else if (flag == "--log-level") slot = &raw.log_level;
            else return unknown_argument(flag);

            if (!take_value(args, i, *slot)) {
                return missing_value(flag);
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        ServerConfig config = std::move(base);
        if (raw.allowed_base) config.allowed_base = raw.allowed_base.value();
        if (raw.host) config.host = raw.host.value();

        if (raw.port) {
            auto port = parse_bounded<std::uint16_t>("--port", raw.port.value(), 1, 65535);
            if (is_error(port)) return get_error(port);
            config.port = get_value(port);
        }
        if (raw.max_timeout) {
            auto timeout = parse_bounded<int>("--max-timeout", raw.max_timeout.value(), 1, 86400);
            if (is_error(timeout)) return get_error(timeout);
            config.max_timeout_s = get_value(timeout);
        }
        if (raw.max_read_bytes) {
            auto bytes = parse_bounded<std::uintmax_t>("--max-read-bytes", raw.max_read_bytes.value(), 1, 1ULL << 32);
            if (is_error(bytes)) return get_error(bytes);
            config.max_read_bytes = get_value(bytes);
        }
        if (raw.retention) {
            auto retention = parse_bounded<int>("--process-retention", raw.retention.value(), 0, 604800);
            if (is_error(retention)) return get_error(retention);
            config.process_retention_s = get_value(retention);
        }
        if (raw.log_level) {
            auto level = parse_level(raw.log_level.value());
            if (is_error(level)) return get_error(level);
            config.log_level = get_value(level);
        }

        if (config.port == 0) {
            return ToolError{ErrorCategory::Input, "Port must be between 1 and 65535", "bounds_error"};
        }
        if (config.max_timeout_s <= 0) {
            return ToolError{ErrorCategory::Input, "Maximum timeout must be positive", "bounds_error"};
        }
        if (config.max_read_bytes == 0) {
            return ToolError{ErrorCategory::Input, "Maximum read size must be positive", "bounds_error"};
        }
        if (config.process_retention_s < 0) {
            return ToolError{ErrorCategory::Input, "Process retention cannot be negative", "bounds_error"};
        }

        // Path validation
        std::error_code path_ec;
        const bool is_dir = std::filesystem::is_directory(config.allowed_base, path_ec);
        if (path_ec || !is_dir) {
            return ToolError{ErrorCategory::Input, "Allowed base does not exist or is not a directory: " + config.allowed_base.string(), "invalid_path"};
        }
        std::filesystem::path canonical_path = std::filesystem::canonical(config.allowed_base, path_ec);
        if (path_ec) {
            return ToolError{ErrorCategory::Input, "Failed to canonicalize allowed base", "invalid_path"};
        }
        config.allowed_base = std::move(canonical_path);

        return config;
    }

    Result<BridgeConfig> parse_bridge_args(int argc, char* argv[], BridgeConfig base) {
        const auto args = collect_args(argc, argv);
        RawBridgeOptions raw;

        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& flag = args[i];
            if (flag == "--print-config") {
                raw.print_config = true;
                continue;
            }

            std::optional<std::string>* slot = nullptr;
            if (flag == "--base-url") slot = &raw.base_url;
            else if (flag == "--tools-cache-ttl") slot = &raw.cache_ttl;
            else if (flag == "--backend-timeout") slot = &raw.backend_timeout;
            else if (flag == "--log-level") slot = &raw.log_level;
            else return unknown_argument(flag);

            if (!take_value(args, i, *slot)) {
                return missing_value(flag);
            }
        }

        BridgeConfig config = std::move(base);
        config.print_config = config.print_config || raw.print_config;

        auto url = core::config::validate_base_url(raw.base_url.value_or(config.base_url));
        if (is_error(url)) return get_error(url);
        config.base_url = get_value(url);

        if (raw.cache_ttl) {
            auto ttl = parse_seconds("--tools-cache-ttl", raw.cache_ttl.value());
            if (is_error(ttl)) return get_error(ttl);
            config.tools_cache_ttl_s = get_value(ttl);
        }
        if (raw.backend_timeout) {
            auto timeout = parse_bounded<int>("--backend-timeout", raw.backend_timeout.value(), 1, 3600);
            if (is_error(timeout)) return get_error(timeout);
            config.backend_timeout_s = get_value(timeout);
        }
        if (config.backend_timeout_s <= 0) {
            return ToolError{ErrorCategory::Input, "Backend timeout must be positive", "bounds_error"};
        }
        if (raw.log_level) {
            auto level = parse_level(raw.log_level.value());
            if (is_error(level)) return get_error(level);
            config.log_level = get_value(level);
        }

        return config;
    }

} // namespace knife::app::cli
