#include "core/config/server_config.hpp"

#include <charconv>
#include <cstdlib>
#include <optional>
#include <system_error>

namespace knife::core::config {

using errors::ErrorCategory;
using errors::ToolError;

namespace {

std::optional<std::string> env_value(const char* name) {
    const char* raw = std::getenv(name);
    if (raw == nullptr || *raw == '\0') {
        return std::nullopt;
    }
    return std::string(raw);
}

template <typename Int>
errors::Result<Int> parse_env_int(const char* name, const std::string& text) {
    Int value{};
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc() || ptr != end) {
        return ToolError{ErrorCategory::Input,
                         std::string("Invalid integer in ") + name + ": " + text,
                         "invalid_config"};
    }
    return value;
}

errors::Result<double> parse_env_double(const char* name, const std::string& text) {
    char* end = nullptr;
    const double value = std::strtod(text.c_str(), &end);
    if (end == text.c_str() || *end != '\0') {
        return ToolError{ErrorCategory::Input,
                         std::string("Invalid number in ") + name + ": " + text,
                         "invalid_config"};
    }
    return value;
}

errors::Result<logging::LogLevel> parse_env_level(const char* name,
                                                 const std::string& text) {
    const auto level = logging::parse_level(text);
    if (!level) {
        return ToolError{ErrorCategory::Input,
                         std::string("Unknown log level in ") + name + ": " + text,
                         "invalid_config", "Use debug, info, warn or error."};
    }
    return *level;
}

}  // namespace

errors::Result<ServerConfig> load_server_config_from_env() {
    ServerConfig config;

    if (auto base = env_value("KNIFE_ALLOWED_BASE")) {
        config.allowed_base = *base;
    }
    if (auto host = env_value("KNIFE_HOST")) {
        config.host = *host;
    }
    if (auto port = env_value("KNIFE_PORT")) {
        auto parsed = parse_env_int<std::uint16_t>("KNIFE_PORT", *port);
        if (errors::is_error(parsed)) return errors::get_error(parsed);
        config.port = errors::get_value(parsed);
    }
    if (auto timeout = env_value("KNIFE_POLICY_MAX_TIMEOUT_S")) {
        auto parsed = parse_env_int<int>("KNIFE_POLICY_MAX_TIMEOUT_S", *timeout);
        if (errors::is_error(parsed)) return errors::get_error(parsed);
        config.max_timeout_s = errors::get_value(parsed);
    }
    if (auto max_read = env_value("KNIFE_MAX_READ_BYTES")) {
        auto parsed = parse_env_int<std::uintmax_t>("KNIFE_MAX_READ_BYTES", *max_read);
        if (errors::is_error(parsed)) return errors::get_error(parsed);
        config.max_read_bytes = errors::get_value(parsed);
    }
    if (auto retention = env_value("KNIFE_PROCESS_RETENTION_S")) {
        auto parsed = parse_env_int<int>("KNIFE_PROCESS_RETENTION_S", *retention);
        if (errors::is_error(parsed)) return errors::get_error(parsed);
        config.process_retention_s = errors::get_value(parsed);
    }
    if (auto level = env_value("KNIFE_LOG_LEVEL")) {
        auto parsed = parse_env_level("KNIFE_LOG_LEVEL", *level);
        if (errors::is_error(parsed)) return errors::get_error(parsed);
        config.log_level = errors::get_value(parsed);
    }

    return config;
}

errors::Result<BridgeConfig> load_bridge_config_from_env() {
    BridgeConfig config;

    if (auto url = env_value("KNIFE_BASE_URL")) {
        config.base_url = *url;
    }
    if (auto ttl = env_value("KNIFE_TOOLS_CACHE_TTL_S")) {
        auto parsed = parse_env_double("KNIFE_TOOLS_CACHE_TTL_S", *ttl);
        if (errors::is_error(parsed)) return errors::get_error(parsed);
        config.tools_cache_ttl_s = errors::get_value(parsed);
    }
    if (auto timeout = env_value("KNIFE_BACKEND_TIMEOUT_S")) {
        auto parsed = parse_env_int<int>("KNIFE_BACKEND_TIMEOUT_S", *timeout);
        if (errors::is_error(parsed)) return errors::get_error(parsed);
        config.backend_timeout_s = errors::get_value(parsed);
    }
    if (auto level = env_value("KNIFE_LOG_LEVEL")) {
        auto parsed = parse_env_level("KNIFE_LOG_LEVEL", *level);
        if (errors::is_error(parsed)) return errors::get_error(parsed);
        config.log_level = errors::get_value(parsed);
    }

    return config;
}

errors::Result<std::string> validate_base_url(const std::string& raw_url) {
    std::string candidate = raw_url;
    const auto first = candidate.find_first_not_of(" \t");
    const auto last = candidate.find_last_not_of(" \t");
    candidate = first == std::string::npos ? "" : candidate.substr(first, last - first + 1);

    const auto scheme_end = candidate.find("://");
    const std::string scheme =
        scheme_end == std::string::npos ? "" : candidate.substr(0, scheme_end);
    if (scheme != "http" && scheme != "https") {
        return ToolError{ErrorCategory::Input,
                         "Base URL must start with http:// or https://",
                         "invalid_base_url"};
    }

    const std::string rest = candidate.substr(scheme_end + 3);
    const auto path_start = rest.find_first_of("/?#");
    const std::string authority =
        path_start == std::string::npos ? rest : rest.substr(0, path_start);
    if (authority.empty()) {
        return ToolError{ErrorCategory::Input,
                         "Base URL must include a host (and optional port)",
                         "invalid_base_url"};
    }

    std::string path;
    if (path_start != std::string::npos && rest[path_start] == '/') {
        path = rest.substr(path_start);
        const auto query = path.find_first_of("?#");
        if (query != std::string::npos) {
            path.erase(query);
        }
    }
    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }

    return scheme + "://" + authority + path;
}

}  // namespace knife::core::config
