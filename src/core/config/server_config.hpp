#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include "core/errors/knife_errors.hpp"
#include "core/logging/logger.hpp"

namespace knife::core::config {

inline constexpr const char* kServerName = "swissknife";
inline constexpr const char* kServerVersion = "0.1.0";

struct ServerConfig {
    std::filesystem::path allowed_base = std::filesystem::current_path();
    std::string host = "127.0.0.1";
    std::uint16_t port = 8000;
    int max_timeout_s = 300;
    std::uintmax_t max_read_bytes = 200000;
    // 0 keeps exited processes for the life of the server.
    int process_retention_s = 0;
    logging::LogLevel log_level = logging::LogLevel::INFO;
};

struct BridgeConfig {
    std::string base_url = "http://127.0.0.1:8000";
    double tools_cache_ttl_s = 5.0;
    int backend_timeout_s = 30;
    bool print_config = false;
    logging::LogLevel log_level = logging::LogLevel::WARN;
};

// Environment variables are read first; CLI flags override them.
errors::Result<ServerConfig> load_server_config_from_env();
errors::Result<BridgeConfig> load_bridge_config_from_env();

// Accepts http(s)://host[:port][/path]; strips a trailing '/'.
errors::Result<std::string> validate_base_url(const std::string& raw_url);

}  // namespace knife::core::config
