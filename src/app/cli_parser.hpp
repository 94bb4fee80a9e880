#pragma once
#include "core/config/server_config.hpp"
#include "core/errors/knife_errors.hpp"

namespace knife::app::cli {
    // Applies knife_server flags over `base` (usually the environment
    // config) and validates the merged result.
    knife::core::errors::Result<knife::core::config::ServerConfig> parse_server_args(
        int argc, char* argv[], knife::core::config::ServerConfig base);

    knife::core::errors::Result<knife::core::config::BridgeConfig> parse_bridge_args(
        int argc, char* argv[], knife::core::config::BridgeConfig base);
}
