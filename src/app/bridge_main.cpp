#include <chrono>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include "app/cli_parser.hpp"
#include "bridge/http_tool_backend.hpp"
#include "bridge/mcp_session.hpp"
#include "bridge/stdio_loop.hpp"
#include "core/config/server_config.hpp"
#include "core/errors/knife_errors.hpp"
#include "core/logging/logger.hpp"

namespace {

int print_config(const knife::core::config::BridgeConfig& cfg,
                 const knife::bridge::HttpToolBackend& backend,
                 const knife::bridge::SessionOptions& session) {
    const auto health = backend.request("GET", "/health");
    const nlohmann::json report{
        {"server", session.server_name},
        {"version", session.server_version},
        {"protocolVersion", session.protocol_version},
        {"baseUrl", cfg.base_url},
        {"healthUrl", cfg.base_url + "/health"},
        {"toolsUrl", cfg.base_url + "/tools/list"},
        {"toolsCacheTtlS", cfg.tools_cache_ttl_s},
        {"backendTimeoutS", cfg.backend_timeout_s},
        {"health", health.body},
        {"bridgeCommand",
         {{"command", "knife_bridge"}, {"env", {{"KNIFE_BASE_URL", cfg.base_url}}}}}};
    std::cout << report.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    namespace config = knife::core::config;
    namespace errors = knife::core::errors;

    // stdout carries protocol frames; diagnostics go to stderr only.
    auto& logger = knife::core::logging::Logger::get();
    logger.set_stream(std::cerr);
    logger.set_component("knife_bridge");

    auto from_env = config::load_bridge_config_from_env();
    if (errors::is_error(from_env)) {
        std::cerr << errors::get_error(from_env).message << std::endl;
        return 2;
    }
    auto parsed = knife::app::cli::parse_bridge_args(argc, argv, errors::get_value(from_env));
    if (errors::is_error(parsed)) {
        const auto& err = errors::get_error(parsed);
        std::cerr << err.message << std::endl;
        if (!err.hint.empty()) {
            std::cerr << "Hint: " << err.hint << std::endl;
        }
        return 2;
    }
    const auto cfg = errors::get_value(parsed);
    logger.set_min_level(cfg.log_level);

    knife::bridge::HttpBackendOptions backend_options;
    backend_options.base_url = cfg.base_url;
    backend_options.timeout = std::chrono::seconds(cfg.backend_timeout_s);
    auto backend = std::make_shared<knife::bridge::HttpToolBackend>(backend_options);

    knife::bridge::SessionOptions session_options;
    session_options.server_name = config::kServerName;
    session_options.server_version = config::kServerVersion;
    session_options.tools_cache_ttl = std::chrono::duration<double>(cfg.tools_cache_ttl_s);

    if (cfg.print_config) {
        return print_config(cfg, *backend, session_options);
    }

    knife::bridge::McpSession session(backend, session_options);
    KNIFE_LOG_INFO("Bridging stdio to " + cfg.base_url);
    const auto handled = knife::bridge::run_stdio_loop(session, std::cin, std::cout);
    KNIFE_LOG_INFO("Handled " + std::to_string(handled) + " messages");
    return 0;
}
