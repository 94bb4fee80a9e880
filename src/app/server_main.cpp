#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <pthread.h>
#include <thread>
#include "app/cli_parser.hpp"
#include "core/config/server_config.hpp"
#include "core/errors/knife_errors.hpp"
#include "core/logging/logger.hpp"
#include "policy/policy_guard.hpp"
#include "process/process_supervisor.hpp"
#include "server/builtin_tools.hpp"
#include "server/http_server.hpp"
#include "server/tool_registry.hpp"
#include "telemetry/telemetry_recorder.hpp"
#include "tools/tool_host.hpp"

int main(int argc, char* argv[]) {
    namespace config = knife::core::config;
    namespace errors = knife::core::errors;

    knife::core::logging::Logger::get().set_component("knife_server");

    // 1. Environment first, then CLI flags on top
    auto from_env = config::load_server_config_from_env();
    if (errors::is_error(from_env)) {
        const auto& err = errors::get_error(from_env);
        KNIFE_LOG_ERROR("Configuration error [" + err.code + "]: " + err.message);
        return 2;
    }
    auto parsed = knife::app::cli::parse_server_args(argc, argv, errors::get_value(from_env));
    if (errors::is_error(parsed)) {
        const auto& err = errors::get_error(parsed);
        KNIFE_LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            KNIFE_LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }
    const auto cfg = errors::get_value(parsed);
    knife::core::logging::Logger::get().set_min_level(cfg.log_level);

    // 2. Shared policy and services
    knife::policy::ExecutionPolicy policy;
    policy.sandbox_root = cfg.allowed_base;
    policy.max_timeout_s = cfg.max_timeout_s;
    auto guard = std::make_shared<const knife::policy::PolicyGuard>(policy);

    knife::process::SupervisorOptions supervisor_options;
    supervisor_options.max_read_bytes = cfg.max_read_bytes;
    supervisor_options.retention = std::chrono::seconds(cfg.process_retention_s);
    auto supervisor =
        std::make_shared<knife::process::ProcessSupervisor>(guard, supervisor_options);

    knife::tools::ToolHostOptions host_options;
    host_options.max_read_bytes = cfg.max_read_bytes;
    auto host = std::make_shared<knife::tools::ToolHost>(guard, host_options);

    auto telemetry = std::make_shared<knife::telemetry::TelemetryRecorder>();
    auto registry = std::make_shared<knife::server::ToolRegistry>(telemetry);
    knife::server::register_builtin_tools(*registry, host, supervisor);

    // 3. SIGINT/SIGTERM are taken synchronously by a watcher thread
    sigset_t stop_signals;
    sigemptyset(&stop_signals);
    sigaddset(&stop_signals, SIGINT);
    sigaddset(&stop_signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &stop_signals, nullptr);

    knife::server::HttpServer server(registry, supervisor);
    std::thread watcher([&server, stop_signals]() {
        int signal_number = 0;
        if (sigwait(&stop_signals, &signal_number) == 0) {
            KNIFE_LOG_INFO("Received signal " + std::to_string(signal_number) + ", shutting down");
            server.stop();
        }
    });
    watcher.detach();

    KNIFE_LOG_INFO(std::string(config::kServerName) + " " + config::kServerVersion +
                   " serving " + cfg.allowed_base.string());
    if (!server.listen(cfg.host, cfg.port)) {
        return 4;
    }
    return 0;
}
