#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>
#include "process/process_supervisor.hpp"
#include "server/tool_registry.hpp"

namespace httplib {
class Server;
}

namespace knife::server {

// Exposes the registry over HTTP/JSON. Tool routes answer 200 with an
// `ok` field; only undecodable bodies and bad query strings answer 422.
class HttpServer {
public:
    HttpServer(std::shared_ptr<ToolRegistry> registry,
               std::shared_ptr<process::ProcessSupervisor> supervisor);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Blocks until stop() is called or the socket cannot be bound. Returns
    // at once if stop() came first.
    bool listen(const std::string& host, std::uint16_t port);
    // Safe from any thread, before or during listen().
    void stop();

    // GET endpoints that are not tools, exposed for in-process use.
    nlohmann::json dashboard_data(std::int64_t history_offset, std::int64_t history_limit,
                                  std::int64_t policy_offset, std::int64_t policy_limit) const;

private:
    void setup_routes();
    void setup_tool_routes();
    void setup_telemetry_routes();

    std::shared_ptr<ToolRegistry> registry_;
    std::shared_ptr<process::ProcessSupervisor> supervisor_;
    std::unique_ptr<httplib::Server> server_;
    std::mutex state_mutex_;
    bool stop_requested_ = false;
    bool listening_ = false;
};

}  // namespace knife::server
