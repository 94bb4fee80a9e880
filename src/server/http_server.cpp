#include "server/http_server.hpp"

#include <charconv>
#include <exception>
#include <limits>
#include <optional>
#include <httplib.h>
#include "core/logging/logger.hpp"
#include "server/builtin_tools.hpp"

namespace knife::server {

using nlohmann::json;

namespace {

constexpr const char* kJson = "application/json";
constexpr std::int64_t kMaxOffset = std::numeric_limits<std::int64_t>::max();

void reply(httplib::Response& res, const json& body, const int status = 200) {
    res.status = status;
    // Replacement keeps a stray non-UTF-8 byte from turning a reply into a 500.
    res.set_content(body.dump(-1, ' ', false, json::error_handler_t::replace), kJson);
}

void reject_request(httplib::Response& res, const std::string& message) {
    reply(res, protocol::failure(core::errors::codes::kInvalidRequest, message), 422);
}

// Query integer with a default; nullopt when present but malformed or
// outside [min, max].
std::optional<std::int64_t> query_int(const httplib::Request& req, const char* key,
                                      const std::int64_t fallback, const std::int64_t min,
                                      const std::int64_t max) {
    if (!req.has_param(key)) {
        return fallback;
    }
    const std::string raw = req.get_param_value(key);
    std::int64_t value = 0;
    const auto* end = raw.data() + raw.size();
    const auto [ptr, ec] = std::from_chars(raw.data(), end, value);
    if (ec != std::errc() || ptr != end || value < min || value > max) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

HttpServer::HttpServer(std::shared_ptr<ToolRegistry> registry,
                       std::shared_ptr<process::ProcessSupervisor> supervisor)
    : registry_(std::move(registry)),
      supervisor_(std::move(supervisor)),
      server_(std::make_unique<httplib::Server>()) {
    setup_routes();
}

HttpServer::~HttpServer() {
    stop();
}

bool HttpServer::listen(const std::string& host, const std::uint16_t port) {
    if (!server_->bind_to_port(host, port)) {
        KNIFE_LOG_ERROR("Unable to bind " + host + ":" + std::to_string(port));
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (stop_requested_) {
            KNIFE_LOG_INFO("HTTP server stopped before it started listening");
            return true;
        }
        listening_ = true;
    }

    KNIFE_LOG_INFO("HTTP server listening on " + host + ":" + std::to_string(port));
    const bool ok = server_->listen_after_bind();
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        listening_ = false;
    }
    if (!ok) {
        KNIFE_LOG_ERROR("HTTP server on " + host + ":" + std::to_string(port) +
                        " stopped with an error");
    }
    return ok;
}

void HttpServer::stop() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (stop_requested_ && !listening_) {
            return;
        }
        stop_requested_ = true;
        if (!listening_) {
            return;
        }
    }
    // listen() is past bind and about to accept; wait so stop() is not lost.
    server_->wait_until_ready();
    server_->stop();
    KNIFE_LOG_INFO("HTTP server stopped");
}

json HttpServer::dashboard_data(const std::int64_t history_offset,
                                const std::int64_t history_limit,
                                const std::int64_t policy_offset,
                                const std::int64_t policy_limit) const {
    auto& telemetry = registry_->telemetry();
    return protocol::success({{"health", protocol::success()},
                              {"history", telemetry.history(history_offset, history_limit)},
                              {"policy_denials",
                               telemetry.policy_denials(policy_offset, policy_limit)},
                              {"error_counters", telemetry.error_counters()},
                              {"processes", process_snapshot(*supervisor_)}});
}

void HttpServer::setup_routes() {
    setup_tool_routes();
    setup_telemetry_routes();

    server_->Get("/tools/list", [this](const httplib::Request&, httplib::Response& res) {
        reply(res, registry_->list_tools());
    });

    server_->Get("/dashboard/data", [this](const httplib::Request& req, httplib::Response& res) {
        const auto history_offset = query_int(req, "history_offset", 0, 0, kMaxOffset);
        const auto history_limit = query_int(req, "history_limit", 10, 1, 100);
        const auto policy_offset = query_int(req, "policy_offset", 0, 0, kMaxOffset);
        const auto policy_limit = query_int(req, "policy_limit", 10, 1, 100);
        if (!history_offset || !history_limit || !policy_offset || !policy_limit) {
            reject_request(res, "Offsets must be >= 0 and limits between 1 and 100.");
            return;
        }
        reply(res, dashboard_data(*history_offset, *history_limit, *policy_offset,
                                  *policy_limit));
    });

    server_->set_exception_handler(
        [](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
            std::string message = "Unhandled server error.";
            try {
                std::rethrow_exception(ep);
            } catch (const std::exception& e) {
                message = e.what();
            }
            KNIFE_LOG_ERROR(req.method + " " + req.path + " failed: " + message);
            reply(res, protocol::failure(core::errors::codes::kInternalError, message), 500);
        });
}

void HttpServer::setup_tool_routes() {
    for (const auto& definition : registry_->definitions()) {
        const std::string name = definition.name;
        if (definition.method == "GET") {
            server_->Get(definition.path,
                         [this, name](const httplib::Request&, httplib::Response& res) {
                             reply(res, registry_->invoke(name, json::object()));
                         });
            continue;
        }

        server_->Post(definition.path, [this, name](const httplib::Request& req,
                                                    httplib::Response& res) {
            json payload = json::object();
            if (!req.body.empty()) {
                payload = json::parse(req.body, nullptr, false);
                if (payload.is_discarded()) {
                    reject_request(res, "Request body is not valid JSON.");
                    return;
                }
                if (!payload.is_object()) {
                    reject_request(res, "Request body must be a JSON object.");
                    return;
                }
            }
            reply(res, registry_->invoke(name, payload));
        });
    }
}

void HttpServer::setup_telemetry_routes() {
    server_->Get("/telemetry/history", [this](const httplib::Request& req,
                                              httplib::Response& res) {
        const auto offset = query_int(req, "offset", 0, 0, kMaxOffset);
        const auto limit = query_int(req, "limit", 20, 1, 100);
        if (!offset || !limit) {
            reject_request(res, "offset must be >= 0 and limit between 1 and 100.");
            return;
        }
        auto body = registry_->telemetry().history(*offset, *limit);
        reply(res, protocol::success(std::move(body)));
    });

    server_->Get("/telemetry/policy_denials", [this](const httplib::Request& req,
                                                     httplib::Response& res) {
        const auto offset = query_int(req, "offset", 0, 0, kMaxOffset);
        const auto limit = query_int(req, "limit", 20, 1, 100);
        if (!offset || !limit) {
            reject_request(res, "offset must be >= 0 and limit between 1 and 100.");
            return;
        }
        auto body = registry_->telemetry().policy_denials(*offset, *limit);
        reply(res, protocol::success(std::move(body)));
    });

    server_->Get("/telemetry/error_counters", [this](const httplib::Request&,
                                                     httplib::Response& res) {
        reply(res, protocol::success({{"error_counters", registry_->telemetry().error_counters()}}));
    });
}

}  // namespace knife::server
