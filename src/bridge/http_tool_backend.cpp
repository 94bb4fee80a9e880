#include "bridge/http_tool_backend.hpp"

#include <utility>
#include <httplib.h>
#include "bridge/message_framing.hpp"
#include "core/logging/logger.hpp"

namespace knife::bridge {

using core::errors::ErrorCategory;
using core::errors::ToolError;
using nlohmann::json;

namespace {

json http_error_body(const int status, const std::string& raw) {
    json parsed = json::parse(raw, nullptr, false);
    return json{{"ok", false},
                {"error", "http_error"},
                {"status", status},
                {"response", parsed.is_discarded() ? json(raw) : parsed}};
}

}  // namespace

HttpToolBackend::HttpToolBackend(HttpBackendOptions options) : options_(std::move(options)) {
    const auto scheme_end = options_.base_url.find("://");
    const auto path_start = scheme_end == std::string::npos
                                ? std::string::npos
                                : options_.base_url.find('/', scheme_end + 3);
    origin_ = options_.base_url.substr(0, path_start);
    if (path_start != std::string::npos) {
        path_prefix_ = options_.base_url.substr(path_start);
    }
}

BackendReply HttpToolBackend::request(const std::string& method, const std::string& path,
                                      const std::optional<json>& payload) const {
    httplib::Client client(origin_);
    if (!client.is_valid()) {
        return BackendReply{json{{"ok", false},
                                 {"error", "connection_error"},
                                 {"message", "Unsupported backend URL: " + options_.base_url}},
                            false};
    }
    const auto seconds = static_cast<time_t>(options_.timeout.count());
    client.set_connection_timeout(seconds, 0);
    client.set_read_timeout(seconds, 0);
    client.set_write_timeout(seconds, 0);

    const std::string target = path_prefix_ + path;
    const auto started = std::chrono::steady_clock::now();
    httplib::Result result = method == "GET"
                                 ? client.Get(target)
                                 : client.Post(target, payload.has_value() ? dump_ascii(*payload)
                                                                           : std::string("{}"),
                                               "application/json");
    const auto elapsed = std::chrono::steady_clock::now() - started;

    if (!result) {
        const bool timed_out = elapsed >= options_.timeout;
        const std::string reason = httplib::to_string(result.error());
        KNIFE_LOG_WARN(method + " " + target + " failed: " + reason);
        return BackendReply{json{{"ok", false},
                                 {"error", timed_out ? "timeout" : "connection_error"},
                                 {"message", reason}},
                            timed_out};
    }

    if (result->status >= 400) {
        return BackendReply{http_error_body(result->status, result->body), false};
    }

    json parsed = json::parse(result->body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return BackendReply{
            json{{"ok", false}, {"error", "invalid_backend_response"}, {"raw", result->body}},
            false};
    }
    return BackendReply{std::move(parsed), false};
}

core::errors::Result<std::vector<protocol::ToolDefinition>> HttpToolBackend::fetch_tools() {
    const auto reply = request("GET", "/tools/list");
    if (!reply.ok()) {
        const auto error = reply.body.find("error");
        const std::string code = error != reply.body.end() && error->is_string()
                                     ? error->get<std::string>()
                                     : std::string("http_error");
        return ToolError{ErrorCategory::Backend,
                         "Unable to fetch tools from " + options_.base_url + ": " +
                             dump_ascii(reply.body),
                         reply.timed_out ? core::errors::codes::kTimeout : code};
    }

    std::vector<protocol::ToolDefinition> tools;
    const auto listed = reply.body.find("tools");
    if (listed != reply.body.end() && listed->is_array()) {
        for (const auto& item : *listed) {
            if (auto tool = protocol::tool_from_json(item)) {
                tools.push_back(std::move(tool.value()));
            }
        }
    }
    return tools;
}

BackendReply HttpToolBackend::call_tool(const protocol::ToolDefinition& tool,
                                        const json& arguments) {
    return request(tool.method.empty() ? "POST" : tool.method, tool.path, arguments);
}

}  // namespace knife::bridge
