#include "bridge/mcp_session.hpp"

#include <set>
#include <utility>
#include "bridge/message_framing.hpp"
#include "core/logging/logger.hpp"

namespace knife::bridge {

using nlohmann::json;

namespace {

json result_response(const json& id, json result) {
    return json{{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}};
}

bool is_hidden_route(const std::string& path) {
    static const std::set<std::string> hidden = {"/health", "/tools/list", "/openapi.json"};
    return hidden.count(path) > 0;
}

json backend_error_json(const core::errors::ToolError& error) {
    return json{{"ok", false}, {"error", error.code}, {"message", error.message}};
}

}  // namespace

McpSession::McpSession(std::shared_ptr<ToolBackend> backend, SessionOptions options)
    : backend_(std::move(backend)),
      options_(std::move(options)),
      cache_(backend_, options_.tools_cache_ttl, options_.clock) {}

json McpSession::error_response(const json& id, const int code, const std::string& message,
                                const std::optional<json>& data) {
    json error{{"code", code}, {"message", message}};
    if (data.has_value()) {
        error["data"] = data.value();
    }
    return json{{"jsonrpc", "2.0"}, {"id", id}, {"error", std::move(error)}};
}

json McpSession::initialize_result() const {
    return json{
        {"protocolVersion", options_.protocol_version},
        {"capabilities",
         {{"tools", json::object()},
          {"experimental",
           {{"resources", {{"enabled", options_.enable_resources}}},
            {"prompts", {{"enabled", options_.enable_prompts}}}}}}},
        {"serverInfo", {{"name", options_.server_name}, {"version", options_.server_version}}}};
}

json McpSession::tools_list(const json& id) {
    auto fetched = cache_.tools(true);
    if (core::errors::is_error(fetched)) {
        const auto& err = core::errors::get_error(fetched);
        const int code = err.code == core::errors::codes::kTimeout ? rpc::kBackendTimeout
                                                                  : rpc::kBackendFailure;
        return error_response(id, code,
                              code == rpc::kBackendTimeout ? "Backend timeout"
                                                           : "Backend HTTP failure",
                              json{{"backend", backend_error_json(err)}});
    }

    json tools = json::array();
    for (const auto& tool : core::errors::get_value(fetched)) {
        if (is_hidden_route(tool.path)) {
            continue;
        }
        tools.push_back(json{{"name", tool.name},
                             {"description", tool.description},
                             {"inputSchema", tool.request_schema.value_or(
                                                 json{{"type", "object"}})}});
    }
    return result_response(id, json{{"tools", tools}});
}

json McpSession::tools_call(const json& params, const json& id) {
    std::string invalid_reason;
    const auto name_it = params.find("name");
    const auto args_it = params.find("arguments");
    if (name_it == params.end() || !name_it->is_string() ||
        name_it->get<std::string>().empty()) {
        invalid_reason = "tools/call params must include a non-empty string `name`.";
    } else if (args_it != params.end() && !args_it->is_null() && !args_it->is_object()) {
        invalid_reason = "tools/call `arguments` must be an object when provided.";
    }
    if (!invalid_reason.empty()) {
        return error_response(id, rpc::kInvalidParams, "Invalid params",
                              json{{"reason", invalid_reason}});
    }

    const std::string name = name_it->get<std::string>();
    const json arguments =
        args_it == params.end() || args_it->is_null() ? json::object() : *args_it;

    auto found = cache_.find(name);
    if (core::errors::is_error(found)) {
        return error_response(id, rpc::kBackendFailure, "Backend HTTP failure",
                              json{{"tool", name},
                                   {"backend", backend_error_json(core::errors::get_error(found))}});
    }
    const auto& tool = core::errors::get_value(found);
    if (!tool.has_value()) {
        return error_response(id, rpc::kInvalidParams, "Tool not found", json{{"name", name}});
    }

    const auto reply = backend_->call_tool(tool.value(), arguments);
    if (reply.timed_out) {
        KNIFE_LOG_WARN("tools/call " + name + " timed out");
        return error_response(id, rpc::kBackendTimeout, "Backend timeout",
                              json{{"tool", name}, {"backend", reply.body}});
    }
    if (!reply.ok()) {
        return error_response(id, rpc::kBackendFailure, "Backend HTTP failure",
                              json{{"tool", name}, {"backend", reply.body}});
    }

    return result_response(
        id, json{{"content", json::array({json{{"type", "text"}, {"text", dump_ascii(reply.body)}}})}});
}

std::optional<json> McpSession::handle(const json& message) {
    if (!message.is_object()) {
        return error_response(nullptr, rpc::kInvalidRequest, "Invalid Request");
    }

    const json id = message.contains("id") ? message["id"] : json(nullptr);
    const auto method_it = message.find("method");
    const std::string method =
        method_it != message.end() && method_it->is_string() ? method_it->get<std::string>() : "";
    json params = json::object();
    if (message.contains("params") && message["params"].is_object()) {
        params = message["params"];
    }

    if (method == "initialize") {
        return result_response(id, initialize_result());
    }
    if (method == "notifications/initialized") {
        return std::nullopt;
    }
    if (method == "tools/list") {
        return tools_list(id);
    }
    if (method == "tools/call") {
        if (message.contains("params") && !message["params"].is_null() &&
            !message["params"].is_object()) {
            return error_response(id, rpc::kInvalidParams, "Invalid params",
                                  json{{"reason", "tools/call params must be an object."}});
        }
        return tools_call(params, id);
    }
    if (method == "ping") {
        return result_response(id, json::object());
    }
    if (method == "shutdown") {
        shutdown_requested_ = true;
        return result_response(id, json::object());
    }

    if (id.is_null()) {
        return std::nullopt;
    }
    return error_response(id, rpc::kMethodNotFound, "Method not found",
                          json{{"method", method_it != message.end() ? *method_it : json(nullptr)}});
}

}  // namespace knife::bridge
