#include "telemetry/telemetry_recorder.hpp"

#include <algorithm>
#include <regex>
#include <set>
#include <utility>
#include "core/errors/knife_errors.hpp"
#include "core/text/utf8.hpp"
#include "core/time/timestamps.hpp"

namespace knife::telemetry {

namespace {

const std::regex& assignment_pattern() {
    static const std::regex pattern(R"((token|password|secret|api[_-]?key)\s*[=:]\s*\S+)",
                                    std::regex::ECMAScript | std::regex::icase);
    return pattern;
}

const std::regex& bearer_pattern() {
    static const std::regex pattern(R"(bearer\s+[a-z0-9._-]+)",
                                    std::regex::ECMAScript | std::regex::icase);
    return pattern;
}

bool is_output_key(const std::string& key) {
    static const std::set<std::string> keys = {"cmd", "stdout", "stderr", "content", "error"};
    return keys.count(key) > 0;
}

bool is_policy_denial(const nlohmann::json& response, const std::string& error_key) {
    if (error_key == core::errors::codes::kPolicyDenied) {
        return true;
    }
    const auto message = response.find("message");
    return error_key == core::errors::codes::kPermissionDenied &&
           message != response.end() && message->is_string() &&
           message->get<std::string>().find("outside allowed base directory") !=
               std::string::npos;
}

}  // namespace

std::string redact_text(const std::string& value, const std::size_t max_chars) {
    if (value.empty()) {
        return value;
    }
    // Oversized input is clipped before matching to bound regex work.
    const std::string bounded = core::text::truncate_code_points(value, max_chars + 1024);
    std::string text = std::regex_replace(bounded, assignment_pattern(), "[REDACTED]");
    text = std::regex_replace(text, bearer_pattern(), "[REDACTED]");
    std::string clipped = core::text::truncate_code_points(text, max_chars);
    if (clipped.size() < text.size() || bounded.size() < value.size()) {
        return clipped + "...[TRUNCATED]";
    }
    return text;
}

nlohmann::json sanitize_value(const nlohmann::json& value, const std::string& key) {
    if (value.is_object()) {
        nlohmann::json out = nlohmann::json::object();
        for (auto it = value.begin(); it != value.end(); ++it) {
            out[it.key()] = sanitize_value(it.value(), it.key());
        }
        return out;
    }
    if (value.is_array()) {
        nlohmann::json out = nlohmann::json::array();
        for (const auto& item : value) {
            out.push_back(sanitize_value(item, key));
        }
        return out;
    }
    if (value.is_string()) {
        return redact_text(value.get<std::string>(), is_output_key(key) ? 4000 : 1500);
    }
    return value;
}

TelemetryRecorder::TelemetryRecorder(TelemetryOptions options) : options_(std::move(options)) {}

void TelemetryRecorder::record_tool_call(const std::string& name, const std::string& method,
                                         const std::string& path,
                                         const nlohmann::json& request,
                                         const nlohmann::json& response) {
    const std::string now = core::time::utc_now_iso8601();
    const auto ok_field = response.find("ok");
    const bool ok = ok_field == response.end() || !ok_field->is_boolean() ||
                    ok_field->get<bool>();

    std::string error_key = "none";
    if (!ok) {
        error_key = "unknown_error";
        const auto error = response.find("error");
        if (error != response.end() && error->is_string() && !error->get<std::string>().empty()) {
            error_key = error->get<std::string>();
        }
    }

    nlohmann::json entry{
        {"timestamp", now},
        {"name", name},
        {"method", method},
        {"path", path},
        {"ok", ok},
        {"request", sanitize_value(request.is_null() ? nlohmann::json::object() : request)},
        {"response", sanitize_value(response)}};

    std::lock_guard<std::mutex> lock(mutex_);
    history_.push_front(std::move(entry));
    if (history_.size() > options_.history_max) {
        history_.pop_back();
    }
    if (ok) {
        return;
    }

    ++error_counters_[error_key];
    if (is_policy_denial(response, error_key)) {
        const std::string detail = response.contains("reason") && response["reason"].is_string()
                                       ? response["reason"].get<std::string>()
                                       : response.value("message", error_key);
        policy_denials_.push_front(nlohmann::json{{"timestamp", now},
                                                  {"name", name},
                                                  {"path", path},
                                                  {"error", error_key},
                                                  {"reason", redact_text(detail)}});
        if (policy_denials_.size() > options_.policy_denials_max) {
            policy_denials_.pop_back();
        }
    }
}

nlohmann::json TelemetryRecorder::page(const std::deque<nlohmann::json>& items,
                                       const std::int64_t offset,
                                       const std::int64_t limit) const {
    const std::int64_t safe_offset = std::max<std::int64_t>(offset, 0);
    const std::int64_t safe_limit = std::max<std::int64_t>(
        1, std::min<std::int64_t>(limit, static_cast<std::int64_t>(options_.page_limit_max)));
    const auto total = static_cast<std::int64_t>(items.size());

    nlohmann::json sliced = nlohmann::json::array();
    for (std::int64_t i = safe_offset; i < total && i < safe_offset + safe_limit; ++i) {
        sliced.push_back(items[static_cast<std::size_t>(i)]);
    }
    return nlohmann::json{
        {"total", total}, {"offset", safe_offset}, {"limit", safe_limit}, {"items", sliced}};
}

nlohmann::json TelemetryRecorder::history(const std::int64_t offset,
                                          const std::int64_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return page(history_, offset, limit);
}

nlohmann::json TelemetryRecorder::policy_denials(const std::int64_t offset,
                                                 const std::int64_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return page(policy_denials_, offset, limit);
}

nlohmann::json TelemetryRecorder::error_counters() const {
    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json counters = nlohmann::json::object();
    for (const auto& [key, count] : error_counters_) {
        counters[key] = count;
    }
    return counters;
}

}  // namespace knife::telemetry
