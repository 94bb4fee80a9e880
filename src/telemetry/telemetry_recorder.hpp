#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

namespace knife::telemetry {

struct TelemetryOptions {
    std::size_t history_max = 500;
    std::size_t policy_denials_max = 200;
    std::size_t page_limit_max = 100;
};

// Masks assignment-style secrets (token, password, secret, api key) and
// bearer tokens, then truncates to `max_chars` characters.
std::string redact_text(const std::string& value, std::size_t max_chars = 4000);

// Recursively redacts every string in a JSON value. Output-bearing keys
// keep a longer budget than the rest.
nlohmann::json sanitize_value(const nlohmann::json& value, const std::string& key = "");

// In-memory record of registry calls. Newest entries come first.
class TelemetryRecorder {
public:
    explicit TelemetryRecorder(TelemetryOptions options = {});

    void record_tool_call(const std::string& name, const std::string& method,
                          const std::string& path, const nlohmann::json& request,
                          const nlohmann::json& response);

    nlohmann::json history(std::int64_t offset = 0, std::int64_t limit = 20) const;
    nlohmann::json policy_denials(std::int64_t offset = 0, std::int64_t limit = 20) const;
    nlohmann::json error_counters() const;

private:
    nlohmann::json page(const std::deque<nlohmann::json>& items, std::int64_t offset,
                        std::int64_t limit) const;

    TelemetryOptions options_;
    mutable std::mutex mutex_;
    std::deque<nlohmann::json> history_;
    std::deque<nlohmann::json> policy_denials_;
    std::map<std::string, std::int64_t> error_counters_;
};

}  // namespace knife::telemetry
