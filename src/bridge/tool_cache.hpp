#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "bridge/tool_backend.hpp"

namespace knife::bridge {

// Time-bounded copy of the registry's tool list. A TTL of zero or less
// refreshes on every lookup. A failed refresh leaves the cache untouched.
class ToolCache {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    ToolCache(std::shared_ptr<ToolBackend> backend, std::chrono::duration<double> ttl,
              Clock clock = [] { return std::chrono::steady_clock::now(); });

    bool needs_refresh() const;

    // Refreshes when forced or stale, then returns the cached tools.
    core::errors::Result<std::vector<protocol::ToolDefinition>> tools(bool force);

    // Lazily refreshed lookup by name. nullopt means unknown.
    core::errors::Result<std::optional<protocol::ToolDefinition>> find(const std::string& name);

private:
    core::errors::Result<core::errors::Ok> refresh_if_needed(bool force);

    std::shared_ptr<ToolBackend> backend_;
    std::chrono::duration<double> ttl_;
    Clock clock_;
    std::vector<protocol::ToolDefinition> tools_;
    std::optional<std::chrono::steady_clock::time_point> fetched_at_;
};

}  // namespace knife::bridge
