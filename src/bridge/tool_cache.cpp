#include "bridge/tool_cache.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace knife::bridge {

ToolCache::ToolCache(std::shared_ptr<ToolBackend> backend, std::chrono::duration<double> ttl,
                     Clock clock)
    : backend_(std::move(backend)), ttl_(ttl), clock_(std::move(clock)) {}

bool ToolCache::needs_refresh() const {
    if (!fetched_at_.has_value() || tools_.empty() || ttl_.count() <= 0) {
        return true;
    }
    return clock_() - fetched_at_.value() >= ttl_;
}

core::errors::Result<core::errors::Ok> ToolCache::refresh_if_needed(const bool force) {
    if (!force && !needs_refresh()) {
        return core::errors::Ok{};
    }
    auto fetched = backend_->fetch_tools();
    if (core::errors::is_error(fetched)) {
        KNIFE_LOG_WARN("Tool list refresh failed: " + core::errors::get_error(fetched).message);
        return core::errors::get_error(fetched);
    }
    tools_ = std::move(std::get<std::vector<protocol::ToolDefinition>>(fetched));
    fetched_at_ = clock_();
    KNIFE_LOG_DEBUG("Tool list refreshed with " + std::to_string(tools_.size()) + " tools");
    return core::errors::Ok{};
}

core::errors::Result<std::vector<protocol::ToolDefinition>> ToolCache::tools(const bool force) {
    auto refreshed = refresh_if_needed(force);
    if (core::errors::is_error(refreshed)) {
        return core::errors::get_error(refreshed);
    }
    return tools_;
}

core::errors::Result<std::optional<protocol::ToolDefinition>> ToolCache::find(
    const std::string& name) {
    auto refreshed = refresh_if_needed(false);
    if (core::errors::is_error(refreshed)) {
        return core::errors::get_error(refreshed);
    }
    for (const auto& tool : tools_) {
        if (tool.name == name) {
            return std::optional<protocol::ToolDefinition>(tool);
        }
    }
    return std::optional<protocol::ToolDefinition>();
}

}  // namespace knife::bridge
