#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include "process/process_supervisor.hpp"
#include "server/tool_registry.hpp"
#include "tools/tool_host.hpp"

namespace knife::server {

// Registers health, shell.exec, the fs.*, search.text and json.patch tools,
// the git.* tools and the process.* lifecycle tools, in the order they are
// advertised.
void register_builtin_tools(ToolRegistry& registry, std::shared_ptr<tools::ToolHost> host,
                            std::shared_ptr<process::ProcessSupervisor> supervisor);

nlohmann::json to_json(const tools::ExecOutcome& outcome);
nlohmann::json to_json(const process::StartOutcome& outcome);
nlohmann::json to_json(const process::ProcessStatus& status);

// Lightweight view of every tracked process for the dashboard.
nlohmann::json process_snapshot(process::ProcessSupervisor& supervisor);

}  // namespace knife::server
