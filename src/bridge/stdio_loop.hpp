#pragma once

#include <istream>
#include <ostream>
#include "bridge/mcp_session.hpp"

namespace knife::bridge {

// Serves framed messages until end of stream or an answered `shutdown`.
// Returns the number of messages handled.
std::size_t run_stdio_loop(McpSession& session, std::istream& in, std::ostream& out);

}  // namespace knife::bridge
