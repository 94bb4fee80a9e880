#include "bridge/stdio_loop.hpp"

#include "bridge/message_framing.hpp"
#include "core/logging/logger.hpp"

namespace knife::bridge {

std::size_t run_stdio_loop(McpSession& session, std::istream& in, std::ostream& out) {
    MessageReader reader(in);
    std::size_t handled = 0;
    while (true) {
        const Frame frame = reader.read();
        if (frame.status == FrameStatus::EndOfStream) {
            KNIFE_LOG_DEBUG("Input stream closed");
            break;
        }
        ++handled;
        if (frame.status == FrameStatus::Malformed) {
            KNIFE_LOG_WARN("Dropping malformed frame: " + frame.error);
            write_message(out, McpSession::error_response(nullptr, rpc::kParseError,
                                                          "Parse error"));
            continue;
        }

        const auto response = session.handle(frame.message);
        if (response.has_value()) {
            write_message(out, response.value());
        }
        if (session.shutdown_requested()) {
            KNIFE_LOG_INFO("Shutdown requested; leaving message loop");
            break;
        }
    }
    return handled;
}

}  // namespace knife::bridge
