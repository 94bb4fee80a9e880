#pragma once

#include <istream>
#include <ostream>
#include <string>
#include <nlohmann/json.hpp>

namespace knife::bridge {

enum class FrameStatus {
    Message,
    EndOfStream,
    Malformed
};

struct Frame {
    FrameStatus status = FrameStatus::EndOfStream;
    nlohmann::json message;
    std::string error;  // set for Malformed
};

// Reads `Content-Length` framed JSON messages. Header names are matched
// case-insensitively and lines may end in "\r\n" or "\n". EOF, a missing
// length or a zero length all end the stream.
class MessageReader {
public:
    explicit MessageReader(std::istream& in) : in_(in) {}

    Frame read();

private:
    std::istream& in_;
};

// Writes one frame with an ASCII-only JSON body and flushes.
void write_message(std::ostream& out, const nlohmann::json& message);

// ASCII-escaped JSON text; invalid UTF-8 is replaced rather than thrown on.
std::string dump_ascii(const nlohmann::json& value);

}  // namespace knife::bridge
