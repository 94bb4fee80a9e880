#include "bridge/message_framing.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <map>

namespace knife::bridge {

namespace {

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

}  // namespace

Frame MessageReader::read() {
    std::map<std::string, std::string> headers;
    std::string line;
    while (true) {
        if (!std::getline(in_, line)) {
            return Frame{};
        }
        if (line.empty() || line == "\r") {
            break;
        }
        const auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        headers[lowercase(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }

    const auto it = headers.find("content-length");
    if (it == headers.end()) {
        return Frame{};
    }
    std::size_t length = 0;
    const auto& raw = it->second;
    const auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), length);
    if (ec != std::errc() || ptr != raw.data() + raw.size() || length == 0) {
        return Frame{};
    }

    std::string body(length, '\0');
    in_.read(body.data(), static_cast<std::streamsize>(length));
    if (static_cast<std::size_t>(in_.gcount()) != length) {
        return Frame{};
    }

    Frame frame;
    frame.message = nlohmann::json::parse(body, nullptr, false);
    if (frame.message.is_discarded()) {
        frame.status = FrameStatus::Malformed;
        frame.message = nullptr;
        frame.error = "Message body is not valid JSON.";
        return frame;
    }
    frame.status = FrameStatus::Message;
    return frame;
}

std::string dump_ascii(const nlohmann::json& value) {
    return value.dump(-1, ' ', true, nlohmann::json::error_handler_t::replace);
}

void write_message(std::ostream& out, const nlohmann::json& message) {
    const std::string body = dump_ascii(message);
    out << "Content-Length: " << body.size() << "\r\n\r\n" << body;
    out.flush();
}

}  // namespace knife::bridge
