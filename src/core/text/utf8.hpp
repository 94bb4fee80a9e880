#pragma once

#include <cstddef>
#include <string>

namespace knife::core::text {

struct DecodedText {
    std::string text;
    std::string encoding;  // "utf-8" or "latin-1"
};

bool is_valid_utf8(const std::string& bytes);

// Maps every byte to the code point of the same value.
std::string latin1_to_utf8(const std::string& bytes);

// UTF-8 when the bytes are valid, byte-preserving Latin-1 otherwise.
DecodedText decode_output(const std::string& bytes);

// Keeps at most `max_code_points` characters of valid UTF-8 text.
std::string truncate_code_points(const std::string& text, std::size_t max_code_points);

}  // namespace knife::core::text
