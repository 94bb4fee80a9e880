#pragma once

#include <string>
#include <vector>
#include "core/errors/knife_errors.hpp"

namespace knife::policy {

// POSIX shell-word splitting without expansion: whitespace separates words,
// single quotes are literal, double quotes allow `\"` and `\\`, a backslash
// outside quotes escapes the next character. Fails with `invalid_command` on
// an unterminated quote or a trailing backslash.
core::errors::Result<std::vector<std::string>> split_shell_words(
    const std::string& text);

// Quotes a word so a POSIX shell would read it back unchanged.
std::string quote_shell_word(const std::string& word);

std::string join_shell_words(const std::vector<std::string>& words);

}  // namespace knife::policy
