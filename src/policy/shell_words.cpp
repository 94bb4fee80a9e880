#include "policy/shell_words.hpp"

#include <cctype>
#include <cstring>
#include <utility>

namespace knife::policy {

using core::errors::ErrorCategory;
using core::errors::ToolError;

namespace {

enum class QuoteState { None, Single, Double };

bool is_shell_space(const char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

bool is_safe_word_char(const char c) {
    const auto uc = static_cast<unsigned char>(c);
    if (uc >= 0x80) {
        return false;
    }
    return std::isalnum(uc) != 0 || std::strchr("@%+=:,./-_", c) != nullptr;
}

}  // namespace

core::errors::Result<std::vector<std::string>> split_shell_words(
    const std::string& text) {
    std::vector<std::string> words;
    std::string current;
    bool has_word = false;
    QuoteState state = QuoteState::None;

    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        switch (state) {
            case QuoteState::Single:
                if (c == '\'') {
                    state = QuoteState::None;
                } else {
                    current.push_back(c);
                }
                break;

            case QuoteState::Double:
                if (c == '"') {
                    state = QuoteState::None;
                } else if (c == '\\' && i + 1 < text.size() &&
                           (text[i + 1] == '"' || text[i + 1] == '\\')) {
                    current.push_back(text[++i]);
                } else {
                    current.push_back(c);
                }
                break;

            case QuoteState::None:
                if (is_shell_space(c)) {
                    if (has_word) {
                        words.push_back(std::move(current));
                        current.clear();
                        has_word = false;
                    }
                } else if (c == '\'') {
                    state = QuoteState::Single;
                    has_word = true;
                } else if (c == '"') {
                    state = QuoteState::Double;
                    has_word = true;
                } else if (c == '\\') {
                    if (i + 1 >= text.size()) {
                        return ToolError{ErrorCategory::Input, "No escaped character",
                                         core::errors::codes::kInvalidCommand};
                    }
                    current.push_back(text[++i]);
                    has_word = true;
                } else {
                    current.push_back(c);
                    has_word = true;
                }
                break;
        }
    }

    if (state != QuoteState::None) {
        return ToolError{ErrorCategory::Input, "No closing quotation",
                         core::errors::codes::kInvalidCommand};
    }
    if (has_word) {
        words.push_back(std::move(current));
    }
    return words;
}

std::string quote_shell_word(const std::string& word) {
    if (word.empty()) {
        return "''";
    }

    bool safe = true;
    for (const char c : word) {
        if (!is_safe_word_char(c)) {
            safe = false;
            break;
        }
    }
    if (safe) {
        return word;
    }

    std::string quoted = "'";
    quoted.reserve(word.size() + 8);
    for (const char c : word) {
        if (c == '\'') {
            quoted += "'\"'\"'";
        } else {
            quoted.push_back(c);
        }
    }
    quoted.push_back('\'');
    return quoted;
}

std::string join_shell_words(const std::vector<std::string>& words) {
    std::string joined;
    for (std::size_t i = 0; i < words.size(); ++i) {
        if (i > 0) {
            joined.push_back(' ');
        }
        joined += quote_shell_word(words[i]);
    }
    return joined;
}

}  // namespace knife::policy
