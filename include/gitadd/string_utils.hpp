#pragma once

#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace gitadd::string_utils {

inline bool equals_ignore_case(char a, char b) {
    return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
}

inline std::string_view trim(std::string_view text) {
    auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
    while (!text.empty() && is_space(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && is_space(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

[[nodiscard]] std::vector<std::string_view> split_lines(std::string_view text);
[[nodiscard]] std::vector<std::string_view> split(std::string_view text, char separator);

// Undo git's C-style quoting ("a\tb", octal escapes). Unquoted input is returned as is.
[[nodiscard]] std::string unquote_path(std::string_view text);

// Case-insensitive subsequence match; an empty pattern matches everything.
[[nodiscard]] bool fuzzy_contains(std::string_view haystack, std::string_view pattern);

// Drop the last UTF-8 code point.
void pop_code_point(std::string& text);

} // namespace gitadd::string_utils
