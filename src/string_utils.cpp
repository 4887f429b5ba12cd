#include "gitadd/string_utils.hpp"

namespace gitadd::string_utils {

std::vector<std::string_view> split_lines(std::string_view text) {
    std::vector<std::string_view> lines;
    std::size_t pos = 0;
    while (pos < text.size()) {
        std::size_t end = text.find('\n', pos);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        auto line = text.substr(pos, end - pos);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        lines.push_back(line);
        pos = end + 1;
    }
    return lines;
}

std::vector<std::string_view> split(std::string_view text, char separator) {
    std::vector<std::string_view> fields;
    std::size_t pos = 0;
    while (true) {
        std::size_t end = text.find(separator, pos);
        if (end == std::string_view::npos) {
            fields.push_back(text.substr(pos));
            break;
        }
        fields.push_back(text.substr(pos, end - pos));
        pos = end + 1;
    }
    return fields;
}

std::string unquote_path(std::string_view text) {
    if (text.size() < 2 || text.front() != '"' || text.back() != '"') {
        return std::string{text};
    }
    text = text.substr(1, text.size() - 2);

    std::string result;
    result.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        char ch = text[i];
        if (ch != '\\' || i + 1 == text.size()) {
            result.push_back(ch);
            continue;
        }
        char next = text[++i];
        switch (next) {
        case 'a': result.push_back('\a'); break;
        case 'b': result.push_back('\b'); break;
        case 'f': result.push_back('\f'); break;
        case 'n': result.push_back('\n'); break;
        case 'r': result.push_back('\r'); break;
        case 't': result.push_back('\t'); break;
        case 'v': result.push_back('\v'); break;
        case '\\': result.push_back('\\'); break;
        case '"': result.push_back('"'); break;
        default:
            if (next >= '0' && next <= '7' && i + 2 < text.size()) {
                int value = 0;
                std::size_t digits = 0;
                while (digits < 3 && text[i + digits] >= '0' && text[i + digits] <= '7') {
                    value = value * 8 + (text[i + digits] - '0');
                    ++digits;
                }
                if (digits == 3) {
                    result.push_back(static_cast<char>(value));
                    i += 2;
                    break;
                }
            }
            result.push_back('\\');
            result.push_back(next);
            break;
        }
    }
    return result;
}

bool fuzzy_contains(std::string_view haystack, std::string_view pattern) {
    std::size_t matched = 0;
    for (char ch : haystack) {
        if (matched == pattern.size()) {
            break;
        }
        if (equals_ignore_case(ch, pattern[matched])) {
            ++matched;
        }
    }
    return matched == pattern.size();
}

void pop_code_point(std::string& text) {
    while (!text.empty()) {
        const auto byte = static_cast<unsigned char>(text.back());
        text.pop_back();
        if ((byte & 0xC0) != 0x80) {
            break;
        }
    }
}

} // namespace gitadd::string_utils
