/**
 * @file Parse.cpp
 * @brief Implementation of desired-value typing
 */

#include "treedit/Parse.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <regex>
#include <stdexcept>

namespace treedit {

namespace {
    std::string to_lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        return s;
    }

    const std::regex& integer_pattern() {
        static const std::regex re("^-?[0-9]+$");
        return re;
    }

    const std::regex& float_pattern() {
        static const std::regex re("^-?[0-9]+\\.[0-9]+([eE][+-]?[0-9]+)?$");
        return re;
    }

    bool looks_compound(const std::string& s) {
        return (s.front() == '{' && s.back() == '}') ||
               (s.front() == '[' && s.back() == ']');
    }
}

Tree parse_value(const std::string& text) {
    if (text.empty()) {
        return "";
    }

    const std::string lower = to_lower(text);
    if (lower == "true") return true;
    if (lower == "false") return false;
    if (lower == "null") return nullptr;

    if (std::regex_match(text, integer_pattern())) {
        try {
            std::size_t pos = 0;
            long long v = std::stoll(text, &pos);
            if (pos == text.size()) {
                return static_cast<std::int64_t>(v);
            }
        } catch (const std::out_of_range&) {
            // beyond int64: kept as text
        }
    }

    if (std::regex_match(text, float_pattern())) {
        try {
            std::size_t pos = 0;
            double v = std::stod(text, &pos);
            if (pos == text.size()) {
                return v;
            }
        } catch (const std::out_of_range&) {
            // overflows double: kept as text
        }
    }

    if (looks_compound(text)) {
        Tree parsed = Tree::parse(text, nullptr, false);
        if (!parsed.is_discarded()) {
            return parsed;
        }
    }

    if (text.size() >= 2 && text.front() == '"' && text.back() == '"') {
        Tree parsed = Tree::parse(text, nullptr, false);
        if (parsed.is_string()) {
            return parsed;
        }
    }

    return text;
}

Assignment split_assignment(const std::string& text) {
    int depth = 0;
    char quote = '\0';
    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (quote != '\0') {
            if (c == '\\') {
                ++i;
            } else if (c == quote) {
                quote = '\0';
            }
            continue;
        }
        switch (c) {
            case '\'':
            case '"':
                quote = c;
                break;
            case '[':
                ++depth;
                break;
            case ']':
                --depth;
                break;
            case '=':
                if (depth == 0) {
                    return {text.substr(0, i), text.substr(i + 1), true};
                }
                break;
            default:
                break;
        }
    }
    return {text, std::string(), false};
}

} // namespace treedit
