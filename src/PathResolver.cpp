/**
 * @file PathResolver.cpp
 * @brief Implementation of pattern resolution
 */

#include "treedit/PathResolver.hpp"
#include "treedit/Errors.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace treedit {

namespace {
    /**
     * @brief Check if a segment has the form "[<digits>]"
     */
    bool is_bracketed_index(const std::string& raw) {
        if (raw.size() < 3 || raw.front() != '[' || raw.back() != ']') {
            return false;
        }
        return std::all_of(raw.begin() + 1, raw.end() - 1,
                           [](unsigned char c) { return std::isdigit(c); });
    }

    bool is_quoted(const std::string& raw) {
        if (raw.size() < 2) return false;
        const char q = raw.front();
        return (q == '\'' || q == '"') && raw.back() == q;
    }

    std::string unquote(const std::string& raw) {
        std::string out;
        out.reserve(raw.size());
        for (std::size_t i = 1; i + 1 < raw.size(); ++i) {
            if (raw[i] == '\\' && i + 2 < raw.size()) {
                ++i;
            }
            out += raw[i];
        }
        return out;
    }
}

PathComponent classify_component(const std::string& raw) {
    if (is_bracketed_index(raw)) {
        const std::string digits = raw.substr(1, raw.size() - 2);
        try {
            return PathComponent::index(static_cast<std::size_t>(std::stoull(digits)));
        } catch (const std::out_of_range&) {
            throw InvalidPathExpression(raw, 1, "index out of range");
        }
    }
    if (is_quoted(raw)) {
        return PathComponent::key(unquote(raw));
    }
    return PathComponent::key(raw);
}

ResolvedPath resolve_path(const PathExpression& expr) {
    if (!expr.is_concrete()) {
        throw InvalidPathExpression(expr.source(), 0,
                                    "wildcard pattern does not name a single location");
    }

    ResolvedPath path;
    for (const auto& raw : expr.segment_strings()) {
        path.push_back(classify_component(raw));
    }
    return path;
}

ResolvedPath resolve_path(const std::string& pattern) {
    return resolve_path(PathExpression::parse(pattern));
}

} // namespace treedit
