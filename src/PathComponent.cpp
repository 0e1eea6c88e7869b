/**
 * @file PathComponent.cpp
 * @brief Canonical rendering of path components
 */

#include "treedit/PathComponent.hpp"
#include <algorithm>
#include <sstream>

namespace treedit {

namespace {
    bool needs_quoting(const std::string& name) {
        if (name.empty()) return true;
        if (name == "*" || name[0] == '$') return true;
        return name.find_first_of(".[]'\"\\ ") != std::string::npos;
    }

    std::string quote(const std::string& name) {
        std::string out = "'";
        for (char c : name) {
            if (c == '\'' || c == '\\') out += '\\';
            out += c;
        }
        out += '\'';
        return out;
    }
}

std::string PathComponent::to_string() const {
    if (kind_ == Kind::Index) {
        return "[" + std::to_string(position_) + "]";
    }
    return needs_quoting(name_) ? quote(name_) : name_;
}

std::string format_path_prefix(const ResolvedPath& path, std::size_t count) {
    std::ostringstream oss;
    const std::size_t n = std::min(count, path.size());
    for (std::size_t i = 0; i < n; ++i) {
        if (i > 0) oss << '.';
        oss << path[i].to_string();
    }
    return oss.str();
}

std::string format_path(const ResolvedPath& path) {
    return format_path_prefix(path, path.size());
}

} // namespace treedit
