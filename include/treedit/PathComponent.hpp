/**
 * @file PathComponent.hpp
 * @brief One step of a resolved path: a mapping key or a sequence index
 */

#ifndef TREEDIT_PATH_COMPONENT_HPP
#define TREEDIT_PATH_COMPONENT_HPP

#include "treedit/Value.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace treedit {

/**
 * @brief Tagged path step, either Key(string) or Index(non-negative)
 *
 * Examples:
 * ```cpp
 * auto k = PathComponent::key("db");    // mapping entry "db"
 * auto i = PathComponent::index(2);     // third sequence element
 * auto n = PathComponent::key("5");     // mapping entry "5", not an index
 * ```
 */
class PathComponent {
public:
    enum class Kind { Key, Index };

    static PathComponent key(std::string name) {
        return PathComponent(Kind::Key, std::move(name), 0);
    }

    static PathComponent index(std::size_t position) {
        return PathComponent(Kind::Index, std::string(), position);
    }

    Kind kind() const noexcept { return kind_; }
    bool is_key() const noexcept { return kind_ == Kind::Key; }
    bool is_index() const noexcept { return kind_ == Kind::Index; }

    /// Mapping key; empty for Index components
    const std::string& name() const noexcept { return name_; }

    /// Sequence position; zero for Key components
    std::size_t position() const noexcept { return position_; }

    /**
     * @brief Canonical segment text
     *
     * Index renders as "[n]". A Key renders verbatim unless it contains
     * characters the path grammar treats specially (or is empty), in which
     * case it is single-quoted.
     */
    std::string to_string() const;

    bool operator==(const PathComponent& other) const noexcept {
        return kind_ == other.kind_ && name_ == other.name_ &&
               position_ == other.position_;
    }

    bool operator!=(const PathComponent& other) const noexcept {
        return !(*this == other);
    }

private:
    PathComponent(Kind kind, std::string name, std::size_t position)
        : kind_(kind), name_(std::move(name)), position_(position) {}

    Kind kind_;
    std::string name_;
    std::size_t position_;
};

/// Ordered components naming one location from the root
using ResolvedPath = std::vector<PathComponent>;

/**
 * @brief A location a pattern currently resolves to, with its value
 */
struct Match {
    ResolvedPath path;
    Tree value;
};

/**
 * @brief Render a resolved path in canonical dotted form
 *
 * Examples:
 * - [Key a, Key b, Index 1] -> "a.b.[1]"
 * - [Key "x.y"] -> "'x.y'"
 * - [] -> ""
 */
std::string format_path(const ResolvedPath& path);

/**
 * @brief Render the first `count` components of a path
 *
 * Used for error messages that name the prefix where traversal failed.
 */
std::string format_path_prefix(const ResolvedPath& path, std::size_t count);

} // namespace treedit

#endif // TREEDIT_PATH_COMPONENT_HPP
