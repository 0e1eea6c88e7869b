/**
 * @file PathResolver.hpp
 * @brief Convert patterns into resolved paths of Key/Index components
 *
 * Classification rules for each canonical segment string:
 * - "[<digits>]" -> Index
 * - "'...'" or "\"...\"" -> Key with the quotes removed (so "'5'" addresses
 *   the mapping entry "5", never sequence position 5)
 * - anything else -> Key, verbatim (a bare "5" is a Key too)
 */

#ifndef TREEDIT_PATH_RESOLVER_HPP
#define TREEDIT_PATH_RESOLVER_HPP

#include "treedit/PathComponent.hpp"
#include "treedit/PathExpression.hpp"
#include <string>

namespace treedit {

/**
 * @brief Classify one canonical segment string
 *
 * Examples:
 * - "[3]" -> Index(3)
 * - "name" -> Key("name")
 * - "'5'" -> Key("5")
 * - "5" -> Key("5")
 */
PathComponent classify_component(const std::string& raw);

/**
 * @brief Resolve a pattern string into a concrete path
 *
 * The pattern is parsed, rendered to canonical form and its segments
 * classified.
 *
 * @throws InvalidPathExpression if the pattern is malformed or contains
 *         wildcards (a wildcard pattern names no single location)
 *
 * Example:
 * ```cpp
 * auto path = resolve_path("a.b[1]");
 * // [Key a, Key b, Index 1]; format_path(path) == "a.b.[1]"
 * ```
 */
ResolvedPath resolve_path(const std::string& pattern);

/**
 * @brief Resolve an already parsed expression
 *
 * Walks the expression's segments outermost to innermost.
 *
 * @throws InvalidPathExpression if the expression contains wildcards
 */
ResolvedPath resolve_path(const PathExpression& expr);

} // namespace treedit

#endif // TREEDIT_PATH_RESOLVER_HPP
