/**
 * @file PathExpression.hpp
 * @brief Pattern parser and match enumeration
 *
 * Grammar accepted by PathExpression::parse():
 * - Optional leading "$" or "$." (ignored)
 * - Member names separated by dots: `db.host`
 * - Bracketed indices, with or without a leading dot: `items[2]`, `items.[2]`
 * - Quoted member names for keys with special characters or numeric keys:
 *   `'5'`, `"a.b"`, `['x y']`
 * - Wildcards for locating existing matches: `*` (every child of a mapping
 *   or sequence) and `[*]` (every element of a sequence)
 *
 * Filters, slices and recursive descent are not supported.
 */

#ifndef TREEDIT_PATH_EXPRESSION_HPP
#define TREEDIT_PATH_EXPRESSION_HPP

#include "treedit/PathComponent.hpp"
#include "treedit/Value.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace treedit {

/**
 * @brief Parsed pattern, evaluated against a Tree to enumerate matches
 *
 * Examples:
 * ```cpp
 * auto expr = PathExpression::parse("servers[*].port");
 * Tree doc = {{"servers", {{{"port", 80}}, {{"port", 443}}}}};
 * auto matches = expr.find_all(doc);
 * // matches[0].path == servers.[0].port, value 80
 * // matches[1].path == servers.[1].port, value 443
 * ```
 */
class PathExpression {
public:
    struct Segment {
        enum class Kind {
            Member,     ///< Named mapping entry
            Index,      ///< Sequence position
            AnyChild,   ///< `*`: every mapping entry or sequence element
            AnyElement  ///< `[*]`: every sequence element
        };

        Kind kind;
        std::string name;        ///< Member name (unquoted) for Member
        bool quoted = false;     ///< Member was written in quotes
        std::size_t index = 0;   ///< Position for Index

        /// Canonical text of this segment ("name", "'5'", "[3]", "*", "[*]")
        std::string to_string() const;
    };

    /**
     * @brief Parse a pattern string
     * @throws InvalidPathExpression on malformed input or an empty pattern
     */
    static PathExpression parse(const std::string& pattern);

    /// Pattern text as given to parse()
    const std::string& source() const noexcept { return source_; }

    const std::vector<Segment>& segments() const noexcept { return segments_; }

    /// Canonical text of each segment, outermost first
    std::vector<std::string> segment_strings() const;

    /// True when no segment is a wildcard
    bool is_concrete() const noexcept;

    /// Canonical dotted form, e.g. "a.b.[1]"
    std::string to_string() const;

    /**
     * @brief Enumerate every location the pattern currently resolves to
     *
     * Missing members, out-of-range indices and steps into the wrong kind of
     * node simply contribute no match. Sequence elements that hold null
     * placeholders do match. Order follows the tree: mapping entries in key
     * order, sequence elements by position.
     */
    std::vector<Match> find_all(const Tree& root) const;

private:
    PathExpression(std::string source, std::vector<Segment> segments)
        : source_(std::move(source)), segments_(std::move(segments)) {}

    std::string source_;
    std::vector<Segment> segments_;
};

} // namespace treedit

#endif // TREEDIT_PATH_EXPRESSION_HPP
