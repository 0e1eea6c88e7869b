/**
 * @file Parse.hpp
 * @brief Typing of desired values given as text
 *
 * Parsing order (first match wins):
 * - Boolean ("true", "false", case-insensitive)
 * - Null ("null", case-insensitive)
 * - Integer (^-?[0-9]+$, within int64)
 * - Float (^-?[0-9]+\.[0-9]+([eE][+-]?[0-9]+)?$)
 * - JSON compound ({...} or [...]) that parses
 * - Double-quoted JSON string ("..."), unquoted
 * - Raw string (fallback)
 */

#ifndef TREEDIT_PARSE_HPP
#define TREEDIT_PARSE_HPP

#include "treedit/Value.hpp"
#include <string>
#include <utility>

namespace treedit {

/**
 * @brief Parse text into a typed tree value
 *
 * Examples:
 * ```cpp
 * parse_value("TRUE")      // -> true
 * parse_value("99")        // -> 99
 * parse_value("2.5e3")     // -> 2500.0
 * parse_value("[1,2]")     // -> [1, 2]
 * parse_value("\"42\"")    // -> "42" (string)
 * parse_value("hello")     // -> "hello"
 * ```
 */
Tree parse_value(const std::string& text);

/// Pattern and value text of one command-line argument
struct Assignment {
    std::string pattern;
    std::string value;
    bool has_value = false;
};

/**
 * @brief Split a "PATTERN=VALUE" argument
 *
 * Splits on the first '=' that is not inside quotes or brackets, so
 * `a['x=y']=1` yields ("a['x=y']", "1"). Without a '=' the whole text is
 * the pattern and the value is empty.
 *
 * @return (pattern, value text, whether a '=' was found)
 */
Assignment split_assignment(const std::string& text);

} // namespace treedit

#endif // TREEDIT_PARSE_HPP
