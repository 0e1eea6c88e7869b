/**
 * @file Value.hpp
 * @brief Tree node type for edited documents
 *
 * Uses nlohmann::json as the underlying node model. Its value_t tag is a
 * closed variant over:
 * - Mapping (object)
 * - Sequence (array, may hold null placeholders)
 * - Scalar (string, boolean, integer, unsigned, float, binary, null)
 */

#ifndef TREEDIT_VALUE_HPP
#define TREEDIT_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace treedit {

/**
 * @brief Hierarchical document node
 *
 * Alias for nlohmann::json. Every traversal in the library switches on
 * `type()` instead of probing the node dynamically.
 */
using Tree = nlohmann::json;

/**
 * @brief Human-readable type name for a node
 * @param node The node to inspect
 * @return "null", "boolean", "integer", "float", "string", "binary",
 *         "sequence" or "mapping"
 */
inline std::string type_name(const Tree& node) {
    switch (node.type()) {
        case Tree::value_t::null:            return "null";
        case Tree::value_t::boolean:         return "boolean";
        case Tree::value_t::number_integer:
        case Tree::value_t::number_unsigned: return "integer";
        case Tree::value_t::number_float:    return "float";
        case Tree::value_t::string:          return "string";
        case Tree::value_t::binary:          return "binary";
        case Tree::value_t::array:           return "sequence";
        case Tree::value_t::object:          return "mapping";
        case Tree::value_t::discarded:       break;
    }
    return "unknown";
}

/**
 * @brief Check whether a node is a Mapping or a Sequence
 */
inline bool is_container(const Tree& node) {
    return node.is_array() || node.is_object();
}

/**
 * @brief Emptiness test used for pruning after deletion
 *
 * True for null, a Mapping with no entries and a Sequence with no entries.
 * Scalars such as 0, "" and false are never empty.
 */
inline bool is_empty(const Tree& node) {
    switch (node.type()) {
        case Tree::value_t::null:
            return true;
        case Tree::value_t::object:
        case Tree::value_t::array:
            return node.empty();
        default:
            return false;
    }
}

/**
 * @brief Textual snapshot of a node for messages and diffs
 *
 * Pretty-printed JSON, two-space indent. Invalid UTF-8 is replaced.
 */
inline std::string to_text(const Tree& node) {
    return node.dump(2, ' ', false, Tree::error_handler_t::replace);
}

} // namespace treedit

#endif // TREEDIT_VALUE_HPP
