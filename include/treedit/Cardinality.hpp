/**
 * @file Cardinality.hpp
 * @brief Per-pattern action selection from match count and desired state
 *
 * | matches | state   | allow_multiple | action       |
 * |---------|---------|----------------|--------------|
 * | 0       | present | any            | Create       |
 * | 0       | absent  | any            | NoOp         |
 * | 1       | present | any            | UpdateOne    |
 * | 1       | absent  | any            | DeleteOne    |
 * | >= 2    | any     | false          | Ambiguous    |
 * | >= 2    | present | true           | UpdateEach   |
 * | >= 2    | absent  | true           | DeleteEach   |
 */

#ifndef TREEDIT_CARDINALITY_HPP
#define TREEDIT_CARDINALITY_HPP

#include <cstddef>
#include <string>

namespace treedit {

/// Desired end state of the locations a pattern names
enum class DesiredState { Present, Absent };

enum class Action {
    NoOp,
    Create,
    UpdateOne,
    DeleteOne,
    UpdateEach,
    DeleteEach,
    Ambiguous
};

/**
 * @brief Choose what to do with one pattern
 *
 * Pure decision; performs no mutation and never throws. The caller turns
 * Action::Ambiguous into an AmbiguousPattern error.
 */
Action choose_action(std::size_t match_count, DesiredState state, bool allow_multiple) noexcept;

/// "present" / "absent"
std::string to_string(DesiredState state);

/// "no-op", "create", "update-one", ...
std::string to_string(Action action);

/**
 * @brief Parse "present" or "absent" (case-insensitive)
 * @throws std::invalid_argument for any other text
 */
DesiredState parse_desired_state(const std::string& text);

} // namespace treedit

#endif // TREEDIT_CARDINALITY_HPP
