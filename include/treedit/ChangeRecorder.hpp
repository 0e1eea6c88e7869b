/**
 * @file ChangeRecorder.hpp
 * @brief Before/after snapshots and diffs of mutated locations
 */

#ifndef TREEDIT_CHANGE_RECORDER_HPP
#define TREEDIT_CHANGE_RECORDER_HPP

#include "treedit/PathComponent.hpp"
#include "treedit/Value.hpp"
#include <string>
#include <vector>

namespace treedit {

/**
 * @brief One performed mutation, kept for reporting only
 *
 * `before` is empty when the location was created, `after` is empty when
 * it was deleted.
 */
struct MutationRecord {
    std::string pattern;
    ResolvedPath path;
    std::string before;
    std::string after;
};

/**
 * @brief Collects mutation records and their line diffs
 *
 * The changed flag turns on with the first recorded mutation and never
 * turns off.
 */
class ChangeRecorder {
public:
    /**
     * @brief Record a mutation
     * @param pattern Pattern text that caused it
     * @param path Location that changed
     * @param before Previous value, or nullptr if the location was created
     * @param after New value, or nullptr if the location was deleted
     */
    void record(const std::string& pattern, const ResolvedPath& path,
                const Tree* before, const Tree* after);

    bool changed() const noexcept { return changed_; }

    const std::vector<MutationRecord>& records() const noexcept { return records_; }

    /// Diff lines of every recorded mutation, in order
    const std::vector<std::string>& diff_output() const noexcept { return diff_output_; }

    /**
     * @brief Line diff of two text snapshots
     *
     * Minimal line diff (diff-match-patch over one character per distinct
     * line). Within a changed region, removed lines come before added
     * ones. Each output line is prefixed
     * with ' ' (unchanged), '-' (only in before) or '+' (only in after).
     *
     * Example: line_diff("1\n2", "1\n3") -> {" 1", "-2", "+3"}
     */
    static std::vector<std::string> line_diff(const std::string& before,
                                              const std::string& after);

private:
    bool changed_ = false;
    std::vector<MutationRecord> records_;
    std::vector<std::string> diff_output_;
};

} // namespace treedit

#endif // TREEDIT_CHANGE_RECORDER_HPP
