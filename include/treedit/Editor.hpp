/**
 * @file Editor.hpp
 * @brief Edit sessions and the single-document invocation
 *
 * Pipeline per pattern: parse -> enumerate matches -> choose action ->
 * mutate -> record. An invocation loads the document once, applies every
 * pattern in request order, and writes the document once, only if
 * something changed. Any error aborts the invocation before the write.
 */

#ifndef TREEDIT_EDITOR_HPP
#define TREEDIT_EDITOR_HPP

#include "treedit/Cardinality.hpp"
#include "treedit/ChangeRecorder.hpp"
#include "treedit/Codec.hpp"
#include "treedit/PathComponent.hpp"
#include "treedit/Value.hpp"
#include <string>
#include <utility>
#include <vector>

namespace treedit {

/**
 * @brief Inputs of one invocation
 */
struct EditRequest {
    std::string file;
    std::vector<std::pair<std::string, Tree>> values; // pattern -> desired value, applied in order
    DesiredState state = DesiredState::Present;
    bool allow_multiple = false;
    bool dry_run = false;  // compute changes and diffs, never write
    bool backup = false;   // copy the original aside before writing
};

/**
 * @brief Outputs of one invocation
 */
struct EditResult {
    bool changed = false;
    bool failed = false;
    std::vector<std::string> messages;
    std::vector<std::string> diff_output;
    std::vector<std::string> error_output;
    std::string backup_file; // empty unless a backup was written

    /// {"changed", "failed", "messages", "diff", "errors", "backup_file"?}
    Tree to_json() const;
};

/**
 * @brief Mutable state threaded through the pattern pipeline
 */
struct Session {
    explicit Session(Tree doc) : tree(std::move(doc)) {}

    Tree tree;
    ChangeRecorder recorder;
    std::vector<std::string> messages;

    bool changed() const noexcept { return recorder.changed(); }
};

/**
 * @brief Apply one pattern to the session's tree
 *
 * @throws InvalidPathExpression if the pattern is malformed, or if it has
 *         wildcards and must be created
 * @throws AmbiguousPattern if it matches several locations and
 *         allow_multiple is false (nothing is mutated)
 * @throws PathNotFound, InvalidPathAccess on structural mismatch
 */
void apply_pattern(Session& session, const std::string& pattern, const Tree& value,
                   DesiredState state, bool allow_multiple);

/**
 * @brief Apply every pattern of a request, in order
 *
 * Stops at the first error; earlier in-memory edits stay in the session
 * but callers must not persist it.
 */
void apply_all(Session& session, const EditRequest& request);

/**
 * @brief Read-only evaluation of a pattern
 * @throws InvalidPathExpression if the pattern is malformed
 */
std::vector<Match> query(const Tree& tree, const std::string& pattern);

/**
 * @brief Run one invocation with the codec chosen by file extension
 *
 * Never throws treedit errors: failures come back as `failed = true` with
 * one message in `error_output`, and the file is left untouched.
 */
EditResult run_edit(const EditRequest& request);

/**
 * @brief Run one invocation with an explicit codec
 *
 * The same codec loads and saves the document, so format details it keeps
 * from the load (TOML dates) survive the save.
 */
EditResult run_edit(const EditRequest& request, DocumentCodec& codec);

/**
 * @brief Copy a file aside as "<file>.<timestamp>~"
 * @return Path of the copy
 * @throws EncodeError if the copy fails
 */
std::string write_backup(const std::string& file);

} // namespace treedit

#endif // TREEDIT_EDITOR_HPP
