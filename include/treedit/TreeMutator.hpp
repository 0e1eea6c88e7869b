/**
 * @file TreeMutator.hpp
 * @brief Recursive get / update / add / delete over resolved paths
 *
 * Behavioral rules:
 * - get_at() never throws; anything that does not resolve is absent
 * - update_at() requires the intermediate structure to exist
 * - add_at() creates missing mappings and null-padded sequences
 * - delete_at() prunes containers emptied by the removal, never the root
 *
 * Mutations take the node by value and return its replacement; each
 * recursion level moves its child out, recurses, and assigns the result
 * back into its own container. Call as `doc = add_at(std::move(doc), ...)`.
 */

#ifndef TREEDIT_TREE_MUTATOR_HPP
#define TREEDIT_TREE_MUTATOR_HPP

#include "treedit/PathComponent.hpp"
#include "treedit/Value.hpp"
#include <cstddef>

namespace treedit {

/// How far past the end of a sequence add_at() may pad with nulls
constexpr std::size_t kMaxSequencePadding = 1024;

/**
 * @brief Look up the node at a path
 *
 * @param root Tree root
 * @param path Resolved path (empty path returns the root)
 * @return Pointer into `root`, or nullptr if any step is missing, out of
 *         range or meets the wrong kind of node
 *
 * Examples:
 * ```cpp
 * Tree doc = {{"a", {{"b", {1, 2, 3}}}}};
 * get_at(doc, resolve_path("a.b.[1]"));  // -> 2
 * get_at(doc, resolve_path("a.c"));      // -> nullptr
 * get_at(doc, resolve_path("a.b.[9]"));  // -> nullptr
 * ```
 */
const Tree* get_at(const Tree& root, const ResolvedPath& path);

/**
 * @brief Replace the value at an existing location
 *
 * A missing terminal key is inserted into its (existing) mapping; every
 * other step must already exist.
 *
 * @return The updated node
 * @throws PathNotFound if an intermediate key is missing, an index is out
 *         of range, or an intermediate node is null
 * @throws InvalidPathAccess if a key step meets a non-mapping or an index
 *         step meets a non-sequence
 */
Tree update_at(Tree node, const ResolvedPath& path, const Tree& value);

/**
 * @brief Assign a value, creating missing structure on the way down
 *
 * - Key under null or a scalar: the node becomes an empty mapping
 * - Index under null: the node becomes an empty sequence
 * - Index beyond the end of a sequence: pad with nulls to index + 1
 *
 * @return The updated node
 * @throws InvalidPathAccess if a key step meets a sequence, an index step
 *         meets a mapping or a non-null scalar, or an index lies more than
 *         kMaxSequencePadding past the end of its sequence
 *
 * Example:
 * ```cpp
 * Tree doc = Tree::object();
 * doc = add_at(std::move(doc), resolve_path("x.list.[2]"), "v");
 * // {"x": {"list": [null, null, "v"]}}
 * ```
 */
Tree add_at(Tree node, const ResolvedPath& path, const Tree& value);

/**
 * @brief Remove the value at a location and prune emptied ancestors
 *
 * Mapping entries are erased. Sequence elements are set to null, so
 * positions of later elements do not shift. When the removed element is
 * the last one, every null placeholder at the new tail is trimmed as well,
 * including placeholders that existed before; a sequence whose last live
 * element is removed becomes empty. Removing any other element leaves the
 * length and the existing placeholders alone. On the
 * way back up, a child container left empty (see is_empty()) is removed
 * from its parent in the same way. Ancestors are pruned only when
 * something was actually removed; the root is never removed.
 *
 * A path that does not resolve is a no-op.
 *
 * @return The updated node
 * @throws InvalidPathAccess if a step meets the wrong kind of non-null node
 */
Tree delete_at(Tree node, const ResolvedPath& path);

} // namespace treedit

#endif // TREEDIT_TREE_MUTATOR_HPP
