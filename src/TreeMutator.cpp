/**
 * @file TreeMutator.cpp
 * @brief Implementation of the tree mutation algorithms
 *
 * Each algorithm recurses on `depth`, an index into the path; the base case
 * is `depth == path.size()`.
 */

#include "treedit/TreeMutator.hpp"
#include "treedit/Errors.hpp"

#include <string>

namespace treedit {

namespace {

/**
 * @brief Dotted location of the node reached after `depth` steps
 */
std::string location(const ResolvedPath& path, std::size_t depth) {
    return depth == 0 ? std::string("$") : format_path_prefix(path, depth);
}

InvalidPathAccess wrong_kind(const ResolvedPath& path, std::size_t depth,
                             const Tree& node) {
    const char* expected = path[depth].is_key() ? "mapping" : "sequence";
    return InvalidPathAccess(location(path, depth), expected, type_name(node));
}

void trim_trailing_nulls(Tree& seq) {
    while (!seq.empty() && seq.back().is_null()) {
        seq.erase(seq.size() - 1);
    }
}

/**
 * @brief Null out one element; only a removal at the tail trims placeholders
 */
void clear_element(Tree& seq, std::size_t pos) {
    seq[pos] = nullptr;
    if (pos + 1 == seq.size()) {
        trim_trailing_nulls(seq);
    }
}

// ---------------------------------------------------------------------------
// get
// ---------------------------------------------------------------------------

const Tree* lookup(const Tree& node, const ResolvedPath& path, std::size_t depth) {
    if (depth == path.size()) {
        return &node;
    }

    const PathComponent& comp = path[depth];
    switch (node.type()) {
        case Tree::value_t::object: {
            if (!comp.is_key()) return nullptr;
            auto it = node.find(comp.name());
            if (it == node.end()) return nullptr;
            return lookup(*it, path, depth + 1);
        }
        case Tree::value_t::array:
            if (!comp.is_index() || comp.position() >= node.size()) return nullptr;
            return lookup(node[comp.position()], path, depth + 1);
        default:
            return nullptr;
    }
}

// ---------------------------------------------------------------------------
// update
// ---------------------------------------------------------------------------

Tree update_step(Tree node, const ResolvedPath& path, const Tree& value,
                 std::size_t depth) {
    if (depth == path.size()) {
        return value;
    }

    const PathComponent& comp = path[depth];
    const bool terminal = depth + 1 == path.size();

    if (node.is_null()) {
        throw PathNotFound(format_path(path), comp.to_string());
    }

    if (comp.is_key()) {
        if (!node.is_object()) {
            throw wrong_kind(path, depth, node);
        }
        auto it = node.find(comp.name());
        if (it == node.end()) {
            if (!terminal) {
                throw PathNotFound(format_path(path), comp.to_string());
            }
            node[comp.name()] = value;
            return node;
        }
        *it = update_step(std::move(*it), path, value, depth + 1);
        return node;
    }

    if (!node.is_array()) {
        throw wrong_kind(path, depth, node);
    }
    if (comp.position() >= node.size()) {
        throw PathNotFound(format_path(path), comp.to_string());
    }
    Tree& child = node[comp.position()];
    child = update_step(std::move(child), path, value, depth + 1);
    return node;
}

// ---------------------------------------------------------------------------
// add
// ---------------------------------------------------------------------------

Tree add_step(Tree node, const ResolvedPath& path, const Tree& value,
              std::size_t depth) {
    if (depth == path.size()) {
        return value;
    }

    const PathComponent& comp = path[depth];

    if (comp.is_key()) {
        switch (node.type()) {
            case Tree::value_t::object:
                break;
            case Tree::value_t::array:
                throw wrong_kind(path, depth, node);
            default:
                // null or scalar: replaced by a fresh mapping
                node = Tree::object();
                break;
        }
        Tree& child = node[comp.name()];
        child = add_step(std::move(child), path, value, depth + 1);
        return node;
    }

    switch (node.type()) {
        case Tree::value_t::null:
            node = Tree::array();
            break;
        case Tree::value_t::array:
            break;
        default:
            throw wrong_kind(path, depth, node);
    }
    if (comp.position() > node.size() + kMaxSequencePadding) {
        throw InvalidPathAccess(location(path, depth),
                                "index at most " + std::to_string(kMaxSequencePadding) +
                                    " past the end of the sequence",
                                "index " + std::to_string(comp.position()));
    }
    while (node.size() <= comp.position()) {
        node.push_back(nullptr);
    }
    Tree& child = node[comp.position()];
    child = add_step(std::move(child), path, value, depth + 1);
    return node;
}

// ---------------------------------------------------------------------------
// delete
// ---------------------------------------------------------------------------

struct Removal {
    Tree node;
    bool removed;
};

Removal remove_step(Tree node, const ResolvedPath& path, std::size_t depth) {
    const PathComponent& comp = path[depth];
    const bool terminal = depth + 1 == path.size();

    if (node.is_null()) {
        return {std::move(node), false};
    }

    if (comp.is_key()) {
        if (!node.is_object()) {
            throw wrong_kind(path, depth, node);
        }
        auto it = node.find(comp.name());
        if (it == node.end()) {
            return {std::move(node), false};
        }
        if (terminal) {
            node.erase(it);
            return {std::move(node), true};
        }
        Removal child = remove_step(std::move(*it), path, depth + 1);
        *it = std::move(child.node);
        if (child.removed && is_empty(*it)) {
            node.erase(it);
        }
        return {std::move(node), child.removed};
    }

    if (!node.is_array()) {
        throw wrong_kind(path, depth, node);
    }
    if (comp.position() >= node.size()) {
        return {std::move(node), false};
    }
    if (terminal) {
        clear_element(node, comp.position());
        return {std::move(node), true};
    }
    Removal child = remove_step(std::move(node[comp.position()]), path, depth + 1);
    node[comp.position()] = std::move(child.node);
    if (child.removed && is_empty(node[comp.position()])) {
        clear_element(node, comp.position());
    }
    return {std::move(node), child.removed};
}

} // anonymous namespace

const Tree* get_at(const Tree& root, const ResolvedPath& path) {
    return lookup(root, path, 0);
}

Tree update_at(Tree node, const ResolvedPath& path, const Tree& value) {
    return update_step(std::move(node), path, value, 0);
}

Tree add_at(Tree node, const ResolvedPath& path, const Tree& value) {
    return add_step(std::move(node), path, value, 0);
}

Tree delete_at(Tree node, const ResolvedPath& path) {
    if (path.empty()) {
        return node;
    }
    return remove_step(std::move(node), path, 0).node;
}

} // namespace treedit
