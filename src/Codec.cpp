/**
 * @file Codec.cpp
 * @brief JSON and TOML document codecs
 */

#include "treedit/Codec.hpp"
#include "treedit/Errors.hpp"

#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <map>
#include <sstream>
#include <utility>

namespace fs = std::filesystem;

namespace treedit {

// ============================================================================
// Utility functions
// ============================================================================

namespace {

/**
 * @brief Read entire file into string.
 */
std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw DecodeError(path, "cannot open file for reading");
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

/**
 * @brief Replace a file's content with `text`.
 */
void write_file(const std::string& path, const std::string& text) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw EncodeError(path, "cannot open file for writing");
    }
    out << text;
    out.flush();
    if (!out) {
        throw EncodeError(path, "write failed");
    }
}

template <typename T>
std::string stream_text(const T& value) {
    std::ostringstream ss;
    ss << value;
    return ss.str();
}

using Pointer = nlohmann::json::json_pointer;
using Temporal = TomlCodec::Temporal;
using TemporalPaths = std::map<std::string, Temporal>;

/**
 * @brief Convert a toml++ node into a tree node.
 *
 * Dates and times become strings; their locations go into `temporal`.
 */
Tree toml_to_tree(const toml::node& node, const Pointer& at, TemporalPaths& temporal) {
    switch (node.type()) {
        case toml::node_type::string:
            return Tree(node.as_string()->get());
        case toml::node_type::integer:
            return Tree(node.as_integer()->get());
        case toml::node_type::floating_point:
            return Tree(node.as_floating_point()->get());
        case toml::node_type::boolean:
            return Tree(node.as_boolean()->get());
        case toml::node_type::date:
            temporal[at.to_string()] = Temporal::Date;
            return Tree(stream_text(node.as_date()->get()));
        case toml::node_type::time:
            temporal[at.to_string()] = Temporal::Time;
            return Tree(stream_text(node.as_time()->get()));
        case toml::node_type::date_time:
            temporal[at.to_string()] = Temporal::DateTime;
            return Tree(stream_text(node.as_date_time()->get()));
        case toml::node_type::array: {
            Tree seq = Tree::array();
            const toml::array& arr = *node.as_array();
            for (std::size_t i = 0; i < arr.size(); ++i) {
                seq.push_back(toml_to_tree(arr[i], at / i, temporal));
            }
            return seq;
        }
        case toml::node_type::table: {
            Tree map = Tree::object();
            for (const auto& [key, val] : *node.as_table()) {
                const std::string name(key.str());
                map[name] = toml_to_tree(val, at / name, temporal);
            }
            return map;
        }
        default:
            return Tree(nullptr);
    }
}

/**
 * @brief Builds toml++ values from tree nodes, rejecting what TOML lacks.
 *
 * `where` is the dotted location used in messages, `at` the JSON pointer
 * used to look up dates and times recorded by the load.
 */
class TomlBuilder {
public:
    TomlBuilder(const std::string& file, const TemporalPaths& temporal)
        : file_(file), temporal_(temporal) {}

    toml::table table(const Tree& map, const std::string& where, const Pointer& at) const {
        toml::table tbl;
        for (auto it = map.begin(); it != map.end(); ++it) {
            const std::string child = join(where, it.key());
            const Pointer child_at = at / it.key();
            const Tree& v = it.value();
            switch (v.type()) {
                case Tree::value_t::object:
                    tbl.insert(it.key(), table(v, child, child_at));
                    break;
                case Tree::value_t::array:
                    tbl.insert(it.key(), array(v, child, child_at));
                    break;
                default:
                    emit_scalar(v, child, child_at,
                                [&](auto&& x) { tbl.insert(it.key(), std::forward<decltype(x)>(x)); });
                    break;
            }
        }
        return tbl;
    }

    toml::array array(const Tree& seq, const std::string& where, const Pointer& at) const {
        toml::array arr;
        for (std::size_t i = 0; i < seq.size(); ++i) {
            const std::string child = where + ".[" + std::to_string(i) + "]";
            const Pointer child_at = at / i;
            const Tree& v = seq[i];
            switch (v.type()) {
                case Tree::value_t::object:
                    arr.push_back(table(v, child, child_at));
                    break;
                case Tree::value_t::array:
                    arr.push_back(array(v, child, child_at));
                    break;
                default:
                    emit_scalar(v, child, child_at,
                                [&](auto&& x) { arr.push_back(std::forward<decltype(x)>(x)); });
                    break;
            }
        }
        return arr;
    }

private:
    const std::string& file_;
    const TemporalPaths& temporal_;

    static std::string join(const std::string& where, const std::string& key) {
        return where.empty() ? key : where + "." + key;
    }

    EncodeError unsupported(const Tree& v, const std::string& where) const {
        return EncodeError(file_, "TOML cannot represent " + type_name(v) +
                                  " value at '" + where + "'");
    }

    template <typename Emit>
    void emit_scalar(const Tree& v, const std::string& where, const Pointer& at,
                     Emit&& emit) const {
        switch (v.type()) {
            case Tree::value_t::string: {
                const auto& text = v.get_ref<const std::string&>();
                if (!emit_temporal(text, at, emit)) {
                    emit(text);
                }
                break;
            }
            case Tree::value_t::boolean:
                emit(v.get<bool>());
                break;
            case Tree::value_t::number_integer:
                emit(v.get<std::int64_t>());
                break;
            case Tree::value_t::number_unsigned: {
                // Oversize for a TOML integer: stored as a float
                const auto u = v.get<std::uint64_t>();
                if (u <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                    emit(static_cast<std::int64_t>(u));
                } else {
                    emit(static_cast<double>(u));
                }
                break;
            }
            case Tree::value_t::number_float:
                emit(v.get<double>());
                break;
            default:
                throw unsupported(v, where);
        }
    }

    /**
     * @brief Re-emit a loaded date or time
     * @return false if `at` held none, or the text no longer reads as one
     */
    template <typename Emit>
    bool emit_temporal(const std::string& text, const Pointer& at, Emit&& emit) const {
        const auto it = temporal_.find(at.to_string());
        if (it == temporal_.end()) {
            return false;
        }

        toml::table parsed;
        try {
            parsed = toml::parse("v = " + text);
        } catch (const toml::parse_error&) {
            return false;
        }
        const toml::node* node = parsed.get("v");
        if (node == nullptr || parsed.size() != 1) {
            return false;
        }

        switch (it->second) {
            case Temporal::Date:
                if (const auto* d = node->as_date()) {
                    emit(d->get());
                    return true;
                }
                break;
            case Temporal::Time:
                if (const auto* t = node->as_time()) {
                    emit(t->get());
                    return true;
                }
                break;
            case Temporal::DateTime:
                if (const auto* dt = node->as_date_time()) {
                    emit(dt->get());
                    return true;
                }
                break;
        }
        return false;
    }
};

} // anonymous namespace

// ============================================================================
// File helpers
// ============================================================================

bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

std::string get_file_extension(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return ext;
}

std::unique_ptr<DocumentCodec> codec_for_path(const std::string& path) {
    const std::string ext = get_file_extension(path);
    if (ext == ".json") {
        return std::make_unique<JsonCodec>();
    }
    if (ext == ".toml") {
        return std::make_unique<TomlCodec>();
    }
    throw DecodeError(path, "unsupported file type '" + ext + "' (expected .json or .toml)");
}

// ============================================================================
// JSON
// ============================================================================

Tree JsonCodec::load(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    const std::string content = read_file(path);
    try {
        return nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        throw DecodeError(path, e.what());
    }
}

void JsonCodec::save(const std::string& path, const Tree& tree) const {
    std::string text;
    try {
        text = tree.dump(2);
    } catch (const nlohmann::json::type_error& e) {
        // invalid UTF-8 in a string value
        throw EncodeError(path, e.what());
    }
    write_file(path, text + "\n");
}

// ============================================================================
// TOML
// ============================================================================

Tree TomlCodec::load(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    toml::table table;
    try {
        table = toml::parse_file(path);
    } catch (const toml::parse_error& e) {
        std::ostringstream details;
        details << e.description() << " (line " << e.source().begin.line
                << ", column " << e.source().begin.column << ")";
        throw DecodeError(path, details.str());
    }
    TemporalPaths temporal;
    Tree tree = toml_to_tree(table, Pointer(), temporal);
    temporal_ = std::move(temporal);
    return tree;
}

void TomlCodec::save(const std::string& path, const Tree& tree) const {
    if (!tree.is_object()) {
        throw EncodeError(path, "TOML documents must have a mapping at the root, not " +
                                type_name(tree));
    }
    TomlBuilder builder(path, temporal_);
    toml::table root = builder.table(tree, "", Pointer());
    write_file(path, stream_text(root) + "\n");
}

} // namespace treedit
