/**
 * @file PathExpression.cpp
 * @brief Implementation of the pattern parser and match enumeration
 */

#include "treedit/PathExpression.hpp"
#include "treedit/Errors.hpp"
#include <cctype>
#include <limits>
#include <sstream>

namespace treedit {

namespace {

using Segment = PathExpression::Segment;

/**
 * @brief Single-pass recursive-descent parser over a pattern string
 */
class PatternParser {
public:
    explicit PatternParser(const std::string& input) : input_(input) {}

    std::vector<Segment> parse() {
        if (input_.empty()) {
            throw error("pattern is empty");
        }

        if (peek() == '$') {
            ++pos_;
            if (at_end()) {
                throw error("pattern names the document root");
            }
            if (peek() == '.') {
                ++pos_;
            } else if (peek() != '[') {
                throw error("expected '.' or '[' after '$'");
            }
        }

        std::vector<Segment> segments;
        segments.push_back(parse_segment());

        while (!at_end()) {
            char c = peek();
            if (c == '.') {
                ++pos_;
                if (at_end()) {
                    throw error("trailing '.'");
                }
                segments.push_back(parse_segment());
            } else if (c == '[') {
                segments.push_back(parse_bracket());
            } else {
                throw error(std::string("unexpected character '") + c + "'");
            }
        }

        return segments;
    }

private:
    const std::string& input_;
    std::size_t pos_ = 0;

    bool at_end() const { return pos_ >= input_.size(); }
    char peek() const { return input_[pos_]; }

    InvalidPathExpression error(const std::string& details) const {
        return InvalidPathExpression(input_, pos_, details);
    }

    Segment parse_segment() {
        char c = peek();
        if (c == '[') {
            return parse_bracket();
        }
        if (c == '\'' || c == '"') {
            return member(parse_quoted(), true);
        }
        if (c == '*' && (pos_ + 1 == input_.size() ||
                         input_[pos_ + 1] == '.' || input_[pos_ + 1] == '[')) {
            ++pos_;
            return Segment{Segment::Kind::AnyChild, {}, false, 0};
        }
        return member(parse_bare_name(), false);
    }

    Segment parse_bracket() {
        ++pos_; // '['
        if (at_end()) {
            throw error("unterminated '['");
        }

        Segment seg{Segment::Kind::Index, {}, false, 0};
        char c = peek();
        if (c == '*') {
            ++pos_;
            seg.kind = Segment::Kind::AnyElement;
        } else if (c == '\'' || c == '"') {
            seg = member(parse_quoted(), true);
        } else if (c == '-') {
            throw error("negative indices are not supported");
        } else if (std::isdigit(static_cast<unsigned char>(c))) {
            seg.index = parse_index();
        } else {
            throw error("expected index, '*' or quoted name inside '[]'");
        }

        if (at_end() || peek() != ']') {
            throw error("expected ']'");
        }
        ++pos_;
        return seg;
    }

    std::size_t parse_index() {
        constexpr auto max = std::numeric_limits<std::size_t>::max();
        std::size_t value = 0;
        while (!at_end() && std::isdigit(static_cast<unsigned char>(peek()))) {
            std::size_t digit = static_cast<std::size_t>(peek() - '0');
            if (value > (max - digit) / 10) {
                throw error("index out of range");
            }
            value = value * 10 + digit;
            ++pos_;
        }
        return value;
    }

    std::string parse_quoted() {
        const char quote = peek();
        ++pos_;
        std::string out;
        while (!at_end()) {
            char c = peek();
            if (c == '\\') {
                ++pos_;
                if (at_end()) break;
                out += peek();
                ++pos_;
                continue;
            }
            if (c == quote) {
                ++pos_;
                return out;
            }
            out += c;
            ++pos_;
        }
        throw error("unterminated quoted name");
    }

    std::string parse_bare_name() {
        std::string out;
        while (!at_end()) {
            char c = peek();
            if (c == '.' || c == '[') break;
            if (c == ']' || c == '\'' || c == '"') {
                throw error(std::string("unexpected character '") + c + "'");
            }
            out += c;
            ++pos_;
        }
        if (out.empty()) {
            throw error("empty member name");
        }
        return out;
    }

    static Segment member(std::string name, bool quoted) {
        return Segment{Segment::Kind::Member, std::move(name), quoted, 0};
    }
};

/// Partial match while expanding segments
struct Cursor {
    ResolvedPath path;
    const Tree* node;
};

ResolvedPath extend(const ResolvedPath& base, PathComponent step) {
    ResolvedPath out = base;
    out.push_back(std::move(step));
    return out;
}

void expand_children(const Cursor& cur, bool mappings, std::vector<Cursor>& out) {
    const Tree& node = *cur.node;
    switch (node.type()) {
        case Tree::value_t::object:
            if (!mappings) return;
            for (auto it = node.begin(); it != node.end(); ++it) {
                out.push_back({extend(cur.path, PathComponent::key(it.key())), &it.value()});
            }
            return;
        case Tree::value_t::array:
            for (std::size_t i = 0; i < node.size(); ++i) {
                out.push_back({extend(cur.path, PathComponent::index(i)), &node[i]});
            }
            return;
        default:
            return;
    }
}

} // anonymous namespace

std::string PathExpression::Segment::to_string() const {
    switch (kind) {
        case Kind::Member:
            // Quoted members keep their quotes so the canonical text still
            // reads as a key, even when the name is numeric.
            if (quoted) {
                std::string out = "'";
                for (char c : name) {
                    if (c == '\'' || c == '\\') out += '\\';
                    out += c;
                }
                return out + "'";
            }
            return PathComponent::key(name).to_string();
        case Kind::Index:
            return "[" + std::to_string(index) + "]";
        case Kind::AnyChild:
            return "*";
        case Kind::AnyElement:
            return "[*]";
    }
    return {};
}

PathExpression PathExpression::parse(const std::string& pattern) {
    PatternParser parser(pattern);
    return PathExpression(pattern, parser.parse());
}

std::vector<std::string> PathExpression::segment_strings() const {
    std::vector<std::string> out;
    out.reserve(segments_.size());
    for (const auto& seg : segments_) {
        out.push_back(seg.to_string());
    }
    return out;
}

bool PathExpression::is_concrete() const noexcept {
    for (const auto& seg : segments_) {
        if (seg.kind == Segment::Kind::AnyChild ||
            seg.kind == Segment::Kind::AnyElement) {
            return false;
        }
    }
    return true;
}

std::string PathExpression::to_string() const {
    std::ostringstream oss;
    for (std::size_t i = 0; i < segments_.size(); ++i) {
        if (i > 0) oss << '.';
        oss << segments_[i].to_string();
    }
    return oss.str();
}

std::vector<Match> PathExpression::find_all(const Tree& root) const {
    std::vector<Cursor> current;
    current.push_back({ResolvedPath{}, &root});

    for (const auto& seg : segments_) {
        std::vector<Cursor> next;
        for (const auto& cur : current) {
            const Tree& node = *cur.node;
            switch (seg.kind) {
                case Segment::Kind::Member:
                    if (node.is_object()) {
                        auto it = node.find(seg.name);
                        if (it != node.end()) {
                            next.push_back({extend(cur.path, PathComponent::key(seg.name)), &*it});
                        }
                    }
                    break;
                case Segment::Kind::Index:
                    if (node.is_array() && seg.index < node.size()) {
                        next.push_back({extend(cur.path, PathComponent::index(seg.index)),
                                        &node[seg.index]});
                    }
                    break;
                case Segment::Kind::AnyChild:
                    expand_children(cur, true, next);
                    break;
                case Segment::Kind::AnyElement:
                    expand_children(cur, false, next);
                    break;
            }
        }
        current = std::move(next);
        if (current.empty()) break;
    }

    std::vector<Match> matches;
    matches.reserve(current.size());
    for (const auto& cur : current) {
        matches.push_back({cur.path, *cur.node});
    }
    return matches;
}

} // namespace treedit
