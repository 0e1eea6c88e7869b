/**
 * @file Errors.hpp
 * @brief Exception types for treedit
 *
 * Error taxonomy:
 * - EditError: Base class
 * - FileNotFoundError: Target document does not exist
 * - DecodeError / EncodeError: Codec failure reading or writing a document
 * - InvalidPathExpression: Pattern cannot be parsed (or resolved)
 * - AmbiguousPattern: Pattern matched several locations, multiple not allowed
 * - PathNotFound: Intermediate segment missing during update
 * - InvalidPathAccess: Step against the wrong kind of container
 *
 * All of them abort the whole invocation; nothing is written.
 */

#ifndef TREEDIT_ERRORS_HPP
#define TREEDIT_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace treedit {

/**
 * @brief Base class for all treedit exceptions
 */
class EditError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Target document not found
 */
class FileNotFoundError : public EditError {
public:
    /**
     * @brief Construct with file path
     * @param path Path to the missing file
     */
    explicit FileNotFoundError(std::string path)
        : EditError("File not found: " + path)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Document could not be decoded (syntax error, unsupported format)
 */
class DecodeError : public EditError {
public:
    /**
     * @param file Path to the document
     * @param details Message from the underlying parser
     */
    DecodeError(std::string file, std::string details)
        : EditError("Failed to decode '" + file + "': " + details)
        , file_(std::move(file))
        , details_(std::move(details))
    {}

    const std::string& file() const noexcept {
        return file_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string file_;
    std::string details_;
};

/**
 * @brief Document could not be encoded or written
 */
class EncodeError : public EditError {
public:
    EncodeError(std::string file, std::string details)
        : EditError("Failed to encode '" + file + "': " + details)
        , file_(std::move(file))
        , details_(std::move(details))
    {}

    const std::string& file() const noexcept {
        return file_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string file_;
    std::string details_;
};

/**
 * @brief Pattern string is malformed, or cannot name a single location
 */
class InvalidPathExpression : public EditError {
public:
    /**
     * @param pattern The offending pattern
     * @param position Character offset of the error within the pattern
     * @param details What went wrong
     */
    InvalidPathExpression(std::string pattern, std::size_t position, std::string details)
        : EditError("Invalid path expression '" + pattern + "' at position " +
                    std::to_string(position) + ": " + details)
        , pattern_(std::move(pattern))
        , position_(position)
        , details_(std::move(details))
    {}

    const std::string& pattern() const noexcept {
        return pattern_;
    }

    std::size_t position() const noexcept {
        return position_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string pattern_;
    std::size_t position_;
    std::string details_;
};

/**
 * @brief Pattern matched two or more locations and multiple edits are off
 */
class AmbiguousPattern : public EditError {
public:
    AmbiguousPattern(std::string pattern, std::size_t match_count)
        : EditError("Pattern '" + pattern + "' matches " +
                    std::to_string(match_count) +
                    " locations; enable multiple matches to edit all of them")
        , pattern_(std::move(pattern))
        , match_count_(match_count)
    {}

    const std::string& pattern() const noexcept {
        return pattern_;
    }

    std::size_t match_count() const noexcept {
        return match_count_;
    }

private:
    std::string pattern_;
    std::size_t match_count_;
};

/**
 * @brief Path segment missing where existing structure is required
 */
class PathNotFound : public EditError {
public:
    /**
     * @param path Full dotted path being accessed (e.g., "a.b.[2]")
     * @param segment The specific segment that does not exist
     */
    PathNotFound(std::string path, std::string segment)
        : EditError("Path not found: '" + segment + "' in path '" + path + "'")
        , path_(std::move(path))
        , segment_(std::move(segment))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& segment() const noexcept {
        return segment_;
    }

private:
    std::string path_;
    std::string segment_;
};

/**
 * @brief Type mismatch during traversal
 *
 * Raised when a key step meets a sequence, or an index step meets a
 * mapping or scalar.
 */
class InvalidPathAccess : public EditError {
public:
    /**
     * @param path Full dotted path being accessed
     * @param expected Expected container kind (e.g., "sequence")
     * @param actual Node kind actually found (e.g., "mapping")
     */
    InvalidPathAccess(std::string path, std::string expected, std::string actual)
        : EditError("Cannot access " + actual + " as " + expected +
                    " at path '" + path + "'")
        , path_(std::move(path))
        , expected_(std::move(expected))
        , actual_(std::move(actual))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& expected() const noexcept {
        return expected_;
    }

    const std::string& actual() const noexcept {
        return actual_;
    }

private:
    std::string path_;
    std::string expected_;
    std::string actual_;
};

} // namespace treedit

#endif // TREEDIT_ERRORS_HPP
