/**
 * @file Codec.hpp
 * @brief Document load/save by file format
 *
 * Formats:
 * - JSON (using nlohmann::json), written with two-space indentation
 * - TOML (using toml++); dates and times load as strings and are written
 *   back as dates and times while their text still reads as one. Documents
 *   holding null or binary values cannot be written
 *
 * The format is chosen from the file extension (.json, .toml).
 */

#ifndef TREEDIT_CODEC_HPP
#define TREEDIT_CODEC_HPP

#include "treedit/Value.hpp"
#include <map>
#include <memory>
#include <string>

namespace treedit {

/**
 * @brief Reads and writes a whole document
 */
class DocumentCodec {
public:
    virtual ~DocumentCodec() = default;

    /**
     * @brief Load a document
     * @throws FileNotFoundError if the file does not exist
     * @throws DecodeError if it cannot be read or parsed
     */
    virtual Tree load(const std::string& path) = 0;

    /**
     * @brief Write a document, replacing the file
     * @throws EncodeError if the tree cannot be represented or written
     */
    virtual void save(const std::string& path, const Tree& tree) const = 0;

    /// Format name for messages ("JSON", "TOML")
    virtual std::string name() const = 0;
};

class JsonCodec : public DocumentCodec {
public:
    Tree load(const std::string& path) override;
    void save(const std::string& path, const Tree& tree) const override;
    std::string name() const override { return "JSON"; }
};

class TomlCodec : public DocumentCodec {
public:
    enum class Temporal { Date, Time, DateTime };

    /// Also remembers where the document held dates and times
    Tree load(const std::string& path) override;

    /**
     * @brief Write a mapping as TOML
     *
     * A string at a location that held a date or time when loaded is
     * written as that kind again if it still parses as one.
     *
     * @throws EncodeError if the root is not a mapping, or for null/binary values
     */
    void save(const std::string& path, const Tree& tree) const override;

    std::string name() const override { return "TOML"; }

    /// Dates and times seen by the last load, keyed by JSON pointer
    const std::map<std::string, Temporal>& temporal_paths() const noexcept {
        return temporal_;
    }

private:
    std::map<std::string, Temporal> temporal_;
};

/**
 * @brief Get file extension (lowercase)
 * @return Extension including the dot (e.g., ".json"), or empty if none
 */
std::string get_file_extension(const std::string& path);

/**
 * @brief Pick the codec for a file by its extension
 * @throws DecodeError if the extension is not .json or .toml
 */
std::unique_ptr<DocumentCodec> codec_for_path(const std::string& path);

/**
 * @brief Check that a path names an existing regular file
 */
bool file_exists(const std::string& path);

} // namespace treedit

#endif // TREEDIT_CODEC_HPP
