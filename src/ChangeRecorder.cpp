/**
 * @file ChangeRecorder.cpp
 * @brief Implementation of mutation recording and line diffs
 */

#include "treedit/ChangeRecorder.hpp"

#include <diff_match_patch.hh>

#include <sstream>
#include <unordered_map>

namespace treedit {

namespace {
    using LineDiffer = diff_match_patch<std::wstring>;

    std::vector<std::string> split_lines(const std::string& text) {
        std::vector<std::string> lines;
        if (text.empty()) {
            return lines;
        }
        std::istringstream iss(text);
        std::string line;
        while (std::getline(iss, line)) {
            lines.push_back(line);
        }
        return lines;
    }

    /**
     * @brief Maps each distinct line to one character
     *
     * A character diff of two encoded texts is a line diff of the originals.
     * Codes start at 1.
     */
    class LineAlphabet {
    public:
        std::wstring encode(const std::vector<std::string>& lines) {
            std::wstring out;
            out.reserve(lines.size());
            for (const auto& line : lines) {
                auto it = codes_.find(line);
                if (it == codes_.end()) {
                    lines_.push_back(line);
                    it = codes_.emplace(line, static_cast<wchar_t>(lines_.size())).first;
                }
                out.push_back(it->second);
            }
            return out;
        }

        const std::string& line(wchar_t code) const {
            return lines_[static_cast<std::size_t>(code) - 1];
        }

    private:
        std::unordered_map<std::string, wchar_t> codes_;
        std::vector<std::string> lines_;
    };
}

std::vector<std::string> ChangeRecorder::line_diff(const std::string& before,
                                                   const std::string& after) {
    LineAlphabet alphabet;
    const std::wstring a = alphabet.encode(split_lines(before));
    const std::wstring b = alphabet.encode(split_lines(after));

    LineDiffer differ;
    differ.Diff_Timeout = 0; // exact diff, no deadline
    const auto diffs = differ.diff_main(a, b, false);

    std::vector<std::string> out;
    for (const auto& d : diffs) {
        const char prefix = d.operation == LineDiffer::DELETE   ? '-'
                            : d.operation == LineDiffer::INSERT ? '+'
                                                                : ' ';
        for (wchar_t code : d.text) {
            out.push_back(prefix + alphabet.line(code));
        }
    }
    return out;
}

void ChangeRecorder::record(const std::string& pattern, const ResolvedPath& path,
                            const Tree* before, const Tree* after) {
    MutationRecord rec;
    rec.pattern = pattern;
    rec.path = path;
    rec.before = before ? to_text(*before) : std::string();
    rec.after = after ? to_text(*after) : std::string();

    const std::string where = format_path(path);
    diff_output_.push_back("--- before: " + where);
    diff_output_.push_back("+++ after: " + where);
    for (auto& line : line_diff(rec.before, rec.after)) {
        diff_output_.push_back(std::move(line));
    }

    records_.push_back(std::move(rec));
    changed_ = true;
}

} // namespace treedit
