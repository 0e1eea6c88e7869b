/**
 * @file Editor.cpp
 * @brief Implementation of edit sessions and invocations
 */

#include "treedit/Editor.hpp"
#include "treedit/Errors.hpp"
#include "treedit/PathExpression.hpp"
#include "treedit/PathResolver.hpp"
#include "treedit/TreeMutator.hpp"

#include <ctime>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace treedit {

namespace {

void update_if_different(Session& session, const std::string& pattern,
                         const ResolvedPath& path, const Tree& value) {
    const Tree* current = get_at(session.tree, path);
    if (current != nullptr && *current == value) {
        return;
    }

    const bool existed = current != nullptr;
    const Tree before = existed ? *current : Tree();
    session.tree = update_at(std::move(session.tree), path, value);
    session.recorder.record(pattern, path, existed ? &before : nullptr, &value);
    session.messages.push_back("Updated " + format_path(path));
}

void delete_if_present(Session& session, const std::string& pattern,
                       const ResolvedPath& path) {
    const Tree* current = get_at(session.tree, path);
    if (current == nullptr || is_empty(*current)) {
        return;
    }

    Tree before = *current;
    session.tree = delete_at(std::move(session.tree), path);
    session.recorder.record(pattern, path, &before, nullptr);
    session.messages.push_back("Deleted " + format_path(path));
}

EditResult failure(const EditError& e) {
    EditResult result;
    result.failed = true;
    result.error_output.push_back(e.what());
    return result;
}

std::string timestamp() {
    std::time_t now = std::time(nullptr);
    std::tm local{};
#if defined(_WIN32)
    localtime_s(&local, &now);
#else
    localtime_r(&now, &local);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d@%H:%M:%S", &local);
    return buf;
}

} // anonymous namespace

void apply_pattern(Session& session, const std::string& pattern, const Tree& value,
                   DesiredState state, bool allow_multiple) {
    const PathExpression expr = PathExpression::parse(pattern);
    const std::vector<Match> matches = expr.find_all(session.tree);

    switch (choose_action(matches.size(), state, allow_multiple)) {
        case Action::NoOp:
            return;

        case Action::Create: {
            const ResolvedPath path = resolve_path(expr);
            session.tree = add_at(std::move(session.tree), path, value);
            session.recorder.record(pattern, path, nullptr, &value);
            session.messages.push_back("Created " + format_path(path));
            return;
        }

        case Action::UpdateOne:
        case Action::UpdateEach:
            for (const auto& m : matches) {
                update_if_different(session, pattern, m.path, value);
            }
            return;

        case Action::DeleteOne:
        case Action::DeleteEach:
            for (const auto& m : matches) {
                delete_if_present(session, pattern, m.path);
            }
            return;

        case Action::Ambiguous:
            throw AmbiguousPattern(pattern, matches.size());
    }
}

void apply_all(Session& session, const EditRequest& request) {
    for (const auto& [pattern, value] : request.values) {
        apply_pattern(session, pattern, value, request.state, request.allow_multiple);
    }
}

std::vector<Match> query(const Tree& tree, const std::string& pattern) {
    return PathExpression::parse(pattern).find_all(tree);
}

std::string write_backup(const std::string& file) {
    const std::string target = file + "." + timestamp() + "~";
    std::error_code ec;
    fs::copy_file(file, target, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        throw EncodeError(target, "backup failed: " + ec.message());
    }
    return target;
}

EditResult run_edit(const EditRequest& request, DocumentCodec& codec) {
    try {
        if (!file_exists(request.file)) {
            throw FileNotFoundError(request.file);
        }

        Session session(codec.load(request.file));
        apply_all(session, request);

        EditResult result;
        result.changed = session.changed();
        result.messages = std::move(session.messages);
        result.diff_output = session.recorder.diff_output();

        if (!result.changed) {
            return result;
        }
        if (request.dry_run) {
            result.messages.push_back("Dry run: " + request.file + " not written");
            return result;
        }
        if (request.backup) {
            result.backup_file = write_backup(request.file);
            result.messages.push_back("Backup written to " + result.backup_file);
        }
        codec.save(request.file, session.tree);
        result.messages.push_back("Wrote " + codec.name() + " to " + request.file);
        return result;
    } catch (const EditError& e) {
        return failure(e);
    }
}

EditResult run_edit(const EditRequest& request) {
    try {
        const auto codec = codec_for_path(request.file);
        return run_edit(request, *codec);
    } catch (const EditError& e) {
        return failure(e);
    }
}

Tree EditResult::to_json() const {
    Tree out = {
        {"changed", changed},
        {"failed", failed},
        {"messages", messages},
        {"diff", diff_output},
        {"errors", error_output}
    };
    if (!backup_file.empty()) {
        out["backup_file"] = backup_file;
    }
    return out;
}

} // namespace treedit
