/**
 * @file Cli.cpp
 * @brief Command-line parsing and dispatch
 */

#include "treedit/Cli.hpp"
#include "treedit/Cardinality.hpp"
#include "treedit/Codec.hpp"
#include "treedit/Editor.hpp"
#include "treedit/Errors.hpp"
#include "treedit/Parse.hpp"

#include <cxxopts.hpp>
#include <nlohmann/json.hpp>

#include <string>
#include <vector>

using nlohmann::json;

namespace treedit {

namespace {

void print_lines(std::ostream& os, const std::vector<std::string>& lines) {
    for (const auto& line : lines) os << line << "\n";
}

int run_get(const std::string& file, const std::string& pattern, bool as_json,
            std::ostream& out) {
    auto codec = codec_for_path(file);
    Tree doc = codec->load(file);
    auto matches = query(doc, pattern);

    if (as_json) {
        json arr = json::array();
        for (const auto& m : matches) {
            arr.push_back({{"path", format_path(m.path)}, {"value", m.value}});
        }
        out << arr.dump(2) << "\n";
    } else {
        for (const auto& m : matches) {
            out << format_path(m.path) << " = " << m.value.dump() << "\n";
        }
    }
    return matches.empty() ? kExitFailed : kExitOk;
}

cxxopts::Options make_options() {
    cxxopts::Options options("treedit", "Declaratively edit values inside JSON/TOML documents via path patterns");
    options.positional_help("PATTERN=VALUE [PATTERN=VALUE ...]");

    options.add_options()
        ("f,file", "Document to edit (.json or .toml)", cxxopts::value<std::string>())
        ("s,state", "Desired state of the patterns: present | absent", cxxopts::value<std::string>()->default_value("present"))
        ("m,allow-multiple", "Edit every location a pattern matches")
        ("n,dry-run", "Report changes without writing the document")
        ("b,backup", "Copy the document aside before writing")
        ("r,raw", "Treat values as plain strings instead of typing them")
        ("g,get", "Print the locations a pattern matches and exit", cxxopts::value<std::string>())
        ("j,json", "Print the result as JSON")
        ("h,help", "Show help");

    options.add_options()
        ("assignments", "Patterns with desired values", cxxopts::value<std::vector<std::string>>());

    options.parse_positional({"assignments"});
    return options;
}

} // namespace

int run_cli(int argc, char** argv, std::ostream& out, std::ostream& err) {
    try {
        cxxopts::Options options = make_options();
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            out << options.help() << "\n";
            out << "Examples:\n"
                << "  treedit -f app.json 'db.port=5432'\n"
                << "  treedit -f app.json -s absent 'servers[*].debug' -m\n"
                << "  treedit -f app.toml --get 'servers[*].host'\n";
            return kExitOk;
        }
        if (!result.count("file")) {
            err << "Error: --file is required\n";
            return kExitUsage;
        }

        const std::string file = result["file"].as<std::string>();
        const bool as_json = result.count("json") > 0;

        if (result.count("get")) {
            return run_get(file, result["get"].as<std::string>(), as_json, out);
        }

        EditRequest request;
        request.file = file;
        request.state = parse_desired_state(result["state"].as<std::string>());
        request.allow_multiple = result.count("allow-multiple") > 0;
        request.dry_run = result.count("dry-run") > 0;
        request.backup = result.count("backup") > 0;

        if (!result.count("assignments")) {
            err << "Error: no patterns given\n";
            return kExitUsage;
        }

        const bool raw = result.count("raw") > 0;
        for (const auto& arg : result["assignments"].as<std::vector<std::string>>()) {
            Assignment a = split_assignment(arg);
            if (!a.has_value && request.state == DesiredState::Present) {
                err << "Error: expected PATTERN=VALUE, got '" << arg << "'\n";
                return kExitUsage;
            }
            Tree value = raw ? Tree(a.value) : parse_value(a.value);
            request.values.emplace_back(a.pattern, std::move(value));
        }

        EditResult outcome = run_edit(request);

        if (as_json) {
            out << outcome.to_json().dump(2) << "\n";
        } else {
            print_lines(out, outcome.messages);
            print_lines(out, outcome.diff_output);
            print_lines(err, outcome.error_output);
            if (!outcome.failed) {
                out << (outcome.changed ? "changed" : "unchanged") << "\n";
            }
        }
        return outcome.failed ? kExitFailed : kExitOk;

    } catch (const EditError& e) {
        err << "Error: " << e.what() << "\n";
        return kExitFailed;
    } catch (const std::exception& ex) {
        err << "Error: " << ex.what() << "\n";
        return kExitUsage;
    }
}

} // namespace treedit
