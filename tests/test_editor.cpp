/**
 * @file test_editor.cpp
 * @brief Tests for edit sessions and the file invocation (GoogleTest)
 *
 * Tests cover:
 * - Session-level pattern application (create, update, delete, fan-out)
 * - Idempotence and the change flag
 * - Ambiguous patterns and failure without partial writes
 * - run_edit: persistence gate, dry run, backup, error reporting
 */

#include <gtest/gtest.h>

#include "treedit/Editor.hpp"
#include "treedit/Errors.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;
using namespace treedit;

// ============================================================================
// Test Utilities
// ============================================================================

/**
 * @brief RAII wrapper for temporary documents
 */
class TempFile {
public:
    TempFile(const std::string& content, const std::string& extension)
        : path_(fs::temp_directory_path() /
                ("treedit_test_" + std::to_string(std::rand()) + extension)) {
        std::ofstream f(path_);
        f << content;
    }

    ~TempFile() {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    std::string path() const { return path_.string(); }

    std::string read() const {
        std::ifstream f(path_);
        std::ostringstream ss;
        ss << f.rdbuf();
        return ss.str();
    }

private:
    fs::path path_;
};

namespace {
    Tree read_json(const TempFile& f) {
        return Tree::parse(f.read());
    }

    EditRequest request_for(const TempFile& f,
                            std::vector<std::pair<std::string, Tree>> values,
                            DesiredState state = DesiredState::Present,
                            bool allow_multiple = false) {
        EditRequest req;
        req.file = f.path();
        req.values = std::move(values);
        req.state = state;
        req.allow_multiple = allow_multiple;
        return req;
    }
}

// ============================================================================
// apply_pattern - single location
// ============================================================================

TEST(ApplyPattern, UpdatesSequenceElement) {
    Session s(Tree::parse(R"({"a": {"b": [1, 2, 3]}})"));
    apply_pattern(s, "a.b.[1]", 99, DesiredState::Present, false);
    EXPECT_EQ(s.tree, Tree::parse(R"({"a": {"b": [1, 99, 3]}})"));
    EXPECT_TRUE(s.changed());
    ASSERT_EQ(s.recorder.records().size(), 1u);
    EXPECT_EQ(s.recorder.records()[0].before, "2");
    EXPECT_EQ(s.recorder.records()[0].after, "99");
}

TEST(ApplyPattern, DeletesSequenceElementAsNull) {
    Session s(Tree::parse(R"({"a": {"b": [1, 2, 3]}})"));
    apply_pattern(s, "a.b.[1]", Tree(), DesiredState::Absent, false);
    EXPECT_EQ(s.tree, Tree::parse(R"({"a": {"b": [1, null, 3]}})"));
    EXPECT_TRUE(s.changed());
}

TEST(ApplyPattern, CreatesMissingStructure) {
    Session s(Tree::object());
    apply_pattern(s, "x.y", "v", DesiredState::Present, false);
    EXPECT_EQ(s.tree, Tree::parse(R"({"x": {"y": "v"}})"));
    EXPECT_TRUE(s.changed());
    EXPECT_EQ(s.recorder.records()[0].before, "");
    EXPECT_EQ(s.messages, (std::vector<std::string>{"Created x.y"}));
}

TEST(ApplyPattern, DeleteOnlyKeyPrunesToEmptyRoot) {
    Session s(Tree::parse(R"({"x": {"y": "v"}})"));
    apply_pattern(s, "x.y", Tree(), DesiredState::Absent, false);
    EXPECT_EQ(s.tree, Tree::object());
    EXPECT_TRUE(s.changed());
}

TEST(ApplyPattern, AbsentPatternWithAbsentStateIsNoOp) {
    Session s(Tree::parse(R"({"a": 1})"));
    apply_pattern(s, "b.c", Tree(), DesiredState::Absent, false);
    EXPECT_EQ(s.tree, Tree::parse(R"({"a": 1})"));
    EXPECT_FALSE(s.changed());
}

TEST(ApplyPattern, EqualValueIsNotAChange) {
    Session s(Tree::parse(R"({"a": {"b": 5}})"));
    apply_pattern(s, "a.b", 5, DesiredState::Present, false);
    EXPECT_FALSE(s.changed());
    EXPECT_TRUE(s.recorder.diff_output().empty());
}

TEST(ApplyPattern, NullMatchIsNotDeletedAgain) {
    Session s(Tree::parse(R"({"list": [1, null, 3]})"));
    apply_pattern(s, "list[1]", Tree(), DesiredState::Absent, false);
    EXPECT_FALSE(s.changed());
}

TEST(ApplyPattern, EmptyContainerMatchIsLeftAlone) {
    Session s(Tree::parse(R"({"m": {}})"));
    apply_pattern(s, "m", Tree(), DesiredState::Absent, false);
    EXPECT_EQ(s.tree, Tree::parse(R"({"m": {}})"));
    EXPECT_FALSE(s.changed());
}

TEST(ApplyPattern, FalsyScalarIsDeleted) {
    Session s(Tree::parse(R"({"flag": false, "n": 1})"));
    apply_pattern(s, "flag", Tree(), DesiredState::Absent, false);
    EXPECT_EQ(s.tree, Tree::parse(R"({"n": 1})"));
    EXPECT_TRUE(s.changed());
}

TEST(ApplyPattern, QuotedNumericKeyIsCreatedAsMappingKey) {
    Session s(Tree::object());
    apply_pattern(s, "ports.'5'", "five", DesiredState::Present, false);
    EXPECT_EQ(s.tree, Tree::parse(R"({"ports": {"5": "five"}})"));
}

TEST(ApplyPattern, IndexIntoMappingFails) {
    Session s(Tree::parse(R"({"a": {"k": 1}})"));
    EXPECT_THROW(apply_pattern(s, "a[0]", 1, DesiredState::Present, false),
                 InvalidPathAccess);
}

TEST(ApplyPattern, MalformedPatternFails) {
    Session s(Tree::object());
    EXPECT_THROW(apply_pattern(s, "a..b", 1, DesiredState::Present, false),
                 InvalidPathExpression);
}

TEST(ApplyPattern, WildcardWithoutMatchesCannotBeCreated) {
    Session s(Tree::parse(R"({"servers": []})"));
    EXPECT_THROW(apply_pattern(s, "servers[*].port", 80, DesiredState::Present, false),
                 InvalidPathExpression);
    EXPECT_FALSE(s.changed());
}

// ============================================================================
// apply_pattern - several locations
// ============================================================================

class FanOutTest : public ::testing::Test {
protected:
    Tree doc = Tree::parse(R"({
        "servers": [
            {"host": "alpha", "debug": true},
            {"host": "beta", "debug": false},
            {"host": "gamma", "debug": true}
        ]
    })");
};

TEST_F(FanOutTest, AmbiguousWithoutAllowMultiple) {
    Session s(doc);
    try {
        apply_pattern(s, "servers[*].debug", false, DesiredState::Present, false);
        FAIL() << "expected AmbiguousPattern";
    } catch (const AmbiguousPattern& e) {
        EXPECT_EQ(e.match_count(), 3u);
        EXPECT_EQ(e.pattern(), "servers[*].debug");
    }
    EXPECT_EQ(s.tree, doc);
    EXPECT_FALSE(s.changed());
}

TEST_F(FanOutTest, AmbiguousDeleteMutatesNothing) {
    Session s(doc);
    EXPECT_THROW(apply_pattern(s, "servers[*].host", Tree(), DesiredState::Absent, false),
                 AmbiguousPattern);
    EXPECT_EQ(s.tree, doc);
}

TEST_F(FanOutTest, UpdateEachOnlyTouchesDifferingValues) {
    Session s(doc);
    apply_pattern(s, "servers[*].debug", false, DesiredState::Present, true);
    for (const auto& server : s.tree["servers"]) {
        EXPECT_EQ(server["debug"], false);
    }
    EXPECT_EQ(s.recorder.records().size(), 2u);
}

TEST_F(FanOutTest, DeleteEachRemovesAllMatches) {
    Session s(doc);
    apply_pattern(s, "servers[*].debug", Tree(), DesiredState::Absent, true);
    EXPECT_EQ(s.tree, Tree::parse(R"({
        "servers": [{"host": "alpha"}, {"host": "beta"}, {"host": "gamma"}]
    })"));
    EXPECT_EQ(s.recorder.records().size(), 3u);
}

TEST_F(FanOutTest, DeleteEveryElementPrunesSequence) {
    Session s(doc);
    apply_pattern(s, "servers[*]", Tree(), DesiredState::Absent, true);
    EXPECT_EQ(s.tree, Tree::object());
    EXPECT_TRUE(s.changed());
}

TEST_F(FanOutTest, SecondFanOutRunIsIdempotent) {
    Session first(doc);
    apply_pattern(first, "servers[*].debug", false, DesiredState::Present, true);
    Session second(first.tree);
    apply_pattern(second, "servers[*].debug", false, DesiredState::Present, true);
    EXPECT_FALSE(second.changed());
}

// ============================================================================
// apply_all / query
// ============================================================================

TEST(ApplyAll, AppliesInRequestOrder) {
    Session s(Tree::object());
    EditRequest req;
    req.values = {{"a.b", 1}, {"a.b", 2}, {"a.c", "x"}};
    apply_all(s, req);
    EXPECT_EQ(s.tree, Tree::parse(R"({"a": {"b": 2, "c": "x"}})"));
    EXPECT_EQ(s.recorder.records().size(), 3u);
}

TEST(ApplyAll, StopsAtFirstError) {
    Session s(Tree::parse(R"({"l": [1, 2]})"));
    EditRequest req;
    req.values = {{"l[*]", 0}, {"never", 1}};
    EXPECT_THROW(apply_all(s, req), AmbiguousPattern);
    EXPECT_FALSE(s.tree.contains("never"));
}

TEST(Query, ReturnsMatchesWithoutMutating) {
    Tree doc = Tree::parse(R"({"a": [{"k": 1}, {"k": 2}]})");
    auto matches = query(doc, "a[*].k");
    ASSERT_EQ(matches.size(), 2u);
    EXPECT_EQ(format_path(matches[1].path), "a.[1].k");
    EXPECT_EQ(matches[1].value, 2);
}

// ============================================================================
// run_edit - JSON documents on disk
// ============================================================================

TEST(RunEdit, IdempotentAcrossInvocations) {
    TempFile f(R"({"a": {"b": [1, 2, 3]}})", ".json");
    auto req = request_for(f, {{"a.b.[1]", 99}});

    EditResult first = run_edit(req);
    EXPECT_FALSE(first.failed);
    EXPECT_TRUE(first.changed);
    EXPECT_EQ(read_json(f), Tree::parse(R"({"a": {"b": [1, 99, 3]}})"));
    EXPECT_FALSE(first.diff_output.empty());

    EditResult second = run_edit(req);
    EXPECT_FALSE(second.failed);
    EXPECT_FALSE(second.changed);
    EXPECT_TRUE(second.diff_output.empty());
}

TEST(RunEdit, UnchangedDocumentIsNotRewritten) {
    const std::string original = "{\"a\":1}";
    TempFile f(original, ".json");
    EditResult r = run_edit(request_for(f, {{"a", 1}}));
    EXPECT_FALSE(r.changed);
    EXPECT_EQ(f.read(), original);
}

TEST(RunEdit, AbsentStateDeletes) {
    TempFile f(R"({"x": {"y": "v"}, "keep": true})", ".json");
    EditResult r = run_edit(request_for(f, {{"x.y", Tree()}}, DesiredState::Absent));
    EXPECT_TRUE(r.changed);
    EXPECT_EQ(read_json(f), Tree::parse(R"({"keep": true})"));
}

TEST(RunEdit, FailureLeavesFileUntouched) {
    const std::string original = R"({"l": [1, 2, 3]})";
    TempFile f(original, ".json");
    EditResult r = run_edit(request_for(f, {{"new.key", 1}, {"l[*]", 0}}));
    EXPECT_TRUE(r.failed);
    EXPECT_FALSE(r.changed);
    ASSERT_EQ(r.error_output.size(), 1u);
    EXPECT_NE(r.error_output[0].find("l[*]"), std::string::npos);
    EXPECT_EQ(f.read(), original);
}

TEST(RunEdit, AllowMultipleUpdatesEveryMatch) {
    TempFile f(R"({"l": [1, 2, 3]})", ".json");
    auto req = request_for(f, {{"l[*]", 0}}, DesiredState::Present, true);
    EditResult r = run_edit(req);
    EXPECT_TRUE(r.changed);
    EXPECT_EQ(read_json(f), Tree::parse(R"({"l": [0, 0, 0]})"));
}

TEST(RunEdit, MissingFileFails) {
    EditRequest req;
    req.file = (fs::temp_directory_path() / "treedit_does_not_exist.json").string();
    req.values = {{"a", 1}};
    EditResult r = run_edit(req);
    EXPECT_TRUE(r.failed);
    ASSERT_EQ(r.error_output.size(), 1u);
    EXPECT_NE(r.error_output[0].find("File not found"), std::string::npos);
}

TEST(RunEdit, MalformedDocumentFails) {
    TempFile f("{ not json", ".json");
    EditResult r = run_edit(request_for(f, {{"a", 1}}));
    EXPECT_TRUE(r.failed);
    EXPECT_NE(r.error_output[0].find("Failed to decode"), std::string::npos);
}

TEST(RunEdit, UnsupportedExtensionFails) {
    TempFile f("a: 1\n", ".yaml");
    EditResult r = run_edit(request_for(f, {{"a", 2}}));
    EXPECT_TRUE(r.failed);
    EXPECT_EQ(f.read(), "a: 1\n");
}

TEST(RunEdit, DryRunReportsButDoesNotWrite) {
    const std::string original = R"({"a": 1})";
    TempFile f(original, ".json");
    auto req = request_for(f, {{"a", 2}});
    req.dry_run = true;
    EditResult r = run_edit(req);
    EXPECT_TRUE(r.changed);
    EXPECT_FALSE(r.diff_output.empty());
    EXPECT_EQ(f.read(), original);
}

TEST(RunEdit, BackupKeepsOriginalContent) {
    const std::string original = R"({"a": 1})";
    TempFile f(original, ".json");
    auto req = request_for(f, {{"a", 2}});
    req.backup = true;
    EditResult r = run_edit(req);
    ASSERT_FALSE(r.failed);
    ASSERT_FALSE(r.backup_file.empty());

    std::ifstream b(r.backup_file);
    std::ostringstream ss;
    ss << b.rdbuf();
    EXPECT_EQ(ss.str(), original);
    EXPECT_EQ(read_json(f), Tree::parse(R"({"a": 2})"));

    std::error_code ec;
    fs::remove(r.backup_file, ec);
}

TEST(RunEdit, NoBackupWithoutChange) {
    TempFile f(R"({"a": 1})", ".json");
    auto req = request_for(f, {{"a", 1}});
    req.backup = true;
    EditResult r = run_edit(req);
    EXPECT_TRUE(r.backup_file.empty());
}

TEST(RunEdit, ResultAsJson) {
    TempFile f(R"({"a": 1})", ".json");
    EditResult r = run_edit(request_for(f, {{"a", 2}}));
    Tree out = r.to_json();
    EXPECT_EQ(out["changed"], true);
    EXPECT_EQ(out["failed"], false);
    EXPECT_TRUE(out["diff"].is_array());
    EXPECT_FALSE(out.contains("backup_file"));
}

TEST(RunEdit, OversizedIndexFailsWithoutWriting) {
    const std::string original = "{}";
    TempFile f(original, ".json");
    EditResult r = run_edit(request_for(f, {{"a.[999999999999]", 1}}));
    EXPECT_TRUE(r.failed);
    ASSERT_EQ(r.error_output.size(), 1u);
    EXPECT_NE(r.error_output[0].find("999999999999"), std::string::npos);
    EXPECT_EQ(f.read(), original);
}

TEST(RunEdit, ExplicitCodecReportsMissingFile) {
    JsonCodec codec;
    EditRequest req;
    req.file = (fs::temp_directory_path() / "treedit_does_not_exist.json").string();
    req.values = {{"a", 1}};
    EditResult r = run_edit(req, codec);
    EXPECT_TRUE(r.failed);
    ASSERT_EQ(r.error_output.size(), 1u);
    EXPECT_NE(r.error_output[0].find("File not found"), std::string::npos);
}

// ============================================================================
// run_edit - TOML documents on disk
// ============================================================================

TEST(RunEdit, TomlDatesKeepTheirTypeWhenOtherKeysChange) {
    TempFile f("released = 1979-05-27\nversion = 1\n", ".toml");
    EditResult r = run_edit(request_for(f, {{"version", 2}}));
    ASSERT_FALSE(r.failed);
    EXPECT_TRUE(r.changed);

    const std::string text = f.read();
    EXPECT_NE(text.find("1979-05-27"), std::string::npos);
    EXPECT_EQ(text.find("\"1979-05-27\""), std::string::npos);
    EXPECT_NE(text.find("version = 2"), std::string::npos);
}
