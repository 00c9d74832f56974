#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include "test_utils.hpp"
#include "core/Constants.hpp"
#include "engine/DiffEngine.hpp"

namespace fs = std::filesystem;

using namespace gitpulse;
using namespace gitpulse::test::utils;

class DiffEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = createTempDir();
        builder = std::make_unique<RepoBuilder>(tempDir / "repo.git");
    }

    void TearDown() override {
        builder.reset();
        removeDir(tempDir);
    }

    CommitObject commitAt(const std::string& id) {
        return builder->store().readCommit(id);
    }

    static const FileDelta* file(const CommitDetail& detail, const std::string& name) {
        auto it = std::find_if(detail.files.begin(), detail.files.end(),
                               [&](const FileDelta& f) { return f.filename == name; });
        return it == detail.files.end() ? nullptr : &*it;
    }

    static void expectConsistent(const CommitDetail& detail) {
        int64_t additions = 0;
        int64_t deletions = 0;
        for (const auto& f : detail.files) {
            EXPECT_EQ(f.changes, f.additions + f.deletions);
            additions += f.additions;
            deletions += f.deletions;
        }
        EXPECT_EQ(detail.stats.additions, additions);
        EXPECT_EQ(detail.stats.deletions, deletions);
        EXPECT_EQ(detail.stats.total, additions + deletions);
    }

    fs::path tempDir;
    std::unique_ptr<RepoBuilder> builder;
};

// Test: Multiset comparison of lines
TEST_F(DiffEngineTest, LineDiffCountsBagDifferences) {
    LineDelta d = DiffEngine::lineDiff("a\nb\nc\n", "a\nc\nd\ne\n");
    EXPECT_EQ(d.additions, 2);
    EXPECT_EQ(d.deletions, 1);

    // Reordering is not a change
    d = DiffEngine::lineDiff("x\ny\n", "y\nx\n");
    EXPECT_EQ(d.additions, 0);
    EXPECT_EQ(d.deletions, 0);

    // Duplicates count
    d = DiffEngine::lineDiff("dup\n", "dup\ndup\ndup\n");
    EXPECT_EQ(d.additions, 2);
    EXPECT_EQ(d.deletions, 0);
}

// Test: Root commit under both strategies
TEST_F(DiffEngineTest, RootCommitFastAndFull) {
    std::string id = builder->commitFiles({{"a.txt", "1\n2\n3\n"}, {"empty.txt", ""}}, "init", 1700000000);
    DiffEngine engine(builder->store());

    auto fast = engine.diffCommit(commitAt(id), DiffMode::Fast);
    ASSERT_TRUE(fast) << fast.error().message;
    EXPECT_EQ(fast.value().diffMode, DiffMode::Fast);
    EXPECT_EQ(fast.value().files.size(), 2u);
    EXPECT_EQ(file(fast.value(), "a.txt")->additions, 1);
    EXPECT_EQ(file(fast.value(), "empty.txt")->additions, 0);
    EXPECT_EQ(file(fast.value(), "empty.txt")->status, ChangeStatus::Added);
    expectConsistent(fast.value());

    auto full = engine.diffCommit(commitAt(id), DiffMode::Full);
    ASSERT_TRUE(full) << full.error().message;
    EXPECT_EQ(full.value().diffMode, DiffMode::Full);
    EXPECT_EQ(file(full.value(), "a.txt")->additions, 3);
    EXPECT_EQ(file(full.value(), "empty.txt")->additions, 0);
    EXPECT_EQ(file(full.value(), "empty.txt")->deletions, 0);
    expectConsistent(full.value());
}

// Test: Modified, removed and added files against the first parent
TEST_F(DiffEngineTest, ChildCommit) {
    builder->commitFiles({{"keep.txt", "k\n"}, {"edit.txt", "a\nb\n"}, {"gone.txt", "x\ny\n"}}, "one", 1700000000);
    std::string id = builder->commitFiles({{"keep.txt", "k\n"}, {"edit.txt", "a\nc\nd\n"}, {"new.txt", "n\n"}},
                                          "two", 1700000100);
    DiffEngine engine(builder->store());

    auto fast = engine.diffCommit(commitAt(id), DiffMode::Fast);
    ASSERT_TRUE(fast);
    EXPECT_EQ(fast.value().files.size(), 3u);
    EXPECT_EQ(file(fast.value(), "edit.txt")->additions, 1);
    EXPECT_EQ(file(fast.value(), "edit.txt")->deletions, 1);
    EXPECT_EQ(file(fast.value(), "gone.txt")->deletions, 1);
    EXPECT_EQ(file(fast.value(), "new.txt")->additions, 1);

    auto full = engine.diffCommit(commitAt(id), DiffMode::Full);
    ASSERT_TRUE(full);
    const FileDelta* edit = file(full.value(), "edit.txt");
    ASSERT_NE(edit, nullptr);
    EXPECT_EQ(edit->status, ChangeStatus::Modified);
    EXPECT_EQ(edit->additions, 2);
    EXPECT_EQ(edit->deletions, 1);

    const FileDelta* gone = file(full.value(), "gone.txt");
    ASSERT_NE(gone, nullptr);
    EXPECT_EQ(gone->deletions, 2);
    EXPECT_FALSE(gone->sha.empty());   // the old blob id
    expectConsistent(full.value());

    EXPECT_EQ(full.value().sha, id);
    EXPECT_EQ(full.value().message, "two");
    EXPECT_EQ(full.value().author.name, "Alice");
    EXPECT_EQ(full.value().authorLogin, "Alice");
}

// Test: Binary blobs count as zero lines
TEST_F(DiffEngineTest, BinaryModificationIsZero) {
    builder->commitFiles({{"img.png", std::string("\x89PNG\0aaa", 8)}}, "one", 1700000000);
    std::string id = builder->commitFiles({{"img.png", std::string("\x89PNG\0bbb", 8)}}, "two", 1700000100);
    DiffEngine engine(builder->store());

    auto full = engine.diffCommit(commitAt(id), DiffMode::Full);
    ASSERT_TRUE(full);
    ASSERT_EQ(full.value().files.size(), 1u);
    EXPECT_EQ(full.value().files[0].additions, 0);
    EXPECT_EQ(full.value().files[0].deletions, 0);
}

// Test: Parent beyond a shallow boundary
TEST_F(DiffEngineTest, MissingParentMakesFilesUnknown) {
    std::string tree = builder->tree({{"a.txt", "1\n"}, {"b.txt", "2\n"}});
    std::string id = builder->commit(tree, {"abababababababababababababababababababab"}, "grafted", 1700000000);
    DiffEngine engine(builder->store());

    auto full = engine.diffCommit(commitAt(id), DiffMode::Full);
    ASSERT_TRUE(full);
    ASSERT_EQ(full.value().files.size(), 2u);
    for (const auto& f : full.value().files) {
        EXPECT_EQ(f.status, ChangeStatus::Unknown);
        EXPECT_EQ(f.changes, 0);
    }
}

// Test: A blob missing from the store fails the commit under full diff only
TEST_F(DiffEngineTest, MissingBlobFailsFullDiff) {
    std::string missingBlob = "cdcdcdcdcdcdcdcdcdcdcdcdcdcdcdcdcdcdcdcd";
    std::string tree = builder->store().writeTree({TreeEntry{Constants::MODE_FILE, "lost.txt", missingBlob}});
    std::string id = builder->commit(tree, {}, "root", 1700000000);
    DiffEngine engine(builder->store());

    EXPECT_TRUE(engine.diffCommit(commitAt(id), DiffMode::Fast));

    auto full = engine.diffCommit(commitAt(id), DiffMode::Full);
    ASSERT_FALSE(full);
    EXPECT_EQ(full.error().code, ErrorCode::ObjectNotFound);
}
