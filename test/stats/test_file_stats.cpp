#include <gtest/gtest.h>
#include <cstdio>
#include "stats/FileStats.hpp"

using namespace gitpulse;
using namespace gitpulse::stats;

namespace {
    FileDelta file(const std::string& name, int64_t additions, int64_t deletions) {
        FileDelta delta;
        delta.filename = name;
        delta.status = ChangeStatus::Modified;
        delta.additions = additions;
        delta.deletions = deletions;
        delta.changes = additions + deletions;
        return delta;
    }

    CommitDetail detail(const std::string& login, std::vector<FileDelta> files) {
        CommitDetail d;
        d.sha = std::string(40, 'b');
        d.author = Signature{login, login + "@example.com", 1704067200};
        d.authorLogin = login;
        d.files = std::move(files);
        for (const auto& f : d.files) {
            d.stats.additions += f.additions;
            d.stats.deletions += f.deletions;
        }
        d.stats.total = d.stats.additions + d.stats.deletions;
        return d;
    }
}

TEST(FileStatsTest, ExtensionOf) {
    EXPECT_EQ(extensionOf("src/app.TS"), ".ts");
    EXPECT_EQ(extensionOf("archive.tar.gz"), ".gz");
    EXPECT_EQ(extensionOf("Makefile"), "(no ext)");
    EXPECT_EQ(extensionOf("config/.gitignore"), "(no ext)");
    EXPECT_EQ(extensionOf("some.dir/README"), "(no ext)");
}

// Test: Touch counts, line totals and contributors in first-seen order
TEST(FileStatsTest, FileChurn) {
    RawDataBundle raw;
    raw.commitDetails = {
        detail("alice", {file("a.cpp", 10, 2), file("b.cpp", 1, 0)}),
        detail("bob", {file("a.cpp", 3, 3)}),
        detail("alice", {file("a.cpp", 0, 1), file("c.md", 4, 0)}),
    };

    auto churn = buildFileChurn(raw);
    ASSERT_EQ(churn.size(), 3u);
    EXPECT_EQ(churn[0].filename, "a.cpp");
    EXPECT_EQ(churn[0].changeCount, 3);
    EXPECT_EQ(churn[0].totalAdditions, 13);
    EXPECT_EQ(churn[0].totalDeletions, 6);
    EXPECT_EQ(churn[0].contributors, (std::vector<std::string>{"alice", "bob"}));
    // ties keep first-seen order
    EXPECT_EQ(churn[1].filename, "b.cpp");
    EXPECT_EQ(churn[2].filename, "c.md");
}

TEST(FileStatsTest, FileChurnCapsAtOneHundred) {
    RawDataBundle raw;
    std::vector<FileDelta> files;
    for (int i = 0; i < 150; ++i) files.push_back(file("f" + std::to_string(i) + ".txt", 1, 0));
    raw.commitDetails = {detail("alice", files)};
    EXPECT_EQ(buildFileChurn(raw).size(), 100u);
}

TEST(FileStatsTest, CouplingNeedsThreeCochanges) {
    RawDataBundle raw;
    for (int i = 0; i < 3; ++i) {
        raw.commitDetails.push_back(detail("alice", {file("src/b.cpp", 1, 0), file("src/a.cpp", 1, 0)}));
    }
    raw.commitDetails.push_back(detail("alice", {file("x.txt", 1, 0), file("y.txt", 1, 0)}));
    raw.commitDetails.push_back(detail("alice", {file("x.txt", 1, 0), file("y.txt", 1, 0)}));

    auto pairs = buildFileCoupling(raw);
    ASSERT_EQ(pairs.size(), 1u);
    EXPECT_EQ(pairs[0].file1, "src/a.cpp");
    EXPECT_EQ(pairs[0].file2, "src/b.cpp");
    EXPECT_EQ(pairs[0].cochanges, 3);
}

// Test: Single-file and oversized commits do not couple anything
TEST(FileStatsTest, CouplingIgnoresHugeAndSingleFileCommits) {
    RawDataBundle raw;
    std::vector<FileDelta> huge;
    for (int i = 0; i < 51; ++i) huge.push_back(file("g" + std::to_string(i) + ".c", 1, 0));
    for (int i = 0; i < 5; ++i) {
        raw.commitDetails.push_back(detail("alice", huge));
        raw.commitDetails.push_back(detail("alice", {file("solo.c", 1, 0)}));
    }
    EXPECT_TRUE(buildFileCoupling(raw).empty());
}

TEST(FileStatsTest, CouplingUsesFirstTwentySortedNames) {
    RawDataBundle raw;
    std::vector<FileDelta> files;
    for (int i = 0; i < 30; ++i) {
        char name[16];
        std::snprintf(name, sizeof(name), "f%02d.c", i);
        files.push_back(file(name, 1, 0));
    }
    for (int i = 0; i < 3; ++i) raw.commitDetails.push_back(detail("alice", files));

    auto pairs = buildFileCoupling(raw);
    EXPECT_EQ(pairs.size(), 20u);
    for (const auto& p : pairs) {
        EXPECT_LT(p.file1, "f20.c");
        EXPECT_LT(p.file2, "f20.c");
        EXPECT_EQ(p.cochanges, 3);
    }
}

TEST(FileStatsTest, CommitSizeHistogram) {
    RawDataBundle raw;
    raw.commitDetails = {
        detail("a", {}),
        detail("a", {file("x", 5, 5)}),
        detail("a", {file("x", 11, 0)}),
        detail("a", {file("x", 100, 0)}),
        detail("a", {file("x", 400, 100)}),
        detail("a", {file("x", 1000, 0)}),
        detail("a", {file("x", 1000, 1)}),
    };

    auto dist = buildCommitSizeDistribution(raw);
    ASSERT_EQ(dist.buckets.size(), 7u);
    int64_t sum = 0;
    for (const auto& bucket : dist.buckets) {
        EXPECT_EQ(bucket.count, 1) << bucket.label;
        sum += bucket.count;
    }
    EXPECT_EQ(sum, static_cast<int64_t>(raw.commitDetails.size()));
    EXPECT_EQ(dist.buckets.back().label, "1000+");
    EXPECT_FALSE(dist.buckets.back().max.has_value());
}

TEST(FileStatsTest, LanguageBreakdown) {
    RawDataBundle raw;
    raw.languages = {{"C++", 2}, {"Markdown", 1}};
    auto languages = buildLanguageBreakdown(raw);
    ASSERT_EQ(languages.size(), 2u);
    EXPECT_EQ(languages[0].name, "C++");
    EXPECT_DOUBLE_EQ(languages[0].percentage, 66.7);
    EXPECT_DOUBLE_EQ(languages[1].percentage, 33.3);

    RawDataBundle empty;
    EXPECT_TRUE(buildLanguageBreakdown(empty).empty());
}

// Test: A commit counts once per extension however many files it touches
TEST(FileStatsTest, ExtensionBreakdowns) {
    RawDataBundle raw;
    raw.commitDetails = {
        detail("a", {file("a.ts", 1, 0), file("b.ts", 1, 0), file("README", 50, 50)}),
        detail("a", {file("c.TS", 2, 1)}),
    };

    auto commits = buildCommitsByExtension(raw);
    ASSERT_EQ(commits.size(), 2u);
    EXPECT_EQ(commits[0].ext, ".ts");
    EXPECT_EQ(commits[0].count, 2);
    EXPECT_EQ(commits[1].ext, "(no ext)");
    EXPECT_EQ(commits[1].count, 1);

    auto lines = buildLinesByExtension(raw);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0].ext, "(no ext)");
    EXPECT_EQ(lines[0].additions, 50);
    EXPECT_EQ(lines[1].ext, ".ts");
    EXPECT_EQ(lines[1].additions, 4);
    EXPECT_EQ(lines[1].deletions, 1);
}

// Test: Co-changes inside an oversized commit do not count toward the threshold
TEST(FileStatsTest, CouplingSkipsCochangeInsideHugeCommit) {
    RawDataBundle raw;
    raw.commitDetails.push_back(detail("alice", {file("a.c", 1, 0), file("b.c", 1, 0)}));
    raw.commitDetails.push_back(detail("alice", {file("a.c", 1, 0), file("b.c", 1, 0)}));

    std::vector<FileDelta> huge = {file("a.c", 1, 0), file("b.c", 1, 0)};
    for (int i = 0; i < 49; ++i) huge.push_back(file("g" + std::to_string(i) + ".c", 1, 0));
    ASSERT_EQ(huge.size(), 51u);
    raw.commitDetails.push_back(detail("alice", huge));

    EXPECT_TRUE(buildFileCoupling(raw).empty());
}
