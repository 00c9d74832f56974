#include <gtest/gtest.h>
#include <filesystem>
#include "test_utils.hpp"
#include "core/Constants.hpp"
#include "engine/LanguageCensus.hpp"

namespace fs = std::filesystem;

using namespace gitpulse;
using namespace gitpulse::test::utils;

class LanguageCensusTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = createTempDir();
        builder = std::make_unique<RepoBuilder>(tempDir / "repo.git");
    }

    void TearDown() override {
        builder.reset();
        removeDir(tempDir);
    }

    fs::path tempDir;
    std::unique_ptr<RepoBuilder> builder;
};

TEST_F(LanguageCensusTest, LanguageForPath) {
    EXPECT_EQ(LanguageCensus::languageForPath("src/app.tsx"), "TypeScript");
    EXPECT_EQ(LanguageCensus::languageForPath("lib/Main.CPP"), "C++");
    EXPECT_EQ(LanguageCensus::languageForPath("include/a.h"), "C");
    EXPECT_EQ(LanguageCensus::languageForPath("README.md"), "Markdown");
    EXPECT_EQ(LanguageCensus::languageForPath("Makefile"), "");
    EXPECT_EQ(LanguageCensus::languageForPath("archive.tar.gz"), "");
    EXPECT_EQ(LanguageCensus::languageForPath("dir.py/noext"), "");
}

TEST_F(LanguageCensusTest, ComputeLanguagesCountsFiles) {
    auto languages = LanguageCensus::computeLanguages({"a.ts", "b.ts", "c.js", "d.bin", "e.yml", "f.yaml"});
    EXPECT_EQ(languages.size(), 3u);
    EXPECT_EQ(languages["TypeScript"], 2);
    EXPECT_EQ(languages["JavaScript"], 1);
    EXPECT_EQ(languages["YAML"], 2);
}

// Test: Lines, binaries and languages of a whole tree
TEST_F(LanguageCensusTest, RunOverTree) {
    std::string tree = builder->tree({
        {"src/main.cpp", "int main() {\n  return 0;\n}\n"},
        {"src/util.hpp", "#pragma once"},
        {"logo.png", std::string("\x89PNG\0\0", 6)},
        {"README.md", "# Title\n\nText\n"},
    });

    LanguageCensus census(builder->store());
    auto result = census.run(tree);
    ASSERT_TRUE(result) << result.error().message;

    EXPECT_EQ(result.value().fileCount, 4);
    EXPECT_EQ(result.value().binaryFileCount, 1);
    EXPECT_EQ(result.value().totalLinesOfCode, 3 + 1 + 3);
    EXPECT_EQ(result.value().skippedFiles, 0);
    EXPECT_EQ(result.value().languages.at("C++"), 2);
    EXPECT_EQ(result.value().languages.at("Markdown"), 1);
}

// Test: Unreadable blobs are skipped, not fatal
TEST_F(LanguageCensusTest, MissingBlobIsSkipped) {
    std::string good = builder->blob("a\nb\n");
    std::string tree = builder->store().writeTree({
        TreeEntry{Constants::MODE_FILE, "good.py", good},
        TreeEntry{Constants::MODE_FILE, "lost.py", "3434343434343434343434343434343434343434"},
    });

    LanguageCensus census(builder->store());
    auto result = census.run(tree);
    ASSERT_TRUE(result);
    EXPECT_EQ(result.value().totalLinesOfCode, 2);
    EXPECT_EQ(result.value().skippedFiles, 1);
    EXPECT_EQ(result.value().languages.at("Python"), 2);
}

TEST_F(LanguageCensusTest, MissingRootTreeFails) {
    LanguageCensus census(builder->store());
    auto result = census.run("5656565656565656565656565656565656565656");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::ObjectNotFound);
}
