#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "test_utils.hpp"
#include "cli/ArgParsing.hpp"
#include "cli/CommandFactory.hpp"
#include "cli/CommandInvoker.hpp"
#include "cli/commands/AnalyzeCommand.hpp"
#include "cli/commands/DiffCommand.hpp"
#include "cli/commands/HelpCommand.hpp"
#include "cli/commands/LogCommand.hpp"
#include "cli/commands/StatsCommand.hpp"
#include "model/Json.hpp"

namespace fs = std::filesystem;

using namespace gitpulse;
using namespace gitpulse::test::utils;

/**
 * @brief Command-level tests: argument parsing and end-to-end runs
 * against local repositories
 */
class CommandsTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Normally done in main.cpp
        auto& f = CommandFactory::instance();
        f.registerCreator("help", [] { return std::make_unique<HelpCommand>(); });
        f.registerCreator("analyze", [] { return std::make_unique<AnalyzeCommand>(); });
        f.registerCreator("stats", [] { return std::make_unique<StatsCommand>(); });
        f.registerCreator("log", [] { return std::make_unique<LogCommand>(); });
        f.registerCreator("diff", [] { return std::make_unique<DiffCommand>(); });

        tempDir = createTempDir();
    }

    void TearDown() override {
        removeDir(tempDir);
    }

    Expected<void> run(const std::string& name, const std::vector<std::string>& args) {
        auto cmd = CommandFactory::instance().create(name);
        if (!cmd) return Error{ErrorCode::InvalidArgs, "no command " + name};
        return invoker.invoke(*cmd, ctx, args);
    }

    fs::path tempDir;
    CommandInvoker invoker;
    AppContext ctx;
};

TEST_F(CommandsTest, ParsePositive) {
    EXPECT_EQ(cli::parsePositive("--n", "42").value(), 42u);
    EXPECT_FALSE(cli::parsePositive("--n", "0"));
    EXPECT_FALSE(cli::parsePositive("--n", "-3"));
    EXPECT_FALSE(cli::parsePositive("--n", "12abc"));
    EXPECT_FALSE(cli::parsePositive("--n", ""));
    EXPECT_FALSE(cli::parsePositive("--n", "99999999999999999999999"));
}

TEST_F(CommandsTest, FactoryCreatesRegisteredCommands) {
    for (const char* name : {"help", "analyze", "stats", "log", "diff"}) {
        auto cmd = CommandFactory::instance().create(name);
        ASSERT_NE(cmd, nullptr) << name;
        EXPECT_STREQ(cmd->name(), name);
    }
    EXPECT_EQ(CommandFactory::instance().create("commit"), nullptr);
    EXPECT_EQ(CommandFactory::instance().names(),
              (std::vector<std::string>{"analyze", "diff", "help", "log", "stats"}));

    std::vector<std::unique_ptr<ICommand>> all;
    CommandFactory::instance().listCommands(all);
    ASSERT_GE(all.size(), 5u);
    EXPECT_STREQ(all.front()->name(), "analyze");
}

// Test: Flags override the context defaults
TEST_F(CommandsTest, AnalyzeParsesFlags) {
    ctx.defaultProxy = "http://default:3128";
    auto parsed = AnalyzeCommand::parse(ctx, {"octo/demo", "--full-diffs", "5", "--batch-size", "3",
                                              "--max-commits", "200", "--timeout", "9", "--idle-timeout", "4", "--raw",
                                              "--output", "out.json", "--mirror", "/srv/mirror"});
    ASSERT_TRUE(parsed) << parsed.error().message;
    const AnalyzeArgs& a = parsed.value();
    EXPECT_EQ(a.request.owner, "octo");
    EXPECT_EQ(a.request.repo, "demo");
    EXPECT_EQ(a.request.proxyUrl, "http://default:3128");
    EXPECT_EQ(a.request.options.fullDiffBudget, 5u);
    EXPECT_EQ(a.request.options.batchSize, 3u);
    EXPECT_EQ(a.request.options.maxCommits, 200u);
    EXPECT_EQ(a.request.options.cloneTimeout, std::chrono::seconds(9));
    EXPECT_EQ(a.request.options.idleTimeout, std::chrono::seconds(4));
    EXPECT_EQ(a.request.options.mirrorRoot, fs::path("/srv/mirror"));
    EXPECT_TRUE(a.raw);
    EXPECT_EQ(a.outputPath, "out.json");

    auto defaults = AnalyzeCommand::parse(ctx, {"octo/demo", "--proxy", "http://p:1"});
    ASSERT_TRUE(defaults);
    EXPECT_EQ(defaults.value().request.proxyUrl, "http://p:1");
    EXPECT_EQ(defaults.value().request.options.batchSize, 10u);
    EXPECT_EQ(defaults.value().request.options.fullDiffBudget, 30u);
    EXPECT_FALSE(defaults.value().raw);
}

TEST_F(CommandsTest, AnalyzeRejectsBadArguments) {
    const std::vector<std::vector<std::string>> bad = {
        {},
        {"octo"},
        {"octo/demo/extra"},
        {"octo/demo", "other/repo"},
        {"octo/demo", "--batch-size"},
        {"octo/demo", "--batch-size", "0"},
        {"octo/demo", "--bogus", "1"},
    };
    for (const auto& args : bad) {
        auto parsed = AnalyzeCommand::parse(ctx, args);
        ASSERT_FALSE(parsed);
        EXPECT_EQ(parsed.error().code, ErrorCode::InvalidArgs);
    }
}

// Test: analyze against a local mirror, then stats over its raw output
TEST_F(CommandsTest, AnalyzeThenStatsFromMirror) {
    RepoBuilder builder(tempDir / "mirror" / "octo" / "demo");
    builder.commitFiles({{"src/main.cpp", "int main() {}\n"}}, "feat: first", 1704067200);
    builder.commitFiles({{"src/main.cpp", "int main() {\n  return 0;\n}\n"}}, "fix: return a value", 1704153600);

    fs::path rawPath = tempDir / "raw.json";
    auto res = run("analyze", {"octo/demo", "--mirror", (tempDir / "mirror").string(), "--raw",
                               "--output", rawPath.string()});
    ASSERT_TRUE(res) << res.error().message;

    auto raw = json::readRawFile(rawPath);
    ASSERT_TRUE(raw) << raw.error().message;
    EXPECT_EQ(raw.value().commits.size(), 2u);
    EXPECT_EQ(raw.value().totalLinesOfCode, 3);

    fs::path analysisPath = tempDir / "analysis.json";
    res = run("stats", {rawPath.string(), "--owner", "octo", "--repo", "demo", "--now", "1706745600",
                        "--output", analysisPath.string()});
    ASSERT_TRUE(res) << res.error().message;

    auto analysis = nlohmann::json::parse(readFile(analysisPath));
    EXPECT_EQ(analysis["owner"], "octo");
    EXPECT_EQ(analysis["totalCommits"], 2);
    EXPECT_EQ(analysis["commitMessages"]["conventionalPercentage"], 100);
    EXPECT_EQ(analysis["firstCommitDate"], "2024-01-01T00:00:00.000Z");
    EXPECT_EQ(analysis["repoAgeDays"], 31);
}

TEST_F(CommandsTest, StatsRequiresInput) {
    auto res = run("stats", {});
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, ErrorCode::InvalidArgs);

    res = run("stats", {(tempDir / "missing.json").string()});
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, ErrorCode::IoError);
}

TEST_F(CommandsTest, LogShowsFirstParentHistory) {
    RepoBuilder builder(tempDir / "repo.git");
    builder.commitFiles({{"a.txt", "a\n"}}, "Initial commit\n", 1704067200);
    builder.commitFiles({{"a.txt", "b\n"}}, "Second change\n\nWith a body\n", 1704153600);

    testing::internal::CaptureStdout();
    auto res = run("log", {"--path", (tempDir / "repo.git").string()});
    std::string out = testing::internal::GetCapturedStdout();
    ASSERT_TRUE(res) << res.error().message;
    EXPECT_NE(out.find("Second change"), std::string::npos);
    EXPECT_NE(out.find("With a body"), std::string::npos);
    EXPECT_NE(out.find("Author: Alice <alice@example.com>"), std::string::npos);
    EXPECT_LT(out.find("Second change"), out.find("Initial commit"));

    testing::internal::CaptureStdout();
    res = run("log", {"--path", (tempDir / "repo.git").string(), "--oneline", "-n", "1"});
    out = testing::internal::GetCapturedStdout();
    ASSERT_TRUE(res);
    EXPECT_NE(out.find("Second change"), std::string::npos);
    EXPECT_EQ(out.find("Initial commit"), std::string::npos);
}

TEST_F(CommandsTest, LogOnUnbornBranch) {
    RepoBuilder builder(tempDir / "empty.git");
    testing::internal::CaptureStdout();
    auto res = run("log", {"--path", (tempDir / "empty.git").string()});
    std::string out = testing::internal::GetCapturedStdout();
    ASSERT_TRUE(res);
    EXPECT_NE(out.find("does not have any commits yet"), std::string::npos);
}

TEST_F(CommandsTest, LogOutsideRepository) {
    auto res = run("log", {"--path", tempDir.string()});
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, ErrorCode::NotARepository);
}

TEST_F(CommandsTest, DiffHeadCommit) {
    RepoBuilder builder(tempDir / "repo.git");
    builder.commitFiles({{"a.txt", "one\ntwo\n"}}, "first", 1704067200);
    builder.commitFiles({{"a.txt", "one\nthree\n"}, {"b.txt", "new\n"}}, "second", 1704153600);

    testing::internal::CaptureStdout();
    auto res = run("diff", {"--path", (tempDir / "repo.git").string(), "--full"});
    std::string out = testing::internal::GetCapturedStdout();
    ASSERT_TRUE(res) << res.error().message;
    EXPECT_NE(out.find("(full)"), std::string::npos);
    EXPECT_NE(out.find("b.txt"), std::string::npos);
    EXPECT_NE(out.find("2 file(s) changed, 2 insertion(s)(+), 1 deletion(s)(-)"), std::string::npos);

    res = run("diff", {"--path", (tempDir / "repo.git").string(), std::string(40, 'f')});
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, ErrorCode::ObjectNotFound);
}

TEST_F(CommandsTest, HelpListsCommands) {
    testing::internal::CaptureStdout();
    auto res = run("help", {});
    std::string out = testing::internal::GetCapturedStdout();
    ASSERT_TRUE(res);
    EXPECT_NE(out.find("analyze"), std::string::npos);
    EXPECT_NE(out.find("stats"), std::string::npos);

    testing::internal::CaptureStdout();
    res = run("help", {"analyze"});
    out = testing::internal::GetCapturedStdout();
    ASSERT_TRUE(res);
    EXPECT_NE(out.find("--full-diffs"), std::string::npos);
}
