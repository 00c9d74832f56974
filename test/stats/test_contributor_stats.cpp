#include <gtest/gtest.h>
#include <string>
#include <utility>
#include <vector>
#include "stats/ContributorStats.hpp"

using namespace gitpulse;
using namespace gitpulse::stats;

namespace {
    CommitSummary commitBy(const std::string& login, int64_t timestamp = 1704067200) {
        CommitSummary commit;
        commit.sha = std::string(40, 'a');
        commit.message = "change";
        commit.author = Signature{login, login + "@example.com", timestamp};
        commit.committer = commit.author;
        commit.authorLogin = login;
        return commit;
    }

    ContributorSummary withShare(const std::string& login, double pct) {
        ContributorSummary c;
        c.login = login;
        c.commitPercentage = pct;
        return c;
    }
}

// Test: Without weekly series, commits are counted per author
TEST(ContributorStatsTest, FallsBackToCommitList) {
    RawDataBundle raw;
    raw.commits = {commitBy("alice"), commitBy("bob"), commitBy("alice"), commitBy("alice")};

    auto contributors = buildContributorSummary(raw);
    ASSERT_EQ(contributors.size(), 2u);
    EXPECT_EQ(contributors[0].login, "alice");
    EXPECT_EQ(contributors[0].totalCommits, 3);
    EXPECT_DOUBLE_EQ(contributors[0].commitPercentage, 75.0);
    EXPECT_EQ(contributors[0].totalAdditions, 0);
    EXPECT_EQ(contributors[0].firstCommitWeek, 0);
    EXPECT_EQ(contributors[1].login, "bob");
    EXPECT_DOUBLE_EQ(contributors[1].commitPercentage, 25.0);

    auto bus = computeBusFactor(contributors);
    EXPECT_EQ(bus.busFactor, 1);
    EXPECT_DOUBLE_EQ(bus.herfindahlIndex, 0.75 * 0.75 + 0.25 * 0.25);
    ASSERT_EQ(bus.cumulativeContributors.size(), 2u);
    EXPECT_DOUBLE_EQ(bus.cumulativeContributors[1].cumulativePercentage, 100.0);
}

TEST(ContributorStatsTest, UsesWeeklySeries) {
    RawDataBundle raw;
    ContributorSeries carol{"carol", "carol@example.com", 1,
                            {{1703980800, 0, 0, 0}, {1704585600, 12, 3, 1}}};
    ContributorSeries dave{"dave", "dave@example.com", 3,
                           {{1703980800, 5, 1, 2}, {1704585600, 0, 0, 0}, {1705190400, 7, 2, 1}}};
    raw.contributorStats = {carol, dave};

    auto contributors = buildContributorSummary(raw);
    ASSERT_EQ(contributors.size(), 2u);
    EXPECT_EQ(contributors[0].login, "dave");
    EXPECT_EQ(contributors[0].totalAdditions, 12);
    EXPECT_EQ(contributors[0].totalDeletions, 3);
    EXPECT_EQ(contributors[0].firstCommitWeek, 1703980800);
    EXPECT_EQ(contributors[0].lastCommitWeek, 1705190400);
    EXPECT_DOUBLE_EQ(contributors[0].commitPercentage, 75.0);

    EXPECT_EQ(contributors[1].firstCommitWeek, 1704585600);
    EXPECT_EQ(contributors[1].lastCommitWeek, 1704585600);
}

TEST(ContributorStatsTest, EqualCommitsKeepFirstSeenOrder) {
    RawDataBundle raw;
    raw.commits = {commitBy("zed"), commitBy("amy")};
    auto contributors = buildContributorSummary(raw);
    ASSERT_EQ(contributors.size(), 2u);
    EXPECT_EQ(contributors[0].login, "zed");
    EXPECT_EQ(contributors[1].login, "amy");
}

TEST(ContributorStatsTest, SingleContributorHasFullConcentration) {
    auto bus = computeBusFactor({withShare("solo", 100.0)});
    EXPECT_EQ(bus.busFactor, 1);
    EXPECT_DOUBLE_EQ(bus.herfindahlIndex, 1.0);
}

// Test: k equal contributors give HHI 1/k and need half of them
TEST(ContributorStatsTest, EqualContributors) {
    std::vector<ContributorSummary> four = {withShare("a", 25.0), withShare("b", 25.0),
                                            withShare("c", 25.0), withShare("d", 25.0)};
    auto bus = computeBusFactor(four);
    EXPECT_EQ(bus.busFactor, 2);
    EXPECT_NEAR(bus.herfindahlIndex, 0.25, 1e-12);
    ASSERT_EQ(bus.cumulativeContributors.size(), 4u);
    EXPECT_DOUBLE_EQ(bus.cumulativeContributors[0].cumulativePercentage, 25.0);
    EXPECT_DOUBLE_EQ(bus.cumulativeContributors[3].cumulativePercentage, 100.0);
}

TEST(ContributorStatsTest, EmptyInput) {
    RawDataBundle raw;
    EXPECT_TRUE(buildContributorSummary(raw).empty());
    auto bus = computeBusFactor({});
    EXPECT_EQ(bus.busFactor, 0);
    EXPECT_DOUBLE_EQ(bus.herfindahlIndex, 0.0);
    EXPECT_TRUE(bus.cumulativeContributors.empty());
}

// Test: A newcomer with a single commit does not move the bus factor
TEST(ContributorStatsTest, SmallContributorKeepsBusFactor) {
    auto busFactorOf = [](const std::vector<std::pair<std::string, int>>& counts) {
        RawDataBundle raw;
        for (const auto& entry : counts) {
            for (int i = 0; i < entry.second; ++i) raw.commits.push_back(commitBy(entry.first));
        }
        return computeBusFactor(buildContributorSummary(raw)).busFactor;
    };

    EXPECT_EQ(busFactorOf({{"alice", 6}, {"bob", 3}, {"carol", 1}}), 1);
    EXPECT_EQ(busFactorOf({{"alice", 6}, {"bob", 3}, {"carol", 1}, {"dave", 1}}), 1);

    EXPECT_EQ(busFactorOf({{"alice", 4}, {"bob", 4}, {"carol", 2}}), 2);
    EXPECT_EQ(busFactorOf({{"alice", 4}, {"bob", 4}, {"carol", 2}, {"dave", 1}}), 2);
}
