#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "core/CommitObject.hpp"
#include "core/TreeWalker.hpp"

namespace gitpulse {

// ---------------------------------------------------------------------------
// Raw data: produced by the history pipeline, consumed by the stats layer
// ---------------------------------------------------------------------------

struct Signature {
    std::string name;
    std::string email;
    int64_t timestamp{0};   // Unix seconds
};

/// One first-parent history entry
struct CommitSummary {
    std::string sha;
    std::string message;
    Signature author;
    Signature committer;
    std::string authorLogin;   // no account lookup: the author name
};

inline Signature authorSignature(const CommitObject& commit) {
    return Signature{commit.authorName, commit.authorEmail, commit.authorTimestamp};
}

inline CommitSummary makeSummary(const CommitObject& commit) {
    CommitSummary summary;
    summary.sha = commit.hash;
    summary.message = commit.message;
    summary.author = authorSignature(commit);
    summary.committer = Signature{commit.committerName, commit.committerEmail, commit.committerTimestamp};
    summary.authorLogin = commit.authorName;
    return summary;
}

enum class DiffMode { Fast, Full };

const char* diffModeName(DiffMode mode);

/// One file's change inside one commit
struct FileDelta {
    std::string filename;
    std::string sha;           // new blob id, or the old one for removals
    ChangeStatus status{ChangeStatus::Unknown};
    int64_t additions{0};
    int64_t deletions{0};
    int64_t changes{0};        // additions + deletions
};

struct DiffStats {
    int64_t additions{0};
    int64_t deletions{0};
    int64_t total{0};
};

/// Diff result for one commit; stats is always the sum over files
struct CommitDetail {
    std::string sha;
    std::string message;
    Signature author;
    std::string authorLogin;
    DiffStats stats;
    std::vector<FileDelta> files;
    DiffMode diffMode{DiffMode::Fast};
};

/// {w, a, d, c} for one author in one week
struct ContributorWeek {
    int64_t w{0};
    int64_t a{0};
    int64_t d{0};
    int64_t c{0};
};

/// Per-author series aligned to the global week axis
struct ContributorSeries {
    std::string login;
    std::string email;
    int64_t total{0};
    std::vector<ContributorWeek> weeks;
};

struct CommitActivityWeek {
    int64_t week{0};
    int64_t total{0};
    std::array<int64_t, 7> days{};   // Sun..Sat
};

/// [week, additions, -deletions]
struct CodeFrequencyRow {
    int64_t week{0};
    int64_t additions{0};
    int64_t deletions{0};   // stored negative, as emitted
};

/// [day, hour, commits]
struct PunchCardCell {
    int day{0};
    int hour{0};
    int64_t commits{0};
};

struct RawDataBundle {
    std::vector<CommitSummary> commits;
    std::vector<CommitDetail> commitDetails;
    std::vector<ContributorSeries> contributorStats;
    std::vector<CodeFrequencyRow> codeFrequency;
    std::vector<CommitActivityWeek> commitActivity;
    std::vector<PunchCardCell> punchCard;
    std::map<std::string, int64_t> languages;   // language -> file count
    int64_t totalLinesOfCode{0};
    int64_t binaryFileCount{0};
};

// ---------------------------------------------------------------------------
// Analysis: derived by the stats layer
// ---------------------------------------------------------------------------

struct ContributorSummary {
    std::string login;
    int64_t totalCommits{0};
    int64_t totalAdditions{0};
    int64_t totalDeletions{0};
    double commitPercentage{0.0};
    int64_t firstCommitWeek{0};
    int64_t lastCommitWeek{0};
};

struct CumulativeShare {
    std::string login;
    double cumulativePercentage{0.0};
};

struct BusFactorData {
    int64_t busFactor{0};
    double herfindahlIndex{0.0};
    std::vector<CumulativeShare> cumulativeContributors;
};

struct FileChurnEntry {
    std::string filename;
    int64_t changeCount{0};
    int64_t totalAdditions{0};
    int64_t totalDeletions{0};
    std::vector<std::string> contributors;   // first-seen order
};

struct ConventionalCommitCounts {
    int64_t feat{0};
    int64_t fix{0};
    int64_t docs{0};
    int64_t style{0};
    int64_t refactor{0};
    int64_t test{0};
    int64_t chore{0};
    int64_t ci{0};
    int64_t perf{0};
    int64_t build{0};
    int64_t other{0};
};

struct WordCount {
    std::string word;
    int64_t count{0};
};

struct CommitMessageStats {
    int64_t totalCommits{0};
    int64_t averageLength{0};
    int64_t medianLength{0};
    int64_t mergeCommitCount{0};
    ConventionalCommitCounts conventionalCommits;
    int64_t conventionalPercentage{0};
    std::vector<WordCount> wordFrequency;
};

struct SizeBucket {
    std::string label;
    int64_t min{0};
    std::optional<int64_t> max;   // open-ended for the last bucket
    int64_t count{0};
};

struct CommitSizeDistribution {
    std::vector<SizeBucket> buckets;
};

struct RepoGrowthPoint {
    std::string date;   // YYYY-MM-DD
    int64_t cumulativeAdditions{0};
    int64_t cumulativeDeletions{0};
    int64_t netGrowth{0};
};

struct PunchCardPoint {
    int day{0};
    int hour{0};
    int64_t commits{0};
};

struct WeeklyActivity {
    std::string weekStart;   // YYYY-MM-DD
    int64_t total{0};
    std::array<int64_t, 7> days{};
};

struct LanguageEntry {
    std::string name;
    int64_t bytes{0};
    double percentage{0.0};
};

struct YearCount {
    int year{0};
    int64_t count{0};
};

struct ExtensionCount {
    std::string ext;
    int64_t count{0};
};

struct ExtensionLines {
    std::string ext;
    int64_t additions{0};
    int64_t deletions{0};
};

struct FileCouplingPair {
    std::string file1;
    std::string file2;
    int64_t cochanges{0};
};

struct AnalysisBundle {
    std::string owner;
    std::string repo;
    int64_t totalCommits{0};
    int64_t totalLinesOfCode{0};
    int64_t binaryFileCount{0};
    std::vector<ContributorSummary> contributors;
    BusFactorData busFactor;
    std::vector<FileChurnEntry> fileChurn;
    CommitMessageStats commitMessages;
    CommitSizeDistribution commitSizeDistribution;
    std::vector<RepoGrowthPoint> repoGrowth;
    std::vector<PunchCardPoint> punchCard;
    std::vector<WeeklyActivity> weeklyActivity;
    std::vector<LanguageEntry> languages;
    std::vector<CommitActivityWeek> commitActivity;
    std::vector<CodeFrequencyRow> codeFrequency;
    std::array<int64_t, 7> commitsByWeekday{};
    std::array<int64_t, 12> commitsByMonth{};
    std::vector<YearCount> commitsByYear;
    std::vector<ExtensionCount> commitsByExtension;
    std::vector<ExtensionLines> linesByExtension;
    std::vector<FileCouplingPair> fileCoupling;
    std::string firstCommitDate;   // ISO-8601 with milliseconds, "" without commits
    int64_t repoAgeDays{0};
};

}
