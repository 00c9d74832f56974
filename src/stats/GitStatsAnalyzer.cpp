#include "stats/GitStatsAnalyzer.hpp"

#include "stats/ContributorStats.hpp"
#include "stats/FileStats.hpp"
#include "stats/MessageStats.hpp"
#include "stats/TimeStats.hpp"

namespace gitpulse {

AnalysisBundle GitStatsAnalyzer::analyze(const RawDataBundle& raw,
                                         const std::string& owner,
                                         const std::string& repo,
                                         int64_t now) {
    AnalysisBundle analysis;
    analysis.owner = owner;
    analysis.repo = repo;
    analysis.totalCommits = static_cast<int64_t>(raw.commits.size());
    analysis.totalLinesOfCode = raw.totalLinesOfCode;
    analysis.binaryFileCount = raw.binaryFileCount;

    analysis.contributors = stats::buildContributorSummary(raw);
    analysis.busFactor = stats::computeBusFactor(analysis.contributors);
    analysis.fileChurn = stats::buildFileChurn(raw);
    analysis.commitMessages = stats::analyzeCommitMessages(raw);
    analysis.commitSizeDistribution = stats::buildCommitSizeDistribution(raw);
    analysis.repoGrowth = stats::buildRepoGrowth(raw);
    analysis.punchCard = stats::buildPunchCard(raw);
    analysis.weeklyActivity = stats::buildWeeklyActivity(raw);
    analysis.languages = stats::buildLanguageBreakdown(raw);
    analysis.commitActivity = raw.commitActivity;
    analysis.codeFrequency = raw.codeFrequency;

    analysis.commitsByWeekday = stats::commitsByWeekday(raw);
    analysis.commitsByMonth = stats::commitsByMonth(raw);
    analysis.commitsByYear = stats::commitsByYear(raw);
    analysis.commitsByExtension = stats::buildCommitsByExtension(raw);
    analysis.linesByExtension = stats::buildLinesByExtension(raw);
    analysis.fileCoupling = stats::buildFileCoupling(raw);
    analysis.firstCommitDate = stats::firstCommitDate(raw);
    analysis.repoAgeDays = stats::repoAgeDays(raw, now);
    return analysis;
}

}
