#include "engine/HistoryPipeline.hpp"

#include <cmath>

#include "engine/BatchExecutor.hpp"
#include "engine/DiffEngine.hpp"
#include "engine/LanguageCensus.hpp"
#include "engine/SamplingScheduler.hpp"
#include "engine/WeeklyAggregator.hpp"
#include "util/Logger.hpp"

namespace gitpulse {

Expected<RawDataBundle> HistoryPipeline::run(const ProgressFn& onProgress) const {
    auto report = [&onProgress](Step step, int percent, const std::string& message) {
        if (onProgress) onProgress(step, percent, message);
    };

    report(Step::ExtractingCommits, 42, "Reading commit history...");
    auto head = repo.resolveHead();
    if (!head) return head.error();

    auto history = repo.firstParentHistory(head.value(), options.maxCommits);
    if (!history) return history.error();
    const auto& commits = history.value();

    RawDataBundle raw;
    raw.commits.reserve(commits.size());
    for (const auto& commit : commits) {
        raw.commits.push_back(makeSummary(commit));
    }
    report(Step::ExtractingCommits, 50, "Found " + std::to_string(commits.size()) + " commits");

    report(Step::ExtractingDetails, 52, "Computing file diffs...");
    DiffEngine engine(repo.objects());
    SamplingScheduler scheduler(options.fullDiffBudget);
    BatchExecutor executor(engine, options.batchSize);
    auto outcome = executor.run(commits, scheduler.assign(commits.size()), [&report](size_t done, size_t total) {
        int percent = 52 + static_cast<int>(std::lround(static_cast<double>(done) / static_cast<double>(total) * 25.0));
        report(Step::ExtractingDetails, percent, BatchExecutor::progressMessage(done, total));
    });
    if (outcome.failed > 0) {
        Logger::instance().warn(std::to_string(outcome.failed) + " of " + std::to_string(commits.size()) +
                                " commits could not be diffed");
    }
    raw.commitDetails = std::move(outcome.details);

    report(Step::ComputingStats, 80, "Computing statistics...");
    if (!commits.empty()) {
        LanguageCensus census(repo.objects());
        auto counted = census.run(commits.front().treeHash);
        if (!counted) return counted.error();
        raw.languages = std::move(counted.value().languages);
        raw.totalLinesOfCode = counted.value().totalLinesOfCode;
        raw.binaryFileCount = counted.value().binaryFileCount;
    }
    report(Step::ComputingStats, 83,
           std::to_string(raw.totalLinesOfCode) + " lines of code, " + std::to_string(raw.binaryFileCount) +
               " binary files");

    report(Step::ComputingStats, 85, "Building weekly aggregates...");
    WeeklyAggregates weekly = WeeklyAggregator::aggregate(raw.commits, raw.commitDetails);
    raw.contributorStats = std::move(weekly.contributorStats);
    raw.codeFrequency = std::move(weekly.codeFrequency);
    raw.commitActivity = std::move(weekly.commitActivity);
    raw.punchCard = std::move(weekly.punchCard);

    report(Step::ComputingStats, 95, "Assembling results...");
    return raw;
}

}
