#include "model/Json.hpp"

#include <fstream>
#include <iostream>
#include <iterator>

#include "util/Calendar.hpp"

namespace fs = std::filesystem;

namespace gitpulse {

namespace {
    ChangeStatus statusFromName(const std::string& name) {
        if (name == "added") return ChangeStatus::Added;
        if (name == "modified") return ChangeStatus::Modified;
        if (name == "removed") return ChangeStatus::Removed;
        return ChangeStatus::Unknown;
    }

    nlohmann::json contributorSummaryJson(const ContributorSummary& c) {
        return nlohmann::json{
            {"login", c.login},
            {"totalCommits", c.totalCommits},
            {"totalAdditions", c.totalAdditions},
            {"totalDeletions", c.totalDeletions},
            {"commitPercentage", c.commitPercentage},
            {"firstCommitWeek", c.firstCommitWeek},
            {"lastCommitWeek", c.lastCommitWeek},
        };
    }

    nlohmann::json busFactorJson(const BusFactorData& bus) {
        nlohmann::json curve = nlohmann::json::array();
        for (const auto& share : bus.cumulativeContributors) {
            curve.push_back({{"login", share.login}, {"cumulativePercentage", share.cumulativePercentage}});
        }
        return nlohmann::json{
            {"busFactor", bus.busFactor},
            {"herfindahlIndex", bus.herfindahlIndex},
            {"cumulativeContributors", curve},
        };
    }

    nlohmann::json commitMessagesJson(const CommitMessageStats& stats) {
        const auto& cc = stats.conventionalCommits;
        nlohmann::json words = nlohmann::json::array();
        for (const auto& w : stats.wordFrequency) {
            words.push_back({{"word", w.word}, {"count", w.count}});
        }
        return nlohmann::json{
            {"totalCommits", stats.totalCommits},
            {"averageLength", stats.averageLength},
            {"medianLength", stats.medianLength},
            {"mergeCommitCount", stats.mergeCommitCount},
            {"conventionalCommits",
             {{"feat", cc.feat}, {"fix", cc.fix}, {"docs", cc.docs}, {"style", cc.style},
              {"refactor", cc.refactor}, {"test", cc.test}, {"chore", cc.chore}, {"ci", cc.ci},
              {"perf", cc.perf}, {"build", cc.build}, {"other", cc.other}}},
            {"conventionalPercentage", stats.conventionalPercentage},
            {"wordFrequency", words},
        };
    }

    nlohmann::json sizeDistributionJson(const CommitSizeDistribution& dist) {
        nlohmann::json buckets = nlohmann::json::array();
        for (const auto& b : dist.buckets) {
            nlohmann::json bucket{{"label", b.label}, {"min", b.min}, {"count", b.count}};
            // JSON has no Infinity
            bucket["max"] = b.max ? nlohmann::json(*b.max) : nlohmann::json(nullptr);
            buckets.push_back(bucket);
        }
        return nlohmann::json{{"buckets", buckets}};
    }
}

const char* diffModeName(DiffMode mode) {
    return mode == DiffMode::Full ? "full" : "fast";
}

void to_json(nlohmann::json& j, const Signature& sig) {
    j = nlohmann::json{
        {"name", sig.name},
        {"email", sig.email},
        {"timestamp", sig.timestamp},
        {"date", calendar::toIsoTimestamp(sig.timestamp)},
    };
}

void from_json(const nlohmann::json& j, Signature& sig) {
    sig.name = j.value("name", std::string());
    sig.email = j.value("email", std::string());
    sig.timestamp = j.value("timestamp", int64_t{0});
}

void to_json(nlohmann::json& j, const CommitSummary& commit) {
    j = nlohmann::json{
        {"sha", commit.sha},
        {"message", commit.message},
        {"author", commit.author},
        {"committer", commit.committer},
        {"authorLogin", commit.authorLogin},
    };
}

void from_json(const nlohmann::json& j, CommitSummary& commit) {
    j.at("sha").get_to(commit.sha);
    commit.message = j.value("message", std::string());
    if (j.contains("author")) j.at("author").get_to(commit.author);
    if (j.contains("committer")) j.at("committer").get_to(commit.committer);
    commit.authorLogin = j.value("authorLogin", std::string());
}

void to_json(nlohmann::json& j, const FileDelta& file) {
    j = nlohmann::json{
        {"sha", file.sha},
        {"filename", file.filename},
        {"status", changeStatusName(file.status)},
        {"additions", file.additions},
        {"deletions", file.deletions},
        {"changes", file.changes},
    };
}

void from_json(const nlohmann::json& j, FileDelta& file) {
    j.at("filename").get_to(file.filename);
    file.sha = j.value("sha", std::string());
    file.status = statusFromName(j.value("status", std::string()));
    file.additions = j.value("additions", int64_t{0});
    file.deletions = j.value("deletions", int64_t{0});
    file.changes = j.value("changes", file.additions + file.deletions);
}

void to_json(nlohmann::json& j, const CommitDetail& detail) {
    j = nlohmann::json{
        {"sha", detail.sha},
        {"message", detail.message},
        {"author", detail.author},
        {"authorLogin", detail.authorLogin},
        {"stats",
         {{"total", detail.stats.total},
          {"additions", detail.stats.additions},
          {"deletions", detail.stats.deletions}}},
        {"files", detail.files},
        {"diffMode", diffModeName(detail.diffMode)},
    };
}

void from_json(const nlohmann::json& j, CommitDetail& detail) {
    j.at("sha").get_to(detail.sha);
    detail.message = j.value("message", std::string());
    if (j.contains("author")) j.at("author").get_to(detail.author);
    detail.authorLogin = j.value("authorLogin", std::string());
    if (j.contains("stats")) {
        const auto& stats = j.at("stats");
        detail.stats.additions = stats.value("additions", int64_t{0});
        detail.stats.deletions = stats.value("deletions", int64_t{0});
        detail.stats.total = stats.value("total", detail.stats.additions + detail.stats.deletions);
    }
    if (j.contains("files")) j.at("files").get_to(detail.files);
    detail.diffMode = j.value("diffMode", std::string("fast")) == "full" ? DiffMode::Full : DiffMode::Fast;
}

void to_json(nlohmann::json& j, const ContributorSeries& series) {
    nlohmann::json weeks = nlohmann::json::array();
    for (const auto& w : series.weeks) {
        weeks.push_back({{"w", w.w}, {"a", w.a}, {"d", w.d}, {"c", w.c}});
    }
    j = nlohmann::json{
        {"author", {{"login", series.login}, {"email", series.email}}},
        {"total", series.total},
        {"weeks", weeks},
    };
}

void from_json(const nlohmann::json& j, ContributorSeries& series) {
    if (j.contains("author")) {
        series.login = j.at("author").value("login", std::string());
        series.email = j.at("author").value("email", std::string());
    }
    series.total = j.value("total", int64_t{0});
    series.weeks.clear();
    if (j.contains("weeks")) {
        for (const auto& w : j.at("weeks")) {
            series.weeks.push_back(ContributorWeek{w.value("w", int64_t{0}), w.value("a", int64_t{0}),
                                                   w.value("d", int64_t{0}), w.value("c", int64_t{0})});
        }
    }
}

void to_json(nlohmann::json& j, const CommitActivityWeek& week) {
    j = nlohmann::json{{"days", week.days}, {"total", week.total}, {"week", week.week}};
}

void from_json(const nlohmann::json& j, CommitActivityWeek& week) {
    week.week = j.value("week", int64_t{0});
    week.total = j.value("total", int64_t{0});
    if (j.contains("days")) j.at("days").get_to(week.days);
}

void to_json(nlohmann::json& j, const CodeFrequencyRow& row) {
    j = nlohmann::json::array({row.week, row.additions, row.deletions});
}

void from_json(const nlohmann::json& j, CodeFrequencyRow& row) {
    row.week = j.at(0).get<int64_t>();
    row.additions = j.at(1).get<int64_t>();
    row.deletions = j.at(2).get<int64_t>();
}

void to_json(nlohmann::json& j, const PunchCardCell& cell) {
    j = nlohmann::json::array({cell.day, cell.hour, cell.commits});
}

void from_json(const nlohmann::json& j, PunchCardCell& cell) {
    cell.day = j.at(0).get<int>();
    cell.hour = j.at(1).get<int>();
    cell.commits = j.at(2).get<int64_t>();
}

void to_json(nlohmann::json& j, const RawDataBundle& raw) {
    j = nlohmann::json{
        {"commits", raw.commits},
        {"commitDetails", raw.commitDetails},
        {"contributorStats", raw.contributorStats},
        {"codeFrequency", raw.codeFrequency},
        {"commitActivity", raw.commitActivity},
        {"punchCard", raw.punchCard},
        {"languages", raw.languages},
        {"totalLinesOfCode", raw.totalLinesOfCode},
        {"binaryFileCount", raw.binaryFileCount},
    };
}

void from_json(const nlohmann::json& j, RawDataBundle& raw) {
    j.at("commits").get_to(raw.commits);
    if (j.contains("commitDetails")) j.at("commitDetails").get_to(raw.commitDetails);
    // null means "not computed", same as empty
    auto optionalArray = [&j](const char* key, auto& out) {
        if (j.contains(key) && !j.at(key).is_null()) j.at(key).get_to(out);
    };
    optionalArray("contributorStats", raw.contributorStats);
    optionalArray("codeFrequency", raw.codeFrequency);
    optionalArray("commitActivity", raw.commitActivity);
    optionalArray("punchCard", raw.punchCard);
    optionalArray("languages", raw.languages);
    raw.totalLinesOfCode = j.value("totalLinesOfCode", int64_t{0});
    raw.binaryFileCount = j.value("binaryFileCount", int64_t{0});
}

void to_json(nlohmann::json& j, const AnalysisBundle& a) {
    nlohmann::json contributors = nlohmann::json::array();
    for (const auto& c : a.contributors) contributors.push_back(contributorSummaryJson(c));

    nlohmann::json churn = nlohmann::json::array();
    for (const auto& f : a.fileChurn) {
        churn.push_back({{"filename", f.filename},
                         {"changeCount", f.changeCount},
                         {"totalAdditions", f.totalAdditions},
                         {"totalDeletions", f.totalDeletions},
                         {"contributors", f.contributors}});
    }

    nlohmann::json growth = nlohmann::json::array();
    for (const auto& p : a.repoGrowth) {
        growth.push_back({{"date", p.date},
                          {"cumulativeAdditions", p.cumulativeAdditions},
                          {"cumulativeDeletions", p.cumulativeDeletions},
                          {"netGrowth", p.netGrowth}});
    }

    nlohmann::json punch = nlohmann::json::array();
    for (const auto& p : a.punchCard) {
        punch.push_back({{"day", p.day}, {"hour", p.hour}, {"commits", p.commits}});
    }

    nlohmann::json weekly = nlohmann::json::array();
    for (const auto& w : a.weeklyActivity) {
        weekly.push_back({{"weekStart", w.weekStart}, {"total", w.total}, {"days", w.days}});
    }

    nlohmann::json languages = nlohmann::json::array();
    for (const auto& l : a.languages) {
        languages.push_back({{"name", l.name}, {"bytes", l.bytes}, {"percentage", l.percentage}});
    }

    nlohmann::json years = nlohmann::json::array();
    for (const auto& y : a.commitsByYear) years.push_back({{"year", y.year}, {"count", y.count}});

    nlohmann::json extCounts = nlohmann::json::array();
    for (const auto& e : a.commitsByExtension) extCounts.push_back({{"ext", e.ext}, {"count", e.count}});

    nlohmann::json extLines = nlohmann::json::array();
    for (const auto& e : a.linesByExtension) {
        extLines.push_back({{"ext", e.ext}, {"additions", e.additions}, {"deletions", e.deletions}});
    }

    nlohmann::json coupling = nlohmann::json::array();
    for (const auto& p : a.fileCoupling) {
        coupling.push_back({{"file1", p.file1}, {"file2", p.file2}, {"cochanges", p.cochanges}});
    }

    j = nlohmann::json{
        {"owner", a.owner},
        {"repo", a.repo},
        {"totalCommits", a.totalCommits},
        {"totalLinesOfCode", a.totalLinesOfCode},
        {"binaryFileCount", a.binaryFileCount},
        {"contributors", contributors},
        {"busFactor", busFactorJson(a.busFactor)},
        {"fileChurn", churn},
        {"commitMessages", commitMessagesJson(a.commitMessages)},
        {"commitSizeDistribution", sizeDistributionJson(a.commitSizeDistribution)},
        {"repoGrowth", growth},
        {"punchCard", punch},
        {"weeklyActivity", weekly},
        {"languages", languages},
        {"commitActivity", a.commitActivity},
        {"codeFrequency", a.codeFrequency},
        {"commitsByWeekday", a.commitsByWeekday},
        {"commitsByMonth", a.commitsByMonth},
        {"commitsByYear", years},
        {"commitsByExtension", extCounts},
        {"linesByExtension", extLines},
        {"fileCoupling", coupling},
        {"firstCommitDate", a.firstCommitDate},
        {"repoAgeDays", a.repoAgeDays},
    };
}

namespace json {

namespace {
    // Commit metadata is not guaranteed to be UTF-8; invalid bytes become U+FFFD
    std::string dumpLenient(const nlohmann::json& j, int indent) {
        return j.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
    }
}

std::string encodeRaw(const RawDataBundle& raw, int indent) {
    return dumpLenient(nlohmann::json(raw), indent);
}

Expected<RawDataBundle> decodeRaw(const std::string& text) {
    try {
        return nlohmann::json::parse(text).get<RawDataBundle>();
    } catch (const nlohmann::json::exception& e) {
        return Error{ErrorCode::InvalidArgs, std::string("Malformed raw data: ") + e.what()};
    }
}

Expected<RawDataBundle> readRawFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::IoError, "Failed to open " + path.string()};
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return decodeRaw(text);
}

std::string encodeAnalysis(const AnalysisBundle& analysis, int indent) {
    return dumpLenient(nlohmann::json(analysis), indent);
}

Expected<void> writeOutput(const fs::path& path, const std::string& text) {
    if (path.empty()) {
        std::cout << text << std::endl;
        return {};
    }
    std::ofstream out(path, std::ios::binary);
    if (!out) {
        return Error{ErrorCode::IoError, "Failed to open output file: " + path.string()};
    }
    out << text << "\n";
    if (!out) {
        return Error{ErrorCode::IoError, "Failed to write output file: " + path.string()};
    }
    return {};
}

}

}
