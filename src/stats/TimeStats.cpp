#include "stats/TimeStats.hpp"

#include <algorithm>
#include <cstdlib>
#include <map>
#include <optional>

#include "util/Calendar.hpp"

namespace gitpulse::stats {

namespace {
    std::optional<int64_t> earliestAuthorTime(const RawDataBundle& raw) {
        std::optional<int64_t> earliest;
        for (const auto& commit : raw.commits) {
            if (!earliest || commit.author.timestamp < *earliest) {
                earliest = commit.author.timestamp;
            }
        }
        return earliest;
    }
}

std::vector<RepoGrowthPoint> buildRepoGrowth(const RawDataBundle& raw) {
    std::vector<RepoGrowthPoint> points;
    points.reserve(raw.codeFrequency.size());
    int64_t additions = 0;
    int64_t deletions = 0;
    for (const auto& row : raw.codeFrequency) {
        additions += row.additions;
        deletions += std::llabs(row.deletions);
        points.push_back(RepoGrowthPoint{calendar::toIsoDate(row.week), additions, deletions, additions - deletions});
    }
    return points;
}

std::vector<PunchCardPoint> buildPunchCard(const RawDataBundle& raw) {
    std::vector<PunchCardPoint> points;
    points.reserve(raw.punchCard.size());
    for (const auto& cell : raw.punchCard) {
        points.push_back(PunchCardPoint{cell.day, cell.hour, cell.commits});
    }
    return points;
}

std::vector<WeeklyActivity> buildWeeklyActivity(const RawDataBundle& raw) {
    std::vector<WeeklyActivity> weeks;
    weeks.reserve(raw.commitActivity.size());
    for (const auto& week : raw.commitActivity) {
        weeks.push_back(WeeklyActivity{calendar::toIsoDate(week.week), week.total, week.days});
    }
    return weeks;
}

std::array<int64_t, 7> commitsByWeekday(const RawDataBundle& raw) {
    std::array<int64_t, 7> counts{};
    for (const auto& commit : raw.commits) {
        ++counts[calendar::dayOfWeek(commit.author.timestamp)];
    }
    return counts;
}

std::array<int64_t, 12> commitsByMonth(const RawDataBundle& raw) {
    std::array<int64_t, 12> counts{};
    for (const auto& commit : raw.commits) {
        ++counts[calendar::toCivil(commit.author.timestamp).month - 1];
    }
    return counts;
}

std::vector<YearCount> commitsByYear(const RawDataBundle& raw) {
    std::map<int, int64_t> years;
    for (const auto& commit : raw.commits) {
        ++years[calendar::toCivil(commit.author.timestamp).year];
    }
    std::vector<YearCount> counts;
    for (const auto& [year, count] : years) {
        counts.push_back(YearCount{year, count});
    }
    return counts;
}

std::string firstCommitDate(const RawDataBundle& raw) {
    auto earliest = earliestAuthorTime(raw);
    return earliest ? calendar::toIsoTimestamp(*earliest) : std::string();
}

int64_t repoAgeDays(const RawDataBundle& raw, int64_t now) {
    auto earliest = earliestAuthorTime(raw);
    if (!earliest) return 0;
    return std::max<int64_t>(0, calendar::daysBetween(*earliest, now));
}

}
