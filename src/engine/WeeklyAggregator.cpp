#include "engine/WeeklyAggregator.hpp"

#include <algorithm>
#include <array>
#include <map>
#include <string>
#include <unordered_map>

#include "util/Calendar.hpp"

namespace gitpulse {

namespace {
    struct WeekTotals {
        std::array<int64_t, 7> days{};
        int64_t additions{0};
        int64_t deletions{0};
    };

    struct AuthorTotals {
        std::string name;
        std::string email;
        int64_t totalCommits{0};
        std::map<int64_t, ContributorWeek> weeks;
    };
}

WeeklyAggregates WeeklyAggregator::aggregate(const std::vector<CommitSummary>& commits,
                                             const std::vector<CommitDetail>& details) {
    WeeklyAggregates out;
    if (commits.empty()) {
        return out;
    }

    std::unordered_map<std::string, const DiffStats*> statsBySha;
    for (const auto& detail : details) {
        statsBySha.emplace(detail.sha, &detail.stats);
    }

    std::array<std::array<int64_t, 24>, 7> punch{};
    std::map<int64_t, WeekTotals> weeks;
    std::vector<AuthorTotals> authors;
    std::unordered_map<std::string, size_t> authorIndex;

    for (const auto& commit : commits) {
        int64_t ts = commit.author.timestamp;
        int day = calendar::dayOfWeek(ts);
        int hour = calendar::hourOfDay(ts);
        int64_t week = calendar::weekStart(ts);

        ++punch[day][hour];

        WeekTotals& bucket = weeks[week];
        ++bucket.days[day];

        auto statsIt = statsBySha.find(commit.sha);
        const DiffStats* stats = statsIt == statsBySha.end() ? nullptr : statsIt->second;
        if (stats) {
            bucket.additions += stats->additions;
            bucket.deletions += stats->deletions;
        }

        auto [indexIt, inserted] = authorIndex.emplace(commit.author.email, authors.size());
        if (inserted) {
            AuthorTotals author;
            author.name = commit.author.name;
            author.email = commit.author.email;
            authors.push_back(std::move(author));
        }
        AuthorTotals& author = authors[indexIt->second];
        ++author.totalCommits;
        ContributorWeek& authorWeek = author.weeks[week];
        authorWeek.w = week;
        ++authorWeek.c;
        if (stats) {
            authorWeek.a += stats->additions;
            authorWeek.d += stats->deletions;
        }
    }

    // Pass 1: week axis (std::map keeps it ascending)
    std::vector<int64_t> axis;
    axis.reserve(weeks.size());
    for (const auto& [week, totals] : weeks) {
        axis.push_back(week);

        CommitActivityWeek activity;
        activity.week = week;
        activity.days = totals.days;
        for (int64_t count : totals.days) activity.total += count;
        out.commitActivity.push_back(activity);

        out.codeFrequency.push_back(CodeFrequencyRow{week, totals.additions, -totals.deletions});
    }

    for (int day = 0; day < 7; ++day) {
        for (int hour = 0; hour < 24; ++hour) {
            out.punchCard.push_back(PunchCardCell{day, hour, punch[day][hour]});
        }
    }

    // Pass 2: expand every author over the shared axis
    for (const auto& author : authors) {
        ContributorSeries series;
        series.login = author.name;
        series.email = author.email;
        series.total = author.totalCommits;
        series.weeks.reserve(axis.size());
        for (int64_t week : axis) {
            auto it = author.weeks.find(week);
            series.weeks.push_back(it == author.weeks.end() ? ContributorWeek{week, 0, 0, 0} : it->second);
        }
        out.contributorStats.push_back(std::move(series));
    }
    std::stable_sort(out.contributorStats.begin(), out.contributorStats.end(),
                     [](const ContributorSeries& a, const ContributorSeries& b) { return a.total > b.total; });

    return out;
}

}
