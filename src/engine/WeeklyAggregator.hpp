#pragma once

#include <vector>

#include "model/GitStats.hpp"

namespace gitpulse {

struct WeeklyAggregates {
    std::vector<CommitActivityWeek> commitActivity;
    std::vector<CodeFrequencyRow> codeFrequency;
    std::vector<PunchCardCell> punchCard;
    std::vector<ContributorSeries> contributorStats;
};

/**
 * @brief Folds history and diff stats into week-aligned buckets
 *
 * Weeks start Sunday 00:00 UTC and are keyed by author date. Every commit
 * counts toward activity and the punch card; line counts come only from
 * commits that have a CommitDetail. Authors are keyed by email and named
 * after their first commit in history order. Each author's series covers
 * the full sorted week axis, zero-filled, and authors are ordered by
 * commit count (descending, ties in first-seen order).
 *
 * An empty history yields empty outputs, punch card included.
 */
class WeeklyAggregator {
public:
    static WeeklyAggregates aggregate(const std::vector<CommitSummary>& commits,
                                      const std::vector<CommitDetail>& details);
};

}
