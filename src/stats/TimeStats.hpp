#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "model/GitStats.hpp"

namespace gitpulse::stats {

/// Running totals over codeFrequency, one point per week
std::vector<RepoGrowthPoint> buildRepoGrowth(const RawDataBundle& raw);

std::vector<PunchCardPoint> buildPunchCard(const RawDataBundle& raw);

std::vector<WeeklyActivity> buildWeeklyActivity(const RawDataBundle& raw);

/// Author-date breakdowns of raw.commits, all in UTC
std::array<int64_t, 7> commitsByWeekday(const RawDataBundle& raw);
std::array<int64_t, 12> commitsByMonth(const RawDataBundle& raw);
std::vector<YearCount> commitsByYear(const RawDataBundle& raw);

/// Earliest author date as ISO-8601, "" without commits
std::string firstCommitDate(const RawDataBundle& raw);

/// Whole days from the earliest author date to @p now; 0 without commits
int64_t repoAgeDays(const RawDataBundle& raw, int64_t now);

}
