#pragma once

#include <string>
#include <vector>

#include "model/GitStats.hpp"

namespace gitpulse::stats {

/// Touch count, line totals and distinct authors per file; top 100 by touches
std::vector<FileChurnEntry> buildFileChurn(const RawDataBundle& raw);

/**
 * @brief Files that change together
 *
 * Only commits touching 2..50 files count. Each contributes every pair
 * among its first 20 distinct filenames in sorted order. Pairs seen fewer
 * than 3 times are dropped; the top 20 are kept.
 */
std::vector<FileCouplingPair> buildFileCoupling(const RawDataBundle& raw);

/// Histogram of additions + deletions per CommitDetail
CommitSizeDistribution buildCommitSizeDistribution(const RawDataBundle& raw);

/// Language shares with percentages rounded to one decimal, largest first
std::vector<LanguageEntry> buildLanguageBreakdown(const RawDataBundle& raw);

/// ".ts" for "src/app.TS"; "(no ext)" when the basename has no dot past its first character
std::string extensionOf(const std::string& filename);

/// Commits touching each extension (counted once per commit); top 20
std::vector<ExtensionCount> buildCommitsByExtension(const RawDataBundle& raw);

/// Line totals per extension; top 20 by additions + deletions
std::vector<ExtensionLines> buildLinesByExtension(const RawDataBundle& raw);

}
