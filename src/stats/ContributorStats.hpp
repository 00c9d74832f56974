#pragma once

#include <vector>

#include "model/GitStats.hpp"

namespace gitpulse::stats {

/**
 * @brief Per-author totals and commit share
 *
 * Uses the weekly contributor series when present. Otherwise commits are
 * counted per author login (the author name) with zero line totals and
 * zero first/last weeks. Sorted by commit count, descending and stable.
 */
std::vector<ContributorSummary> buildContributorSummary(const RawDataBundle& raw);

/**
 * @brief Bus factor, HHI and the cumulative share curve
 *
 * Contributors are ranked by commit share; the bus factor is how many are
 * needed before the running share reaches 50%. HHI sums squared shares in
 * [0, 1]. The curve continues past the crossing for every contributor.
 */
BusFactorData computeBusFactor(const std::vector<ContributorSummary>& contributors);

}
