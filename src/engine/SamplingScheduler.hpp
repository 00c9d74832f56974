#pragma once

#include <cstddef>
#include <vector>

#include "core/Constants.hpp"
#include "model/GitStats.hpp"

namespace gitpulse {

/**
 * @brief Chooses which commits get the expensive full diff
 *
 * With N commits and a budget of B, indices floor(i * N / B) for i in [0, B)
 * are diffed in full; every commit is when N <= B. The rest use the fast
 * strategy.
 */
class SamplingScheduler {
public:
    explicit SamplingScheduler(size_t budget = Constants::FULL_DIFF_BUDGET) : budget(budget) {}

    size_t fullDiffBudget() const { return budget; }

    /// Evenly spaced indices, ascending and distinct
    static std::vector<size_t> sampleIndices(size_t total, size_t budget);

    /// Diff mode per commit index
    std::vector<DiffMode> assign(size_t total) const;

private:
    size_t budget;
};

}
