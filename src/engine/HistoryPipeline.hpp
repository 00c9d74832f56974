#pragma once

#include <functional>
#include <string>

#include "core/Repository.hpp"
#include "engine/EngineOptions.hpp"
#include "engine/Messages.hpp"
#include "model/GitStats.hpp"
#include "util/Expected.hpp"

namespace gitpulse {

/**
 * @brief Everything after the clone: history, diffs, census, aggregation
 *
 * Progress schedule:
 *   extracting-commits  42 reading history, 50 commits found
 *   extracting-details  52 start, then 52 + 25 * done/total after each batch
 *   computing-stats     80 census, 83 census result, 85 aggregation, 95 assembly
 */
class HistoryPipeline {
public:
    using ProgressFn = std::function<void(Step step, int percent, const std::string& message)>;

    HistoryPipeline(const Repository& repo, EngineOptions options) : repo(repo), options(std::move(options)) {}

    Expected<RawDataBundle> run(const ProgressFn& onProgress = nullptr) const;

private:
    const Repository& repo;
    EngineOptions options;
};

}
