#pragma once

#include <cstdint>
#include <string>

#include "model/GitStats.hpp"

namespace gitpulse {

/**
 * @brief Derives the full AnalysisBundle from a RawDataBundle
 *
 * Pure: the same bundle, names and @p now always give the same result.
 * @p now (Unix seconds) is only used for the repository age.
 */
class GitStatsAnalyzer {
public:
    static AnalysisBundle analyze(const RawDataBundle& raw,
                                  const std::string& owner,
                                  const std::string& repo,
                                  int64_t now);
};

}
