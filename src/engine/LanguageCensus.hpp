#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "core/ObjectStore.hpp"
#include "util/Expected.hpp"

namespace gitpulse {

struct CensusResult {
    std::map<std::string, int64_t> languages;   // language -> file count
    int64_t totalLinesOfCode{0};
    int64_t binaryFileCount{0};
    int64_t fileCount{0};
    int64_t skippedFiles{0};                    // blobs that could not be read
};

/**
 * @brief Lines of code and language mix of one tree
 *
 * Every blob leaf is read once: text blobs add their line count, binary
 * blobs are counted separately, unreadable blobs are skipped. Languages
 * come from the lowercased extension of the file name, with the file count
 * standing in for size.
 */
class LanguageCensus {
public:
    explicit LanguageCensus(const ObjectStore& store) : store(store) {}

    /// @return Census, or an error when @p treeId itself cannot be read
    Expected<CensusResult> run(const std::string& treeId) const;

    /// Language for a path ("src/app.tsx" -> "TypeScript"), empty when unmapped
    static std::string languageForPath(const std::string& path);

    static std::map<std::string, int64_t> computeLanguages(const std::vector<std::string>& paths);

private:
    const ObjectStore& store;
};

}
