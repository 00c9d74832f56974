#pragma once

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <string>

#include "core/Constants.hpp"

namespace gitpulse {

/**
 * @brief Runtime tuning, seeded from Constants and fixed when a run starts
 *
 * Environment:
 *   GITPULSE_GIT    git executable used by the clone transport (default "git")
 *   GITPULSE_PROXY  default transport proxy, read by the CLI
 */
struct EngineOptions {
    size_t batchSize{Constants::BATCH_SIZE};
    size_t fullDiffBudget{Constants::FULL_DIFF_BUDGET};
    size_t maxCommits{Constants::MAX_HISTORY_COMMITS};
    std::chrono::seconds cloneTimeout{Constants::CLONE_TIMEOUT_SECONDS};
    std::chrono::seconds idleTimeout{Constants::IDLE_TIMEOUT_SECONDS};
    std::string gitExecutable{"git"};
    std::filesystem::path mirrorRoot;    // non-empty: copy <root>/<owner>/<repo> instead of cloning
    std::filesystem::path scratchRoot;   // empty: the system temp directory

    static EngineOptions fromEnvironment() {
        EngineOptions options;
        if (const char* git = std::getenv("GITPULSE_GIT")) {
            if (*git) options.gitExecutable = git;
        }
        return options;
    }
};

}
